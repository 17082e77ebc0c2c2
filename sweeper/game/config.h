#ifndef SWEEPER_GAME_CONFIG_H_
#define SWEEPER_GAME_CONFIG_H_

#include <cstddef>
#include <string>

namespace sweeper {

// The dimensions and mine count of a game.
struct GameConfig {
  std::size_t rows;
  std::size_t cols;
  std::size_t mines;
};

// Premade common difficulties.
enum class Difficulty {
  // 9x9 with 10 mines.
  BEGINNER,

  // 16x16 with 40 mines.
  INTERMEDIATE,

  // 16x30 with 99 mines.
  EXPERT,
};

// Returns the configuration for a premade difficulty.
GameConfig PresetConfig(Difficulty difficulty);

// Parses "beginner", "intermediate" or "expert".
//
// Returns false if the name is not recognized.
bool ParseDifficulty(const std::string& name, Difficulty* difficulty);

// Returns the name of the difficulty as accepted by ParseDifficulty.
const char* DifficultyName(Difficulty difficulty);

// A requested configuration, either a difficulty name or a custom size.
//
// An empty difficulty or a zero number means the value was not supplied.
struct ConfigOptions {
  std::string difficulty;
  std::size_t rows = 0;
  std::size_t cols = 0;
  std::size_t mines = 0;
};

// Returns true if the configuration describes a game that can be created:
// a non-empty grid with at least one mine and at least one mine-free cell.
bool IsValidConfig(const GameConfig& config);

// Returns true if mines can be placed outside the 3x3 safe zone around any
// first move.
bool HasRoomForSafeZone(const GameConfig& config);

// Resolves the options into a configuration.
//
// A difficulty and a custom size are mutually exclusive. Returns false and
// describes the problem in *error if the options are invalid; *config is only
// written on success.
bool ResolveConfig(const ConfigOptions& options, GameConfig* config,
                   std::string* error);

}  // namespace sweeper

#endif  // SWEEPER_GAME_CONFIG_H_
