#include "sweeper/game/config.h"

#include <glib.h>

namespace sweeper {

namespace {

// The first move and its eight neighbours.
constexpr std::size_t kSafeZoneSize = 9;

constexpr GameConfig kBeginnerConfig = {9, 9, 10};
constexpr GameConfig kIntermediateConfig = {16, 16, 40};
constexpr GameConfig kExpertConfig = {16, 30, 99};

}  // namespace

GameConfig PresetConfig(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::BEGINNER:
      return kBeginnerConfig;
    case Difficulty::INTERMEDIATE:
      return kIntermediateConfig;
    case Difficulty::EXPERT:
    default:
      return kExpertConfig;
  }
}

bool ParseDifficulty(const std::string& name, Difficulty* difficulty) {
  if (name == "beginner") {
    *difficulty = Difficulty::BEGINNER;
  } else if (name == "intermediate") {
    *difficulty = Difficulty::INTERMEDIATE;
  } else if (name == "expert") {
    *difficulty = Difficulty::EXPERT;
  } else {
    return false;
  }
  return true;
}

const char* DifficultyName(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::BEGINNER:
      return "beginner";
    case Difficulty::INTERMEDIATE:
      return "intermediate";
    case Difficulty::EXPERT:
    default:
      return "expert";
  }
}

bool IsValidConfig(const GameConfig& config) {
  return config.rows > 0 && config.cols > 0 && config.mines > 0 &&
         config.mines < config.rows * config.cols;
}

bool HasRoomForSafeZone(const GameConfig& config) {
  const std::size_t cells = config.rows * config.cols;
  return cells >= kSafeZoneSize && config.mines <= cells - kSafeZoneSize;
}

bool ResolveConfig(const ConfigOptions& options, GameConfig* config,
                   std::string* error) {
  const bool has_custom =
      options.rows != 0 || options.cols != 0 || options.mines != 0;

  if (options.difficulty.empty() && !has_custom) {
    *error = "No difficulty or custom grid size provided";
    return false;
  }

  if (!options.difficulty.empty() && has_custom) {
    *error = "Cannot use a difficulty and a custom grid size at the same time";
    return false;
  }

  GameConfig resolved;
  if (!options.difficulty.empty()) {
    Difficulty difficulty;
    if (!ParseDifficulty(options.difficulty, &difficulty)) {
      *error = "Unknown difficulty '" + options.difficulty +
               "' (expected beginner, intermediate or expert)";
      return false;
    }
    resolved = PresetConfig(difficulty);
  } else {
    if (options.rows == 0 || options.cols == 0 || options.mines == 0) {
      *error = "Invalid number of rows, columns or mines";
      return false;
    }
    resolved = GameConfig{options.rows, options.cols, options.mines};
    if (!IsValidConfig(resolved)) {
      *error = "Number of mines must be less than number of cells";
      return false;
    }
  }

  if (!HasRoomForSafeZone(resolved)) {
    g_warning("%zu mines in a %zux%zu grid leave no room for a safe first "
              "move; only the first cell will be guaranteed safe",
              resolved.mines, resolved.rows, resolved.cols);
  }

  *config = resolved;
  return true;
}

}  // namespace sweeper
