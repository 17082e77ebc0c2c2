#include "sweeper/game/config.h"

#include <string>

#include <gtest/gtest.h>

namespace sweeper {
namespace {

void ExpectConfig(const GameConfig& config, std::size_t rows, std::size_t cols,
                  std::size_t mines) {
  EXPECT_EQ(rows, config.rows);
  EXPECT_EQ(cols, config.cols);
  EXPECT_EQ(mines, config.mines);
}

TEST(ConfigTest, Presets) {
  ExpectConfig(PresetConfig(Difficulty::BEGINNER), 9, 9, 10);
  ExpectConfig(PresetConfig(Difficulty::INTERMEDIATE), 16, 16, 40);
  ExpectConfig(PresetConfig(Difficulty::EXPERT), 16, 30, 99);
}

TEST(ConfigTest, ParseDifficultyRoundTripsNames) {
  for (Difficulty difficulty : {Difficulty::BEGINNER, Difficulty::INTERMEDIATE,
                                Difficulty::EXPERT}) {
    Difficulty parsed;
    ASSERT_TRUE(ParseDifficulty(DifficultyName(difficulty), &parsed));
    EXPECT_EQ(difficulty, parsed);
  }
  Difficulty parsed;
  EXPECT_FALSE(ParseDifficulty("easy", &parsed));
}

TEST(ConfigTest, ResolvesDifficulty) {
  ConfigOptions options;
  options.difficulty = "intermediate";
  GameConfig config;
  std::string error;
  ASSERT_TRUE(ResolveConfig(options, &config, &error));
  ExpectConfig(config, 16, 16, 40);
}

TEST(ConfigTest, ResolvesCustomSize) {
  ConfigOptions options;
  options.rows = 5;
  options.cols = 7;
  options.mines = 6;
  GameConfig config;
  std::string error;
  ASSERT_TRUE(ResolveConfig(options, &config, &error));
  ExpectConfig(config, 5, 7, 6);
}

TEST(ConfigTest, RejectsMissingOptions) {
  GameConfig config;
  std::string error;
  EXPECT_FALSE(ResolveConfig(ConfigOptions(), &config, &error));
  EXPECT_FALSE(error.empty());
}

TEST(ConfigTest, RejectsDifficultyWithCustomSize) {
  ConfigOptions options;
  options.difficulty = "beginner";
  options.mines = 3;
  GameConfig config;
  std::string error;
  EXPECT_FALSE(ResolveConfig(options, &config, &error));
  EXPECT_NE(std::string::npos, error.find("same time"));
}

TEST(ConfigTest, RejectsUnknownDifficulty) {
  ConfigOptions options;
  options.difficulty = "hard";
  GameConfig config;
  std::string error;
  EXPECT_FALSE(ResolveConfig(options, &config, &error));
  EXPECT_NE(std::string::npos, error.find("hard"));
}

TEST(ConfigTest, RejectsPartialCustomSize) {
  ConfigOptions options;
  options.rows = 5;
  options.cols = 5;
  GameConfig config;
  std::string error;
  EXPECT_FALSE(ResolveConfig(options, &config, &error));
}

TEST(ConfigTest, RejectsTooManyMines) {
  ConfigOptions options;
  options.rows = 3;
  options.cols = 3;
  options.mines = 9;
  GameConfig config = {1, 1, 1};
  std::string error;
  EXPECT_FALSE(ResolveConfig(options, &config, &error));
  // Not written on failure.
  ExpectConfig(config, 1, 1, 1);
}

TEST(ConfigTest, AcceptsCrowdedGridWithoutSafeZone) {
  ConfigOptions options;
  options.rows = 3;
  options.cols = 3;
  options.mines = 8;
  GameConfig config;
  std::string error;
  ASSERT_TRUE(ResolveConfig(options, &config, &error));
  EXPECT_FALSE(HasRoomForSafeZone(config));
  EXPECT_TRUE(HasRoomForSafeZone(PresetConfig(Difficulty::EXPERT)));
}

TEST(ConfigTest, IsValidConfig) {
  EXPECT_TRUE(IsValidConfig(GameConfig{2, 2, 3}));
  EXPECT_FALSE(IsValidConfig(GameConfig{0, 2, 1}));
  EXPECT_FALSE(IsValidConfig(GameConfig{2, 0, 1}));
  EXPECT_FALSE(IsValidConfig(GameConfig{2, 2, 0}));
  EXPECT_FALSE(IsValidConfig(GameConfig{2, 2, 4}));
}

}  // namespace
}  // namespace sweeper
