#include "sweeper/solver/local.h"

#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "sweeper/game/game.h"
#include "sweeper/game/random.h"
#include "sweeper/solver/knowledge.h"
#include "sweeper/solver/solver.h"
#include "sweeper/testing/boards.h"
#include "sweeper/testing/scripted_random.h"

namespace sweeper {
namespace solver {
namespace {

using ::sweeper::testing::ScriptedRandom;
using local::FindMines;
using local::FindSafe;
using ::sweeper::testing::kRidgeConfig;
using ::sweeper::testing::kRidgeMines;

void ExpectAction(const Action& action, Action::Type type, std::size_t row,
                  std::size_t col) {
  EXPECT_EQ(type, action.type);
  EXPECT_EQ(row, action.row);
  EXPECT_EQ(col, action.col);
}

TEST(LocalTest, FlagsCellWhenClueMatchesClosedNeighbours) {
  // Three uncovered 1s around a single covered corner.
  Knowledge knowledge(2, 2);
  knowledge.NotifyEvent(Event{Event::Type::UNCOVER, 0, 0, 1});
  knowledge.NotifyEvent(Event{Event::Type::UNCOVER, 0, 1, 1});
  knowledge.NotifyEvent(Event{Event::Type::UNCOVER, 1, 0, 1});

  const std::vector<Action> mines = FindMines(knowledge);
  // Each of the three cells implies the same mine; it is flagged once.
  ASSERT_EQ(1u, mines.size());
  ExpectAction(mines[0], Action::Type::FLAG, 1, 1);
  EXPECT_TRUE(FindSafe(knowledge).empty());
}

TEST(LocalTest, AlreadyFlaggedMinesAreNotToggled) {
  Knowledge knowledge(2, 2);
  knowledge.NotifyEvent(Event{Event::Type::UNCOVER, 0, 0, 1});
  knowledge.NotifyEvent(Event{Event::Type::UNCOVER, 0, 1, 1});
  knowledge.NotifyEvent(Event{Event::Type::UNCOVER, 1, 0, 1});
  knowledge.NotifyEvent(Event{Event::Type::FLAG, 1, 1, 0});

  EXPECT_TRUE(FindMines(knowledge).empty());
  EXPECT_TRUE(FindSafe(knowledge).empty());
}

TEST(LocalTest, UncoversWhenFlagsSatisfyClue) {
  // 1 at (0,0) with a flag at (1,0): (0,1) and (1,1) are safe.
  Knowledge knowledge(2, 2);
  knowledge.NotifyEvent(Event{Event::Type::UNCOVER, 0, 0, 1});
  knowledge.NotifyEvent(Event{Event::Type::FLAG, 1, 0, 0});

  const std::vector<Action> safe = FindSafe(knowledge);
  ASSERT_EQ(2u, safe.size());
  ExpectAction(safe[0], Action::Type::UNCOVER, 0, 1);
  ExpectAction(safe[1], Action::Type::UNCOVER, 1, 1);
}

TEST(LocalTest, SafePassUsesFlagsFromMinePass) {
  //   1 1 -
  //   1 - -
  Knowledge knowledge(2, 3);
  knowledge.NotifyEvent(Event{Event::Type::UNCOVER, 0, 0, 1});
  knowledge.NotifyEvent(Event{Event::Type::UNCOVER, 0, 1, 1});
  knowledge.NotifyEvent(Event{Event::Type::UNCOVER, 1, 0, 1});

  // Before the flag is placed the 1 at (0,1) says nothing.
  EXPECT_TRUE(FindSafe(knowledge).empty());

  const std::vector<Action> mines = FindMines(knowledge);
  ASSERT_EQ(1u, mines.size());
  ExpectAction(mines[0], Action::Type::FLAG, 1, 1);
  knowledge.NotifyEvent(Event{Event::Type::FLAG, 1, 1, 0});

  const std::vector<Action> safe = FindSafe(knowledge);
  ASSERT_EQ(2u, safe.size());
  ExpectAction(safe[0], Action::Type::UNCOVER, 0, 2);
  ExpectAction(safe[1], Action::Type::UNCOVER, 1, 2);
}

TEST(LocalTest, StuckOnRidgeUntilAMineIsFlagged) {
  ScriptedRandom random(kRidgeMines);
  std::unique_ptr<Game> game = NewGame(kRidgeConfig, random);
  std::unique_ptr<Solver> solver = New(Algorithm::LOCAL, *game);

  game->Reveal(1, 0);
  EXPECT_TRUE(solver->Analyze().empty());

  game->ToggleFlag(0, 3);
  const std::vector<Action> actions = solver->Analyze();
  ASSERT_EQ(1u, actions.size());
  ExpectAction(actions[0], Action::Type::UNCOVER, 1, 3);
}

TEST(LocalTest, SolverFinishesRidgeOnceMinesAreKnown) {
  ScriptedRandom random(kRidgeMines);
  std::unique_ptr<Game> game = NewGame(kRidgeConfig, random);
  std::unique_ptr<Solver> solver = New(Algorithm::LOCAL, *game);

  game->Reveal(1, 0);
  game->ToggleFlag(0, 3);
  game->ToggleFlag(2, 3);

  std::vector<Action> actions;
  do {
    actions = solver->Analyze();
    game->Execute(actions);
  } while (!actions.empty());

  EXPECT_TRUE(game->IsWin());
}

TEST(LocalTest, DeductionsAreSoundOnRandomBoards) {
  const GameConfig config = PresetConfig(Difficulty::INTERMEDIATE);
  for (unsigned seed = 0; seed < 20; ++seed) {
    std::unique_ptr<Random> random = NewRandom(seed);
    std::unique_ptr<Game> game = NewGame(config, *random);
    std::unique_ptr<Solver> solver = New(Algorithm::LOCAL, *game);
    game->Reveal(config.rows / 2, config.cols / 2);

    std::vector<Action> actions = solver->Analyze();
    while (!actions.empty() && !game->IsGameOver()) {
      for (const Action& action : actions) {
        EXPECT_EQ(action.type == Action::Type::FLAG,
                  game->GetCell(action.row, action.col).has_mine)
            << "seed " << seed << " at (" << action.row << ", " << action.col
            << ")";
      }
      game->Execute(actions);
      actions = solver->Analyze();
    }
    EXPECT_NE(Game::State::LOSS, game->GetState()) << "seed " << seed;
  }
}

}  // namespace
}  // namespace solver
}  // namespace sweeper
