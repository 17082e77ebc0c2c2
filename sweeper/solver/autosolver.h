#ifndef SWEEPER_SOLVER_AUTOSOLVER_H_
#define SWEEPER_SOLVER_AUTOSOLVER_H_

#include <cstddef>
#include <memory>
#include <vector>

#include "sweeper/game/game.h"
#include "sweeper/game/random.h"
#include "sweeper/solver/knowledge.h"
#include "sweeper/solver/solver.h"

namespace sweeper {
namespace solver {

// Plays a game to the end without human input.
//
// The first move is a random cell. After that the solver repeatedly applies
// local analysis (a mine pass, then a safe pass that sees the new flags)
// until it stops making progress, then tries the subset strategy, and only
// when that also finds nothing does it uncover a random unresolved cell. A
// guess may hit a mine; the solver never backtracks.
class AutoSolver {
 public:
  enum class State {
    // Solve has not been called.
    NOT_STARTED,

    // Solve is in progress.
    RUNNING,

    // The game ended in a win.
    WON,

    // The game ended in a loss.
    LOST,
  };

  // The number of actions taken by each strategy.
  struct Stats {
    std::size_t local_flags = 0;
    std::size_t local_uncovers = 0;
    std::size_t subset_flags = 0;
    std::size_t subset_uncovers = 0;

    // Includes the first move.
    std::size_t random_guesses = 0;
  };

  // Creates a solver for a game where no action has been executed yet.
  // Subscribes to the game. Both game and random must outlive the solver.
  AutoSolver(Game& game, Random& random);

  AutoSolver(const AutoSolver&) = delete;
  AutoSolver& operator=(const AutoSolver&) = delete;

  // Plays the game until it is over and returns true if it was won.
  //
  // Calling Solve again just returns the outcome.
  bool Solve();

  State GetState() const { return state_; }

  const Stats& GetStats() const { return stats_; }

 private:
  // Executes the actions, counting flags and uncovers.
  //
  // Returns false if there were no actions.
  bool Execute(const std::vector<Action>& actions, const char* strategy,
               std::size_t* flags, std::size_t* uncovers);

  // Uncovers a cell chosen uniformly among all cells (first move) or among
  // the unresolved cells.
  //
  // Returns false if there was nothing to uncover.
  bool Guess();

  Game& game_;
  Random& random_;
  Knowledge knowledge_;
  std::unique_ptr<Solver> subset_;
  State state_;
  Stats stats_;
};

}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_AUTOSOLVER_H_
