#ifndef SWEEPER_SOLVER_SOLVER_H_
#define SWEEPER_SOLVER_SOLVER_H_

#include <memory>
#include <vector>

#include "sweeper/game/game.h"

namespace sweeper {
namespace solver {

// Deduction algorithms.
enum class Algorithm {
  // Analyze each uncovered cell against its immediate neighbours.
  LOCAL,

  // Compare the neighbourhoods of pairs of uncovered cells.
  SUBSET,
};

class Solver : public EventSubscriber {
 public:
  virtual ~Solver() = default;

  // Recommends actions based on the Solver's current knowledge of the game.
  //
  // Every recommended action is forced by what is visible, and each cell
  // appears in at most one action, so executing all of them in order is safe.
  //
  // The Solver must return an empty vector to indicate that no progress can be
  // made.
  virtual std::vector<Action> Analyze() = 0;
};

// Creates a new solver for the specified algorithm.
//
// This solver will be automatically subscribed to the provided game and must
// be created before the first action is executed.
std::unique_ptr<Solver> New(Algorithm alg, Game& game);

}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_SOLVER_H_
