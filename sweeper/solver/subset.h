#ifndef SWEEPER_SOLVER_SUBSET_H_
#define SWEEPER_SOLVER_SUBSET_H_

#include <memory>
#include <vector>

#include "sweeper/game/game.h"
#include "sweeper/solver/knowledge.h"
#include "sweeper/solver/solver.h"

namespace sweeper {
namespace solver {
namespace subset {

// Compares every pair of uncovered cells A and B that both still need mines.
//
// Let U(X) be the unresolved neighbours of X and r(X) its clue less its
// flagged neighbours, labelled so that r(A) >= r(B). If
//   r(A) - r(B) == |U(A) \ U(B)|
// then the mines A needs beyond those B can supply must fill U(A) \ U(B), so
// all of those cells are flagged and all of U(B) \ U(A) is uncovered. Pairs
// with identical unresolved sets carry no information and are skipped.
std::vector<Action> FindDifferences(const Knowledge& knowledge);

// Provides a solver that recommends the actions found by FindDifferences.
//
// The solver is not subscribed to the game; use solver::New for that.
std::unique_ptr<Solver> New(Game& game);

}  // namespace subset
}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_SUBSET_H_
