#ifndef SWEEPER_SOLVER_LOCAL_H_
#define SWEEPER_SOLVER_LOCAL_H_

#include <memory>
#include <vector>

#include "sweeper/game/game.h"
#include "sweeper/solver/knowledge.h"
#include "sweeper/solver/solver.h"

namespace sweeper {
namespace solver {
namespace local {

// Returns FLAG actions for the unresolved neighbours of every uncovered cell
// whose clue equals its number of closed (covered or flagged) neighbours.
std::vector<Action> FindMines(const Knowledge& knowledge);

// Returns UNCOVER actions for the unresolved neighbours of every uncovered
// cell whose clue equals its number of flagged neighbours.
std::vector<Action> FindSafe(const Knowledge& knowledge);

// Provides a solver that produces actions from local analysis of a cell and
// its immediate neighbors.
//
// This solver is capable of:
//  - Flagging cells when the number of covered adjacent cells matches the
//    number of adjacent mines.
//  - Uncovering adjacent cells when the number of flagged adjacent cells
//    matches the number of adjacent mines.
//
// Flags are recommended before uncovers. This solver will not find solutions
// that require reasoning about two or more cells simultaneously.
//
// The solver is not subscribed to the game; use solver::New for that.
std::unique_ptr<Solver> New(Game& game);

}  // namespace local
}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_LOCAL_H_
