#ifndef SWEEPER_SOLVER_ACTION_COLLECTOR_H_
#define SWEEPER_SOLVER_ACTION_COLLECTOR_H_

#include <cstddef>
#include <utility>
#include <vector>

#include "sweeper/game/game.h"
#include "sweeper/solver/knowledge.h"

namespace sweeper {
namespace solver {

// Collects recommended actions, at most one per cell.
//
// A FLAG action is a toggle, so recommending it twice for the same cell would
// undo it. Later recommendations for a cell that already has an action are
// dropped.
class ActionCollector {
 public:
  explicit ActionCollector(const Knowledge& knowledge)
      : cols_(knowledge.GetCols()),
        have_action_(knowledge.GetRows() * knowledge.GetCols(), false) {}

  void Add(Action::Type type, const CellLocation& location) {
    const std::size_t index = location.row * cols_ + location.col;
    if (!have_action_[index]) {
      have_action_[index] = true;
      actions_.push_back(Action{type, location.row, location.col});
    }
  }

  std::vector<Action>&& MoveActions() { return std::move(actions_); }

 private:
  const std::size_t cols_;
  std::vector<bool> have_action_;
  std::vector<Action> actions_;
};

}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_ACTION_COLLECTOR_H_
