#include "sweeper/solver/local.h"

#include <cstddef>

#include "sweeper/compat/make_unique.h"
#include "sweeper/solver/action_collector.h"

namespace sweeper {
namespace solver {
namespace local {

namespace {

void CollectMines(const Knowledge& knowledge, ActionCollector& collector) {
  for (std::size_t row = 0; row < knowledge.GetRows(); ++row) {
    for (std::size_t col = 0; col < knowledge.GetCols(); ++col) {
      if (!knowledge.IsOpened(row, col)) {
        continue;
      }
      // The clue matches the closed neighbours: all of them are mines.
      const std::size_t mines = knowledge.GetAdjacentMines(row, col);
      if (mines == 0 || mines != knowledge.CountClosedAdjacent(row, col)) {
        continue;
      }
      for (const CellLocation& location :
           knowledge.GetUnresolvedAdjacent(row, col)) {
        collector.Add(Action::Type::FLAG, location);
      }
    }
  }
}

void CollectSafe(const Knowledge& knowledge, ActionCollector& collector) {
  for (std::size_t row = 0; row < knowledge.GetRows(); ++row) {
    for (std::size_t col = 0; col < knowledge.GetCols(); ++col) {
      if (!knowledge.IsOpened(row, col)) {
        continue;
      }
      // The flags already satisfy the clue: everything else is safe.
      if (knowledge.GetAdjacentMines(row, col) !=
          knowledge.CountFlaggedAdjacent(row, col)) {
        continue;
      }
      for (const CellLocation& location :
           knowledge.GetUnresolvedAdjacent(row, col)) {
        collector.Add(Action::Type::UNCOVER, location);
      }
    }
  }
}

class LocalSolver : public Solver {
 public:
  LocalSolver(std::size_t rows, std::size_t cols) : knowledge_(rows, cols) {}

  ~LocalSolver() final = default;

  void NotifyEvent(const Event& event) final { knowledge_.NotifyEvent(event); }

  std::vector<Action> Analyze() final {
    ActionCollector collector(knowledge_);
    if (!knowledge_.IsGameOver()) {
      CollectMines(knowledge_, collector);
      CollectSafe(knowledge_, collector);
    }
    return collector.MoveActions();
  }

 private:
  Knowledge knowledge_;
};

}  // namespace

std::vector<Action> FindMines(const Knowledge& knowledge) {
  ActionCollector collector(knowledge);
  CollectMines(knowledge, collector);
  return collector.MoveActions();
}

std::vector<Action> FindSafe(const Knowledge& knowledge) {
  ActionCollector collector(knowledge);
  CollectSafe(knowledge, collector);
  return collector.MoveActions();
}

std::unique_ptr<Solver> New(Game& game) {
  return MakeUnique<LocalSolver>(game.GetRows(), game.GetCols());
}

}  // namespace local
}  // namespace solver
}  // namespace sweeper
