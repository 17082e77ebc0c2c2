#include "sweeper/solver/subset.h"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

#include "sweeper/compat/make_unique.h"
#include "sweeper/solver/action_collector.h"

namespace sweeper {
namespace solver {
namespace subset {

namespace {

// An uncovered cell with mines left to find among its unresolved neighbours.
struct Constraint {
  CellLocation location;

  // The clue less the flagged neighbours. Always positive.
  std::size_t mines;

  // The unresolved neighbours in row-major order.
  std::vector<CellLocation> unresolved;
};

// Returns the locations in a that are not in b. Both must be sorted.
std::vector<CellLocation> Difference(const std::vector<CellLocation>& a,
                                     const std::vector<CellLocation>& b) {
  std::vector<CellLocation> result;
  std::set_difference(a.begin(), a.end(), b.begin(), b.end(),
                      std::back_inserter(result));
  return result;
}

// Returns true if the two cells are close enough to share a neighbour.
bool MayOverlap(const CellLocation& a, const CellLocation& b) {
  const std::size_t dr = a.row > b.row ? a.row - b.row : b.row - a.row;
  const std::size_t dc = a.col > b.col ? a.col - b.col : b.col - a.col;
  return dr <= 2 && dc <= 2;
}

std::vector<Constraint> MakeConstraints(const Knowledge& knowledge) {
  std::vector<Constraint> constraints;
  for (std::size_t row = 0; row < knowledge.GetRows(); ++row) {
    for (std::size_t col = 0; col < knowledge.GetCols(); ++col) {
      if (!knowledge.IsOpened(row, col)) {
        continue;
      }
      const std::size_t mines = knowledge.GetRemainingMines(row, col);
      if (mines == 0) {
        continue;
      }
      constraints.push_back(Constraint{
          CellLocation{row, col}, mines,
          knowledge.GetUnresolvedAdjacent(row, col)});
    }
  }
  return constraints;
}

// Applies the rule to a pair where a needs at least as many mines as b.
void Compare(const Constraint& a, const Constraint& b,
             ActionCollector& collector) {
  if (a.unresolved == b.unresolved) {
    return;
  }
  const std::vector<CellLocation> a_only = Difference(a.unresolved,
                                                      b.unresolved);
  if (a.mines - b.mines != a_only.size()) {
    return;
  }
  for (const CellLocation& location : a_only) {
    collector.Add(Action::Type::FLAG, location);
  }
  for (const CellLocation& location : Difference(b.unresolved, a.unresolved)) {
    collector.Add(Action::Type::UNCOVER, location);
  }
}

void CollectDifferences(const Knowledge& knowledge,
                        ActionCollector& collector) {
  const std::vector<Constraint> constraints = MakeConstraints(knowledge);
  for (std::size_t i = 0; i < constraints.size(); ++i) {
    for (std::size_t j = i + 1; j < constraints.size(); ++j) {
      // With mines left on both sides, the rule never holds for two cells
      // whose neighbourhoods are disjoint.
      if (!MayOverlap(constraints[i].location, constraints[j].location)) {
        continue;
      }
      const Constraint* a = &constraints[i];
      const Constraint* b = &constraints[j];
      if (a->mines < b->mines) {
        std::swap(a, b);
      }
      Compare(*a, *b, collector);
      if (a->mines == b->mines) {
        Compare(*b, *a, collector);
      }
    }
  }
}

class SubsetSolver : public Solver {
 public:
  SubsetSolver(std::size_t rows, std::size_t cols) : knowledge_(rows, cols) {}

  ~SubsetSolver() final = default;

  void NotifyEvent(const Event& event) final { knowledge_.NotifyEvent(event); }

  std::vector<Action> Analyze() final {
    ActionCollector collector(knowledge_);
    if (!knowledge_.IsGameOver()) {
      CollectDifferences(knowledge_, collector);
    }
    return collector.MoveActions();
  }

 private:
  Knowledge knowledge_;
};

}  // namespace

std::vector<Action> FindDifferences(const Knowledge& knowledge) {
  ActionCollector collector(knowledge);
  CollectDifferences(knowledge, collector);
  return collector.MoveActions();
}

std::unique_ptr<Solver> New(Game& game) {
  return MakeUnique<SubsetSolver>(game.GetRows(), game.GetCols());
}

}  // namespace subset
}  // namespace solver
}  // namespace sweeper
