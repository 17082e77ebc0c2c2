#ifndef SWEEPER_SOLVER_KNOWLEDGE_H_
#define SWEEPER_SOLVER_KNOWLEDGE_H_

#include <cstddef>
#include <vector>

#include "sweeper/game/game.h"
#include "sweeper/game/grid.h"

namespace sweeper {
namespace solver {

// Represents the row/col location of a cell.
struct CellLocation {
  std::size_t row;
  std::size_t col;
};

inline bool operator==(const CellLocation& a, const CellLocation& b) {
  return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const CellLocation& a, const CellLocation& b) {
  return !(a == b);
}

// Row-major ordering.
inline bool operator<(const CellLocation& a, const CellLocation& b) {
  return a.row < b.row || (a.row == b.row && a.col < b.col);
}

// Player knowledge about a game, built only from the events the game emits.
//
// Solvers reason over this view so they never see where the mines are.
//
// Terminology used by the queries below:
//   opened     - the cell is uncovered and its clue is known.
//   closed     - the cell is not opened (it may be flagged).
//   unresolved - the cell is closed and not flagged.
class Knowledge : public EventSubscriber {
 public:
  Knowledge(std::size_t rows, std::size_t cols);

  ~Knowledge() final = default;

  // Updates knowledge from a game event.
  void NotifyEvent(const Event& event) final;

  std::size_t GetRows() const { return grid_.GetRows(); }

  std::size_t GetCols() const { return grid_.GetCols(); }

  // Returns true once a WIN or LOSS event has been seen.
  bool IsGameOver() const { return game_over_; }

  CellState GetState(std::size_t row, std::size_t col) const {
    return grid_(row, col).state;
  }

  // Returns the clue of an opened cell.
  std::size_t GetAdjacentMines(std::size_t row, std::size_t col) const {
    return grid_(row, col).adjacent_mines;
  }

  bool IsOpened(std::size_t row, std::size_t col) const {
    return GetState(row, col) == CellState::UNCOVERED;
  }

  bool IsFlagged(std::size_t row, std::size_t col) const {
    return GetState(row, col) == CellState::FLAGGED;
  }

  bool IsUnresolved(std::size_t row, std::size_t col) const {
    return GetState(row, col) == CellState::COVERED;
  }

  // Counts the neighbours that are not opened, flagged ones included.
  std::size_t CountClosedAdjacent(std::size_t row, std::size_t col) const;

  // Counts the flagged neighbours.
  std::size_t CountFlaggedAdjacent(std::size_t row, std::size_t col) const;

  // Returns the unresolved neighbours in row-major order.
  std::vector<CellLocation> GetUnresolvedAdjacent(std::size_t row,
                                                  std::size_t col) const;

  // Returns the clue of an opened cell less its flagged neighbours, or zero
  // if the flags already account for the clue.
  std::size_t GetRemainingMines(std::size_t row, std::size_t col) const;

  // Counts the cells that are opened or flagged.
  std::size_t CountOpenedOrFlagged() const;

  // Returns all unresolved cells in row-major order.
  std::vector<CellLocation> GetUnresolved() const;

 private:
  struct Cell {
    CellState state = CellState::COVERED;

    // Only valid if the state is UNCOVERED.
    std::size_t adjacent_mines = 0;
  };

  Grid<Cell> grid_;
  bool game_over_;
};

}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_KNOWLEDGE_H_
