#include "sweeper/solver/knowledge.h"

namespace sweeper {
namespace solver {

Knowledge::Knowledge(std::size_t rows, std::size_t cols)
    : grid_(rows, cols), game_over_(false) {}

void Knowledge::NotifyEvent(const Event& event) {
  if (!grid_.IsValid(event.row, event.col)) {
    return;
  }
  Cell& cell = grid_(event.row, event.col);
  switch (event.type) {
    case Event::Type::UNCOVER:
      cell.state = CellState::UNCOVERED;
      cell.adjacent_mines = event.adjacent_mines;
      break;
    case Event::Type::FLAG:
      cell.state = CellState::FLAGGED;
      break;
    case Event::Type::UNFLAG:
      cell.state = CellState::COVERED;
      break;
    case Event::Type::SHOW_MINE:
      cell.state = CellState::MINE;
      break;
    case Event::Type::BAD_FLAG:
      cell.state = CellState::BAD_FLAG;
      break;
    case Event::Type::WIN:
      game_over_ = true;
      break;
    case Event::Type::LOSS:
      game_over_ = true;
      cell.state = CellState::LOSING_MINE;
      break;
  }
}

std::size_t Knowledge::CountClosedAdjacent(std::size_t row,
                                           std::size_t col) const {
  return grid_.ForEachAdjacent(row, col,
                               [this](std::size_t row, std::size_t col) {
                                 return !IsOpened(row, col);
                               });
}

std::size_t Knowledge::CountFlaggedAdjacent(std::size_t row,
                                            std::size_t col) const {
  return grid_.ForEachAdjacent(row, col,
                               [this](std::size_t row, std::size_t col) {
                                 return IsFlagged(row, col);
                               });
}

std::vector<CellLocation> Knowledge::GetUnresolvedAdjacent(
    std::size_t row, std::size_t col) const {
  std::vector<CellLocation> locations;
  grid_.ForEachAdjacent(
      row, col, [this, &locations](std::size_t row, std::size_t col) {
        if (IsUnresolved(row, col)) {
          locations.push_back({row, col});
        }
        return false;
      });
  return locations;
}

std::size_t Knowledge::GetRemainingMines(std::size_t row,
                                         std::size_t col) const {
  const std::size_t mines = GetAdjacentMines(row, col);
  const std::size_t flags = CountFlaggedAdjacent(row, col);
  return flags <= mines ? mines - flags : 0;
}

std::size_t Knowledge::CountOpenedOrFlagged() const {
  std::size_t count = 0;
  grid_.ForEach(
      [&count](std::size_t, std::size_t, const Cell& cell) {
        if (cell.state == CellState::UNCOVERED ||
            cell.state == CellState::FLAGGED) {
          ++count;
        }
      });
  return count;
}

std::vector<CellLocation> Knowledge::GetUnresolved() const {
  std::vector<CellLocation> locations;
  grid_.ForEach(
      [&locations](std::size_t row, std::size_t col, const Cell& cell) {
        if (cell.state == CellState::COVERED) {
          locations.push_back({row, col});
        }
      });
  return locations;
}

}  // namespace solver
}  // namespace sweeper
