#ifndef SWEEPER_GAME_GRID_H_
#define SWEEPER_GAME_GRID_H_

#include <cstddef>
#include <memory>

namespace sweeper {

// A dense, row-major, two dimensional arena of Cells.
//
// Cells are addressed either by (row, col) or by their flat index
// row * cols + col. Neighbourhoods are derived from coordinates on demand, so
// cells never hold references to one another.
template <typename Cell>
class Grid {
 public:
  Grid() : Grid(0, 0) {}

  Grid(std::size_t rows, std::size_t cols) { Reset(rows, cols); }

  ~Grid() = default;

  // Copying would need a deep copy of the arena; only moves are supported.
  Grid(const Grid&) = delete;
  Grid& operator=(const Grid&) = delete;

  Grid(Grid&&) = default;
  Grid& operator=(Grid&&) = default;

  // Replaces all cells with default constructed cells at the new dimensions.
  void Reset(std::size_t rows, std::size_t cols) {
    rows_ = rows;
    cols_ = cols;
    if (rows > 0 && cols > 0) {
      cells_.reset(new Cell[rows * cols]());
    } else {
      cells_.reset();
    }
  }

  std::size_t GetRows() const { return rows_; }

  std::size_t GetCols() const { return cols_; }

  // Returns the total number of cells.
  std::size_t GetSize() const { return rows_ * cols_; }

  // Returns true if the given row and column are inside the grid.
  bool IsValid(std::size_t row, std::size_t col) const {
    return row < rows_ && col < cols_;
  }

  // Converts between (row, col) and flat indexes.
  std::size_t Index(std::size_t row, std::size_t col) const {
    return row * cols_ + col;
  }
  std::size_t Row(std::size_t index) const { return index / cols_; }
  std::size_t Col(std::size_t index) const { return index % cols_; }

  const Cell& operator()(std::size_t row, std::size_t col) const {
    return cells_[Index(row, col)];
  }

  Cell& operator()(std::size_t row, std::size_t col) {
    return cells_[Index(row, col)];
  }

  const Cell& operator[](std::size_t index) const { return cells_[index]; }

  Cell& operator[](std::size_t index) { return cells_[index]; }

  // Calls the provided function object for each Cell in row-major order.
  //
  // The function should be callable as:
  //   fn(row, col, cell);
  template <class Fn>
  void ForEach(Fn fn) {
    for (std::size_t row = 0; row < rows_; ++row) {
      for (std::size_t col = 0; col < cols_; ++col) {
        fn(row, col, cells_[Index(row, col)]);
      }
    }
  }

  template <class Fn>
  void ForEach(Fn fn) const {
    for (std::size_t row = 0; row < rows_; ++row) {
      for (std::size_t col = 0; col < cols_; ++col) {
        fn(row, col, cells_[Index(row, col)]);
      }
    }
  }

  // Calls the provided function object for each of the up to eight valid
  // adjacent cells, in row-major order.
  //
  // The function should be callable as:
  //   bool v = fn(row, col);
  //
  // Returns the number of function calls that returned true.
  template <class Fn>
  std::size_t ForEachAdjacent(std::size_t row, std::size_t col, Fn fn) const {
    // Relies on unsigned wrap-around: row - 1 for row 0 is never valid.
    std::size_t count = 0;
    for (std::size_t r = row - 1; r != row + 2; ++r) {
      for (std::size_t c = col - 1; c != col + 2; ++c) {
        if ((r != row || c != col) && IsValid(r, c) && fn(r, c)) {
          ++count;
        }
      }
    }
    return count;
  }

  // Returns true if (row2, col2) is one of the cells adjacent to (row1, col1).
  static bool IsAdjacent(std::size_t row1, std::size_t col1, std::size_t row2,
                         std::size_t col2) {
    const std::size_t dr = row1 > row2 ? row1 - row2 : row2 - row1;
    const std::size_t dc = col1 > col2 ? col1 - col2 : col2 - col1;
    return dr <= 1 && dc <= 1 && (dr != 0 || dc != 0);
  }

 private:
  std::size_t rows_;
  std::size_t cols_;
  std::unique_ptr<Cell[]> cells_;
};

}  // namespace sweeper

#endif  // SWEEPER_GAME_GRID_H_
