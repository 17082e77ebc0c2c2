#include "sweeper/game/grid.h"

#include <cstddef>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace sweeper {
namespace {

std::size_t CountAdjacent(const Grid<int>& grid, std::size_t row,
                          std::size_t col) {
  return grid.ForEachAdjacent(
      row, col, [](std::size_t, std::size_t) { return true; });
}

TEST(GridTest, AdjacentCountsAtCornersEdgesAndInterior) {
  Grid<int> grid(4, 5);
  EXPECT_EQ(3u, CountAdjacent(grid, 0, 0));
  EXPECT_EQ(3u, CountAdjacent(grid, 3, 4));
  EXPECT_EQ(5u, CountAdjacent(grid, 0, 2));
  EXPECT_EQ(5u, CountAdjacent(grid, 2, 4));
  EXPECT_EQ(8u, CountAdjacent(grid, 2, 2));
}

TEST(GridTest, AdjacentCellsAreRowMajorAndExcludeCenter) {
  Grid<int> grid(3, 3);
  std::vector<std::pair<std::size_t, std::size_t>> visited;
  grid.ForEachAdjacent(1, 1, [&visited](std::size_t row, std::size_t col) {
    visited.push_back(std::make_pair(row, col));
    return false;
  });

  const std::vector<std::pair<std::size_t, std::size_t>> expected = {
      {0, 0}, {0, 1}, {0, 2}, {1, 0}, {1, 2}, {2, 0}, {2, 1}, {2, 2}};
  EXPECT_EQ(expected, visited);
}

TEST(GridTest, SingleCellGridHasNoNeighbours) {
  Grid<int> grid(1, 1);
  EXPECT_EQ(0u, CountAdjacent(grid, 0, 0));
}

TEST(GridTest, IndexConversions) {
  Grid<int> grid(3, 7);
  EXPECT_EQ(21u, grid.GetSize());
  EXPECT_EQ(16u, grid.Index(2, 2));
  EXPECT_EQ(2u, grid.Row(16));
  EXPECT_EQ(2u, grid.Col(16));
  EXPECT_TRUE(grid.IsValid(2, 6));
  EXPECT_FALSE(grid.IsValid(3, 0));
  EXPECT_FALSE(grid.IsValid(0, 7));
}

TEST(GridTest, CellsAreValueInitializedAndAddressable) {
  Grid<int> grid(2, 2);
  grid.ForEach([](std::size_t, std::size_t, int& cell) {
    EXPECT_EQ(0, cell);
  });
  grid(1, 0) = 5;
  EXPECT_EQ(5, grid[2]);
}

TEST(GridTest, IsAdjacent) {
  EXPECT_TRUE(Grid<int>::IsAdjacent(1, 1, 0, 0));
  EXPECT_TRUE(Grid<int>::IsAdjacent(1, 1, 2, 1));
  EXPECT_FALSE(Grid<int>::IsAdjacent(1, 1, 1, 1));
  EXPECT_FALSE(Grid<int>::IsAdjacent(1, 1, 3, 1));
  EXPECT_FALSE(Grid<int>::IsAdjacent(0, 0, 0, 2));
}

}  // namespace
}  // namespace sweeper
