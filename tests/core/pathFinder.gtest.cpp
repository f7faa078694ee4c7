#include "maze/layout.hpp"
#include "maze/pathFinder.hpp"

#include <cstdlib>
#include <gtest/gtest.h>

namespace maze::gtest {

TEST(PathFinder, StraightLine) {
	const auto grid = parseLayout("S...G\n");
	const auto path = shortestPath(grid, grid.start(), grid.goal());

	ASSERT_EQ(path.size(), 5u);
	for (Id col = 0; col != 5; ++col) {
		EXPECT_EQ(path[col], (Coord{0u, col}));
	}
}

TEST(PathFinder, AroundWalls) {
	const auto grid = parseLayout("S#...\n"
	                              ".#.#.\n"
	                              "...#G\n");
	const auto path = shortestPath(grid, grid.start(), grid.goal());

	// Down twice, right twice, up twice, right twice, down twice.
	ASSERT_EQ(path.size(), 11u);
	EXPECT_EQ(path.front(), grid.start());
	EXPECT_EQ(path.back(), grid.goal());

	// Every step is one cell on a walkable field.
	for (std::size_t i = 1; i < path.size(); ++i) {
		EXPECT_TRUE(grid.isWalkable(path[i]));
		const auto dr = static_cast<int>(path[i].row) - static_cast<int>(path[i - 1].row);
		const auto dc = static_cast<int>(path[i].col) - static_cast<int>(path[i - 1].col);
		EXPECT_EQ(std::abs(dr) + std::abs(dc), 1);
	}
}

TEST(PathFinder, ShortestOfSeveral) {
	const auto grid = parseLayout("S....\n"
	                              ".###.\n"
	                              "....G\n");
	EXPECT_EQ(shortestPath(grid, grid.start(), grid.goal()).size(), 7u);
}

TEST(PathFinder, Unreachable) {
	const auto grid = Grid(1u, 3u, {Grid::Cell::Start, Grid::Cell::Wall, Grid::Cell::Goal});
	EXPECT_TRUE(shortestPath(grid, grid.start(), grid.goal()).empty());
}

TEST(PathFinder, WallOrOutsideEndpoint) {
	const auto grid = parseLayout("S#G\n...\n");
	EXPECT_TRUE(shortestPath(grid, grid.start(), {0u, 1u}).empty());
	EXPECT_TRUE(shortestPath(grid, {0u, 1u}, grid.goal()).empty());
	EXPECT_TRUE(shortestPath(grid, grid.start(), {7u, 7u}).empty());
}

TEST(PathFinder, SameCell) {
	const auto grid = parseLayout("S.G\n");
	const auto path = shortestPath(grid, {0u, 1u}, {0u, 1u});
	ASSERT_EQ(path.size(), 1u);
	EXPECT_EQ(path.front(), (Coord{0u, 1u}));
}

TEST(PathFinder, DirectionBetween) {
	EXPECT_EQ(directionBetween({1u, 1u}, {0u, 1u}), Direction::Up);
	EXPECT_EQ(directionBetween({1u, 1u}, {2u, 1u}), Direction::Down);
	EXPECT_EQ(directionBetween({1u, 1u}, {1u, 0u}), Direction::Left);
	EXPECT_EQ(directionBetween({1u, 1u}, {1u, 2u}), Direction::Right);
}

} // namespace maze::gtest
