#include "maze/pathFinder.hpp"

#include "maze/moveChecker.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <deque>
#include <limits>

namespace maze {

static constexpr std::array<Direction, 4> kDirections{Direction::Up, Direction::Down, Direction::Left, Direction::Right};
static constexpr std::size_t kUnvisited = std::numeric_limits<std::size_t>::max();

std::vector<Coord> shortestPath(const Grid& grid, const Coord from, const Coord to) {
	if (!grid.isWalkable(from) || !grid.isWalkable(to)) {
		return {};
	}

	const auto width = grid.width();
	auto index       = [&](Coord c) { return c.row * width + c.col; };

	// Parent index of every reached cell. The start points to itself.
	std::vector<std::size_t> parent(grid.height() * width, kUnvisited);
	parent[index(from)] = index(from);

	std::deque<Coord> queue{from};
	while (!queue.empty() && parent[index(to)] == kUnvisited) {
		const auto c = queue.front();
		queue.pop_front();

		for (const auto dir: kDirections) {
			if (!isValidMove(grid, c, dir)) {
				continue;
			}
			const auto next = *neighbour(grid, c, dir);
			if (parent[index(next)] != kUnvisited) {
				continue;
			}
			parent[index(next)] = index(c);
			queue.push_back(next);
		}
	}

	if (parent[index(to)] == kUnvisited) {
		return {};
	}

	std::vector<Coord> path{to};
	for (auto i = index(to); i != index(from); i = parent[i]) {
		const auto p = parent[i];
		path.push_back(Coord{static_cast<Id>(p / width), static_cast<Id>(p % width)});
	}
	std::reverse(path.begin(), path.end());
	return path;
}

Direction directionBetween(const Coord from, const Coord to) {
	assert((from.row == to.row) != (from.col == to.col));

	if (to.row < from.row)
		return Direction::Up;
	if (to.row > from.row)
		return Direction::Down;
	if (to.col < from.col)
		return Direction::Left;
	return Direction::Right;
}

} // namespace maze
