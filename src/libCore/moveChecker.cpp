#include "maze/moveChecker.hpp"

namespace maze {

std::optional<Coord> neighbour(const Grid& grid, const Coord c, const Direction dir) {
	const int nr = static_cast<int>(c.row) + rowOffset(dir);
	const int nc = static_cast<int>(c.col) + colOffset(dir);
	if (!grid.contains(nr, nc)) {
		return std::nullopt;
	}

	return Coord{static_cast<Id>(nr), static_cast<Id>(nc)};
}

bool isValidMove(const Grid& grid, const Coord current, const Direction dir) {
	const auto candidate = neighbour(grid, current, dir);
	return candidate && grid.cellAt(*candidate) != Grid::Cell::Wall;
}

Coord attemptMove(const Grid& grid, const Coord current, const Direction dir) {
	if (!isValidMove(grid, current, dir)) {
		return current;
	}
	return *neighbour(grid, current, dir);
}

} // namespace maze
