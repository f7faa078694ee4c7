#pragma once

#include "maze/types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace maze {

//! Thrown when querying a cell outside of the grid.
class BoundsError : public std::out_of_range {
public:
	using std::out_of_range::out_of_range;
};

//! Thrown when a maze layout violates the grid invariants.
class LayoutError : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

//! Immutable maze layout of fixed size.
class Grid {
public:
	enum class Cell { Wall, Open, Start, Goal };

public:
	//! Cells are given row by row. Requires exactly one Start and one Goal cell.
	Grid(std::size_t height, std::size_t width, std::vector<Cell> cells);

	std::size_t height() const;
	std::size_t width() const;

	Cell cellAt(Coord c) const;            //!< Cell at (row, col). Throws BoundsError if outside the grid.
	bool contains(int row, int col) const; //!< True if (row, col) lies inside the grid.
	bool isWalkable(Coord c) const;        //!< True if inside the grid and not a wall.

	Coord start() const;
	Coord goal() const;

private:
	std::size_t m_height;      //!< Number of rows.
	std::size_t m_width;       //!< Number of columns.
	std::vector<Cell> m_cells; //!< Row major cell data.
	Coord m_start{0u, 0u};
	Coord m_goal{0u, 0u};
};

} // namespace maze
