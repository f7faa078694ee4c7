#pragma once

#include "maze/grid.hpp"
#include "maze/types.hpp"

#include <vector>

namespace maze {

//! Breadth first search through walkable cells.
//! \returns Path from `from` to `to` including both ends. Empty if unreachable or an end is a wall.
std::vector<Coord> shortestPath(const Grid& grid, Coord from, Coord to);

//! Direction of the step leading from one cell to an adjacent cell.
Direction directionBetween(Coord from, Coord to);

} // namespace maze
