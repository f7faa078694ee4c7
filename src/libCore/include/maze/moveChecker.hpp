#pragma once

#include "maze/grid.hpp"
#include "maze/types.hpp"

#include <optional>

namespace maze {

//! Returns the neighbouring coordinate in the given direction. Empty if it leaves the grid.
std::optional<Coord> neighbour(const Grid& grid, Coord c, Direction dir);

//! True if a step from current in the given direction ends on a walkable cell.
bool isValidMove(const Grid& grid, Coord current, Direction dir);

//! Position after trying to step from current in the given direction.
//! \note Steps off the grid or into a wall are no-ops and return current unchanged.
Coord attemptMove(const Grid& grid, Coord current, Direction dir);

} // namespace maze
