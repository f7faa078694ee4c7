#pragma once

#include <cstdint>

namespace maze {

using Id = unsigned; //!< Grid index used by the core library.

//! Coordinate pair on the grid. Origin is the top left cell.
struct Coord {
	Id row, col;

	bool operator==(const Coord&) const = default;
};

enum class Direction { Up, Down, Left, Right };

enum class GameStatus {
	Running, //!< Player is still looking for the goal.
	Won      //!< Goal reached. Terminal.
};

enum GameSignal : uint64_t {
	GS_None           = 0,
	GS_PositionChange = 1 << 0, //!< Player moved.
	GS_MoveRejected   = 1 << 1, //!< Move hit a wall or the border.
	GS_StateChange    = 1 << 2, //!< Game state changed. Goal reached.
	GS_NothingToUndo  = 1 << 3, //!< Undo requested with an empty history.
};

//! Returns the row/column offset of one step in the given direction.
inline constexpr int rowOffset(const Direction dir) {
	return dir == Direction::Up ? -1 : (dir == Direction::Down ? 1 : 0);
}
inline constexpr int colOffset(const Direction dir) {
	return dir == Direction::Left ? -1 : (dir == Direction::Right ? 1 : 0);
}

} // namespace maze
