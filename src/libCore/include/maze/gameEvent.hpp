#pragma once

#include "maze/types.hpp"

#include <variant>

namespace maze {

struct MoveEvent {
	Direction dir;
};
struct UndoEvent {};
struct QuitEvent {};

using GameEvent = std::variant<MoveEvent, UndoEvent, QuitEvent>;

} // namespace maze
