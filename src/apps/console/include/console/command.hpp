#pragma once

#include "maze/types.hpp"

#include <optional>
#include <string_view>

namespace maze::console {

enum class Command { Up, Down, Left, Right, Undo, Hint, Quit };

constexpr char KEY_ESCAPE = '\x1b';

//! Map a key to its command. Case insensitive. Empty for unknown keys.
std::optional<Command> parseCommand(char key);

//! Map the final byte of an arrow key sequence (ESC '[' A..D) to its command.
std::optional<Command> parseArrowKey(char last);

//! Movement direction of a command. Empty for non movement commands.
std::optional<Direction> toDirection(Command command);

std::string_view toString(Direction dir);

} // namespace maze::console
