#include "console/command.hpp"

#include <cctype>

namespace maze::console {

std::optional<Command> parseCommand(const char key) {
	switch (std::tolower(static_cast<unsigned char>(key))) {
	case 'w':
		return Command::Up;
	case 's':
		return Command::Down;
	case 'a':
		return Command::Left;
	case 'd':
		return Command::Right;
	case 'u':
		return Command::Undo;
	case 'h':
		return Command::Hint;
	case 'q':
		return Command::Quit;
	default:
		return std::nullopt;
	}
}

std::optional<Command> parseArrowKey(const char last) {
	switch (last) {
	case 'A':
		return Command::Up;
	case 'B':
		return Command::Down;
	case 'C':
		return Command::Right;
	case 'D':
		return Command::Left;
	default:
		return std::nullopt;
	}
}

std::optional<Direction> toDirection(const Command command) {
	switch (command) {
	case Command::Up:
		return Direction::Up;
	case Command::Down:
		return Direction::Down;
	case Command::Left:
		return Direction::Left;
	case Command::Right:
		return Direction::Right;
	default:
		return std::nullopt;
	}
}

std::string_view toString(const Direction dir) {
	switch (dir) {
	case Direction::Up:
		return "up";
	case Direction::Down:
		return "down";
	case Direction::Left:
		return "left";
	case Direction::Right:
		return "right";
	}
	return "";
}

} // namespace maze::console
