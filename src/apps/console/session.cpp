#include "console/session.hpp"

#include "Logging.hpp"

#include <cctype>
#include <format>
#include <string>

namespace maze::console {

Session::Session(Game& game, const ConsoleConfig& config, std::ostream& out)
    : m_game(game), m_config(config), m_out(out), m_view(game, out, config.clearScreen) {
	m_game.subscribeSignals(&m_view, GS_PositionChange | GS_MoveRejected | GS_StateChange | GS_NothingToUndo);
}

Session::~Session() {
	m_game.unsubscribeSignals(&m_view);
}

int Session::run(std::istream& in) {
	const auto& grid = m_game.grid();
	Logger().Log(Logging::LogLevel::Info, std::format("[Session] Started on {}x{} maze.", grid.height(), grid.width()));

	m_view.draw();
	while (m_game.isActive()) {
		m_out << m_config.prompt << std::flush;

		std::optional<Command> command;
		if (!readCommand(in, command)) {
			Logger().Log(Logging::LogLevel::Info, "[Session] Input closed. Quitting.");
			m_game.pushEvent(QuitEvent{});
			break;
		}
		if (!command) {
			continue;
		}
		handleCommand(*command);
	}

	if (m_game.status() == GameStatus::Won) {
		Logger().Log(Logging::LogLevel::Info, std::format("[Session] Goal reached after {} moves.", m_game.moveCount()));
	}
	return 0;
}

bool Session::readCommand(std::istream& in, std::optional<Command>& command) {
	char key = 0;
	if (!(in >> key)) {
		return false;
	}

	if (key != KEY_ESCAPE) {
		command = parseCommand(key);
		if (!command) {
			Logger().Log(Logging::LogLevel::Debug, std::format("[Session] Ignoring unknown key {:#04x}.", static_cast<unsigned char>(key)));
			if (std::isprint(static_cast<unsigned char>(key))) {
				m_out << std::format("Unknown command '{}'.\n", key);
			} else {
				m_out << "Unknown command.\n";
			}
		}
		return true;
	}

	// Lone escape or an unsupported sequence is dropped as a whole.
	if (in.peek() != '[') {
		Logger().Log(Logging::LogLevel::Debug, "[Session] Ignoring escape key.");
		m_out << "Unknown command.\n";
		return true;
	}
	in.get();

	const auto last = in.get();
	if (last == std::char_traits<char>::eof()) {
		return false;
	}
	command = parseArrowKey(static_cast<char>(last));
	if (!command) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Session] Ignoring escape sequence ending in {:#04x}.", last));
		m_out << "Unknown command.\n";
	}
	return true;
}

void Session::handleCommand(const Command command) {
	switch (command) {
	case Command::Undo:
		Logger().Log(Logging::LogLevel::Info, "[Session] Undo requested.");
		m_game.pushEvent(UndoEvent{});
		break;
	case Command::Hint:
		showHint();
		break;
	case Command::Quit:
		Logger().Log(Logging::LogLevel::Info, std::format("[Session] Player quit after {} moves.", m_game.moveCount()));
		m_game.pushEvent(QuitEvent{});
		m_out << "Bye.\n";
		break;
	default: {
		const auto dir      = *toDirection(command);
		const auto previous = m_game.playerPosition();
		m_game.pushEvent(MoveEvent{dir});
		if (m_game.playerPosition() == previous) {
			Logger().Log(Logging::LogLevel::Debug, std::format("[Session] Move {} from ({}, {}) blocked.", toString(dir), previous.row, previous.col));
		}
		break;
	}
	}
}

void Session::showHint() {
	const auto hint = m_game.hint();
	if (!hint) {
		m_out << "No hint available.\n";
		return;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Session] Hint shown: {} ({} steps).", toString(hint->dir), hint->steps));
	m_out << std::format("Hint: go {}. The goal is {} {} away.\n", toString(hint->dir), hint->steps, hint->steps == 1u ? "step" : "steps");
}

} // namespace maze::console
