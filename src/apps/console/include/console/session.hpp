#pragma once

#include "console/command.hpp"
#include "console/config.hpp"
#include "console/consoleView.hpp"
#include "maze/game.hpp"

#include <istream>
#include <optional>
#include <ostream>

namespace maze::console {

//! Interactive game loop reading single key commands from a text stream.
class Session {
public:
	Session(Game& game, const ConsoleConfig& config, std::ostream& out);
	~Session();

	Session(const Session&)            = delete;
	Session& operator=(const Session&) = delete;

	//! Blocks until the goal is reached, the player quits or the input ends.
	//! \returns Process exit code.
	int run(std::istream& in);

private:
	//! Reads the next key. Arrow key sequences are consumed as a whole.
	//! \returns False once the input is closed.
	bool readCommand(std::istream& in, std::optional<Command>& command);

	void handleCommand(Command command);
	void showHint();

private:
	Game& m_game;
	const ConsoleConfig& m_config;
	std::ostream& m_out;
	ConsoleView m_view;
};

} // namespace maze::console
