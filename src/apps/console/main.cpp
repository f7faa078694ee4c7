#include "Logging.hpp"
#include "console/config.hpp"
#include "console/session.hpp"
#include "maze/game.hpp"
#include "maze/layout.hpp"

#include <exception>
#include <format>
#include <iostream>

int main(int, char**) {
	const maze::console::ConsoleConfig config{};

	try {
		maze::Game game(maze::parseLayout(config.layout));
		maze::console::Session session(game, config, std::cout);
		return session.run(std::cin);
	} catch (const std::exception& e) {
		maze::console::Logger().Log(Logging::LogLevel::Error, std::format("[Main] Could not start the game: {}", e.what()));
		std::cerr << std::format("Could not start the game: {}\n", e.what());
		return 1;
	}
}
