#pragma once

#include <string_view>

namespace maze::console {

//! Built in maze. '#' wall, '.' open, 'S' start, 'G' goal.
inline constexpr std::string_view kDefaultLayout = "S..#......\n"
                                                   "##.#.####.\n"
                                                   "#..#....#.\n"
                                                   "#.####.##.\n"
                                                   "#......#..\n"
                                                   "####.#.#.#\n"
                                                   "#....#...G\n";

struct ConsoleConfig {
	std::string_view layout{kDefaultLayout}; //!< Maze to play.
	bool clearScreen{true};                  //!< Clear the terminal before drawing the grid.

	//! Shown before every read.
	std::string_view prompt{"Move [w/a/s/d], u undo, h hint, q quit: "};
};

} // namespace maze::console
