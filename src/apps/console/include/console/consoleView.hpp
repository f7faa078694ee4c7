#pragma once

#include "maze/IGameSignalListener.hpp"
#include "maze/game.hpp"

#include <ostream>

namespace maze::console {

//! Output glyphs.
constexpr char OUT_WALL   = '#';
constexpr char OUT_OPEN   = '.';
constexpr char OUT_START  = 'S';
constexpr char OUT_GOAL   = 'G';
constexpr char OUT_PLAYER = '@';

//! Text glyph of a grid cell.
char toGlyph(Grid::Cell cell);

//! Writes the grid with the player on top, one line per row.
void drawGrid(const Game& game, std::ostream& out);

//! Renders the game to a text stream whenever the game signals a change.
class ConsoleView : public IGameSignalListener {
public:
	ConsoleView(const Game& game, std::ostream& out, bool clearScreen);

	void draw(); //!< Grid plus status line.

	void onGameEvent(GameSignal signal) override;

private:
	const Game& m_game;
	std::ostream& m_out;
	bool m_clearScreen;
};

} // namespace maze::console
