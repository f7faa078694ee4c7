#include "console/consoleView.hpp"
#include "maze/layout.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace maze::console::gtest {

TEST(ConsoleView, Glyphs) {
	EXPECT_EQ(toGlyph(Grid::Cell::Wall), OUT_WALL);
	EXPECT_EQ(toGlyph(Grid::Cell::Open), OUT_OPEN);
	EXPECT_EQ(toGlyph(Grid::Cell::Start), OUT_START);
	EXPECT_EQ(toGlyph(Grid::Cell::Goal), OUT_GOAL);
}

TEST(ConsoleView, PlayerOverlay) {
	Game game(parseLayout("S.#\n..G\n"));
	std::ostringstream out;

	drawGrid(game, out);
	EXPECT_EQ(out.str(), "@.#\n..G\n");

	// Start glyph shows once the player left.
	game.pushEvent(MoveEvent{Direction::Down});
	out.str("");
	drawGrid(game, out);
	EXPECT_EQ(out.str(), "S.#\n@.G\n");
}

TEST(ConsoleView, RendersOnSignals) {
	Game game(parseLayout("S.G\n"));
	std::ostringstream out;
	ConsoleView view(game, out, false);
	game.subscribeSignals(&view, GS_PositionChange | GS_MoveRejected | GS_StateChange);

	game.pushEvent(MoveEvent{Direction::Up});
	EXPECT_EQ(out.str(), "Blocked.\n");

	out.str("");
	game.pushEvent(MoveEvent{Direction::Right});
	EXPECT_EQ(out.str(), "S@G\nMoves: 1\n");

	out.str("");
	game.pushEvent(MoveEvent{Direction::Right});
	EXPECT_EQ(out.str(), "S.@\nMoves: 2\nYou reached the goal in 2 moves!\n");

	game.unsubscribeSignals(&view);
}

TEST(ConsoleView, NothingToUndo) {
	Game game(parseLayout("S.G\n"));
	std::ostringstream out;
	ConsoleView view(game, out, false);
	game.subscribeSignals(&view, GS_PositionChange | GS_MoveRejected | GS_NothingToUndo);

	game.pushEvent(UndoEvent{});
	EXPECT_EQ(out.str(), "Nothing to undo.\n");

	game.unsubscribeSignals(&view);
}

TEST(ConsoleView, ClearScreen) {
	Game game(parseLayout("S.G\n"));
	std::ostringstream out;
	ConsoleView view(game, out, true);

	view.draw();
	EXPECT_EQ(out.str(), "\033[2J\033[1;1H@.G\nMoves: 0\n");
}

} // namespace maze::console::gtest
