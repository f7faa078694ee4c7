#include "console/consoleView.hpp"

#include <format>

namespace maze::console {

char toGlyph(const Grid::Cell cell) {
	switch (cell) {
	case Grid::Cell::Wall:
		return OUT_WALL;
	case Grid::Cell::Open:
		return OUT_OPEN;
	case Grid::Cell::Start:
		return OUT_START;
	case Grid::Cell::Goal:
		return OUT_GOAL;
	}
	return '?';
}

void drawGrid(const Game& game, std::ostream& out) {
	const auto& grid  = game.grid();
	const auto player = game.playerPosition();

	for (Id row = 0; row != grid.height(); ++row) {
		for (Id col = 0; col != grid.width(); ++col) {
			const Coord c{row, col};
			out << (c == player ? OUT_PLAYER : toGlyph(grid.cellAt(c)));
		}
		out << '\n';
	}
}

ConsoleView::ConsoleView(const Game& game, std::ostream& out, const bool clearScreen)
    : m_game(game), m_out(out), m_clearScreen(clearScreen) {
}

void ConsoleView::draw() {
	if (m_clearScreen) {
		m_out << "\033[2J\033[1;1H";
	}
	drawGrid(m_game, m_out);
	m_out << std::format("Moves: {}\n", m_game.moveCount()) << std::flush;
}

void ConsoleView::onGameEvent(const GameSignal signal) {
	switch (signal) {
	case GS_PositionChange:
		draw();
		break;
	case GS_MoveRejected:
		m_out << "Blocked.\n";
		break;
	case GS_NothingToUndo:
		m_out << "Nothing to undo.\n";
		break;
	case GS_StateChange:
		if (m_game.status() == GameStatus::Won) {
			m_out << std::format("You reached the goal in {} moves!\n", m_game.moveCount()) << std::flush;
		}
		break;
	default:
		break;
	}
}

} // namespace maze::console
