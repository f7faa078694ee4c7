#include "maze/game.hpp"

#include "maze/moveChecker.hpp"
#include "maze/pathFinder.hpp"

#include <cassert>
#include <utility>
#include <variant>

namespace maze {

Game::Game(Grid grid) : m_grid{std::move(grid)}, m_player{m_grid.start()} {
}

void Game::pushEvent(const GameEvent& event) {
	if (!m_gameActive) {
		return;
	}
	std::visit([&](auto&& ev) { handleEvent(ev); }, event);
}

const Grid& Game::grid() const {
	return m_grid;
}

Coord Game::playerPosition() const {
	return m_player;
}

GameStatus Game::status() const {
	return m_status;
}

bool Game::isActive() const {
	return m_gameActive;
}

unsigned Game::moveCount() const {
	return m_moveCount;
}

std::optional<Hint> Game::hint() const {
	if (!m_gameActive) {
		return std::nullopt;
	}

	const auto path = shortestPath(m_grid, m_player, m_grid.goal());
	if (path.size() < 2u) {
		return std::nullopt;
	}
	return Hint{directionBetween(path[0], path[1]), path.size() - 1u};
}

void Game::handleEvent(const MoveEvent& event) {
	const auto next = attemptMove(m_grid, m_player, event.dir);
	if (next == m_player) {
		m_eventHub.signal(GS_MoveRejected);
		return;
	}

	m_history.record(m_player);
	m_player = next;
	++m_moveCount;
	assert(m_grid.isWalkable(m_player));

	if (m_player == m_grid.goal()) {
		m_status     = GameStatus::Won;
		m_gameActive = false;
		m_eventHub.signal(GS_PositionChange | GS_StateChange);
		return;
	}
	m_eventHub.signal(GS_PositionChange);
}

void Game::handleEvent(const UndoEvent&) {
	const auto previous = m_history.undo();
	if (!previous) {
		m_eventHub.signal(GS_NothingToUndo);
		return;
	}

	m_player = *previous;
	++m_moveCount;
	m_eventHub.signal(GS_PositionChange);
}

void Game::handleEvent(const QuitEvent&) {
	m_gameActive = false;
}

void Game::subscribeSignals(IGameSignalListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void Game::unsubscribeSignals(IGameSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}

} // namespace maze
