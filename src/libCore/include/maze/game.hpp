#pragma once

#include "maze/eventHub.hpp"
#include "maze/gameEvent.hpp"
#include "maze/grid.hpp"
#include "maze/moveHistory.hpp"
#include "maze/types.hpp"

#include <cstddef>
#include <optional>

namespace maze {

//! Next step towards the goal.
struct Hint {
	Direction dir;     //!< First step of a shortest path.
	std::size_t steps; //!< Remaining steps to the goal.
};

//! Core game setup. Owns the grid and the player position.
class Game {
public:
	//! Setup a game with the player on the start cell.
	explicit Game(Grid grid);

	void pushEvent(const GameEvent& event); //!< Handle an event synchronously. Ignored once the game is over.

	const Grid& grid() const;     //!< Get grid data for rendering.
	Coord playerPosition() const; //!< Current player coordinate.
	GameStatus status() const;    //!< Running or Won.
	bool isActive() const;        //!< False once won or quit.
	unsigned moveCount() const;   //!< Accepted moves and undos so far.

	//! Direction and distance to the goal. Empty if the game is over.
	std::optional<Hint> hint() const;

public:
	void subscribeSignals(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribeSignals(IGameSignalListener* listener);

private:
	void handleEvent(const MoveEvent& event);
	void handleEvent(const UndoEvent& event);
	void handleEvent(const QuitEvent& event);

private:
	bool m_gameActive{true};
	GameStatus m_status{GameStatus::Running};
	unsigned m_moveCount{0u};

	Grid m_grid;
	Coord m_player;
	MoveHistory m_history; //!< Positions before each accepted move.
	EventHub m_eventHub;   //!< Hub to signal updates of the game state to external components.
};

} // namespace maze
