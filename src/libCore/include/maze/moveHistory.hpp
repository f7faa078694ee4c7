#pragma once

#include "maze/types.hpp"

#include <cstddef>
#include <deque>
#include <optional>

namespace maze {

//! Bounded record of previous player positions. Allows stepping back.
class MoveHistory {
public:
	static constexpr std::size_t DefaultCapacity = 20000u;

	explicit MoveHistory(std::size_t capacity = DefaultCapacity);

	//! Store a position. Drops the oldest entry once the capacity is reached.
	void record(Coord c);

	//! Remove and return the latest position. Empty if nothing was recorded.
	std::optional<Coord> undo();

	std::size_t size() const;
	void clear();

private:
	std::size_t m_capacity;
	std::deque<Coord> m_positions;
};

} // namespace maze
