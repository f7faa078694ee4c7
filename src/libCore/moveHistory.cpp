#include "maze/moveHistory.hpp"

namespace maze {

MoveHistory::MoveHistory(const std::size_t capacity) : m_capacity(capacity) {
}

void MoveHistory::record(const Coord c) {
	if (m_capacity == 0u) {
		return;
	}
	if (m_positions.size() == m_capacity) {
		m_positions.pop_front();
	}
	m_positions.push_back(c);
}

std::optional<Coord> MoveHistory::undo() {
	if (m_positions.empty()) {
		return std::nullopt;
	}

	const auto last = m_positions.back();
	m_positions.pop_back();
	return last;
}

std::size_t MoveHistory::size() const {
	return m_positions.size();
}

void MoveHistory::clear() {
	m_positions.clear();
}

} // namespace maze
