#include "maze/grid.hpp"

#include <format>
#include <optional>
#include <utility>

namespace maze {

Grid::Grid(const std::size_t height, const std::size_t width, std::vector<Cell> cells)
    : m_height(height), m_width(width), m_cells(std::move(cells)) {
	if (m_height == 0u || m_width == 0u) {
		throw LayoutError("Maze layout is empty.");
	}
	if (m_cells.size() != m_height * m_width) {
		throw LayoutError(std::format("Maze layout has {} cells, expected {}x{}.", m_cells.size(), m_height, m_width));
	}

	std::optional<Coord> start, goal;
	for (std::size_t i = 0; i != m_cells.size(); ++i) {
		const Coord c{static_cast<Id>(i / m_width), static_cast<Id>(i % m_width)};
		if (m_cells[i] == Cell::Start) {
			if (start) {
				throw LayoutError(std::format("Second start cell at ({}, {}).", c.row, c.col));
			}
			start = c;
		} else if (m_cells[i] == Cell::Goal) {
			if (goal) {
				throw LayoutError(std::format("Second goal cell at ({}, {}).", c.row, c.col));
			}
			goal = c;
		}
	}
	if (!start) {
		throw LayoutError("Maze layout has no start cell.");
	}
	if (!goal) {
		throw LayoutError("Maze layout has no goal cell.");
	}
	m_start = *start;
	m_goal  = *goal;
}

std::size_t Grid::height() const {
	return m_height;
}

std::size_t Grid::width() const {
	return m_width;
}

Grid::Cell Grid::cellAt(const Coord c) const {
	if (c.row >= m_height || c.col >= m_width) {
		throw BoundsError(std::format("Cell ({}, {}) outside of {}x{} grid.", c.row, c.col, m_height, m_width));
	}

	return m_cells[c.row * m_width + c.col];
}

bool Grid::contains(const int row, const int col) const {
	return row >= 0 && col >= 0 && static_cast<std::size_t>(row) < m_height && static_cast<std::size_t>(col) < m_width;
}

bool Grid::isWalkable(const Coord c) const {
	return c.row < m_height && c.col < m_width && m_cells[c.row * m_width + c.col] != Cell::Wall;
}

Coord Grid::start() const {
	return m_start;
}

Coord Grid::goal() const {
	return m_goal;
}

} // namespace maze
