#include "maze/layout.hpp"

#include "maze/pathFinder.hpp"

#include <format>
#include <utility>
#include <vector>

namespace maze {

static Grid::Cell toCell(const char glyph, const std::size_t row, const std::size_t col) {
	switch (glyph) {
	case GLYPH_WALL:
		return Grid::Cell::Wall;
	case GLYPH_OPEN:
		return Grid::Cell::Open;
	case GLYPH_START:
		return Grid::Cell::Start;
	case GLYPH_GOAL:
		return Grid::Cell::Goal;
	default:
		throw LayoutError(std::format("Unknown glyph '{}' at ({}, {}).", glyph, row, col));
	}
}

//! Split into lines. Accepts '\r\n' endings and a single trailing newline.
static std::vector<std::string_view> splitLines(std::string_view text) {
	std::vector<std::string_view> lines;
	while (!text.empty()) {
		const auto end = text.find('\n');
		auto line      = text.substr(0, end);
		if (!line.empty() && line.back() == '\r') {
			line.remove_suffix(1);
		}
		lines.push_back(line);

		if (end == std::string_view::npos) {
			break;
		}
		text.remove_prefix(end + 1);
	}
	return lines;
}

Grid parseLayout(const std::string_view text) {
	const auto lines = splitLines(text);
	if (lines.empty()) {
		throw LayoutError("Maze layout is empty.");
	}
	if (lines.front().empty()) {
		throw LayoutError("Row 0 is empty.");
	}

	const auto width = lines.front().size();
	std::vector<Grid::Cell> cells;
	cells.reserve(lines.size() * width);

	for (std::size_t row = 0; row != lines.size(); ++row) {
		if (lines[row].size() != width) {
			throw LayoutError(std::format("Row {} has {} cells, expected {}.", row, lines[row].size(), width));
		}
		for (std::size_t col = 0; col != width; ++col) {
			cells.push_back(toCell(lines[row][col], row, col));
		}
	}

	Grid grid(lines.size(), width, std::move(cells));
	if (shortestPath(grid, grid.start(), grid.goal()).empty()) {
		throw LayoutError("Goal cannot be reached from the start.");
	}
	return grid;
}

} // namespace maze
