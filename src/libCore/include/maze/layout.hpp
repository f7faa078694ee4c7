#pragma once

#include "maze/grid.hpp"

#include <string_view>

namespace maze {

//! Layout glyphs. One text line per grid row.
constexpr char GLYPH_WALL  = '#';
constexpr char GLYPH_OPEN  = '.';
constexpr char GLYPH_START = 'S';
constexpr char GLYPH_GOAL  = 'G';

//! Build a grid from its text layout.
//! \throws LayoutError if the text is malformed or the goal cannot be reached from the start.
Grid parseLayout(std::string_view text);

} // namespace maze
