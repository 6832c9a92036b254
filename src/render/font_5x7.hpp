// Fixed 5x7 bitmap font for frame labels (printable ASCII).
#pragma once
#include <string>

#include "render/raster.hpp"

constexpr int GLYPH_WIDTH = 5;
constexpr int GLYPH_HEIGHT = 7;
constexpr int GLYPH_ADVANCE = 6;  // glyph plus one column of spacing

int text_width(const std::string& text, int scale);
int text_height(int scale);

// Draws text with its top-left corner at (x, y). Characters outside
// 32..126 render as '?'.
void draw_text(Raster& img, int x, int y, const std::string& text, Rgb color, int scale);
