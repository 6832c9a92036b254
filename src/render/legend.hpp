// Static color bar legend, rendered once per scale and reused by every frame.
#pragma once
#include <string>

#include "render/color_scale.hpp"
#include "render/raster.hpp"

struct LegendStyle {
    int text_scale = 1;
    Rgb background{255, 255, 255};
    Rgb text{0, 0, 0};
    std::string units;
};

// Rows needed for a legend at this text scale.
int legend_height(int text_scale);

std::string format_tick(double value, double span);

Raster render_legend(const ColorScale& scale, int width, const LegendStyle& style);
