#include "legend.hpp"

#include <cmath>
#include <cstdio>

#include "render/font_5x7.hpp"

namespace {

int bar_height(int text_scale) { return 6 * text_scale; }
int label_gap(int text_scale) { return 3 * text_scale; }

}  // namespace

int legend_height(int text_scale) {
    return bar_height(text_scale) + label_gap(text_scale) + text_height(text_scale);
}

std::string format_tick(double value, double span) {
    char buf[32];
    if (std::abs(span) >= 20.0)
        std::snprintf(buf, sizeof(buf), "%.0f", value);
    else if (std::abs(span) >= 2.0)
        std::snprintf(buf, sizeof(buf), "%.1f", value);
    else
        std::snprintf(buf, sizeof(buf), "%.3g", value);
    std::string s(buf);
    return s == "-0" ? "0" : s;
}

Raster render_legend(const ColorScale& scale, int width, const LegendStyle& style) {
    const int ts = style.text_scale;
    Raster img(width, legend_height(ts), style.background);
    const int bar_h = bar_height(ts);

    for (int x = 0; x < width; ++x) {
        double t = width > 1 ? static_cast<double>(x) / (width - 1) : 0.0;
        img.fill_rect(x, 0, 1, bar_h, scale.ramp.sample(t));
    }
    // 1px frame around the bar
    img.fill_rect(0, 0, width, 1, style.text);
    img.fill_rect(0, bar_h - 1, width, 1, style.text);
    img.fill_rect(0, 0, 1, bar_h, style.text);
    img.fill_rect(width - 1, 0, 1, bar_h, style.text);

    const double span = scale.max - scale.min;
    std::string lo = format_tick(scale.min, span);
    std::string mid = format_tick(0.5 * (scale.min + scale.max), span);
    std::string hi = format_tick(scale.max, span);
    if (!style.units.empty()) hi += " " + style.units;

    const int y = bar_h + label_gap(ts);
    draw_text(img, 0, y, lo, style.text, ts);
    draw_text(img, (width - text_width(mid, ts)) / 2, y, mid, style.text, ts);
    draw_text(img, width - text_width(hi, ts), y, hi, style.text, ts);
    return img;
}
