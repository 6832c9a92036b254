#include "color_scale.hpp"

#include <algorithm>
#include <cmath>
#include <omp.h>

void ColorRamp::validate() const {
    ensure<ValidationError>(stops.size() >= 2, "Color ramp '" + name + "' needs at least 2 stops");
    for (size_t k = 0; k < stops.size(); ++k) {
        ensure<ValidationError>(stops[k].pos >= 0.0 && stops[k].pos <= 1.0,
                                "Color ramp '" + name + "' stop outside [0,1]");
        if (k > 0)
            ensure<ValidationError>(stops[k].pos > stops[k - 1].pos,
                                    "Color ramp '" + name + "' stops not strictly increasing");
    }
}

Rgb ColorRamp::sample(double t) const {
    if (t <= stops.front().pos) return stops.front().color;
    if (t >= stops.back().pos) return stops.back().color;
    size_t k = 1;
    while (stops[k].pos < t) ++k;
    const auto& a = stops[k - 1];
    const auto& b = stops[k];
    double w = (t - a.pos) / (b.pos - a.pos);
    auto lerp = [w](uint8_t x, uint8_t y) {
        return static_cast<uint8_t>(std::lround(x + w * (static_cast<double>(y) - x)));
    };
    return {lerp(a.color.r, b.color.r), lerp(a.color.g, b.color.g), lerp(a.color.b, b.color.b)};
}

// blue -> mediumslateblue -> red
ColorRamp temperature_ramp() {
    return {"temperature", {{0.0, {0, 0, 255}}, {0.5, {123, 104, 238}}, {1.0, {255, 0, 0}}}};
}

ColorRamp precipitation_ramp() {
    return {"precipitation", {{0.0, {255, 255, 255}}, {0.4, {65, 105, 225}}, {1.0, {128, 0, 128}}}};
}

ColorRamp wind_ramp() {
    return {"wind", {{0.0, {220, 220, 220}}, {0.5, {0, 128, 128}}, {1.0, {139, 0, 0}}}};
}

ColorRamp ramp_by_name(const std::string& name) {
    if (name == "temperature") return temperature_ramp();
    if (name == "precipitation") return precipitation_ramp();
    if (name == "wind") return wind_ramp();
    throw ValidationError("Unknown color ramp: " + name);
}

double ColorScale::normalize(double x) const {
    return std::clamp((x - min) / (max - min), 0.0, 1.0);
}

Rgb ColorScale::map_value(double x) const {
    if (is_missing(x, missing_value)) return missing_color;
    return ramp.sample(normalize(x));
}

Rgb ColorScale::map_cell(const Field2D& F, size_t k) const {
    if (missing_at(F, k, missing_value)) return missing_color;
    return ramp.sample(normalize(F.value(k)));
}

ColorScale make_color_scale(const DataSeries& series, const ColorRamp& ramp,
                            const std::optional<ValueRange>& override_range, Rgb missing_color) {
    ramp.validate();
    ValueRange r = series.global_range();
    if (override_range) {
        r = *override_range;
        ensure<ValidationError>(std::isfinite(r.min) && std::isfinite(r.max) && r.min < r.max,
                                "Color range override must be finite with min < max");
    } else if (r.max - r.min <= 0.0) {
        r.min -= 0.5;
        r.max += 0.5;
    }
    return ColorScale{r.min, r.max, ramp, missing_color, series.spec().missing_value};
}

Raster map_grid(const ColorScale& scale, const Field2D& F) {
    Raster img(F.nx, F.ny);
    #pragma omp parallel for schedule(static)
    for (int j = 0; j < F.ny; ++j)
        for (int i = 0; i < F.nx; ++i)
            img.set(i, F.ny - 1 - j, scale.map_cell(F, F.id(i, j)));
    return img;
}
