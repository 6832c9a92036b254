// Fixed value-to-color mapping shared by every frame of a run.
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "render/raster.hpp"
#include "series/data_series.hpp"

struct ColorStop {
    double pos;  // in [0,1]
    Rgb color;
};

struct ColorRamp {
    std::string name;
    std::vector<ColorStop> stops;

    // At least two stops, positions strictly increasing inside [0,1].
    void validate() const;
    Rgb sample(double t) const;
};

ColorRamp temperature_ramp();
ColorRamp precipitation_ramp();
ColorRamp wind_ramp();
ColorRamp ramp_by_name(const std::string& name);

struct ColorScale {
    double min, max;
    ColorRamp ramp;
    Rgb missing_color;
    std::optional<double> missing_value;

    double normalize(double x) const;
    Rgb map_value(double x) const;
    Rgb map_cell(const Field2D& F, size_t k) const;
};

constexpr Rgb DEFAULT_MISSING_COLOR{128, 128, 128};

// Built once per run from the observed global range, or from a fixed
// override when animations must be comparable with each other.
ColorScale make_color_scale(const DataSeries& series, const ColorRamp& ramp,
                            const std::optional<ValueRange>& override_range = std::nullopt,
                            Rgb missing_color = DEFAULT_MISSING_COLOR);

// One color per grid cell, laid out nx by ny with the northern row on top.
Raster map_grid(const ColorScale& scale, const Field2D& F);
