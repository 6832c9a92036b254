// Per-timestamp frame rendering onto a fixed canvas layout.
#pragma once
#include <string>

#include "render/color_scale.hpp"
#include "render/raster.hpp"
#include "series/data_series.hpp"

enum class AspectRatio { Square, Vertical };
enum class FitMode { Pad, Crop };

std::string to_string(AspectRatio a);
AspectRatio parse_aspect(const std::string& s);
FitMode parse_fit(const std::string& s);

struct RenderOptions {
    int canvas_width = 720;
    FitMode fit = FitMode::Pad;
    double distortion_tolerance = 0.02;  // relative change of the grid aspect ratio
    double max_crop_fraction = 0.25;     // per axis, crop mode only
    bool legend = true;
    std::string time_format;  // strftime, UTC; empty picks one from the series cadence
    std::string location_label;
    Rgb background{255, 255, 255};
    Rgb text_color{0, 0, 0};
};

struct Rect {
    int x = 0, y = 0, w = 0, h = 0;
};

// Everything about a frame that must not change between timestamps.
struct CanvasLayout {
    AspectRatio aspect = AspectRatio::Square;
    int width = 0, height = 0;
    int text_scale = 1;
    int band = 0;  // height of the top and bottom overlay bands
    Rect viewport; // visible map area between the bands
    Rect map;      // whole grid; larger than the viewport when cropping
    Rect legend;
    int location_y = 0, time_y = 0, label_x = 0;
};

struct RenderedFrame {
    Timestamp time;
    AspectRatio aspect;
    Raster image;
};

void validate_render_options(const RenderOptions& opt);

// Throws CompositionError when the grid cannot be placed within tolerance.
CanvasLayout compose_layout(const GridSpec& spec, AspectRatio aspect, const RenderOptions& opt);

std::string default_time_format(const DataSeries& series);

class FrameRenderer {
public:
    FrameRenderer(const ColorScale& scale, const GridSpec& spec, AspectRatio aspect, const RenderOptions& opt,
                  std::string time_format);

    const CanvasLayout& layout() const { return layout_; }
    const Raster& legend() const { return legend_; }

    // Pure: reads only the sample and the state fixed at construction.
    RenderedFrame render(const Sample& s) const;

private:
    const ColorScale* scale_;
    RenderOptions opt_;
    std::string time_format_;
    CanvasLayout layout_;
    Raster legend_;
};
