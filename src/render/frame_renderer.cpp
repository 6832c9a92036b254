#include "frame_renderer.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "render/font_5x7.hpp"
#include "render/legend.hpp"

std::string to_string(AspectRatio a) { return a == AspectRatio::Square ? "square" : "vertical"; }

AspectRatio parse_aspect(const std::string& s) {
    if (s == "square") return AspectRatio::Square;
    if (s == "vertical") return AspectRatio::Vertical;
    throw ValidationError("Unknown aspect ratio: " + s);
}

FitMode parse_fit(const std::string& s) {
    if (s == "pad") return FitMode::Pad;
    if (s == "crop") return FitMode::Crop;
    throw ValidationError("Unknown fit mode: " + s);
}

void validate_render_options(const RenderOptions& opt) {
    ensure<ValidationError>(opt.canvas_width >= 64 && opt.canvas_width <= 8192, "canvas_width must be in [64,8192]");
    ensure<ValidationError>(opt.distortion_tolerance >= 0.0 && opt.max_crop_fraction >= 0.0
                                && opt.max_crop_fraction < 1.0,
                            "Composition tolerances out of range");
}

CanvasLayout compose_layout(const GridSpec& spec, AspectRatio aspect, const RenderOptions& opt) {
    validate_render_options(opt);
    spec.validate();

    CanvasLayout L;
    L.aspect = aspect;
    L.width = opt.canvas_width - opt.canvas_width % 2;
    L.height = (aspect == AspectRatio::Square) ? L.width : ((L.width * 16 / 9 + 1) / 2) * 2;
    L.text_scale = std::max(1, L.width / 320);

    const int ts = L.text_scale;
    const int pad = 4 * ts;
    const int th = text_height(ts);
    const bool has_location = !opt.location_label.empty();
    int top = pad + th + pad;
    if (has_location) top += th + pad;
    int bottom = opt.legend ? pad + legend_height(ts) + pad : 0;
    L.band = std::max(top, bottom);

    L.label_x = pad;
    L.location_y = pad;
    L.time_y = has_location ? pad + th + pad : pad;
    L.legend = {2 * pad, L.height - pad - legend_height(ts), L.width - 4 * pad, legend_height(ts)};

    L.viewport = {0, L.band, L.width, L.height - 2 * L.band};
    ensure<CompositionError>(L.viewport.h > 0, "No room for the map on a " + to_string(aspect) + " canvas");

    const double a = spec.aspect();
    const double box_w = L.viewport.w, box_h = L.viewport.h;
    double map_h = (opt.fit == FitMode::Pad) ? std::min(box_h, box_w / a) : std::max(box_h, box_w / a);
    double map_w = map_h * a;
    int w = static_cast<int>(std::lround(map_w));
    int h = static_cast<int>(std::lround(map_h));
    ensure<CompositionError>(w >= 1 && h >= 1, "Grid collapses to an empty map on a " + to_string(aspect)
                                                   + " canvas");

    const double distortion = std::abs((static_cast<double>(w) / h) / a - 1.0);
    ensure<CompositionError>(distortion <= opt.distortion_tolerance,
                             "Grid aspect " + std::to_string(a) + " distorted by " + std::to_string(distortion * 100.0)
                                 + "% on a " + to_string(aspect) + " canvas");
    if (opt.fit == FitMode::Crop) {
        const double lost_x = 1.0 - std::min(1.0, box_w / w);
        const double lost_y = 1.0 - std::min(1.0, box_h / h);
        ensure<CompositionError>(std::max(lost_x, lost_y) <= opt.max_crop_fraction,
                                 "Cropping would discard " + std::to_string(std::max(lost_x, lost_y) * 100.0)
                                     + "% of the grid on a " + to_string(aspect) + " canvas");
    }

    // Grid center on canvas center.
    L.map = {(L.width - w) / 2, (L.height - h) / 2, w, h};
    return L;
}

std::string default_time_format(const DataSeries& series) {
    for (const auto& s : series)
        if (s.time % SECONDS_PER_DAY != 0) return "%Y-%m-%d %H:%M UTC";
    return "%Y-%m-%d";
}

FrameRenderer::FrameRenderer(const ColorScale& scale, const GridSpec& spec, AspectRatio aspect,
                             const RenderOptions& opt, std::string time_format)
    : scale_(&scale), opt_(opt), time_format_(std::move(time_format)), layout_(compose_layout(spec, aspect, opt)) {
    if (opt_.legend) {
        LegendStyle style;
        style.text_scale = layout_.text_scale;
        style.background = opt_.background;
        style.text = opt_.text_color;
        style.units = spec.units;
        legend_ = render_legend(*scale_, layout_.legend.w, style);
    }
}

RenderedFrame FrameRenderer::render(const Sample& s) const {
    const CanvasLayout& L = layout_;
    Raster base = map_grid(*scale_, s.field);
    Raster img(L.width, L.height, opt_.background);

    const Rect& m = L.map;
    const Rect& v = L.viewport;
    const int x0 = std::max(m.x, v.x), x1 = std::min(m.x + m.w, v.x + v.w);
    const int y0 = std::max(m.y, v.y), y1 = std::min(m.y + m.h, v.y + v.h);

    // Nearest-neighbor: destination pixel -> grid cell.
    std::vector<int> src_col(std::max(0, x1 - x0));
    for (int x = x0; x < x1; ++x)
        src_col[x - x0] = std::min(base.width - 1, static_cast<int>(static_cast<long long>(x - m.x) * base.width / m.w));
    for (int y = y0; y < y1; ++y) {
        int row = std::min(base.height - 1, static_cast<int>(static_cast<long long>(y - m.y) * base.height / m.h));
        for (int x = x0; x < x1; ++x) img.set(x, y, base.at(src_col[x - x0], row));
    }

    if (!opt_.location_label.empty())
        draw_text(img, L.label_x, L.location_y, opt_.location_label, opt_.text_color, L.text_scale);
    draw_text(img, L.label_x, L.time_y, format_timestamp(s.time, time_format_), opt_.text_color, L.text_scale);
    if (opt_.legend) img.blit(legend_, L.legend.x, L.legend.y);

    return {s.time, L.aspect, std::move(img)};
}
