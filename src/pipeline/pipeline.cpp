#include "pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <omp.h>
#include <sstream>

#include "utils/log.hpp"
#include "utils/stats.hpp"

namespace {

template <class T>
std::vector<T> distinct(const std::vector<T>& xs) {
    std::vector<T> out;
    for (const auto& x : xs)
        if (std::find(out.begin(), out.end(), x) == out.end()) out.push_back(x);
    return out;
}

std::string variant_name(AspectRatio a, OutputFormat f) { return to_string(a) + "-" + to_string(f); }

}  // namespace

void validate_config(const PipelineConfig& config) {
    ensure<ValidationError>(!config.aspect_ratios.empty(), "No aspect ratios requested");
    ensure<ValidationError>(!config.formats.empty(), "No output formats requested");
    config.ramp.validate();
    validate_render_options(config.render);
    validate_timing(config.timing);
    validate_encoder_options(config.encoder);
    if (config.color_range)
        ensure<ValidationError>(std::isfinite(config.color_range->min) && std::isfinite(config.color_range->max)
                                    && config.color_range->min < config.color_range->max,
                                "Color range override must be finite with min < max");
}

std::vector<RenderedFrame> render_all(const DataSeries& series, const FrameRenderer& renderer,
                                      const CancelFlag* cancel) {
    const int n = static_cast<int>(series.size());
    std::vector<RenderedFrame> frames(series.size());
    std::exception_ptr error;
    bool stop = false;

    #pragma omp parallel for schedule(dynamic)
    for (int k = 0; k < n; ++k) {
        bool skip;
        #pragma omp atomic read
        skip = stop;
        if (skip || (cancel && cancel->load(std::memory_order_relaxed))) continue;
        try {
            frames[k] = renderer.render(series[k]);
        } catch (...) {
            #pragma omp critical(wxanim_render_error)
            {
                if (!error) error = std::current_exception();
            }
            #pragma omp atomic write
            stop = true;
        }
    }
    if (error) std::rethrow_exception(error);
    check_cancel(cancel);
    return frames;
}

PipelineResult Pipeline::run(const DataSeries& series, const PipelineConfig& config) const {
    validate_config(config);
    ensure<InsufficientFramesError>(series.size() >= 2, "Need at least 2 timestamps to animate");

    auto wall_start = std::chrono::high_resolution_clock::now();
    report_summary(config.source_id, series);

    const ColorScale scale = make_color_scale(series, config.ramp, config.color_range);
    {
        std::ostringstream msg;
        msg << "color scale " << scale.ramp.name << " [" << scale.min << ", " << scale.max << "]"
            << (config.color_range ? " (fixed)" : " (observed)");
        log_info(msg.str());
    }
    const std::string time_format =
        config.render.time_format.empty() ? default_time_format(series) : config.render.time_format;
    auto formats = distinct(config.formats);
    if (config.final_still && std::find(formats.begin(), formats.end(), OutputFormat::Png) == formats.end())
        formats.push_back(OutputFormat::Png);

    PipelineResult result;
    auto fail_aspect = [&](AspectRatio aspect, const std::string& stage, const std::string& reason) {
        for (auto f : formats) {
            result.failures.push_back({aspect, f, stage, reason});
            log_warn(variant_name(aspect, f) + " failed at " + stage + ": " + reason);
        }
    };

    for (AspectRatio aspect : distinct(config.aspect_ratios)) {
        std::unique_ptr<FrameRenderer> renderer;
        std::vector<RenderedFrame> frames;
        try {
            renderer = std::make_unique<FrameRenderer>(scale, series.spec(), aspect, config.render, time_format);
        } catch (const CompositionError& e) {
            fail_aspect(aspect, "compose", e.what());
            continue;
        }
        const auto& L = renderer->layout();
        log_info(to_string(aspect) + " canvas " + std::to_string(L.width) + "x" + std::to_string(L.height) + ", map "
                 + std::to_string(L.map.w) + "x" + std::to_string(L.map.h) + " at (" + std::to_string(L.map.x) + ","
                 + std::to_string(L.map.y) + ")");

        auto render_start = std::chrono::high_resolution_clock::now();
        try {
            frames = render_all(series, *renderer, cancel);
        } catch (const CompositionError& e) {
            fail_aspect(aspect, "render", e.what());
            continue;
        } catch (const CancelledError& e) {
            fail_aspect(aspect, "render", e.what());
            continue;
        }
        auto render_end = std::chrono::high_resolution_clock::now();
        log_info(to_string(aspect) + " rendered " + std::to_string(frames.size()) + " frames in "
                 + std::to_string(std::chrono::duration<double>(render_end - render_start).count()) + " s");

        EncodingPlan plan;
        try {
            plan = assemble(frames, config.timing);
        } catch (const ValidationError& e) {
            fail_aspect(aspect, "assemble", e.what());
            continue;
        }
        log_info(to_string(aspect) + " plan: " + (plan.uniform ? "uniform" : "irregular") + " steps, gif "
                 + std::to_string(plan.gif_duration_cs() * 10) + " ms, mp4 " + std::to_string(plan.fps) + " fps x "
                 + std::to_string(plan.video_frames.size()));

        for (OutputFormat format : formats) {
            try {
                auto encoder = encoder_factory(format, config.encoder);
                ensure<EncodingError>(encoder != nullptr, "no encoder for " + to_string(format));
                OutputArtifact art = encoder->encode(frames, plan, cancel);
                art.source_id = config.source_id;
                log_info(variant_name(aspect, format) + " -> " + std::to_string(art.bytes.size()) + " bytes, "
                         + std::to_string(art.frame_count) + " frames, " + std::to_string(art.duration_seconds) + " s");
                result.artifacts.push_back(std::move(art));
            } catch (const EncodingError& e) {
                result.failures.push_back({aspect, format, "encode", e.what()});
                log_warn(variant_name(aspect, format) + " failed at encode: " + e.what());
            }
        }
    }

    auto wall_end = std::chrono::high_resolution_clock::now();
    log_info("produced " + std::to_string(result.artifacts.size()) + " artifacts, "
             + std::to_string(result.failures.size()) + " failures in "
             + std::to_string(std::chrono::duration<double>(wall_end - wall_start).count()) + " s");
    return result;
}
