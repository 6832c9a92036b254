// Runs every requested (aspect ratio, format) variant for one series.
#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "anim/animation_assembler.hpp"
#include "encode/encoder.hpp"
#include "render/color_scale.hpp"
#include "render/frame_renderer.hpp"
#include "series/data_series.hpp"

struct PipelineConfig {
    std::string source_id = "series";
    std::vector<AspectRatio> aspect_ratios{AspectRatio::Square, AspectRatio::Vertical};
    std::vector<OutputFormat> formats{OutputFormat::Mp4, OutputFormat::Gif};
    bool final_still = true;  // also a PNG of the last frame per aspect
    std::optional<ValueRange> color_range;
    ColorRamp ramp = temperature_ramp();
    RenderOptions render;
    TimingOptions timing;
    EncoderOptions encoder;
};

struct VariantFailure {
    AspectRatio aspect;
    OutputFormat format;
    std::string stage;  // "compose", "render", "assemble", "encode"
    std::string reason;
};

struct PipelineResult {
    std::vector<OutputArtifact> artifacts;
    std::vector<VariantFailure> failures;

    bool complete() const { return failures.empty(); }
};

using EncoderFactory = std::function<std::unique_ptr<Encoder>(OutputFormat, const EncoderOptions&)>;

struct Pipeline {
    EncoderFactory encoder_factory = make_encoder;
    const CancelFlag* cancel = nullptr;

    // Throws ValidationError / InsufficientFramesError before any rendering.
    // Composition and encoding failures are reported per variant.
    PipelineResult run(const DataSeries& series, const PipelineConfig& config) const;
};

void validate_config(const PipelineConfig& config);

// Renders one frame per sample, in parallel; result index k is sample k.
std::vector<RenderedFrame> render_all(const DataSeries& series, const FrameRenderer& renderer,
                                      const CancelFlag* cancel);
