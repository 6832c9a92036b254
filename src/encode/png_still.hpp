// Single PNG still of the final frame, written through libpng.
#pragma once
#include <cstdint>
#include <vector>

#include "encode/encoder.hpp"

// 8-bit RGB, no interlacing. Throws EncodingError.
std::vector<uint8_t> encode_png(const Raster& image);

// Emits the latest frame by timestamp; timing in the plan is ignored.
struct PngEncoder : Encoder {
    EncoderOptions opt;
    explicit PngEncoder(const EncoderOptions& o) : opt(o) {}

    OutputFormat format() const override { return OutputFormat::Png; }
    OutputArtifact encode(const std::vector<RenderedFrame>& frames, const EncodingPlan& plan,
                          const CancelFlag* cancel) const override;
};
