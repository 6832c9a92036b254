// GIF89a encoder with one palette shared by every frame.
#pragma once
#include <cstdint>
#include <vector>

#include "encode/encoder.hpp"

// Up to max_colors entries. Exact when the frames use no more colors than
// that, median cut over sampled pixels otherwise.
std::vector<Rgb> build_shared_palette(const std::vector<const RenderedFrame*>& frames, int max_colors);

// Variable-width LZW code stream (not yet split into sub-blocks).
std::vector<uint8_t> lzw_compress(const std::vector<uint8_t>& indices, int min_code_size);

struct GifEncoder : Encoder {
    EncoderOptions opt;
    explicit GifEncoder(const EncoderOptions& o) : opt(o) {}

    OutputFormat format() const override { return OutputFormat::Gif; }
    OutputArtifact encode(const std::vector<RenderedFrame>& frames, const EncodingPlan& plan,
                          const CancelFlag* cancel) const override;
};
