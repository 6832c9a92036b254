// H.264/MP4 encoder driving an ffmpeg child process over a raw rgb24 pipe.
#pragma once
#include <string>

#include "encode/encoder.hpp"

// Absolute path of an executable, searching PATH when name has no '/'.
// Empty when not found.
std::string resolve_executable(const std::string& name);

struct Mp4Encoder : Encoder {
    EncoderOptions opt;
    explicit Mp4Encoder(const EncoderOptions& o) : opt(o) {}

    OutputFormat format() const override { return OutputFormat::Mp4; }
    OutputArtifact encode(const std::vector<RenderedFrame>& frames, const EncodingPlan& plan,
                          const CancelFlag* cancel) const override;

    std::string command(const std::string& ffmpeg, int width, int height, int fps,
                        const std::string& output_path) const;
};
