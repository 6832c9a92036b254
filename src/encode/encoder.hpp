// Container encoders consuming ordered frames plus an encoding plan.
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "anim/animation_assembler.hpp"
#include "render/frame_renderer.hpp"

enum class OutputFormat { Mp4, Gif, Png };

std::string to_string(OutputFormat f);
OutputFormat parse_format(const std::string& s);

struct OutputArtifact {
    std::string source_id;
    OutputFormat format = OutputFormat::Gif;
    AspectRatio aspect = AspectRatio::Square;
    std::vector<uint8_t> bytes;
    double duration_seconds = 0.0;
    size_t frame_count = 0;
    int width = 0, height = 0;
};

// <source>_<aspect>.<format>, source reduced to [A-Za-z0-9_-].
std::string artifact_file_name(const std::string& source_id, AspectRatio aspect, OutputFormat format);

struct EncoderOptions {
    int loop_count = 0;  // gif, 0 loops forever
    int palette_size = 256;
    std::string ffmpeg_path = "ffmpeg";
    int crf = 23;
    std::string preset = "medium";
};

void validate_encoder_options(const EncoderOptions& opt);

using CancelFlag = std::atomic<bool>;

// Throws CancelledError once the flag is raised. Called between frames.
void check_cancel(const CancelFlag* cancel);

struct Encoder {
    virtual ~Encoder() = default;
    virtual OutputFormat format() const = 0;
    // Throws EncodingError; fills everything but source_id.
    virtual OutputArtifact encode(const std::vector<RenderedFrame>& frames, const EncodingPlan& plan,
                                  const CancelFlag* cancel) const = 0;
};

std::unique_ptr<Encoder> make_encoder(OutputFormat format, const EncoderOptions& opt);
