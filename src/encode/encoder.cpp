#include "encoder.hpp"

#include <cctype>

#include "encode/gif_encoder.hpp"
#include "encode/mp4_encoder.hpp"
#include "encode/png_still.hpp"

std::string to_string(OutputFormat f) {
    switch (f) {
    case OutputFormat::Gif: return "gif";
    case OutputFormat::Png: return "png";
    default: return "mp4";
    }
}

OutputFormat parse_format(const std::string& s) {
    if (s == "gif") return OutputFormat::Gif;
    if (s == "mp4") return OutputFormat::Mp4;
    if (s == "png") return OutputFormat::Png;
    throw ValidationError("Unknown output format: " + s);
}

std::string artifact_file_name(const std::string& source_id, AspectRatio aspect, OutputFormat format) {
    std::string base;
    for (char c : source_id)
        base += (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_') ? c : '_';
    if (base.empty()) base = "series";
    return base + "_" + to_string(aspect) + "." + to_string(format);
}

void validate_encoder_options(const EncoderOptions& opt) {
    ensure<ValidationError>(opt.loop_count >= 0 && opt.loop_count <= 65535, "loop_count must be in [0,65535]");
    ensure<ValidationError>(opt.palette_size >= 2 && opt.palette_size <= 256, "palette_size must be in [2,256]");
    ensure<ValidationError>(opt.crf >= 0 && opt.crf <= 51, "crf must be in [0,51]");
    ensure<ValidationError>(!opt.ffmpeg_path.empty(), "ffmpeg_path is empty");
}

void check_cancel(const CancelFlag* cancel) {
    if (cancel && cancel->load(std::memory_order_relaxed)) throw CancelledError("cancelled");
}

std::unique_ptr<Encoder> make_encoder(OutputFormat format, const EncoderOptions& opt) {
    if (format == OutputFormat::Gif) return std::make_unique<GifEncoder>(opt);
    if (format == OutputFormat::Png) return std::make_unique<PngEncoder>(opt);
    return std::make_unique<Mp4Encoder>(opt);
}
