#include "mp4_encoder.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::string shell_quote(const std::string& s) {
    std::string q = "'";
    for (char c : s) {
        if (c == '\'')
            q += "'\\''";
        else
            q += c;
    }
    return q + "'";
}

bool is_executable(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

// A reader that exits early must not kill us with SIGPIPE; the short write
// is reported instead.
struct IgnoreSigpipe {
    using Handler = void (*)(int);
    Handler previous;
    IgnoreSigpipe() : previous(std::signal(SIGPIPE, SIG_IGN)) {}
    ~IgnoreSigpipe() { std::signal(SIGPIPE, previous == SIG_ERR ? SIG_DFL : previous); }
};

struct Pipe {
    FILE* fp = nullptr;
    explicit Pipe(const std::string& cmd) : fp(popen(cmd.c_str(), "w")) {}
    ~Pipe() {
        if (fp) pclose(fp);
    }
    int close() {
        int status = pclose(fp);
        fp = nullptr;
        return status;
    }
};

struct TempFile {
    fs::path path;
    ~TempFile() {
        std::error_code ec;
        fs::remove(path, ec);
    }
};

fs::path temp_output_path() {
    static std::atomic<unsigned> counter{0};
    std::error_code ec;
    const fs::path dir = fs::temp_directory_path(ec);
    ensure<EncodingError>(!ec, "MP4: no temporary directory: " + ec.message());
    ensure<EncodingError>(fs::is_directory(dir, ec), "MP4: temporary directory " + dir.string() + " does not exist");
    return dir / ("wxanim_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + ".mp4");
}

}  // namespace

std::string resolve_executable(const std::string& name) {
    if (name.find('/') != std::string::npos) return is_executable(name) ? name : std::string();
    const char* env = std::getenv("PATH");
    std::stringstream dirs(env ? env : "");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        if (is_executable(candidate)) return candidate.string();
    }
    return "";
}

std::string Mp4Encoder::command(const std::string& ffmpeg, int width, int height, int fps,
                                const std::string& output_path) const {
    std::ostringstream cmd;
    cmd << shell_quote(ffmpeg) << " -y -loglevel error -nostats"
        << " -f rawvideo -vcodec rawvideo -pix_fmt rgb24"
        << " -s " << width << "x" << height << " -r " << fps << " -i -"
        << " -an -c:v libx264 -profile:v high -pix_fmt yuv420p"
        << " -crf " << opt.crf << " -preset " << shell_quote(opt.preset) << " -movflags +faststart"
        << " -f mp4 " << shell_quote(output_path);
    return cmd.str();
}

OutputArtifact Mp4Encoder::encode(const std::vector<RenderedFrame>& frames, const EncodingPlan& plan,
                                  const CancelFlag* cancel) const {
    ensure<EncodingError>(!plan.video_frames.empty() && plan.order.size() == frames.size() && plan.fps >= 1,
                          "MP4: plan does not match frames");
    auto ordered = ordered_frames(frames, plan);
    const int w = ordered.front()->image.width, h = ordered.front()->image.height;
    ensure<EncodingError>(w % 2 == 0 && h % 2 == 0,
                          "MP4: yuv420p needs even dimensions, got " + std::to_string(w) + "x" + std::to_string(h));
    const size_t frame_bytes = static_cast<size_t>(w) * h * 3;
    for (const auto* f : ordered)
        ensure<EncodingError>(f->image.width == w && f->image.height == h && f->image.rgb.size() == frame_bytes,
                              "MP4: frames differ in size or pixel format");

    const std::string ffmpeg = resolve_executable(opt.ffmpeg_path);
    ensure<EncodingError>(!ffmpeg.empty(), "MP4: ffmpeg not found (" + opt.ffmpeg_path + ")");

    TempFile tmp{temp_output_path()};
    {
        IgnoreSigpipe guard;
        Pipe pipe(command(ffmpeg, w, h, plan.fps, tmp.path.string()));
        ensure<EncodingError>(pipe.fp != nullptr, "MP4: failed to start ffmpeg");
        for (size_t idx : plan.video_frames) {
            check_cancel(cancel);
            ensure<EncodingError>(idx < ordered.size(), "MP4: plan references a missing frame");
            size_t written = std::fwrite(ordered[idx]->image.rgb.data(), 1, frame_bytes, pipe.fp);
            ensure<EncodingError>(written == frame_bytes, "MP4: short write to ffmpeg pipe");
        }
        int status = pipe.close();
        ensure<EncodingError>(status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0,
                              "MP4: ffmpeg exited with status " + std::to_string(status));
    }

    std::error_code ec;
    ensure<EncodingError>(fs::is_regular_file(tmp.path, ec), "MP4: ffmpeg produced no output");
    std::ifstream in(tmp.path, std::ios::binary);
    ensure<EncodingError>(in.good(), "MP4: cannot read " + tmp.path.string());
    OutputArtifact art;
    art.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    ensure<EncodingError>(!in.bad(), "MP4: read error on " + tmp.path.string());
    ensure<EncodingError>(!art.bytes.empty(), "MP4: ffmpeg produced an empty file");

    art.format = OutputFormat::Mp4;
    art.aspect = plan.aspect;
    art.duration_seconds = plan.video_duration_seconds();
    art.frame_count = plan.video_frames.size();
    art.width = w;
    art.height = h;
    return art;
}
