// Frame ordering and time-gap normalization into per-format encoding plans.
#pragma once
#include <vector>

#include "render/frame_renderer.hpp"

struct TimingOptions {
    double target_duration_seconds = 10.0;  // whole animation, hold included
    double hold_last_seconds = 0.0;         // extra time on the final frame
    int frame_rate = 0;                     // mp4; 0 derives it from the frame count
    double uniform_tolerance = 0.05;        // max/min step ratio still treated as uniform
    int min_gif_delay_cs = 2;
};

struct GifEntry {
    size_t frame;  // index into the timestamp-ordered frames
    int delay_cs;
};

struct EncodingPlan {
    AspectRatio aspect = AspectRatio::Square;
    std::vector<size_t> order;  // order[k] = index of the k-th frame by timestamp in the input
    bool uniform = true;
    std::vector<double> display_seconds;  // per ordered frame, before quantization

    std::vector<GifEntry> gif;
    int fps = 1;
    std::vector<size_t> video_frames;  // one ordered-frame index per video frame

    int gif_duration_cs() const;
    double video_duration_seconds() const { return static_cast<double>(video_frames.size()) / fps; }
};

void validate_timing(const TimingOptions& opt);

// Frames may arrive in any order. Throws InsufficientFramesError for fewer
// than two frames and ValidationError for duplicate timestamps or mixed
// aspect ratios.
EncodingPlan assemble(const std::vector<RenderedFrame>& frames, const TimingOptions& opt);

// Frames reordered according to plan.order.
std::vector<const RenderedFrame*> ordered_frames(const std::vector<RenderedFrame>& frames, const EncodingPlan& plan);
