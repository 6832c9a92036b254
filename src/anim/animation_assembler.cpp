#include "animation_assembler.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

void validate_timing(const TimingOptions& opt) {
    ensure<ValidationError>(std::isfinite(opt.target_duration_seconds) && opt.target_duration_seconds > 0.0,
                            "target_duration_seconds must be > 0");
    ensure<ValidationError>(std::isfinite(opt.hold_last_seconds) && opt.hold_last_seconds >= 0.0,
                            "hold_last_seconds must be >= 0");
    ensure<ValidationError>(opt.target_duration_seconds - opt.hold_last_seconds > 0.0,
                            "hold_last_seconds leaves no time for the animation");
    ensure<ValidationError>(opt.frame_rate >= 0 && opt.frame_rate <= 240, "frame_rate must be in [0,240]");
    ensure<ValidationError>(opt.uniform_tolerance >= 0.0, "uniform_tolerance must be >= 0");
    ensure<ValidationError>(opt.min_gif_delay_cs >= 1, "min_gif_delay_cs must be >= 1");
}

int EncodingPlan::gif_duration_cs() const {
    int total = 0;
    for (const auto& e : gif) total += e.delay_cs;
    return total;
}

EncodingPlan assemble(const std::vector<RenderedFrame>& frames, const TimingOptions& opt) {
    validate_timing(opt);
    ensure<InsufficientFramesError>(frames.size() >= 2,
                                    "Need at least 2 frames to animate, got " + std::to_string(frames.size()));

    EncodingPlan plan;
    plan.aspect = frames.front().aspect;
    plan.order.resize(frames.size());
    std::iota(plan.order.begin(), plan.order.end(), size_t{0});
    std::stable_sort(plan.order.begin(), plan.order.end(),
                     [&](size_t a, size_t b) { return frames[a].time < frames[b].time; });

    const size_t n = frames.size();
    std::vector<double> deltas(n - 1);
    for (size_t k = 0; k < n; ++k) {
        const auto& f = frames[plan.order[k]];
        ensure<ValidationError>(f.aspect == plan.aspect, "Frames of different aspect ratios in one animation");
        if (k > 0) {
            const auto& prev = frames[plan.order[k - 1]];
            ensure<ValidationError>(f.time > prev.time,
                                    "Duplicate frame timestamp " + format_timestamp(f.time, "%Y-%m-%dT%H:%M:%SZ"));
            deltas[k - 1] = static_cast<double>(f.time - prev.time);
        }
    }

    auto [dmin, dmax] = std::minmax_element(deltas.begin(), deltas.end());
    plan.uniform = (*dmax / *dmin - 1.0) <= opt.uniform_tolerance;

    // Irregular gaps: display time proportional to the gap that follows each
    // frame; the last frame has no successor and takes the median gap.
    std::vector<double> weight(n, 1.0);
    if (!plan.uniform) {
        std::vector<double> sorted = deltas;
        std::nth_element(sorted.begin(), sorted.begin() + sorted.size() / 2, sorted.end());
        for (size_t k = 0; k + 1 < n; ++k) weight[k] = deltas[k];
        weight[n - 1] = sorted[sorted.size() / 2];
    }
    const double T = opt.target_duration_seconds - opt.hold_last_seconds;
    const double wsum = std::accumulate(weight.begin(), weight.end(), 0.0);
    plan.display_seconds.resize(n);
    for (size_t k = 0; k < n; ++k) plan.display_seconds[k] = T * weight[k] / wsum;

    // GIF delays are centiseconds; carry the rounding error forward so the
    // total tracks the target.
    double carry = 0.0;
    for (size_t k = 0; k < n; ++k) {
        double exact = plan.display_seconds[k] * 100.0 + carry;
        int cs = std::max(opt.min_gif_delay_cs, static_cast<int>(std::lround(exact)));
        carry = exact - cs;
        plan.gif.push_back({k, cs});
    }
    plan.gif.back().delay_cs += static_cast<int>(std::lround(opt.hold_last_seconds * 100.0));

    // MP4: constant rate, each video frame shows whichever data frame is on
    // screen at its midpoint on the normalized timeline.
    const bool derived = opt.frame_rate <= 0;
    plan.fps = derived ? std::max(1, static_cast<int>(std::lround(n / T))) : opt.frame_rate;
    // One video frame per data frame only while that still lands within one
    // video frame of the target duration.
    const bool one_to_one =
        derived && plan.uniform && std::abs(static_cast<double>(n) / plan.fps - T) <= 1.0 / plan.fps + 1e-9;
    const size_t video_count = one_to_one ? n : static_cast<size_t>(std::max(1L, std::lround(T * plan.fps)));

    std::vector<double> end(n);
    std::partial_sum(plan.display_seconds.begin(), plan.display_seconds.end(), end.begin());
    size_t k = 0;
    for (size_t m = 0; m < video_count; ++m) {
        double t = (m + 0.5) / video_count * T;
        while (k + 1 < n && t >= end[k]) ++k;
        plan.video_frames.push_back(k);
    }
    const long hold_frames = std::lround(opt.hold_last_seconds * plan.fps);
    for (long h = 0; h < hold_frames; ++h) plan.video_frames.push_back(n - 1);

    return plan;
}

std::vector<const RenderedFrame*> ordered_frames(const std::vector<RenderedFrame>& frames, const EncodingPlan& plan) {
    std::vector<const RenderedFrame*> out;
    out.reserve(plan.order.size());
    for (size_t idx : plan.order) out.push_back(&frames[idx]);
    return out;
}
