#include <gtest/gtest.h>

#include <algorithm>

#include "anim/animation_assembler.hpp"
#include "test_helpers.hpp"

using namespace testutil;

class AnimationAssemblerTest : public ::testing::Test {
protected:
    TimingOptions opt;

    std::vector<RenderedFrame> frames_at(const std::vector<Timestamp>& times) {
        std::vector<RenderedFrame> frames;
        for (auto t : times) frames.push_back(solid_frame(t, 2, 2, {}));
        return frames;
    }

    std::vector<RenderedFrame> hourly(int n) {
        std::vector<Timestamp> times;
        for (int k = 0; k < n; ++k) times.push_back(T0 + k * HOUR);
        return frames_at(times);
    }
};

TEST_F(AnimationAssemblerTest, UniformDayInSixSeconds) {
    opt.target_duration_seconds = 6.0;
    auto plan = assemble(hourly(24), opt);
    EXPECT_TRUE(plan.uniform);
    ASSERT_EQ(plan.gif.size(), 24u);
    for (const auto& e : plan.gif) EXPECT_EQ(e.delay_cs, 25);
    EXPECT_EQ(plan.gif_duration_cs(), 600);
    EXPECT_EQ(plan.fps, 4);
    ASSERT_EQ(plan.video_frames.size(), 24u);
    for (size_t k = 0; k < 24; ++k) EXPECT_EQ(plan.video_frames[k], k);
    EXPECT_DOUBLE_EQ(plan.video_duration_seconds(), 6.0);
}

TEST_F(AnimationAssemblerTest, SortsFramesByTimestamp) {
    auto frames = frames_at({T0 + 2 * HOUR, T0, T0 + 3 * HOUR, T0 + HOUR});
    auto plan = assemble(frames, opt);
    EXPECT_EQ(plan.order, (std::vector<size_t>{1, 3, 0, 2}));
    auto ordered = ordered_frames(frames, plan);
    for (size_t k = 1; k < ordered.size(); ++k) EXPECT_LT(ordered[k - 1]->time, ordered[k]->time);
}

TEST_F(AnimationAssemblerTest, IrregularGapsStretchDisplayTime) {
    opt.target_duration_seconds = 6.0;
    // Gaps of 1h, 1h, 3h; the last frame takes the median gap.
    auto plan = assemble(frames_at({T0, T0 + HOUR, T0 + 2 * HOUR, T0 + 5 * HOUR}), opt);
    EXPECT_FALSE(plan.uniform);
    ASSERT_EQ(plan.gif.size(), 4u);
    EXPECT_EQ(plan.gif[0].delay_cs, 100);
    EXPECT_EQ(plan.gif[1].delay_cs, 100);
    EXPECT_EQ(plan.gif[2].delay_cs, 300);
    EXPECT_EQ(plan.gif[3].delay_cs, 100);
    EXPECT_EQ(plan.fps, 1);
    EXPECT_EQ(plan.video_frames, (std::vector<size_t>{0, 1, 2, 2, 2, 3}));
}

TEST_F(AnimationAssemblerTest, SmallJitterStillUniform) {
    auto plan = assemble(frames_at({T0, T0 + 3600, T0 + 7260, T0 + 10800}), opt);
    EXPECT_TRUE(plan.uniform);
}

TEST_F(AnimationAssemblerTest, HoldExtendsLastFrame) {
    opt.target_duration_seconds = 6.0;
    opt.hold_last_seconds = 1.0;
    auto plan = assemble(hourly(24), opt);
    EXPECT_EQ(plan.gif_duration_cs(), 600);
    EXPECT_GE(plan.gif.back().delay_cs, 100);
    EXPECT_EQ(plan.fps, 5);
    ASSERT_EQ(plan.video_frames.size(), 24u + 5u);
    for (size_t k = 24; k < plan.video_frames.size(); ++k) EXPECT_EQ(plan.video_frames[k], 23u);
}

TEST_F(AnimationAssemblerTest, FixedFrameRateResamples) {
    opt.target_duration_seconds = 6.0;
    opt.frame_rate = 10;
    auto plan = assemble(hourly(24), opt);
    EXPECT_EQ(plan.fps, 10);
    ASSERT_EQ(plan.video_frames.size(), 60u);
    EXPECT_EQ(plan.video_frames.front(), 0u);
    EXPECT_EQ(plan.video_frames.back(), 23u);
    EXPECT_TRUE(std::is_sorted(plan.video_frames.begin(), plan.video_frames.end()));
}

TEST_F(AnimationAssemblerTest, FewFramesStillFillTargetDuration) {
    opt.target_duration_seconds = 10.0;
    auto plan = assemble(hourly(3), opt);
    EXPECT_EQ(plan.fps, 1);
    ASSERT_EQ(plan.video_frames.size(), 10u);
    EXPECT_DOUBLE_EQ(plan.video_duration_seconds(), 10.0);
    EXPECT_EQ(plan.gif_duration_cs(), 1000);
    // Each of the three frames holds for about a third of the clip.
    EXPECT_EQ(plan.video_frames, (std::vector<size_t>{0, 0, 0, 1, 1, 1, 1, 2, 2, 2}));
}

TEST_F(AnimationAssemblerTest, DerivedRateRoundingDoesNotShortenClip) {
    // round(24 / 20) = 1 fps; one video frame per data frame would last 24 s.
    opt.target_duration_seconds = 20.0;
    auto plan = assemble(hourly(24), opt);
    EXPECT_EQ(plan.fps, 1);
    ASSERT_EQ(plan.video_frames.size(), 20u);
    EXPECT_DOUBLE_EQ(plan.video_duration_seconds(), 20.0);
    EXPECT_EQ(plan.gif_duration_cs(), 2000);
    EXPECT_EQ(plan.video_frames.front(), 0u);
    EXPECT_EQ(plan.video_frames.back(), 23u);
    EXPECT_TRUE(std::is_sorted(plan.video_frames.begin(), plan.video_frames.end()));
}

TEST_F(AnimationAssemblerTest, ShortFramesHitMinimumDelay) {
    opt.target_duration_seconds = 0.5;
    auto plan = assemble(hourly(50), opt);
    for (const auto& e : plan.gif) EXPECT_GE(e.delay_cs, opt.min_gif_delay_cs);
}

TEST_F(AnimationAssemblerTest, RejectsBadInput) {
    EXPECT_THROW(assemble(hourly(1), opt), InsufficientFramesError);
    EXPECT_THROW(assemble(frames_at({T0, T0 + HOUR, T0 + HOUR}), opt), ValidationError);

    auto mixed = hourly(3);
    mixed[1].aspect = AspectRatio::Vertical;
    EXPECT_THROW(assemble(mixed, opt), ValidationError);
}

TEST_F(AnimationAssemblerTest, RejectsBadTiming) {
    TimingOptions bad;
    bad.target_duration_seconds = 0.0;
    EXPECT_THROW(validate_timing(bad), ValidationError);
    bad = TimingOptions();
    bad.hold_last_seconds = -1.0;
    EXPECT_THROW(validate_timing(bad), ValidationError);
    bad = TimingOptions();
    bad.hold_last_seconds = bad.target_duration_seconds;
    EXPECT_THROW(validate_timing(bad), ValidationError);
    bad = TimingOptions();
    bad.frame_rate = -2;
    EXPECT_THROW(validate_timing(bad), ValidationError);
}
