#include <gtest/gtest.h>

#include <cstdlib>

#include "encode/gif_encoder.hpp"
#include "test_helpers.hpp"

using namespace testutil;

class GifEncoderTest : public ::testing::Test {
protected:
    EncoderOptions opt;
    TimingOptions timing;

    // Three 6x4 frames with a solid background and one marker pixel each.
    std::vector<RenderedFrame> marked_frames() {
        std::vector<RenderedFrame> frames;
        const Rgb colors[] = {{255, 0, 0}, {0, 255, 0}, {0, 0, 255}};
        for (int k = 0; k < 3; ++k) {
            auto f = solid_frame(T0 + k * HOUR, 6, 4, {250, 250, 250});
            f.image.set(k, k, colors[k]);
            frames.push_back(std::move(f));
        }
        return frames;
    }
};

TEST_F(GifEncoderTest, WritesFramesDelaysAndLoop) {
    timing.target_duration_seconds = 3.0;
    opt.loop_count = 0;
    auto frames = marked_frames();
    auto plan = assemble(frames, timing);
    auto art = GifEncoder(opt).encode(frames, plan, nullptr);

    EXPECT_EQ(art.format, OutputFormat::Gif);
    EXPECT_EQ(art.frame_count, 3u);
    EXPECT_DOUBLE_EQ(art.duration_seconds, 3.0);
    EXPECT_EQ(art.bytes.back(), 0x3B);

    auto gif = read_gif(art.bytes);
    EXPECT_EQ(gif.width, 6);
    EXPECT_EQ(gif.height, 4);
    EXPECT_EQ(gif.loop_count, 0);
    ASSERT_EQ(gif.frames.size(), 3u);
    for (const auto& f : gif.frames) {
        EXPECT_EQ(f.delay_cs, 100);
        ASSERT_EQ(f.indices.size(), 24u);
    }
    EXPECT_EQ(gif.pixel(0, 0, 0), (Rgb{255, 0, 0}));
    EXPECT_EQ(gif.pixel(1, 1, 1), (Rgb{0, 255, 0}));
    EXPECT_EQ(gif.pixel(2, 2, 2), (Rgb{0, 0, 255}));
    EXPECT_EQ(gif.pixel(2, 5, 3), (Rgb{250, 250, 250}));
}

TEST_F(GifEncoderTest, FramesFollowTimestampOrder) {
    auto frames = marked_frames();
    std::swap(frames[0], frames[2]);
    auto plan = assemble(frames, timing);
    auto gif = read_gif(GifEncoder(opt).encode(frames, plan, nullptr).bytes);
    ASSERT_EQ(gif.frames.size(), 3u);
    EXPECT_EQ(gif.pixel(0, 0, 0), (Rgb{255, 0, 0}));
    EXPECT_EQ(gif.pixel(2, 2, 2), (Rgb{0, 0, 255}));
}

TEST_F(GifEncoderTest, FiniteLoopCount) {
    opt.loop_count = 3;
    auto frames = marked_frames();
    auto gif = read_gif(GifEncoder(opt).encode(frames, assemble(frames, timing), nullptr).bytes);
    EXPECT_EQ(gif.loop_count, 3);
}

TEST_F(GifEncoderTest, ManyColorsQuantizedToSharedPalette) {
    std::vector<RenderedFrame> frames;
    for (int k = 0; k < 2; ++k) {
        Raster img(64, 64);
        for (int y = 0; y < 64; ++y)
            for (int x = 0; x < 64; ++x)
                img.set(x, y, {static_cast<uint8_t>(x * 4), static_cast<uint8_t>(y * 4), static_cast<uint8_t>(k * 200)});
        frames.push_back({T0 + k * HOUR, AspectRatio::Square, std::move(img)});
    }
    auto gif = read_gif(GifEncoder(opt).encode(frames, assemble(frames, timing), nullptr).bytes);
    ASSERT_EQ(gif.palette.size(), 256u);
    ASSERT_EQ(gif.frames.size(), 2u);
    for (size_t k = 0; k < 2; ++k) {
        ASSERT_EQ(gif.frames[k].indices.size(), 64u * 64u);
        for (int y = 0; y < 64; y += 7)
            for (int x = 0; x < 64; x += 5) {
                Rgb want = frames[k].image.at(x, y);
                Rgb got = gif.pixel(k, x, y);
                EXPECT_LE(std::abs(int(want.r) - got.r), 24);
                EXPECT_LE(std::abs(int(want.g) - got.g), 24);
                EXPECT_LE(std::abs(int(want.b) - got.b), 24);
            }
    }
}

TEST_F(GifEncoderTest, LzwSurvivesTableReset) {
    std::vector<uint8_t> indices(30000);
    uint32_t state = 12345;
    for (auto& px : indices) {
        state = state * 1103515245u + 12345u;
        px = static_cast<uint8_t>((state >> 16) & 0xFF);
    }
    EXPECT_EQ(lzw_decode(lzw_compress(indices, 8), 8), indices);

    std::vector<uint8_t> runs(5000, 1);
    EXPECT_EQ(lzw_decode(lzw_compress(runs, 2), 2), runs);
}

TEST_F(GifEncoderTest, CancelStopsEncoding) {
    auto frames = marked_frames();
    CancelFlag cancel{true};
    EXPECT_THROW(GifEncoder(opt).encode(frames, assemble(frames, timing), &cancel), CancelledError);
}

TEST_F(GifEncoderTest, MismatchedFrameSizesRejected) {
    auto frames = marked_frames();
    frames[1].image = Raster(5, 4);
    EXPECT_THROW(GifEncoder(opt).encode(frames, assemble(frames, timing), nullptr), EncodingError);
}

TEST_F(GifEncoderTest, DelayBeyondSixteenBitsRejected) {
    timing.target_duration_seconds = 800.0;
    timing.hold_last_seconds = 700.0;
    auto frames = marked_frames();
    auto plan = assemble(frames, timing);
    ASSERT_GT(plan.gif.back().delay_cs, 65535);
    EXPECT_THROW(GifEncoder(opt).encode(frames, plan, nullptr), EncodingError);
}

TEST(ArtifactNameTest, DeterministicAndSanitized) {
    EXPECT_EQ(artifact_file_name("seatac", AspectRatio::Square, OutputFormat::Gif), "seatac_square.gif");
    EXPECT_EQ(artifact_file_name("sea tac/2", AspectRatio::Vertical, OutputFormat::Mp4), "sea_tac_2_vertical.mp4");
    EXPECT_EQ(artifact_file_name("", AspectRatio::Square, OutputFormat::Mp4), "series_square.mp4");
    EXPECT_EQ(artifact_file_name("seatac", AspectRatio::Vertical, OutputFormat::Png), "seatac_vertical.png");
    EXPECT_EQ(parse_format("png"), OutputFormat::Png);
}
