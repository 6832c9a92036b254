#include <gtest/gtest.h>

#include <cstring>
#include <png.h>

#include "encode/png_still.hpp"
#include "test_helpers.hpp"

using namespace testutil;

namespace {

Raster decode_png(const std::vector<uint8_t>& bytes) {
    png_image img;
    std::memset(&img, 0, sizeof(img));
    img.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_memory(&img, bytes.data(), bytes.size())) throw std::runtime_error(img.message);
    img.format = PNG_FORMAT_RGB;
    Raster out(static_cast<int>(img.width), static_cast<int>(img.height));
    if (!png_image_finish_read(&img, nullptr, out.rgb.data(), 0, nullptr)) throw std::runtime_error(img.message);
    return out;
}

}  // namespace

class PngStillTest : public ::testing::Test {
protected:
    EncoderOptions opt;
    TimingOptions timing;
};

TEST_F(PngStillTest, EncodesRasterLosslessly) {
    Raster image(7, 5, {12, 34, 56});
    image.set(0, 0, {255, 0, 0});
    image.set(6, 4, {0, 0, 255});
    image.set(3, 2, {1, 2, 3});

    auto bytes = encode_png(image);
    const uint8_t signature[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    ASSERT_GT(bytes.size(), sizeof(signature));
    EXPECT_EQ(std::memcmp(bytes.data(), signature, sizeof(signature)), 0);

    Raster back = decode_png(bytes);
    EXPECT_EQ(back.width, 7);
    EXPECT_EQ(back.height, 5);
    EXPECT_EQ(back.rgb, image.rgb);
}

TEST_F(PngStillTest, StillShowsLatestFrame) {
    // Input order differs from timestamp order; the latest timestamp is green.
    std::vector<RenderedFrame> frames;
    frames.push_back(solid_frame(T0 + 2 * HOUR, 8, 6, {0, 200, 0}));
    frames.push_back(solid_frame(T0, 8, 6, {200, 0, 0}));
    frames.push_back(solid_frame(T0 + HOUR, 8, 6, {0, 0, 200}));
    auto plan = assemble(frames, timing);
    auto art = PngEncoder(opt).encode(frames, plan, nullptr);

    EXPECT_EQ(art.format, OutputFormat::Png);
    EXPECT_EQ(art.frame_count, 1u);
    EXPECT_EQ(art.width, 8);
    EXPECT_EQ(art.height, 6);
    Raster back = decode_png(art.bytes);
    EXPECT_EQ(back.at(0, 0), (Rgb{0, 200, 0}));
    EXPECT_EQ(back.at(7, 5), (Rgb{0, 200, 0}));
}

TEST_F(PngStillTest, EmptyImageRejected) {
    EXPECT_THROW(encode_png(Raster()), EncodingError);
}

TEST_F(PngStillTest, CancelStopsEncoding) {
    std::vector<RenderedFrame> frames{solid_frame(T0, 4, 4, {}), solid_frame(T0 + HOUR, 4, 4, {})};
    CancelFlag cancel{true};
    EXPECT_THROW(PngEncoder(opt).encode(frames, assemble(frames, timing), &cancel), CancelledError);
}
