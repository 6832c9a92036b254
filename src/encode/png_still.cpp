#include "png_still.hpp"

#include <csetjmp>
#include <png.h>

namespace {

void append_bytes(png_structp png, png_bytep data, png_size_t len) {
    auto* out = static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + len);
}

void no_flush(png_structp) {}

}  // namespace

std::vector<uint8_t> encode_png(const Raster& image) {
    const int w = image.width, h = image.height;
    ensure<EncodingError>(w > 0 && h > 0 && image.rgb.size() == static_cast<size_t>(w) * h * 3,
                          "PNG: empty or malformed image");

    std::vector<uint8_t> out;
    std::vector<png_bytep> rows(static_cast<size_t>(h));
    for (int y = 0; y < h; ++y) rows[y] = const_cast<png_bytep>(image.rgb.data() + image.id(0, y));

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    ensure<EncodingError>(png != nullptr, "PNG: cannot create libpng writer");
    png_infop info = png_create_info_struct(png);
    if (info == nullptr) {
        png_destroy_write_struct(&png, nullptr);
        throw EncodingError("PNG: cannot create libpng info");
    }
    // libpng reports errors by longjmp back here; nothing with a destructor
    // is created past this point.
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        throw EncodingError("PNG: libpng failed while writing " + std::to_string(w) + "x" + std::to_string(h));
    }
    png_set_write_fn(png, &out, append_bytes, no_flush);
    png_set_IHDR(png, info, static_cast<png_uint_32>(w), static_cast<png_uint_32>(h), 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    png_write_image(png, rows.data());
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    return out;
}

OutputArtifact PngEncoder::encode(const std::vector<RenderedFrame>& frames, const EncodingPlan& plan,
                                  const CancelFlag* cancel) const {
    ensure<EncodingError>(!frames.empty() && plan.order.size() == frames.size(), "PNG: plan does not match frames");
    check_cancel(cancel);
    const RenderedFrame& last = frames[plan.order.back()];

    OutputArtifact art;
    art.format = OutputFormat::Png;
    art.aspect = plan.aspect;
    art.bytes = encode_png(last.image);
    art.frame_count = 1;
    art.width = last.image.width;
    art.height = last.image.height;
    return art;
}
