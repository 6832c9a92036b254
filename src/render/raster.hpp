// RGB8 pixel buffer, row-major, top row first.
#pragma once
#include <algorithm>
#include <cstdint>
#include <vector>

struct Rgb {
    uint8_t r = 0, g = 0, b = 0;
    bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb& o) const { return !(*this == o); }
};

struct Raster {
    int width = 0, height = 0;
    std::vector<uint8_t> rgb;

    Raster() = default;
    Raster(int w, int h, Rgb fill = {}) : width(w), height(h), rgb(static_cast<size_t>(w) * h * 3) {
        for (size_t k = 0; k < rgb.size(); k += 3) {
            rgb[k] = fill.r;
            rgb[k + 1] = fill.g;
            rgb[k + 2] = fill.b;
        }
    }

    inline size_t id(int x, int y) const { return (static_cast<size_t>(y) * width + x) * 3; }

    inline Rgb at(int x, int y) const {
        size_t k = id(x, y);
        return {rgb[k], rgb[k + 1], rgb[k + 2]};
    }

    inline void set(int x, int y, Rgb c) {
        if (x < 0 || y < 0 || x >= width || y >= height) return;
        size_t k = id(x, y);
        rgb[k] = c.r;
        rgb[k + 1] = c.g;
        rgb[k + 2] = c.b;
    }

    void fill_rect(int x0, int y0, int w, int h, Rgb c) {
        int x1 = std::min(width, x0 + w), y1 = std::min(height, y0 + h);
        for (int y = std::max(0, y0); y < y1; ++y)
            for (int x = std::max(0, x0); x < x1; ++x) set(x, y, c);
    }

    // Copies src with its top-left corner at (x0, y0), clipped to this raster.
    void blit(const Raster& src, int x0, int y0) {
        for (int y = 0; y < src.height; ++y) {
            int ty = y0 + y;
            if (ty < 0 || ty >= height) continue;
            for (int x = 0; x < src.width; ++x) {
                int tx = x0 + x;
                if (tx < 0 || tx >= width) continue;
                size_t s = src.id(x, y), d = id(tx, ty);
                rgb[d] = src.rgb[s];
                rgb[d + 1] = src.rgb[s + 1];
                rgb[d + 2] = src.rgb[s + 2];
            }
        }
    }
};
