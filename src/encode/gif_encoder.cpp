#include "gif_encoder.hpp"

#include <algorithm>
#include <numeric>
#include <unordered_map>
#include <unordered_set>

namespace {

constexpr size_t PALETTE_SAMPLE_TARGET = 200000;

inline uint32_t pack(uint8_t r, uint8_t g, uint8_t b) { return (uint32_t(r) << 16) | (uint32_t(g) << 8) | b; }

struct ColorBox {
    std::vector<uint32_t> indices;
    uint8_t lo[3], hi[3];

    void compute_bounds(const std::vector<uint8_t>& px) {
        for (int c = 0; c < 3; ++c) {
            lo[c] = 255;
            hi[c] = 0;
        }
        for (uint32_t idx : indices)
            for (int c = 0; c < 3; ++c) {
                lo[c] = std::min(lo[c], px[idx * 3 + c]);
                hi[c] = std::max(hi[c], px[idx * 3 + c]);
            }
    }

    int longest_axis() const {
        int best = 0;
        for (int c = 1; c < 3; ++c)
            if (hi[c] - lo[c] > hi[best] - lo[best]) best = c;
        return best;
    }

    bool splittable() const { return indices.size() > 1 && (hi[0] > lo[0] || hi[1] > lo[1] || hi[2] > lo[2]); }

    Rgb average(const std::vector<uint8_t>& px) const {
        uint64_t sum[3] = {0, 0, 0};
        for (uint32_t idx : indices)
            for (int c = 0; c < 3; ++c) sum[c] += px[idx * 3 + c];
        const uint64_t n = std::max<uint64_t>(1, indices.size());
        return {static_cast<uint8_t>((sum[0] + n / 2) / n), static_cast<uint8_t>((sum[1] + n / 2) / n),
                static_cast<uint8_t>((sum[2] + n / 2) / n)};
    }
};

std::vector<Rgb> median_cut(const std::vector<uint8_t>& px, int max_colors) {
    ColorBox initial;
    initial.indices.resize(px.size() / 3);
    std::iota(initial.indices.begin(), initial.indices.end(), 0u);
    initial.compute_bounds(px);

    std::vector<ColorBox> boxes;
    boxes.push_back(std::move(initial));
    while (static_cast<int>(boxes.size()) < max_colors) {
        // Split the most populated box that still has a color range.
        size_t best = boxes.size();
        for (size_t k = 0; k < boxes.size(); ++k)
            if (boxes[k].splittable() && (best == boxes.size() || boxes[k].indices.size() > boxes[best].indices.size()))
                best = k;
        if (best == boxes.size()) break;

        auto& box = boxes[best];
        int axis = box.longest_axis();
        size_t mid = box.indices.size() / 2;
        std::nth_element(box.indices.begin(), box.indices.begin() + mid, box.indices.end(),
                         [&](uint32_t a, uint32_t b) { return px[a * 3 + axis] < px[b * 3 + axis]; });
        ColorBox other;
        other.indices.assign(box.indices.begin() + mid, box.indices.end());
        box.indices.resize(mid);
        box.compute_bounds(px);
        other.compute_bounds(px);
        boxes.push_back(std::move(other));
    }

    std::vector<Rgb> palette;
    palette.reserve(boxes.size());
    for (const auto& box : boxes) palette.push_back(box.average(px));
    return palette;
}

uint8_t nearest_index(const std::vector<Rgb>& palette, Rgb c) {
    uint8_t best = 0;
    int best_dist = 1 << 30;
    for (size_t k = 0; k < palette.size(); ++k) {
        int dr = int(c.r) - palette[k].r, dg = int(c.g) - palette[k].g, db = int(c.b) - palette[k].b;
        int dist = dr * dr + dg * dg + db * db;
        if (dist < best_dist) {
            best_dist = dist;
            best = static_cast<uint8_t>(k);
        }
    }
    return best;
}

void put16(std::vector<uint8_t>& out, int v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

}  // namespace

std::vector<Rgb> build_shared_palette(const std::vector<const RenderedFrame*>& frames, int max_colors) {
    std::unordered_set<uint32_t> distinct;
    size_t total = 0;
    for (const auto* f : frames) {
        const auto& px = f->image.rgb;
        total += px.size() / 3;
        for (size_t k = 0; k < px.size() && static_cast<int>(distinct.size()) <= max_colors; k += 3)
            distinct.insert(pack(px[k], px[k + 1], px[k + 2]));
    }
    if (static_cast<int>(distinct.size()) <= max_colors) {
        std::vector<uint32_t> sorted(distinct.begin(), distinct.end());
        std::sort(sorted.begin(), sorted.end());
        std::vector<Rgb> palette;
        for (uint32_t c : sorted)
            palette.push_back({static_cast<uint8_t>(c >> 16), static_cast<uint8_t>(c >> 8), static_cast<uint8_t>(c)});
        return palette;
    }

    // Sample evenly across all frames so later frames shape the palette too.
    const size_t stride = std::max<size_t>(1, total / PALETTE_SAMPLE_TARGET);
    std::vector<uint8_t> sample;
    sample.reserve((total / stride + frames.size()) * 3);
    for (const auto* f : frames) {
        const auto& px = f->image.rgb;
        for (size_t p = 0; p < px.size() / 3; p += stride)
            sample.insert(sample.end(), px.begin() + p * 3, px.begin() + p * 3 + 3);
    }
    return median_cut(sample, max_colors);
}

std::vector<uint8_t> lzw_compress(const std::vector<uint8_t>& indices, int min_code_size) {
    const int clear = 1 << min_code_size;
    const int eoi = clear + 1;
    int code_size = min_code_size + 1;
    int max_code = eoi;  // last assigned code
    std::unordered_map<uint32_t, uint16_t> dict;

    std::vector<uint8_t> out;
    uint32_t bits = 0;
    int nbits = 0;
    auto emit = [&](int code) {
        bits |= static_cast<uint32_t>(code) << nbits;
        nbits += code_size;
        while (nbits >= 8) {
            out.push_back(static_cast<uint8_t>(bits & 0xFF));
            bits >>= 8;
            nbits -= 8;
        }
    };

    emit(clear);
    int cur = -1;
    for (uint8_t px : indices) {
        if (cur < 0) {
            cur = px;
            continue;
        }
        const uint32_t key = (static_cast<uint32_t>(cur) << 8) | px;
        auto it = dict.find(key);
        if (it != dict.end()) {
            cur = it->second;
            continue;
        }
        emit(cur);
        dict.emplace(key, static_cast<uint16_t>(++max_code));
        if (max_code >= (1 << code_size) && code_size < 12) ++code_size;
        if (max_code == 4095) {
            emit(clear);
            dict.clear();
            code_size = min_code_size + 1;
            max_code = eoi;
        }
        cur = px;
    }
    if (cur >= 0) {
        emit(cur);
        // The decoder adds one more entry on reading the final code and may
        // widen before the end-of-information code.
        ++max_code;
        if (max_code >= (1 << code_size) && code_size < 12) ++code_size;
    }
    emit(eoi);
    if (nbits > 0) out.push_back(static_cast<uint8_t>(bits & 0xFF));
    return out;
}

OutputArtifact GifEncoder::encode(const std::vector<RenderedFrame>& frames, const EncodingPlan& plan,
                                  const CancelFlag* cancel) const {
    ensure<EncodingError>(!plan.gif.empty() && plan.order.size() == frames.size(), "GIF: plan does not match frames");
    auto ordered = ordered_frames(frames, plan);
    const int w = ordered.front()->image.width, h = ordered.front()->image.height;
    ensure<EncodingError>(w >= 1 && h >= 1 && w <= 65535 && h <= 65535, "GIF: unsupported canvas size");
    for (const auto* f : ordered)
        ensure<EncodingError>(f->image.width == w && f->image.height == h
                                  && f->image.rgb.size() == static_cast<size_t>(w) * h * 3,
                              "GIF: frames differ in size or pixel format");

    // The delay field is 16 bits of centiseconds.
    for (const auto& entry : plan.gif)
        ensure<EncodingError>(entry.delay_cs >= 0 && entry.delay_cs <= 65535,
                              "GIF: frame delay of " + std::to_string(entry.delay_cs) + " cs exceeds 655.35 s");

    const std::vector<Rgb> palette = build_shared_palette(ordered, opt.palette_size);
    ensure<EncodingError>(!palette.empty(), "GIF: empty palette");

    int table_bits = 1;
    while ((1 << table_bits) < static_cast<int>(palette.size())) ++table_bits;
    const int min_code_size = std::max(2, table_bits);

    std::vector<uint8_t> out;
    out.reserve(static_cast<size_t>(w) * h * plan.gif.size() / 2);
    const char magic[] = "GIF89a";
    out.insert(out.end(), magic, magic + 6);

    // Logical screen descriptor: global color table, 8 bits per primary.
    put16(out, w);
    put16(out, h);
    out.push_back(static_cast<uint8_t>(0x80 | (0x07 << 4) | (table_bits - 1)));
    out.push_back(0);  // background color index
    out.push_back(0);  // pixel aspect ratio

    for (int k = 0; k < (1 << table_bits); ++k) {
        Rgb c = k < static_cast<int>(palette.size()) ? palette[k] : Rgb{};
        out.push_back(c.r);
        out.push_back(c.g);
        out.push_back(c.b);
    }

    const char netscape[] = "NETSCAPE2.0";
    out.push_back(0x21);
    out.push_back(0xFF);
    out.push_back(0x0B);
    out.insert(out.end(), netscape, netscape + 11);
    out.push_back(0x03);
    out.push_back(0x01);
    put16(out, opt.loop_count);
    out.push_back(0x00);

    std::unordered_map<uint32_t, uint8_t> cache;
    std::vector<uint8_t> indexed(static_cast<size_t>(w) * h);
    for (const auto& entry : plan.gif) {
        check_cancel(cancel);
        ensure<EncodingError>(entry.frame < ordered.size(), "GIF: plan references a missing frame");
        const auto& px = ordered[entry.frame]->image.rgb;
        for (size_t p = 0; p < indexed.size(); ++p) {
            const uint32_t key = pack(px[p * 3], px[p * 3 + 1], px[p * 3 + 2]);
            auto it = cache.find(key);
            if (it == cache.end())
                it = cache.emplace(key, nearest_index(palette, {px[p * 3], px[p * 3 + 1], px[p * 3 + 2]})).first;
            indexed[p] = it->second;
        }

        // Graphic control extension: disposal "leave in place", no transparency.
        out.push_back(0x21);
        out.push_back(0xF9);
        out.push_back(0x04);
        out.push_back(0x04);
        put16(out, entry.delay_cs);
        out.push_back(0x00);
        out.push_back(0x00);

        out.push_back(0x2C);
        put16(out, 0);
        put16(out, 0);
        put16(out, w);
        put16(out, h);
        out.push_back(0x00);  // no local color table, not interlaced

        out.push_back(static_cast<uint8_t>(min_code_size));
        std::vector<uint8_t> stream = lzw_compress(indexed, min_code_size);
        for (size_t pos = 0; pos < stream.size(); pos += 255) {
            const size_t len = std::min<size_t>(255, stream.size() - pos);
            out.push_back(static_cast<uint8_t>(len));
            out.insert(out.end(), stream.begin() + pos, stream.begin() + pos + len);
        }
        out.push_back(0x00);
    }
    out.push_back(0x3B);

    OutputArtifact art;
    art.format = OutputFormat::Gif;
    art.aspect = plan.aspect;
    art.bytes = std::move(out);
    art.duration_seconds = plan.gif_duration_cs() / 100.0;
    art.frame_count = plan.gif.size();
    art.width = w;
    art.height = h;
    return art;
}
