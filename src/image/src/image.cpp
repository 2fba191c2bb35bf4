#include "image/image.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace elz::image {

namespace {
    inline uint8_t clamp8(int v) { return (v < 0) ? 0 : (v > 255 ? 255 : static_cast<uint8_t>(v)); }

    inline uint8_t quantize(float v) {
        if(!(v > 0.0f)) return 0; // also catches NaN
        if(v >= 1.0f) return 255;
        return static_cast<uint8_t>(v * 255.0f + 0.5f);
    }

    template <class Sample, class ToFloat>
    core::Result<Frame> normalize_channels(const Sample* data, int32_t width, int32_t height,
                                           int32_t channels, ToFloat to_float) {
        if(!data || width <= 0 || height <= 0) {
            return core::fail(core::ErrorCode::InvalidFrame,
                              "empty frame " + std::to_string(width) + "x" + std::to_string(height));
        }
        if(channels < 1 || channels > 4) {
            return core::fail(core::ErrorCode::InvalidFrame,
                              "unsupported channel count " + std::to_string(channels));
        }

        Frame out(width, height);
        const size_t pixels = static_cast<size_t>(width) * static_cast<size_t>(height);
        const size_t step = static_cast<size_t>(channels);
        for(size_t i = 0; i < pixels; ++i) {
            const Sample* s = data + i * step;
            float* d = &out.data[i * 3];
            if(channels >= 3) {
                d[0] = to_float(s[0]);
                d[1] = to_float(s[1]);
                d[2] = to_float(s[2]);
            } else {
                // grey or grey+alpha
                d[0] = d[1] = d[2] = to_float(s[0]);
            }
        }
        return out;
    }
}

Frame::Frame(int32_t w, int32_t h, RgbF fill)
    : width(w), height(h) {
    const size_t pixels = (w > 0 && h > 0) ? static_cast<size_t>(w) * static_cast<size_t>(h) : 0;
    data.resize(pixels * 3);
    for(size_t i = 0; i < pixels; ++i) {
        data[i * 3 + 0] = fill.r;
        data[i * 3 + 1] = fill.g;
        data[i * 3 + 2] = fill.b;
    }
}

Canvas::Canvas(int32_t w, int32_t h, Rgb8 fill_color)
    : width(w), height(h) {
    const size_t pixels = (w > 0 && h > 0) ? static_cast<size_t>(w) * static_cast<size_t>(h) : 0;
    data.resize(pixels * 3);
    fill(fill_color);
}

void Canvas::set(int32_t x, int32_t y, Rgb8 c) {
    if(!in_bounds(x, y)) return;
    uint8_t* p = &data[index(x, y)];
    p[0] = c.r; p[1] = c.g; p[2] = c.b;
}

void Canvas::add(int32_t x, int32_t y, Rgb8 delta) {
    if(!in_bounds(x, y)) return;
    uint8_t* p = &data[index(x, y)];
    p[0] = clamp8(p[0] + delta.r);
    p[1] = clamp8(p[1] + delta.g);
    p[2] = clamp8(p[2] + delta.b);
}

void Canvas::fill(Rgb8 c) {
    for(size_t i = 0; i + 2 < data.size(); i += 3) {
        data[i] = c.r; data[i + 1] = c.g; data[i + 2] = c.b;
    }
}

void Canvas::fill_rect(const Rect& r, Rgb8 c) {
    const int32_t x0 = std::max(0, r.x), x1 = std::min(width, r.right());
    const int32_t y0 = std::max(0, r.y), y1 = std::min(height, r.bottom());
    for(int32_t y = y0; y < y1; ++y) {
        for(int32_t x = x0; x < x1; ++x) {
            uint8_t* p = &data[index(x, y)];
            p[0] = c.r; p[1] = c.g; p[2] = c.b;
        }
    }
}

void Canvas::fill_row(int32_t y, Rgb8 c) { fill_rect({0, y, width, 1}, c); }
void Canvas::fill_column(int32_t x, Rgb8 c) { fill_rect({x, 0, 1, height}, c); }

core::Result<Frame> frame_from_channels(const float* data, int32_t width, int32_t height, int32_t channels) {
    return normalize_channels(data, width, height, channels, [](float v) { return v; });
}

core::Result<Frame> frame_from_u8(const uint8_t* data, int32_t width, int32_t height, int32_t channels) {
    return normalize_channels(data, width, height, channels,
                              [](uint8_t v) { return static_cast<float>(v) / 255.0f; });
}

Canvas to_canvas(const Frame& frame) {
    Canvas out(frame.width, frame.height);
    for(size_t i = 0; i < frame.data.size() && i < out.data.size(); ++i) {
        out.data[i] = quantize(frame.data[i]);
    }
    return out;
}

void blit(const Canvas& src, Canvas& dst, int32_t x, int32_t y) {
    blit(src, Rect{0, 0, src.width, src.height}, dst, x, y);
}

void blit(const Canvas& src, const Rect& from, Canvas& dst, int32_t x, int32_t y) {
    // clip the source rect to src, shifting the destination with it
    const int32_t sx0 = std::max(0, from.x), sy0 = std::max(0, from.y);
    const int32_t sx1 = std::min(src.width, from.right()), sy1 = std::min(src.height, from.bottom());
    x += sx0 - from.x;
    y += sy0 - from.y;

    const int32_t x0 = std::max(0, x), x1 = std::min(dst.width, x + (sx1 - sx0));
    const int32_t y0 = std::max(0, y), y1 = std::min(dst.height, y + (sy1 - sy0));
    if(x0 >= x1) return;
    const size_t row_bytes = static_cast<size_t>(x1 - x0) * 3;
    for(int32_t dy = y0; dy < y1; ++dy) {
        const uint8_t* s = &src.data[src.index(sx0 + (x0 - x), sy0 + (dy - y))];
        std::copy(s, s + row_bytes, &dst.data[dst.index(x0, dy)]);
    }
}

} // namespace elz::image
