#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

#include "core/error.hpp"

namespace elz::image {

struct Size {
    int32_t width = 0;
    int32_t height = 0;
};

struct Point {
    int32_t x = 0;
    int32_t y = 0;
};

struct Rect {
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;

    int32_t right() const { return x + width; }   // exclusive
    int32_t bottom() const { return y + height; } // exclusive
    bool empty() const { return width <= 0 || height <= 0; }
    bool contains(const Rect& o) const {
        return o.x >= x && o.y >= y && o.right() <= right() && o.bottom() <= bottom();
    }
    bool intersects(const Rect& o) const {
        return o.x < right() && x < o.right() && o.y < bottom() && y < o.bottom();
    }
    // Empty (zero-sized) when the two do not overlap.
    Rect intersected(const Rect& o) const {
        const int32_t x0 = x > o.x ? x : o.x;
        const int32_t y0 = y > o.y ? y : o.y;
        const int32_t x1 = right() < o.right() ? right() : o.right();
        const int32_t y1 = bottom() < o.bottom() ? bottom() : o.bottom();
        if(x1 <= x0 || y1 <= y0) return {x0, y0, 0, 0};
        return {x0, y0, x1 - x0, y1 - y0};
    }
};

struct Rgb8 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

inline bool operator==(const Rgb8& a, const Rgb8& b) { return a.r == b.r && a.g == b.g && a.b == b.b; }
inline bool operator!=(const Rgb8& a, const Rgb8& b) { return !(a == b); }

struct RgbF {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
};

// Scene or display referred RGB raster, interleaved R,G,B floats.
// Nominal range 0-1; log and linear highlights may exceed 1.
struct Frame {
    int32_t width = 0;
    int32_t height = 0;
    std::vector<float> data;

    Frame() = default;
    Frame(int32_t w, int32_t h, RgbF fill = {});

    bool empty() const { return width <= 0 || height <= 0 || data.empty(); }
    Size size() const { return {width, height}; }
    size_t index(int32_t x, int32_t y) const { return (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 3; }
    const float* pixel(int32_t x, int32_t y) const { return &data[index(x, y)]; }
    float* pixel(int32_t x, int32_t y) { return &data[index(x, y)]; }
    RgbF at(int32_t x, int32_t y) const { const float* p = pixel(x, y); return {p[0], p[1], p[2]}; }
    void set(int32_t x, int32_t y, RgbF c) { float* p = pixel(x, y); p[0] = c.r; p[1] = c.g; p[2] = c.b; }
};

// 8-bit RGB raster used for scope images and the final panel.
struct Canvas {
    int32_t width = 0;
    int32_t height = 0;
    std::vector<uint8_t> data;

    Canvas() = default;
    Canvas(int32_t w, int32_t h, Rgb8 fill = {});

    bool empty() const { return width <= 0 || height <= 0 || data.empty(); }
    Size size() const { return {width, height}; }
    int32_t stride() const { return width * 3; }
    bool in_bounds(int32_t x, int32_t y) const { return x >= 0 && y >= 0 && x < width && y < height; }
    size_t index(int32_t x, int32_t y) const { return (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 3; }

    Rgb8 at(int32_t x, int32_t y) const { const uint8_t* p = &data[index(x, y)]; return {p[0], p[1], p[2]}; }
    // Out-of-bounds writes are ignored.
    void set(int32_t x, int32_t y, Rgb8 c);
    // Saturating per-channel add; used for density plots.
    void add(int32_t x, int32_t y, Rgb8 delta);
    void fill(Rgb8 c);
    void fill_rect(const Rect& r, Rgb8 c);
    void fill_row(int32_t y, Rgb8 c);
    void fill_column(int32_t x, Rgb8 c);
};

// Builds a three-channel frame from an interleaved buffer with 1 (grey),
// 2 (grey+alpha), 3 (RGB) or 4 (RGBA) channels. Grey is replicated, alpha dropped.
core::Result<Frame> frame_from_channels(const float* data, int32_t width, int32_t height, int32_t channels);

// Same as frame_from_channels for 8-bit samples, scaled to 0-1.
core::Result<Frame> frame_from_u8(const uint8_t* data, int32_t width, int32_t height, int32_t channels);

// Quantises to 8 bits (clamped to 0-1, rounded to nearest), so 8-bit input -> frame -> canvas is lossless.
Canvas to_canvas(const Frame& frame);

// Copies src into dst with its top-left corner at (x, y); parts outside dst are clipped.
void blit(const Canvas& src, Canvas& dst, int32_t x, int32_t y);

// Copies the `from` part of src (clipped to src) to dst at (x, y).
void blit(const Canvas& src, const Rect& from, Canvas& dst, int32_t x, int32_t y);

} // namespace elz::image
