#pragma once

#include <array>
#include <cstdint>

#include "draw/painter.hpp"
#include "image/image.hpp"

namespace elz::scopes {

// Broadcast (BT.601) luma and colour-difference signals.
struct Yuv {
    double y = 0.0;
    double u = 0.0;
    double v = 0.0;
};

Yuv rgb_to_yuv(double r, double g, double b) noexcept;

struct ColorTarget {
    const char* name;
    image::Point position;
    image::Rgb8 color;
};

/**
 * Chroma density scope of the recorded (log-domain) signal.
 *
 * The frame is sampled on a coarse grid (about 50 samples per axis), so cost
 * does not depend on resolution. Each sample brighter than the noise floor adds
 * a fixed amount of white at (centre + V, centre - U); repeated hits saturate.
 */
class VectorScopeRenderer {
public:
    static constexpr int32_t kSamplesPerAxis = 50;
    static constexpr double kLumaFloor = 0.01;
    static constexpr uint8_t kDensityStep = 80;

    explicit VectorScopeRenderer(const draw::Painter& painter) : painter_(painter) {}
    explicit VectorScopeRenderer(const draw::Painter&& painter) = delete;

    image::Canvas render(const image::Frame& log_frame, image::Size canvas_size) const;

    // Graticule only, on an existing canvas
    void draw_graticule(image::Canvas& canvas) const;

    static image::Point center(image::Size canvas_size) noexcept;
    static int32_t scale(image::Size canvas_size) noexcept;
    static image::Point plot_position(const Yuv& yuv, image::Size canvas_size) noexcept;

    // 75% amplitude colour-bar targets, placed where those bars plot.
    static std::array<ColorTarget, 6> color_targets(image::Size canvas_size);

private:
    void draw_full_graticule(image::Canvas& canvas) const;
    void draw_minimal_graticule(image::Canvas& canvas) const;

    const draw::Painter& painter_;
};

} // namespace elz::scopes
