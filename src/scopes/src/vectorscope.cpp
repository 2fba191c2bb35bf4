#include "scopes/vectorscope.hpp"

#include <algorithm>
#include <cmath>

namespace elz::scopes {

namespace {
    constexpr double kPi = 3.14159265358979323846;
    constexpr double kInnerCircle = 0.75;
    constexpr double kIAxisDegrees = 33.0;
    constexpr double kQAxisDegrees = 123.0;
    constexpr double kBarAmplitude = 0.75;

    constexpr image::Rgb8 kCircleColor{64, 64, 64};
    constexpr image::Rgb8 kAxisColor{96, 96, 96};
    constexpr image::Rgb8 kTargetRing{128, 128, 128};
    constexpr int32_t kTargetRadius = 3;

    double radians(double deg) { return deg * kPi / 180.0; }
}

Yuv rgb_to_yuv(double r, double g, double b) noexcept {
    return {
        0.299 * r + 0.587 * g + 0.114 * b,
        -0.14713 * r - 0.28886 * g + 0.436 * b,
        0.615 * r - 0.51499 * g - 0.10001 * b
    };
}

image::Point VectorScopeRenderer::center(image::Size canvas_size) noexcept {
    return {canvas_size.width / 2, canvas_size.height / 2};
}

int32_t VectorScopeRenderer::scale(image::Size canvas_size) noexcept {
    return std::min(canvas_size.width, canvas_size.height) / 3;
}

image::Point VectorScopeRenderer::plot_position(const Yuv& yuv, image::Size canvas_size) noexcept {
    const image::Point c = center(canvas_size);
    const double s = static_cast<double>(scale(canvas_size));
    const double x = std::clamp(c.x + yuv.v * s, 0.0, static_cast<double>(canvas_size.width - 1));
    const double y = std::clamp(c.y - yuv.u * s, 0.0, static_cast<double>(canvas_size.height - 1));
    // Round rather than truncate: neutral greys carry ~1e-5 of U, which must not
    // push them off the centre pixel.
    return {static_cast<int32_t>(std::lround(x)), static_cast<int32_t>(std::lround(y))};
}

std::array<ColorTarget, 6> VectorScopeRenderer::color_targets(image::Size canvas_size) {
    const double a = kBarAmplitude;
    auto at = [&](double r, double g, double b) { return plot_position(rgb_to_yuv(r, g, b), canvas_size); };
    return {{
        {"R",  at(a, 0, 0), {255, 0, 0}},
        {"Yl", at(a, a, 0), {255, 255, 0}},
        {"G",  at(0, a, 0), {0, 255, 0}},
        {"Cy", at(0, a, a), {0, 255, 255}},
        {"B",  at(0, 0, a), {0, 0, 255}},
        {"Mg", at(a, 0, a), {255, 0, 255}},
    }};
}

void VectorScopeRenderer::draw_graticule(image::Canvas& canvas) const {
    if(canvas.empty()) return;
    if(painter_.capabilities().shapes) {
        draw_full_graticule(canvas);
    } else {
        draw_minimal_graticule(canvas);
    }
}

void VectorScopeRenderer::draw_full_graticule(image::Canvas& canvas) const {
    const image::Size size = canvas.size();
    const image::Point c = center(size);
    const int32_t s = scale(size);

    painter_.draw_circle(canvas, c, static_cast<int32_t>(s * kInnerCircle), kCircleColor, false);
    painter_.draw_circle(canvas, c, s, kCircleColor, false);

    // I (skin tone) and Q axes
    for(double deg : {kIAxisDegrees, kQAxisDegrees}) {
        const double dx = s * std::cos(radians(deg));
        const double dy = s * std::sin(radians(deg));
        painter_.draw_line(canvas,
                           {static_cast<int32_t>(c.x - dx), static_cast<int32_t>(c.y - dy)},
                           {static_cast<int32_t>(c.x + dx), static_cast<int32_t>(c.y + dy)},
                           kAxisColor);
    }

    for(const ColorTarget& t : color_targets(size)) {
        painter_.draw_circle(canvas, t.position, kTargetRadius, t.color, true);
        painter_.draw_circle(canvas, t.position, kTargetRadius + 1, kTargetRing, false);
    }
}

void VectorScopeRenderer::draw_minimal_graticule(image::Canvas& canvas) const {
    const image::Size size = canvas.size();
    const image::Point c = center(size);
    const int32_t s = scale(size);

    painter_.draw_line(canvas, {0, c.y}, {size.width - 1, c.y}, kCircleColor);
    painter_.draw_line(canvas, {c.x, 0}, {c.x, size.height - 1}, kCircleColor);
    painter_.draw_circle(canvas, c, static_cast<int32_t>(s * kInnerCircle), kCircleColor, false);
    painter_.draw_circle(canvas, c, s, kCircleColor, false);
}

image::Canvas VectorScopeRenderer::render(const image::Frame& log_frame, image::Size canvas_size) const {
    image::Canvas scope(canvas_size.width, canvas_size.height);
    if(scope.empty()) return scope;

    // Graticule first: density is added on top so samples on a graticule line stay visible.
    draw_graticule(scope);
    if(log_frame.empty()) return scope;

    const int32_t x_step = std::max(1, log_frame.width / kSamplesPerAxis);
    const int32_t y_step = std::max(1, log_frame.height / kSamplesPerAxis);
    const image::Rgb8 step{kDensityStep, kDensityStep, kDensityStep};

    for(int32_t y = 0; y < log_frame.height; y += y_step) {
        for(int32_t x = 0; x < log_frame.width; x += x_step) {
            const float* p = log_frame.pixel(x, y);
            const Yuv yuv = rgb_to_yuv(p[0], p[1], p[2]);
            if(!(yuv.y > kLumaFloor)) continue;
            const image::Point pos = plot_position(yuv, canvas_size);
            scope.add(pos.x, pos.y, step);
        }
    }
    return scope;
}

} // namespace elz::scopes
