#pragma once

#include "draw/painter.hpp"

namespace elz::draw {

/**
 * Always-available software painter.
 * Aliased lines, polygonal circles, filled discs and a built-in 5x7 bitmap font
 * (upper-case only) scaled by `text_scale`.
 */
class RasterPainter final : public Painter {
public:
    explicit RasterPainter(int32_t text_scale = 2);

    const char* name() const noexcept override { return "raster"; }
    Capabilities capabilities() const noexcept override { return {true, false}; }

    void draw_line(image::Canvas& canvas, image::Point a, image::Point b, image::Rgb8 color) const override;
    void draw_circle(image::Canvas& canvas, image::Point center, int32_t radius,
                     image::Rgb8 color, bool filled) const override;

    TextExtent measure_text(std::string_view text) const override;
    using Painter::draw_text;
    void draw_text(image::Canvas& canvas, image::Point top_left, std::string_view text,
                   image::Rgb8 color, const image::Rect& clip) const override;

    static constexpr int32_t kGlyphWidth = 5;
    static constexpr int32_t kGlyphHeight = 7;
    static constexpr int32_t kGlyphAdvance = 6;
    // Circle outlines are drawn as polygons with this many segments.
    static constexpr int32_t kCircleSegments = 72;

private:
    int32_t scale_;
};

} // namespace elz::draw
