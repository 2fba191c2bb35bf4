#pragma once

#include <QtGui/QFont>

#include "draw/painter.hpp"

namespace elz::draw {

/**
 * QPainter backend.
 * Draws straight into the canvas memory through a wrapping QImage
 * (Format_RGB888), antialiased, with the first installed monospace font.
 * Requires a live QGuiApplication for font access.
 */
class QtPainter final : public Painter {
public:
    QtPainter();

    // True when a QGuiApplication exists in this process.
    static bool usable() noexcept;

    const char* name() const noexcept override { return "qt"; }
    Capabilities capabilities() const noexcept override { return {true, true}; }

    void draw_line(image::Canvas& canvas, image::Point a, image::Point b, image::Rgb8 color) const override;
    void draw_circle(image::Canvas& canvas, image::Point center, int32_t radius,
                     image::Rgb8 color, bool filled) const override;

    TextExtent measure_text(std::string_view text) const override;
    using Painter::draw_text;
    void draw_text(image::Canvas& canvas, image::Point top_left, std::string_view text,
                   image::Rgb8 color, const image::Rect& clip) const override;

    const QFont& font() const noexcept { return font_; }

private:
    QFont font_;
};

} // namespace elz::draw
