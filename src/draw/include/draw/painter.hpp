#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include "image/image.hpp"

namespace elz::draw {

/**
 * What a backend can render at full fidelity.
 * Renderers degrade their output (simpler graticule, built-in font) when a
 * capability is missing; they never fail because of it.
 */
struct Capabilities {
    bool shapes = false;       // circles, diagonal lines and filled markers
    bool system_fonts = false; // text rendered with an installed font
};

struct TextExtent {
    int32_t width = 0;
    int32_t height = 0;
};

/**
 * Drawing backend used for graticules and panel labels.
 *
 * Implementations are immutable after construction and draw only into the
 * canvas they are handed, so one instance may be shared by concurrent frames.
 */
class Painter {
public:
    virtual ~Painter() = default;

    virtual const char* name() const noexcept = 0;
    virtual Capabilities capabilities() const noexcept = 0;

    virtual void draw_line(image::Canvas& canvas, image::Point a, image::Point b, image::Rgb8 color) const = 0;
    virtual void draw_circle(image::Canvas& canvas, image::Point center, int32_t radius,
                             image::Rgb8 color, bool filled) const = 0;

    virtual TextExtent measure_text(std::string_view text) const = 0;
    // `top_left` is the top-left corner of the text's bounding box. Nothing is
    // drawn outside `clip`.
    virtual void draw_text(image::Canvas& canvas, image::Point top_left, std::string_view text,
                           image::Rgb8 color, const image::Rect& clip) const = 0;

    void draw_text(image::Canvas& canvas, image::Point top_left, std::string_view text,
                   image::Rgb8 color) const {
        draw_text(canvas, top_left, text, color, {0, 0, canvas.width, canvas.height});
    }
};

enum class Backend {
    Auto,   // Qt when built in and a QGuiApplication is running, raster otherwise
    Qt,
    Raster
};

/**
 * Select a painter once, at engine construction.
 * Falling back from Qt logs a single warning per process.
 */
std::unique_ptr<Painter> make_painter(Backend preferred = Backend::Auto);

// True when the Qt backend was compiled in.
bool qt_backend_built() noexcept;

} // namespace elz::draw
