#include "draw/raster_painter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace elz::draw {

namespace {

constexpr double kPi = 3.14159265358979323846;

struct Glyph {
    char c;
    uint8_t rows[RasterPainter::kGlyphHeight]; // bit 4 is the leftmost column
};

constexpr Glyph kFont[] = {
    {' ', {0b00000, 0b00000, 0b00000, 0b00000, 0b00000, 0b00000, 0b00000}},
    {'A', {0b01110, 0b10001, 0b10001, 0b11111, 0b10001, 0b10001, 0b10001}},
    {'B', {0b11110, 0b10001, 0b10001, 0b11110, 0b10001, 0b10001, 0b11110}},
    {'C', {0b01110, 0b10001, 0b10000, 0b10000, 0b10000, 0b10001, 0b01110}},
    {'D', {0b11110, 0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b11110}},
    {'E', {0b11111, 0b10000, 0b10000, 0b11110, 0b10000, 0b10000, 0b11111}},
    {'F', {0b11111, 0b10000, 0b10000, 0b11110, 0b10000, 0b10000, 0b10000}},
    {'G', {0b01110, 0b10001, 0b10000, 0b10111, 0b10001, 0b10001, 0b01111}},
    {'H', {0b10001, 0b10001, 0b10001, 0b11111, 0b10001, 0b10001, 0b10001}},
    {'I', {0b01110, 0b00100, 0b00100, 0b00100, 0b00100, 0b00100, 0b01110}},
    {'J', {0b00111, 0b00010, 0b00010, 0b00010, 0b00010, 0b10010, 0b01100}},
    {'K', {0b10001, 0b10010, 0b10100, 0b11000, 0b10100, 0b10010, 0b10001}},
    {'L', {0b10000, 0b10000, 0b10000, 0b10000, 0b10000, 0b10000, 0b11111}},
    {'M', {0b10001, 0b11011, 0b10101, 0b10101, 0b10001, 0b10001, 0b10001}},
    {'N', {0b10001, 0b10001, 0b11001, 0b10101, 0b10011, 0b10001, 0b10001}},
    {'O', {0b01110, 0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b01110}},
    {'P', {0b11110, 0b10001, 0b10001, 0b11110, 0b10000, 0b10000, 0b10000}},
    {'Q', {0b01110, 0b10001, 0b10001, 0b10001, 0b10101, 0b10010, 0b01101}},
    {'R', {0b11110, 0b10001, 0b10001, 0b11110, 0b10100, 0b10010, 0b10001}},
    {'S', {0b01111, 0b10000, 0b10000, 0b01110, 0b00001, 0b00001, 0b11110}},
    {'T', {0b11111, 0b00100, 0b00100, 0b00100, 0b00100, 0b00100, 0b00100}},
    {'U', {0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b01110}},
    {'V', {0b10001, 0b10001, 0b10001, 0b10001, 0b10001, 0b01010, 0b00100}},
    {'W', {0b10001, 0b10001, 0b10001, 0b10101, 0b10101, 0b10101, 0b01010}},
    {'X', {0b10001, 0b10001, 0b01010, 0b00100, 0b01010, 0b10001, 0b10001}},
    {'Y', {0b10001, 0b10001, 0b01010, 0b00100, 0b00100, 0b00100, 0b00100}},
    {'Z', {0b11111, 0b00001, 0b00010, 0b00100, 0b01000, 0b10000, 0b11111}},
    {'0', {0b01110, 0b10001, 0b10011, 0b10101, 0b11001, 0b10001, 0b01110}},
    {'1', {0b00100, 0b01100, 0b00100, 0b00100, 0b00100, 0b00100, 0b01110}},
    {'2', {0b01110, 0b10001, 0b00001, 0b00010, 0b00100, 0b01000, 0b11111}},
    {'3', {0b11111, 0b00010, 0b00100, 0b00010, 0b00001, 0b10001, 0b01110}},
    {'4', {0b00010, 0b00110, 0b01010, 0b10010, 0b11111, 0b00010, 0b00010}},
    {'5', {0b11111, 0b10000, 0b11110, 0b00001, 0b00001, 0b10001, 0b01110}},
    {'6', {0b00110, 0b01000, 0b10000, 0b11110, 0b10001, 0b10001, 0b01110}},
    {'7', {0b11111, 0b00001, 0b00010, 0b00100, 0b01000, 0b01000, 0b01000}},
    {'8', {0b01110, 0b10001, 0b10001, 0b01110, 0b10001, 0b10001, 0b01110}},
    {'9', {0b01110, 0b10001, 0b10001, 0b01111, 0b00001, 0b00010, 0b01100}},
    {'-', {0b00000, 0b00000, 0b00000, 0b11111, 0b00000, 0b00000, 0b00000}},
    {'+', {0b00000, 0b00100, 0b00100, 0b11111, 0b00100, 0b00100, 0b00000}},
    {'.', {0b00000, 0b00000, 0b00000, 0b00000, 0b00000, 0b01100, 0b01100}},
    {':', {0b00000, 0b01100, 0b01100, 0b00000, 0b01100, 0b01100, 0b00000}},
    {'/', {0b00000, 0b00001, 0b00010, 0b00100, 0b01000, 0b10000, 0b00000}},
    {'%', {0b11000, 0b11001, 0b00010, 0b00100, 0b01000, 0b10011, 0b00011}},
    {'(', {0b00010, 0b00100, 0b01000, 0b01000, 0b01000, 0b00100, 0b00010}},
    {')', {0b01000, 0b00100, 0b00010, 0b00010, 0b00010, 0b00100, 0b01000}},
    {'?', {0b01110, 0b10001, 0b00001, 0b00010, 0b00100, 0b00000, 0b00100}},
};

const Glyph& glyph_for(char c) {
    const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    for(const Glyph& g : kFont) {
        if(g.c == upper) return g;
    }
    for(const Glyph& g : kFont) {
        if(g.c == '?') return g;
    }
    return kFont[0];
}

void fill_span(image::Canvas& canvas, int32_t y, int32_t x0, int32_t x1, image::Rgb8 color) {
    canvas.fill_rect({x0, y, x1 - x0 + 1, 1}, color);
}

} // namespace

RasterPainter::RasterPainter(int32_t text_scale)
    : scale_(std::max<int32_t>(1, text_scale)) {}

void RasterPainter::draw_line(image::Canvas& canvas, image::Point a, image::Point b, image::Rgb8 color) const {
    // Bresenham, all octants
    int32_t x0 = a.x, y0 = a.y;
    const int32_t dx = std::abs(b.x - a.x), sx = a.x < b.x ? 1 : -1;
    const int32_t dy = -std::abs(b.y - a.y), sy = a.y < b.y ? 1 : -1;
    int32_t err = dx + dy;
    while(true) {
        canvas.set(x0, y0, color);
        if(x0 == b.x && y0 == b.y) break;
        const int32_t e2 = 2 * err;
        if(e2 >= dy) { err += dy; x0 += sx; }
        if(e2 <= dx) { err += dx; y0 += sy; }
    }
}

void RasterPainter::draw_circle(image::Canvas& canvas, image::Point center, int32_t radius,
                                image::Rgb8 color, bool filled) const {
    if(radius <= 0) {
        canvas.set(center.x, center.y, color);
        return;
    }
    if(filled) {
        for(int32_t dy = -radius; dy <= radius; ++dy) {
            const int32_t half = static_cast<int32_t>(std::sqrt(static_cast<double>(radius * radius - dy * dy)));
            fill_span(canvas, center.y + dy, center.x - half, center.x + half, color);
        }
        return;
    }
    image::Point prev{center.x + radius, center.y};
    for(int32_t i = 1; i <= kCircleSegments; ++i) {
        const double angle = 2.0 * kPi * static_cast<double>(i) / static_cast<double>(kCircleSegments);
        const image::Point next{
            center.x + static_cast<int32_t>(std::lround(radius * std::cos(angle))),
            center.y + static_cast<int32_t>(std::lround(radius * std::sin(angle)))
        };
        draw_line(canvas, prev, next, color);
        prev = next;
    }
}

TextExtent RasterPainter::measure_text(std::string_view text) const {
    if(text.empty()) return {0, kGlyphHeight * scale_};
    const auto n = static_cast<int32_t>(text.size());
    return {(n * kGlyphAdvance - (kGlyphAdvance - kGlyphWidth)) * scale_, kGlyphHeight * scale_};
}

void RasterPainter::draw_text(image::Canvas& canvas, image::Point top_left, std::string_view text,
                              image::Rgb8 color, const image::Rect& clip) const {
    if(clip.empty()) return;
    int32_t pen_x = top_left.x;
    for(char c : text) {
        const Glyph& g = glyph_for(c);
        for(int32_t row = 0; row < kGlyphHeight; ++row) {
            for(int32_t col = 0; col < kGlyphWidth; ++col) {
                if(!(g.rows[row] & (1u << (kGlyphWidth - 1 - col)))) continue;
                const image::Rect dot{pen_x + col * scale_, top_left.y + row * scale_, scale_, scale_};
                canvas.fill_rect(dot.intersected(clip), color);
            }
        }
        pen_x += kGlyphAdvance * scale_;
    }
}

} // namespace elz::draw
