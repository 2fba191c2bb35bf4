#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "color/log_curve.hpp"
#include "draw/raster_painter.hpp"
#include "scopes/vectorscope.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

using namespace elz;
using image::Canvas;
using image::Frame;
using scopes::VectorScopeRenderer;

namespace {
    const image::Size kScope{480, 540};

    struct Diff {
        int32_t x;
        int32_t y;
    };

    std::vector<Diff> differences(const Canvas& a, const Canvas& b) {
        std::vector<Diff> out;
        for(int32_t y = 0; y < a.height; ++y)
            for(int32_t x = 0; x < a.width; ++x)
                if(a.at(x, y) != b.at(x, y)) out.push_back({x, y});
        return out;
    }

    Canvas graticule_only(const VectorScopeRenderer& r) {
        return r.render(Frame{}, kScope);
    }

    // A backend limited to horizontal, vertical and round marks.
    class NoShapesPainter final : public draw::Painter {
    public:
        const char* name() const noexcept override { return "no-shapes"; }
        draw::Capabilities capabilities() const noexcept override { return {}; }
        void draw_line(Canvas& c, image::Point a, image::Point b, image::Rgb8 color) const override {
            raster_.draw_line(c, a, b, color);
        }
        void draw_circle(Canvas& c, image::Point center, int32_t radius, image::Rgb8 color, bool filled) const override {
            raster_.draw_circle(c, center, radius, color, filled);
        }
        draw::TextExtent measure_text(std::string_view text) const override { return raster_.measure_text(text); }
        using draw::Painter::draw_text;
        void draw_text(Canvas& c, image::Point top_left, std::string_view text, image::Rgb8 color,
                       const image::Rect& clip) const override {
            raster_.draw_text(c, top_left, text, color, clip);
        }

    private:
        draw::RasterPainter raster_;
    };
}

TEST_CASE("BT.601 colour difference signals", "[vectorscope]") {
    const auto white = scopes::rgb_to_yuv(1.0, 1.0, 1.0);
    REQUIRE_THAT(white.y, Catch::Matchers::WithinAbs(1.0, 1e-9));
    REQUIRE_THAT(white.u, Catch::Matchers::WithinAbs(0.0, 1e-4));
    REQUIRE_THAT(white.v, Catch::Matchers::WithinAbs(0.0, 1e-9));
    const auto red = scopes::rgb_to_yuv(1.0, 0.0, 0.0);
    REQUIRE(red.v > 0.6);
    REQUIRE(red.u < 0.0);
}

TEST_CASE("Scope geometry", "[vectorscope]") {
    REQUIRE(VectorScopeRenderer::center(kScope).x == 240);
    REQUIRE(VectorScopeRenderer::center(kScope).y == 270);
    REQUIRE(VectorScopeRenderer::scale(kScope) == 160);

    // far out of gamut clamps to the canvas edge
    const auto p = VectorScopeRenderer::plot_position({0.5, -10.0, 10.0}, kScope);
    REQUIRE(p.x == kScope.width - 1);
    REQUIRE(p.y == kScope.height - 1);
}

TEST_CASE("Output has the requested size", "[vectorscope]") {
    const draw::RasterPainter painter;
    const VectorScopeRenderer r(painter);
    const Canvas c = r.render(Frame(16, 9, {0.3f, 0.3f, 0.3f}), {200, 100});
    REQUIRE(c.width == 200);
    REQUIRE(c.height == 100);
}

TEST_CASE("Uniform grey plots a single mark at the centre", "[vectorscope]") {
    const draw::RasterPainter painter;
    const VectorScopeRenderer r(painter);
    const float code = static_cast<float>(color::encode(color::LogCurve::LogC4, 0.18));
    const Canvas scope = r.render(Frame(320, 180, {code, code, code}), kScope);

    const auto diffs = differences(graticule_only(r), scope);
    REQUIRE(diffs.size() == 1);
    REQUIRE(diffs[0].x == 240);
    REQUIRE(diffs[0].y == 270);
    // 50x50 samples saturate the mark
    REQUIRE(scope.at(240, 270) == image::Rgb8{255, 255, 255});
}

TEST_CASE("Dark pixels are not plotted", "[vectorscope]") {
    const draw::RasterPainter painter;
    const VectorScopeRenderer r(painter);
    const Canvas scope = r.render(Frame(64, 64, {0.005f, 0.005f, 0.005f}), kScope);
    REQUIRE(differences(graticule_only(r), scope).empty());
}

TEST_CASE("Sparse samples add fixed density steps", "[vectorscope]") {
    const draw::RasterPainter painter;
    const VectorScopeRenderer r(painter);
    // 1x1 frame: one sample on an untouched part of the canvas
    const Frame f(1, 1, {0.6f, 0.3f, 0.3f});
    const auto pos = VectorScopeRenderer::plot_position(scopes::rgb_to_yuv(0.6f, 0.3f, 0.3f), kScope);
    const Canvas base = graticule_only(r);
    const Canvas scope = r.render(f, kScope);
    const image::Rgb8 before = base.at(pos.x, pos.y);
    REQUIRE(scope.at(pos.x, pos.y).r == std::min(255, before.r + 80));
    REQUIRE(differences(base, scope).size() == 1);
}

TEST_CASE("75% red lands on the red target", "[vectorscope]") {
    const draw::RasterPainter painter;
    const VectorScopeRenderer r(painter);
    const Canvas scope = r.render(Frame(50, 50, {0.75f, 0.0f, 0.0f}), kScope);
    const auto targets = VectorScopeRenderer::color_targets(kScope);
    REQUIRE(std::string(targets[0].name) == "R");
    const auto diffs = differences(graticule_only(r), scope);
    REQUIRE(diffs.size() == 1);
    REQUIRE(diffs[0].x == targets[0].position.x);
    REQUIRE(diffs[0].y == targets[0].position.y);
}

TEST_CASE("Targets sit inside the outer circle", "[vectorscope]") {
    const auto c = VectorScopeRenderer::center(kScope);
    const int32_t s = VectorScopeRenderer::scale(kScope);
    for(const auto& t : VectorScopeRenderer::color_targets(kScope)) {
        const int32_t dx = t.position.x - c.x;
        const int32_t dy = t.position.y - c.y;
        INFO(t.name);
        REQUIRE(dx * dx + dy * dy < (s + 1) * (s + 1));
        REQUIRE(dx * dx + dy * dy > (s / 4) * (s / 4));
    }
}

TEST_CASE("Raster painter draws the full graticule", "[vectorscope]") {
    const draw::RasterPainter painter;
    const VectorScopeRenderer r(painter);
    const Canvas g = graticule_only(r);

    // I axis at 33 degrees through the centre, radius 160
    const image::Rgb8 axis{96, 96, 96};
    REQUIRE(g.at(105, 182) == axis);
    REQUIRE(g.at(374, 357) == axis);

    for(const auto& t : VectorScopeRenderer::color_targets(kScope)) {
        INFO(t.name);
        REQUIRE(g.at(t.position.x, t.position.y) == t.color);
    }
    // no crosshair
    REQUIRE(g.at(0, 270) == image::Rgb8{0, 0, 0});
}

TEST_CASE("Minimal graticule draws a crosshair", "[vectorscope]") {
    const NoShapesPainter painter;
    const VectorScopeRenderer r(painter);
    const Canvas g = graticule_only(r);
    REQUIRE(g.at(0, 270) == image::Rgb8{64, 64, 64});
    REQUIRE(g.at(479, 270) == image::Rgb8{64, 64, 64});
    REQUIRE(g.at(240, 0) == image::Rgb8{64, 64, 64});
    REQUIRE(g.at(240 + 160, 270) == image::Rgb8{64, 64, 64});
    REQUIRE(g.at(10, 10) == image::Rgb8{0, 0, 0});
}
