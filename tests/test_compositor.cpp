#include <catch2/catch_test_macros.hpp>
#include "draw/raster_painter.hpp"
#include "panel/compositor.hpp"
#include "panel/zone_inset.hpp"

#include <cstdlib>

using namespace elz;
using image::Canvas;
using image::Frame;
using image::Rect;
using image::Rgb8;
using panel::Compositor;
using panel::Quadrant;

namespace {
    const image::Size kOutput{1920, 1080};
    constexpr Quadrant kAll[] = {Quadrant::Original, Quadrant::ZoneMap, Quadrant::VectorScope, Quadrant::Waveform};
    constexpr Rgb8 kWhite{255, 255, 255};

    bool near(Rgb8 a, Rgb8 b) {
        return std::abs(a.r - b.r) <= 1 && std::abs(a.g - b.g) <= 1 && std::abs(a.b - b.b) <= 1;
    }

    // White pixels not covered by any label box. Inputs carry no white of their own.
    int stray_label_ink(const panel::QuadrantLayout& layout) {
        int n = 0;
        for(int32_t y = 0; y < layout.canvas.height; ++y) {
            for(int32_t x = 0; x < layout.canvas.width; ++x) {
                if(layout.canvas.at(x, y) != kWhite) continue;
                bool covered = false;
                for(Quadrant q : kAll) {
                    const Rect& box = layout.label(q);
                    if(x >= box.x && y >= box.y && x < box.right() && y < box.bottom()) covered = true;
                }
                if(!covered) ++n;
            }
        }
        return n;
    }
}

TEST_CASE("Top row height follows the source aspect", "[compositor]") {
    const draw::RasterPainter painter;
    const Compositor comp(painter);
    const auto layout = comp.compose(Frame(320, 180), Frame(320, 180), Canvas(480, 540), Canvas(480, 540), kOutput);

    REQUIRE(layout.canvas.width == 1920);
    REQUIRE(layout.canvas.height == 1080);
    REQUIRE(layout.top_height == 540);
    REQUIRE(layout.region(Quadrant::Original).width == 960);
    REQUIRE(layout.region(Quadrant::ZoneMap).x == 960);
    REQUIRE(layout.region(Quadrant::VectorScope).y == 540);
    REQUIRE(layout.region(Quadrant::Waveform).height == 540);
}

TEST_CASE("Labels are inside their quadrants and do not overlap", "[compositor]") {
    const draw::RasterPainter painter;
    const Compositor comp(painter);
    for(image::Size src : {image::Size{320, 180}, image::Size{400, 300}, image::Size{1000, 200}}) {
        const auto layout = comp.compose(Frame(src.width, src.height), Frame(src.width, src.height),
                                         Canvas(480, 540), Canvas(480, 540), kOutput);
        INFO(src.width << "x" << src.height);
        REQUIRE(layout.top_height <= kOutput.height);
        REQUIRE(kOutput.height - layout.top_height >= 0);
        for(Quadrant q : kAll) {
            REQUIRE_FALSE(layout.label(q).empty());
            REQUIRE(layout.region(q).contains(layout.label(q)));
            for(Quadrant o : kAll) {
                if(o != q) REQUIRE_FALSE(layout.label(q).intersects(layout.label(o)));
            }
        }
    }
}

TEST_CASE("Labels sit 10 px in and 25 px above the region bottom", "[compositor]") {
    const draw::RasterPainter painter;
    const Compositor comp(painter);
    const auto layout = comp.compose(Frame(320, 180), Frame(320, 180), Canvas(480, 540), Canvas(480, 540), kOutput);
    REQUIRE(layout.label(Quadrant::Original).x == 10);
    REQUIRE(layout.label(Quadrant::Original).y == 540 - 25);
    REQUIRE(layout.label(Quadrant::ZoneMap).x == 970);
    REQUIRE(layout.label(Quadrant::Waveform).y == 1080 - 25);
    // white label pixels land in the canvas
    bool found_white = false;
    const Rect box = layout.label(Quadrant::Waveform);
    for(int32_t y = box.y; y < box.bottom(); ++y)
        for(int32_t x = box.x; x < box.right(); ++x)
            if(layout.canvas.at(x, y) == Rgb8{255, 255, 255}) found_white = true;
    REQUIRE(found_white);
}

TEST_CASE("Tall sources leave no room for the scopes", "[compositor]") {
    const draw::RasterPainter painter;
    const Compositor comp(painter);
    const auto layout = comp.compose(Frame(100, 400), Frame(100, 400), Canvas(480, 540), Canvas(480, 540), kOutput);
    REQUIRE(layout.top_height == 1080);
    REQUIRE(layout.region(Quadrant::VectorScope).empty());
    REQUIRE(layout.region(Quadrant::Original).contains(layout.label(Quadrant::Original)));
    // scope labels are left out with their regions
    REQUIRE(layout.label(Quadrant::VectorScope).empty());
    REQUIRE(layout.label(Quadrant::Waveform).empty());
}

TEST_CASE("Label ink stays inside the label box on a very wide source", "[compositor]") {
    const draw::RasterPainter painter;
    const Compositor comp(painter);
    const Frame wide(2000, 10, {0.3f, 0.3f, 0.3f});
    const auto layout = comp.compose(wide, Frame(2000, 10), Canvas(480, 540), Canvas(480, 540), kOutput);
    REQUIRE(layout.top_height == 4);
    REQUIRE(layout.label(Quadrant::Original).height <= 4);
    for(Quadrant q : kAll) REQUIRE(layout.region(q).contains(layout.label(q)));
    // the strip's label would otherwise spill into the vectorscope quadrant below
    REQUIRE(stray_label_ink(layout) == 0);
}

TEST_CASE("Label ink stays inside the label box on a narrow output", "[compositor]") {
    const draw::RasterPainter painter;
    const Compositor comp(painter);
    const auto layout = comp.compose(Frame(320, 180), Frame(320, 180), Canvas(48, 54), Canvas(48, 54), {64, 64});
    REQUIRE(layout.region(Quadrant::Original).width == 32);
    for(Quadrant q : kAll) {
        INFO(static_cast<int>(q));
        REQUIRE(layout.region(q).contains(layout.label(q)));
        REQUIRE(layout.label(q).width <= 32);
    }
    REQUIRE(stray_label_ink(layout) == 0);
}

TEST_CASE("Scopes are centred and letterboxed with the background", "[compositor]") {
    const draw::RasterPainter painter;
    const Rgb8 bg{10, 20, 30};
    const Compositor comp(painter, bg);
    const Canvas scope(480, 540, {200, 200, 200});
    const auto layout = comp.compose(Frame(320, 180), Frame(320, 180), scope, scope, kOutput);

    // 480x540 scope in a 960x540 quadrant: 240 px bars either side
    REQUIRE(layout.canvas.at(100, 700) == bg);
    REQUIRE(layout.canvas.at(300, 700) == Rgb8{200, 200, 200});
    REQUIRE(layout.canvas.at(960 + 100, 700) == bg);
    REQUIRE(layout.canvas.at(960 + 500, 700) == Rgb8{200, 200, 200});
}

TEST_CASE("Top images fill the quadrant width", "[compositor]") {
    const draw::RasterPainter painter;
    const Compositor comp(painter);
    const Frame grey(320, 180, {0.5f, 0.5f, 0.5f});
    const Frame red(320, 180, {1.0f, 0.0f, 0.0f});
    const auto layout = comp.compose(grey, red, Canvas(480, 540), Canvas(480, 540), kOutput);
    REQUIRE(near(layout.canvas.at(0, 0), Rgb8{128, 128, 128}));
    REQUIRE(near(layout.canvas.at(959, 300), Rgb8{128, 128, 128}));
    REQUIRE(near(layout.canvas.at(960, 0), Rgb8{255, 0, 0}));
    REQUIRE(near(layout.canvas.at(1919, 300), Rgb8{255, 0, 0}));
}

TEST_CASE("Zone inset has a white border", "[compositor]") {
    const Frame map(200, 100, {0.0f, 0.0f, 1.0f});
    const Canvas inset = panel::make_zone_inset(map, 100, 2);
    REQUIRE(inset.width == 104);
    REQUIRE(inset.height == 54);
    REQUIRE(inset.at(0, 0) == Rgb8{255, 255, 255});
    REQUIRE(inset.at(1, 30) == Rgb8{255, 255, 255});
    REQUIRE(inset.at(103, 53) == Rgb8{255, 255, 255});
    REQUIRE(near(inset.at(2, 2), Rgb8{0, 0, 255}));
    REQUIRE(near(inset.at(101, 51), Rgb8{0, 0, 255}));

    REQUIRE(panel::make_zone_inset(Frame{}, 100).empty());
    REQUIRE(panel::make_zone_inset(map, 0).empty());
}
