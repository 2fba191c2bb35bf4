#include <catch2/catch_test_macros.hpp>
#include "image/resample.hpp"

#include <cstdlib>

using namespace elz::image;

namespace {
    bool near(Rgb8 a, Rgb8 b, int tol) {
        return std::abs(a.r - b.r) <= tol && std::abs(a.g - b.g) <= tol && std::abs(a.b - b.b) <= tol;
    }

    bool uniform(const Canvas& c, Rgb8 colour, int tol) {
        for(int32_t y = 0; y < c.height; ++y)
            for(int32_t x = 0; x < c.width; ++x)
                if(!near(c.at(x, y), colour, tol)) return false;
        return true;
    }
}

TEST_CASE("Uniform canvases stay uniform through every filter", "[resample]") {
    const Rgb8 grey{71, 71, 71};
    const Rgb8 zone{144, 140, 135};
    for(Rgb8 colour : {grey, zone}) {
        const Canvas src(64, 36, colour);
        for(Filter f : {Filter::Nearest, Filter::Bilinear, Filter::Lanczos3}) {
            const Canvas down = resize(src, {17, 9}, f);
            REQUIRE(down.width == 17);
            REQUIRE(down.height == 9);
            REQUIRE(uniform(down, colour, 1));

            const Canvas up = resize(src, {150, 81}, f);
            REQUIRE(up.width == 150);
            REQUIRE(uniform(up, colour, 1));
        }
    }
}

TEST_CASE("Channels are scaled independently", "[resample]") {
    // Saturated primaries must not bleed into the other channels
    const Canvas red(40, 20, {255, 0, 0});
    const Canvas out = resize(red, {120, 60});
    REQUIRE(uniform(out, {255, 0, 0}, 1));
}

TEST_CASE("Same-size resize is a copy", "[resample]") {
    Canvas src(5, 4);
    src.set(2, 3, {255, 128, 64});
    const Canvas out = resize(src, {5, 4});
    REQUIRE(out.data == src.data);
}

TEST_CASE("Empty inputs give empty outputs", "[resample]") {
    REQUIRE(resize(Canvas{}, {10, 10}).empty());
    REQUIRE(resize(Canvas(4, 4), {0, 10}).empty());
    REQUIRE(resize_to_width(Canvas(4, 4), 0).empty());
}

TEST_CASE("resize_to_width keeps aspect ratio", "[resample]") {
    const Canvas src(1920, 1080);
    const Canvas out = resize_to_width(src, 960);
    REQUIRE(out.width == 960);
    REQUIRE(out.height == 540);

    // Height truncates, never below one row
    REQUIRE(resize_to_width(Canvas(1000, 1), 10).height == 1);
    REQUIRE(resize_to_width(Canvas(3, 2), 4).height == 2);
}

TEST_CASE("fit_into letterboxes and centres", "[resample]") {
    const Rgb8 white{255, 255, 255};
    const Rgb8 blue{0, 0, 255};
    const Canvas src(100, 50, white);
    Rect placed;
    const Canvas out = fit_into(src, {200, 200}, blue, &placed);

    REQUIRE(out.width == 200);
    REQUIRE(out.height == 200);
    REQUIRE(placed.x == 0);
    REQUIRE(placed.y == 50);
    REQUIRE(placed.width == 200);
    REQUIRE(placed.height == 100);
    REQUIRE(out.at(0, 0) == blue);
    REQUIRE(out.at(100, 199) == blue);
    REQUIRE(near(out.at(100, 100), white, 1));
}

TEST_CASE("Downscaling averages fine detail", "[resample]") {
    // 1-pixel checkerboard collapses to mid grey instead of aliasing
    Canvas src(64, 64);
    for(int32_t y = 0; y < 64; ++y)
        for(int32_t x = 0; x < 64; ++x)
            if((x + y) % 2 == 0) src.set(x, y, {255, 255, 255});
    const Canvas out = resize(src, {8, 8}, Filter::Bilinear);
    REQUIRE(std::abs(out.at(4, 4).g - 128) < 16);
}
