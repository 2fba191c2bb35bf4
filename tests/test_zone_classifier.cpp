#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "color/zone_classifier.hpp"

#include <cmath>
#include <limits>

using namespace elz::color;
using elz::image::Frame;

TEST_CASE("Zone luminance uses wide-gamut weights", "[classifier]") {
    REQUIRE_THAT(zone_luminance(1.0, 0.0, 0.0), Catch::Matchers::WithinAbs(0.2627, 1e-12));
    REQUIRE_THAT(zone_luminance(0.0, 1.0, 0.0), Catch::Matchers::WithinAbs(0.6780, 1e-12));
    REQUIRE_THAT(zone_luminance(1.0, 1.0, 1.0), Catch::Matchers::WithinAbs(1.0, 1e-12));
}

TEST_CASE("Uniform mid grey maps to the 18% zone colour", "[classifier]") {
    const ZoneTable table;
    const ZoneClassifier classifier(table);
    const Frame linear(8, 4, {0.18f, 0.18f, 0.18f});
    const Frame map = classifier.classify(linear);

    REQUIRE(map.width == 8);
    REQUIRE(map.height == 4);
    const auto& expected = table[table.index_of_stop(0.0)].display;
    for(int32_t y = 0; y < map.height; ++y) {
        for(int32_t x = 0; x < map.width; ++x) {
            REQUIRE(map.at(x, y).r == expected.r);
            REQUIRE(map.at(x, y).g == expected.g);
            REQUIRE(map.at(x, y).b == expected.b);
        }
    }
}

TEST_CASE("Black, negative and NaN pixels are the darkest zone", "[classifier]") {
    const ZoneTable table;
    const ZoneClassifier classifier(table);
    Frame linear(3, 1);
    linear.set(1, 0, {-1.0f, -1.0f, -1.0f});
    const float nan = std::numeric_limits<float>::quiet_NaN();
    linear.set(2, 0, {nan, 0.5f, 0.5f});
    const auto idx = classifier.classify_indices(linear);
    REQUIRE(idx.indices[0] == 0);
    REQUIRE(idx.indices[1] == 0);
    REQUIRE(idx.indices[2] == 0);
}

TEST_CASE("Index map reports per-zone coverage", "[classifier]") {
    const ZoneTable table;
    const ZoneClassifier classifier(table);
    Frame linear(4, 1, {0.18f, 0.18f, 0.18f});
    linear.set(3, 0, {100.0f, 100.0f, 100.0f}); // about +9 stops
    const auto idx = classifier.classify_indices(linear);

    REQUIRE(idx.width == 4);
    REQUIRE(idx.indices.size() == 4);
    REQUIRE(idx.indices[3] == kZoneCount - 1);
    REQUIRE_THAT(idx.coverage[8], Catch::Matchers::WithinAbs(0.75, 1e-12));
    REQUIRE_THAT(idx.coverage[kZoneCount - 1], Catch::Matchers::WithinAbs(0.25, 1e-12));
    REQUIRE(classifier.zone_coverage(linear) == idx.coverage);
    double total = 0.0;
    for(double c : idx.coverage) total += c;
    REQUIRE_THAT(total, Catch::Matchers::WithinAbs(1.0, 1e-12));
}

TEST_CASE("One stop over grey is the +1 zone", "[classifier]") {
    const ZoneTable table;
    const ZoneClassifier classifier(table);
    const Frame linear(1, 1, {0.36f, 0.36f, 0.36f});
    const auto idx = classifier.classify_indices(linear);
    REQUIRE(table[idx.indices[0]].stop == 1.0);
}
