#pragma once

#include <array>
#include <cstddef>

#include "image/image.hpp"

namespace elz::color {

inline constexpr size_t kZoneCount = 17;
inline constexpr double kMidGrey = 0.18;
// Outer zones extend this many stops past mid grey so every luminance is covered.
inline constexpr double kOuterStops = 20.0;

/**
 * One EL Zone: a band of scene-linear luminance around a nominal stop value.
 */
struct Zone {
    double stop = 0.0;      // nominal exposure relative to 18% grey
    double low = 0.0;       // inclusive lower bound, linear luminance
    double high = 0.0;      // exclusive upper bound, linear luminance
    image::Rgb8 reference;  // 8-bit reference palette entry
    image::RgbF display;    // display-encoded colour drawn in the zone map
};

/**
 * The 17-zone EL exposure table.
 *
 * Built once and shared read-only between frames and threads. Bounds sit at
 * the midpoints (in stops) between adjacent nominal values, so the table is
 * contiguous and strictly increasing.
 */
class ZoneTable {
public:
    ZoneTable();

    static const std::array<double, kZoneCount>& stops() noexcept;
    static const std::array<image::Rgb8, kZoneCount>& reference_palette() noexcept;

    const Zone& operator[](size_t i) const noexcept { return zones_[i]; }
    const std::array<Zone, kZoneCount>& zones() const noexcept { return zones_; }
    size_t size() const noexcept { return zones_.size(); }

    // Index of the zone whose [low, high) interval contains luma. Values below
    // the table (including negatives and NaN) map to the darkest zone, values at
    // or above the top bound to the brightest.
    size_t find(double luma) const noexcept;

    // Index of the zone whose nominal stop equals `stop`, or size() if none.
    size_t index_of_stop(double stop) const noexcept;

    const image::RgbF& display_color(double luma) const noexcept { return zones_[find(luma)].display; }

private:
    std::array<Zone, kZoneCount> zones_{};
};

// sRGB electro-optical transfer function, 0-1 code to 0-1 linear.
double srgb_eotf(double v) noexcept;

} // namespace elz::color
