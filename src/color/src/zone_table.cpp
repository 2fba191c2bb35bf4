#include "color/zone_table.hpp"

#include <algorithm>
#include <cmath>

namespace elz::color {

namespace {
    constexpr std::array<double, kZoneCount> kStops = {
        -7.0, -6.0, -5.0, -4.0, -3.0, -2.0, -1.0, -0.5, 0.0, 0.5, 1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0
    };

    constexpr std::array<image::Rgb8, kZoneCount> kPalette = {{
        {3, 3, 3},        // -7   near black
        {98, 71, 155},    // -6   dark purple
        {158, 126, 184},  // -5   purple
        {24, 116, 167},   // -4   dark blue
        {39, 174, 228},   // -3   blue
        {27, 168, 75},    // -2   dark green
        {93, 187, 71},    // -1   green
        {148, 200, 64},   // -0.5 light green
        {144, 140, 135},  //  0   18% grey
        {251, 232, 0},    // +0.5 yellow
        {255, 248, 166},  // +1   light yellow
        {244, 112, 42},   // +2   orange
        {247, 170, 71},   // +3   light orange
        {239, 28, 38},    // +4   red
        {229, 126, 140},  // +5   pink
        {243, 190, 192},  // +6   light pink
        {255, 255, 255}   // +7   white
    }};

    constexpr double kDisplayGamma = 2.4;

    float to_display(uint8_t code) {
        const double linear = srgb_eotf(static_cast<double>(code) / 255.0);
        return static_cast<float>(std::pow(linear, 1.0 / kDisplayGamma));
    }

    double stops_to_linear(double stops) { return kMidGrey * std::pow(2.0, stops); }
}

double srgb_eotf(double v) noexcept {
    return v <= 0.04045 ? v / 12.92 : std::pow((v + 0.055) / 1.055, 2.4);
}

ZoneTable::ZoneTable() {
    const size_t last = kZoneCount - 1;
    for(size_t i = 0; i < kZoneCount; ++i) {
        const double s = kStops[i];
        const double low_stops = i == 0 ? -kOuterStops : s - (s - kStops[i - 1]) / 2.0;
        const double high_stops = i == last ? kOuterStops : s + (kStops[i + 1] - s) / 2.0;

        Zone& z = zones_[i];
        z.stop = s;
        z.reference = kPalette[i];
        z.display = {to_display(kPalette[i].r), to_display(kPalette[i].g), to_display(kPalette[i].b)};
        // Midpoints of whole and half stops are exact in binary, so high_i == low_{i+1}.
        z.low = stops_to_linear(low_stops);
        z.high = stops_to_linear(high_stops);
    }
}

const std::array<double, kZoneCount>& ZoneTable::stops() noexcept { return kStops; }

const std::array<image::Rgb8, kZoneCount>& ZoneTable::reference_palette() noexcept { return kPalette; }

size_t ZoneTable::find(double luma) const noexcept {
    if(std::isnan(luma)) return 0;
    // First zone whose upper bound lies above luma; intervals are half-open.
    auto it = std::upper_bound(zones_.begin(), zones_.end(), luma,
                               [](double v, const Zone& z) { return v < z.high; });
    if(it == zones_.end()) return kZoneCount - 1;
    return static_cast<size_t>(it - zones_.begin());
}

size_t ZoneTable::index_of_stop(double stop) const noexcept {
    for(size_t i = 0; i < zones_.size(); ++i) {
        if(zones_[i].stop == stop) return i;
    }
    return zones_.size();
}

} // namespace elz::color
