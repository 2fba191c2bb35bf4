#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "color/zone_table.hpp"
#include "image/image.hpp"

namespace elz::color {

// Wide-gamut (BT.2020) luma weights, applied to scene-linear RGB.
inline constexpr double kZoneLumaR = 0.2627;
inline constexpr double kZoneLumaG = 0.6780;
inline constexpr double kZoneLumaB = 0.0593;

inline double zone_luminance(double r, double g, double b) noexcept {
    return kZoneLumaR * r + kZoneLumaG * g + kZoneLumaB * b;
}

/**
 * Per-pixel zone indices plus the share of pixels falling in each zone.
 */
struct ZoneIndexMap {
    int32_t width = 0;
    int32_t height = 0;
    std::vector<uint8_t> indices;
    std::array<double, kZoneCount> coverage{};
};

/**
 * Classifies scene-linear frames against a shared ZoneTable.
 * Holds only a reference to the table; cheap to construct per call.
 */
class ZoneClassifier {
public:
    explicit ZoneClassifier(const ZoneTable& table) : table_(table) {}
    // The table is borrowed; a temporary would dangle.
    explicit ZoneClassifier(const ZoneTable&& table) = delete;

    // False-colour zone map: each pixel replaced by its zone's display colour.
    image::Frame classify(const image::Frame& linear_frame) const;

    ZoneIndexMap classify_indices(const image::Frame& linear_frame) const;

    // Fraction of pixels in each zone, darkest first.
    std::array<double, kZoneCount> zone_coverage(const image::Frame& linear_frame) const {
        return classify_indices(linear_frame).coverage;
    }

    const ZoneTable& table() const noexcept { return table_; }

private:
    const ZoneTable& table_;
};

} // namespace elz::color
