#pragma once

#include <array>
#include <string_view>

#include "draw/painter.hpp"
#include "image/image.hpp"

namespace elz::panel {

enum class Quadrant {
    Original = 0,
    ZoneMap = 1,
    VectorScope = 2,
    Waveform = 3
};

inline constexpr std::array<std::string_view, 4> kQuadrantLabels = {
    "Original Log", "EL Zone System", "Vectorscope", "Waveform"
};

/**
 * The composed panel plus the geometry it was built with.
 */
struct QuadrantLayout {
    image::Canvas canvas;
    int32_t top_height = 0;
    std::array<image::Rect, 4> regions{}; // indexed by Quadrant
    std::array<image::Rect, 4> labels{};  // label bounding boxes, indexed by Quadrant

    const image::Rect& region(Quadrant q) const { return regions[static_cast<size_t>(q)]; }
    const image::Rect& label(Quadrant q) const { return labels[static_cast<size_t>(q)]; }
};

/**
 * Lays out the four analysis views on one output canvas:
 *
 *   +-----------------+-----------------+
 *   | original (log)  | EL zone map     |  top_height
 *   +-----------------+-----------------+
 *   | vectorscope     | waveform        |  output height - top_height
 *   +-----------------+-----------------+
 *
 * The top pair is scaled to the quadrant width keeping aspect (no
 * letterboxing), the scopes are fitted and centred in what remains.
 * A source tall enough to fill the output leaves the bottom row empty; the
 * scopes and their labels are then left out.
 */
class Compositor {
public:
    static constexpr int32_t kLabelInset = 10;
    static constexpr int32_t kLabelRise = 25;

    explicit Compositor(const draw::Painter& painter, image::Rgb8 background = {0, 0, 0})
        : painter_(painter), background_(background) {}
    // The painter is held by reference and must outlive the compositor.
    explicit Compositor(const draw::Painter&& painter, image::Rgb8 background = {0, 0, 0}) = delete;

    QuadrantLayout compose(const image::Frame& original, const image::Frame& zone_map,
                           const image::Canvas& vector_scope, const image::Canvas& waveform,
                           image::Size output_size) const;

    // Box for `text` anchored at (region.x + 10, region.bottom - 25), pulled back inside region.
    image::Rect label_box(const image::Rect& region, std::string_view text) const;

private:
    void place_label(QuadrantLayout& layout, Quadrant q) const;

    const draw::Painter& painter_;
    image::Rgb8 background_;
};

} // namespace elz::panel
