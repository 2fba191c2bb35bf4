#include "panel/zone_inset.hpp"
#include "image/resample.hpp"

#include <algorithm>

namespace elz::panel {

image::Canvas make_zone_inset(const image::Frame& zone_map, int32_t width, int32_t border) {
    if(zone_map.empty() || width <= 0) return {};
    border = std::max(0, border);

    const image::Canvas scaled = image::resize_to_width(image::to_canvas(zone_map), width);
    image::Canvas inset(scaled.width + 2 * border, scaled.height + 2 * border, {255, 255, 255});
    image::blit(scaled, inset, border, border);
    return inset;
}

} // namespace elz::panel
