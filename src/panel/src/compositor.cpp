#include "panel/compositor.hpp"
#include "core/log.hpp"
#include "image/resample.hpp"

#include <algorithm>
#include <string>

namespace elz::panel {

namespace {
    constexpr image::Rgb8 kLabelColor{255, 255, 255};


    // Fit and centre a scope in its region. Only the scaled image is copied;
    // the letterbox keeps the canvas background untouched.
    void place_scope(image::Canvas& canvas, const image::Canvas& scope, const image::Rect& region) {
        if(scope.empty() || region.empty()) return;
        image::Rect placed;
        const image::Canvas fitted = image::fit_into(scope, {region.width, region.height}, {}, &placed);
        image::blit(fitted, placed, canvas, region.x + placed.x, region.y + placed.y);
    }
}

image::Rect Compositor::label_box(const image::Rect& region, std::string_view text) const {
    const draw::TextExtent ext = painter_.measure_text(text);
    image::Rect box{region.x + kLabelInset, region.bottom() - kLabelRise, ext.width, ext.height};
    // Short regions: keep the label inside instead of spilling into the neighbour
    box.y = std::min(box.y, region.bottom() - box.height);
    box.y = std::max(box.y, region.y);
    box.x = std::min(box.x, region.right() - box.width);
    box.x = std::max(box.x, region.x);
    box.width = std::min(box.width, region.right() - box.x);
    box.height = std::min(box.height, region.bottom() - box.y);
    return box;
}

void Compositor::place_label(QuadrantLayout& layout, Quadrant q) const {
    const size_t i = static_cast<size_t>(q);
    const image::Rect& region = layout.regions[i];
    if(region.empty()) {
        log::debug(std::string("No room for the ") + std::string(kQuadrantLabels[i]) +
                   " quadrant, label omitted");
        return;
    }
    const image::Rect box = label_box(region, kQuadrantLabels[i]);
    layout.labels[i] = box;
    // The box may be smaller than the text in short or narrow regions; ink stays inside it.
    painter_.draw_text(layout.canvas, {box.x, box.y}, kQuadrantLabels[i], kLabelColor, box);
}

QuadrantLayout Compositor::compose(const image::Frame& original, const image::Frame& zone_map,
                                   const image::Canvas& vector_scope, const image::Canvas& waveform,
                                   image::Size output_size) const {
    QuadrantLayout layout;
    layout.canvas = image::Canvas(output_size.width, output_size.height, background_);
    if(layout.canvas.empty()) return layout;

    const int32_t quad_w = output_size.width / 2;
    const int32_t right_w = output_size.width - quad_w;

    // Top row: scale to quadrant width, height follows the source aspect
    if(!original.empty()) {
        const image::Canvas top_left = image::resize_to_width(image::to_canvas(original), quad_w);
        layout.top_height = std::min(top_left.height, output_size.height);
        image::blit(top_left, layout.canvas, 0, 0);
    }
    if(!zone_map.empty()) {
        const image::Canvas top_right = image::resize_to_width(image::to_canvas(zone_map), quad_w);
        image::blit(top_right, layout.canvas, quad_w, 0);
    }
    layout.regions[static_cast<size_t>(Quadrant::Original)] = {0, 0, quad_w, layout.top_height};
    layout.regions[static_cast<size_t>(Quadrant::ZoneMap)] = {quad_w, 0, right_w, layout.top_height};

    const int32_t bottom_h = output_size.height - layout.top_height;
    layout.regions[static_cast<size_t>(Quadrant::VectorScope)] = {0, layout.top_height, quad_w, bottom_h};
    layout.regions[static_cast<size_t>(Quadrant::Waveform)] = {quad_w, layout.top_height, right_w, bottom_h};

    if(bottom_h > 0 && quad_w > 0) {
        place_scope(layout.canvas, vector_scope, layout.region(Quadrant::VectorScope));
        place_scope(layout.canvas, waveform, layout.region(Quadrant::Waveform));
    }

    for(Quadrant q : {Quadrant::Original, Quadrant::ZoneMap, Quadrant::VectorScope, Quadrant::Waveform}) {
        place_label(layout, q);
    }
    return layout;
}

} // namespace elz::panel
