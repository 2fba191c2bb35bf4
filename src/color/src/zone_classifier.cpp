#include "color/zone_classifier.hpp"

namespace elz::color {

image::Frame ZoneClassifier::classify(const image::Frame& linear_frame) const {
    image::Frame out(linear_frame.width, linear_frame.height);
    const size_t pixels = linear_frame.data.size() / 3;
    for(size_t i = 0; i < pixels; ++i) {
        const float* p = &linear_frame.data[i * 3];
        const image::RgbF& c = table_.display_color(zone_luminance(p[0], p[1], p[2]));
        float* d = &out.data[i * 3];
        d[0] = c.r; d[1] = c.g; d[2] = c.b;
    }
    return out;
}

ZoneIndexMap ZoneClassifier::classify_indices(const image::Frame& linear_frame) const {
    ZoneIndexMap out;
    out.width = linear_frame.width;
    out.height = linear_frame.height;
    const size_t pixels = linear_frame.data.size() / 3;
    out.indices.resize(pixels);

    std::array<size_t, kZoneCount> counts{};
    for(size_t i = 0; i < pixels; ++i) {
        const float* p = &linear_frame.data[i * 3];
        const size_t zone = table_.find(zone_luminance(p[0], p[1], p[2]));
        out.indices[i] = static_cast<uint8_t>(zone);
        ++counts[zone];
    }
    if(pixels > 0) {
        for(size_t z = 0; z < kZoneCount; ++z) {
            out.coverage[z] = static_cast<double>(counts[z]) / static_cast<double>(pixels);
        }
    }
    return out;
}

} // namespace elz::color
