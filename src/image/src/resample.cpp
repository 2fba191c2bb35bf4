#include "image/resample.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

extern "C" {
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

namespace elz::image {

namespace {

int sws_flags(Filter f) {
    switch(f) {
        case Filter::Nearest: return SWS_POINT;
        case Filter::Bilinear: return SWS_BILINEAR | SWS_ACCURATE_RND;
        case Filter::Lanczos3: return SWS_LANCZOS | SWS_ACCURATE_RND;
    }
    return SWS_BICUBIC;
}

struct SwsDeleter {
    void operator()(SwsContext* ctx) const noexcept { sws_freeContext(ctx); }
};
using SwsPtr = std::unique_ptr<SwsContext, SwsDeleter>;

} // namespace

Canvas resize(const Canvas& src, Size target, Filter filter) {
    if(src.empty() || target.width <= 0 || target.height <= 0) return {};
    if(src.width == target.width && src.height == target.height) return src;

    // GRAY8 to GRAY8 keeps swscale on its luma path: no matrix, no range change.
    SwsPtr ctx(sws_getContext(src.width, src.height, AV_PIX_FMT_GRAY8,
                              target.width, target.height, AV_PIX_FMT_GRAY8,
                              sws_flags(filter), nullptr, nullptr, nullptr));
    if(!ctx) {
        throw std::runtime_error("swscale: no context for " + std::to_string(src.width) + "x" +
                                 std::to_string(src.height) + " -> " + std::to_string(target.width) +
                                 "x" + std::to_string(target.height));
    }

    const size_t src_pixels = static_cast<size_t>(src.width) * static_cast<size_t>(src.height);
    const size_t dst_pixels = static_cast<size_t>(target.width) * static_cast<size_t>(target.height);
    std::vector<uint8_t> in_plane(src_pixels);
    std::vector<uint8_t> out_plane(dst_pixels);
    Canvas out(target.width, target.height);

    for(size_t c = 0; c < 3; ++c) {
        for(size_t i = 0; i < src_pixels; ++i) in_plane[i] = src.data[i * 3 + c];

        const uint8_t* src_data[4] = {in_plane.data(), nullptr, nullptr, nullptr};
        const int src_linesize[4] = {src.width, 0, 0, 0};
        uint8_t* dst_data[4] = {out_plane.data(), nullptr, nullptr, nullptr};
        const int dst_linesize[4] = {target.width, 0, 0, 0};
        const int rows = sws_scale(ctx.get(), src_data, src_linesize, 0, src.height, dst_data, dst_linesize);
        if(rows <= 0) throw std::runtime_error("swscale: sws_scale produced no rows");

        for(size_t i = 0; i < dst_pixels; ++i) out.data[i * 3 + c] = out_plane[i];
    }
    return out;
}

Canvas resize_to_width(const Canvas& src, int32_t width, Filter filter) {
    if(src.empty() || width <= 0) return {};
    const double scale = static_cast<double>(width) / static_cast<double>(src.width);
    const int32_t height = std::max<int32_t>(1, static_cast<int32_t>(static_cast<double>(src.height) * scale));
    return resize(src, {width, height}, filter);
}

Canvas fit_into(const Canvas& src, Size box, Rgb8 background, Rect* placed, Filter filter) {
    if(placed) *placed = {};
    if(box.width <= 0 || box.height <= 0) return {};
    Canvas out(box.width, box.height, background);
    if(src.empty()) return out;

    const double scale = std::min(static_cast<double>(box.width) / static_cast<double>(src.width),
                                  static_cast<double>(box.height) / static_cast<double>(src.height));
    const int32_t new_w = std::clamp(static_cast<int32_t>(static_cast<double>(src.width) * scale), 1, box.width);
    const int32_t new_h = std::clamp(static_cast<int32_t>(static_cast<double>(src.height) * scale), 1, box.height);
    const Canvas scaled = resize(src, {new_w, new_h}, filter);

    const int32_t x_off = (box.width - new_w) / 2;
    const int32_t y_off = (box.height - new_h) / 2;
    blit(scaled, out, x_off, y_off);
    if(placed) *placed = {x_off, y_off, new_w, new_h};
    return out;
}

} // namespace elz::image
