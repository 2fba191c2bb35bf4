#pragma once
#include "image/image.hpp"

namespace elz::image {

enum class Filter {
    Nearest,
    Bilinear,
    Lanczos3
};

/**
 * Resample a canvas to an exact size with libswscale.
 * Each channel is scaled as its own 8-bit plane so no colour conversion
 * happens on the way; a flat colour stays flat.
 * @param src Source canvas
 * @param target Target size (each dimension >= 1)
 * @param filter Reconstruction filter (SWS_POINT, SWS_BILINEAR, SWS_LANCZOS)
 * @return Resampled canvas, or an empty canvas when src or target is empty
 * @throws std::runtime_error when swscale cannot build a context for the sizes
 */
Canvas resize(const Canvas& src, Size target, Filter filter = Filter::Lanczos3);

/**
 * Scale to exactly `width` pixels wide, height following the aspect ratio
 * (truncated, at least 1 pixel).
 */
Canvas resize_to_width(const Canvas& src, int32_t width, Filter filter = Filter::Lanczos3);

/**
 * Scale to the largest size fitting inside `box` while keeping aspect ratio,
 * then centre it on a `box`-sized canvas filled with `background`.
 * @param placed Optional output: rectangle the scaled image occupies within box
 */
Canvas fit_into(const Canvas& src, Size box, Rgb8 background, Rect* placed = nullptr,
                Filter filter = Filter::Lanczos3);

} // namespace elz::image
