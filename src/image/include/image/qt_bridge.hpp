#pragma once

#include <QtGui/QImage>

#include "core/error.hpp"
#include "image/image.hpp"

namespace elz::image {

// Any QImage format; alpha is dropped, 8-bit samples scaled to 0-1.
core::Result<Frame> frame_from_qimage(const QImage& img);

// Deep copy into a Format_RGB888 image.
QImage to_qimage(const Canvas& canvas);

} // namespace elz::image
