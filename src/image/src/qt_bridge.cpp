#include "image/qt_bridge.hpp"

#include <algorithm>
#include <vector>

namespace elz::image {

core::Result<Frame> frame_from_qimage(const QImage& img) {
    if(img.isNull()) {
        return core::fail(core::ErrorCode::InvalidFrame, "null image");
    }
    const QImage rgb = img.convertToFormat(QImage::Format_RGB888);
    const int32_t w = rgb.width();
    const int32_t h = rgb.height();

    // QImage rows are 4-byte aligned; repack tightly
    std::vector<uint8_t> packed(static_cast<size_t>(w) * static_cast<size_t>(h) * 3);
    const size_t row_bytes = static_cast<size_t>(w) * 3;
    for(int32_t y = 0; y < h; ++y) {
        const uchar* line = rgb.constScanLine(y);
        std::copy(line, line + row_bytes, packed.data() + static_cast<size_t>(y) * row_bytes);
    }
    return frame_from_u8(packed.data(), w, h, 3);
}

QImage to_qimage(const Canvas& canvas) {
    if(canvas.empty()) return {};
    const QImage view(canvas.data.data(), canvas.width, canvas.height, canvas.stride(), QImage::Format_RGB888);
    return view.copy();
}

} // namespace elz::image
