#include "scopes/waveform.hpp"

#include <algorithm>
#include <cmath>

namespace elz::scopes {

namespace {
    constexpr image::Rgb8 kIreColor{48, 48, 48};
    constexpr image::Rgb8 kTickColor{32, 32, 32};
    constexpr image::Rgb8 kBandColor{160, 160, 160};
    constexpr image::Rgb8 kReferenceColor{96, 96, 96};
    constexpr image::Rgb8 kMidGreyColor{80, 80, 80};
    constexpr image::Rgb8 kTraceStep{16, 80, 16};
    constexpr int32_t kTimingDivisions = 8;
}

int32_t WaveformRenderer::level_row(double level, int32_t canvas_height) noexcept {
    const double l = std::isnan(level) ? 0.0 : std::clamp(level, 0.0, 1.0);
    const double span = static_cast<double>(canvas_height - 2 * kMargin);
    const double row = (1.0 - l) * span + kMargin;
    return std::clamp(static_cast<int32_t>(row), 0, std::max(0, canvas_height - 1));
}

void WaveformRenderer::draw_grid(image::Canvas& canvas) const {
    if(canvas.empty()) return;
    const int32_t w = canvas.width;
    const int32_t h = canvas.height;

    for(double ire : {0.0, 0.25, 0.5, 0.75, 1.0}) {
        canvas.fill_row(level_row(ire, h), kIreColor);
    }
    for(int32_t i = 1; i < kTimingDivisions; ++i) {
        canvas.fill_column(static_cast<int32_t>(static_cast<int64_t>(w) * i / kTimingDivisions), kTickColor);
    }

    // White level band
    canvas.fill_row(kMargin, kBandColor);
    canvas.fill_row(kMargin + 1, kBandColor);

    canvas.fill_row(level_row(0.75, h), kReferenceColor);
    canvas.fill_row(level_row(0.5, h), kReferenceColor);
    canvas.fill_row(level_row(mid_grey_code_, h), kMidGreyColor);

    // Black level band, just above the 0% line
    canvas.fill_row(h - kMargin - 2, kBandColor);
    canvas.fill_row(h - kMargin - 1, kBandColor);
}

image::Canvas WaveformRenderer::render(const image::Frame& log_frame, image::Size canvas_size) const {
    image::Canvas wave(canvas_size.width, canvas_size.height);
    if(wave.empty()) return wave;

    draw_grid(wave);
    if(log_frame.empty()) return wave;

    const int32_t src_w = log_frame.width;
    const int32_t row_step = std::max(1, log_frame.height / kRowSamples);

    for(int32_t col = 0; col < wave.width; ++col) {
        const int32_t src_x = (wave.width > 1)
            ? static_cast<int32_t>(static_cast<int64_t>(col) * (src_w - 1) / (wave.width - 1))
            : 0;
        for(int32_t y = 0; y < log_frame.height; y += row_step) {
            const float* p = log_frame.pixel(src_x, y);
            const double luma = kWaveformLumaR * p[0] + kWaveformLumaG * p[1] + kWaveformLumaB * p[2];
            wave.add(col, level_row(luma, wave.height), kTraceStep);
        }
    }
    return wave;
}

} // namespace elz::scopes
