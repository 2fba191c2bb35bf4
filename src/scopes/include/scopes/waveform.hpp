#pragma once

#include <cstdint>

#include "image/image.hpp"

namespace elz::scopes {

// Rec.709 luma weights; the waveform reads the recorded signal, not scene light.
inline constexpr double kWaveformLumaR = 0.2126;
inline constexpr double kWaveformLumaG = 0.7152;
inline constexpr double kWaveformLumaB = 0.0722;

/**
 * Luma waveform of the recorded (log-domain) signal.
 *
 * Every output column maps to one source column; each sampled pixel of that
 * column adds green to the row of its luma level, so dense levels glow.
 * Signal 1.0 sits 20 rows below the top edge and 0.0 20 rows above the bottom.
 */
class WaveformRenderer {
public:
    static constexpr int32_t kMargin = 20;
    static constexpr int32_t kRowSamples = 200;

    /**
     * @param mid_grey_code Signal level of scene-linear 18% grey on the
     *        recording curve; marked with its own reference line
     */
    explicit WaveformRenderer(double mid_grey_code = 0.18) : mid_grey_code_(mid_grey_code) {}

    image::Canvas render(const image::Frame& log_frame, image::Size canvas_size) const;

    // IRE lines, timing ticks and reference levels, on an existing canvas
    void draw_grid(image::Canvas& canvas) const;

    // Row a signal level (clamped to 0-1) is plotted on.
    static int32_t level_row(double level, int32_t canvas_height) noexcept;

    double mid_grey_code() const noexcept { return mid_grey_code_; }

private:
    double mid_grey_code_;
};

} // namespace elz::scopes
