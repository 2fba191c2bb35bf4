#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "image/image.hpp"

/**
 * Camera log curves for exposure analysis.
 *
 * Each curve is a pointwise transfer function between a normalised log code
 * value and scene-linear light, where 0.18 is nominal mid grey. Decoding feeds
 * the zone classifier; encoding places curve-aware references on the scopes.
 */

namespace elz::color {

/**
 * Log curves selectable for a processing run
 */
enum class LogCurve {
    LinearIdentity = 0, // Input already scene-linear
    LogC4,              // ARRI LogC4
    LogC4Approx,        // Parametric LogC4 approximation
    SLog3,              // Sony S-Log3
    AppleLogApprox,     // Apple Log, exponential approximation
    RedLog3Approx,      // RED Log3G10, approximation
    GenericFallback     // 14-stop exponential around code 0.5
};

/**
 * Decode one log code value to scene-linear light.
 * Values outside the enum fall through to GenericFallback.
 * @param curve Source curve
 * @param v Normalised code value
 * @return Scene-linear value (non-negative for the clamped curves)
 */
double decode(LogCurve curve, double v) noexcept;

/**
 * Encode scene-linear light to a normalised code value (inverse of decode
 * on the curve's monotonic range).
 * @param curve Target curve
 * @param linear Scene-linear value
 * @return Normalised code value
 */
double encode(LogCurve curve, double linear) noexcept;

/**
 * Decode every channel of a frame.
 * LinearIdentity returns an identical copy.
 */
image::Frame decode_frame(const image::Frame& log_frame, LogCurve curve);

/**
 * Parse a configuration name ("linear", "logc4", "logc4_approx", "slog3",
 * "apple_log", "redlog3"; case-insensitive).
 * Unknown names log a warning and return GenericFallback.
 */
LogCurve parse_log_curve(std::string_view name);

/**
 * Canonical configuration name for a curve
 */
const char* log_curve_name(LogCurve curve) noexcept;

/**
 * Human-readable curve description
 */
std::string log_curve_display_name(LogCurve curve);

std::vector<LogCurve> supported_log_curves();

// Individual transfer functions, exposed for tests and tooling
double logc4_to_linear(double v) noexcept;
double linear_to_logc4(double x) noexcept;
double logc4_approx_to_linear(double v) noexcept;
double linear_to_logc4_approx(double x) noexcept;
double slog3_to_linear(double v) noexcept;
double linear_to_slog3(double x) noexcept;
double apple_log_approx_to_linear(double v) noexcept;
double linear_to_apple_log_approx(double x) noexcept;
double redlog3_approx_to_linear(double v) noexcept;
double linear_to_redlog3_approx(double x) noexcept;
double generic_log_to_linear(double v) noexcept;
double linear_to_generic_log(double x) noexcept;

} // namespace elz::color
