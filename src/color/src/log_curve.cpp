#include "color/log_curve.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

/**
 * Log curve implementation.
 *
 * LogC4 and S-Log3 follow the manufacturers' published decode formulas.
 * The Apple Log, RED Log3G10 and generic curves are coarse exponential
 * approximations used where an exact curve is unavailable; they are good
 * enough for zone placement, not for grading.
 */

namespace elz::color {

namespace {
    // Floor for log() of non-positive linear values in the encoders
    constexpr double kTinyLinear = 1e-10;

    // ARRI LogC4
    const double kLogC4A = (std::pow(2.0, 18.0) - 16.0) / 117.45;
    constexpr double kLogC4B = (1023.0 - 95.0) / 1023.0;
    constexpr double kLogC4C = 95.0 / 1023.0;
    const double kLogC4S = (7.0 * std::log(2.0) * std::pow(2.0, 7.0 - 14.0 * kLogC4C / kLogC4B)) / (kLogC4A * kLogC4B);
    const double kLogC4T = (std::pow(2.0, 14.0 * (-kLogC4C / kLogC4B) + 6.0) - 64.0) / kLogC4A;

    // Parametric LogC4 approximation
    constexpr double kApproxA = 0.0647954196341293;
    constexpr double kApproxB = 0.0799017958419154;
    constexpr double kApproxC = 0.0851858618842153;
    constexpr double kApproxD = 0.0562935137369496;

    // Sony S-Log3
    constexpr double kSLog3Break = 171.2102946929 / 1023.0;

    // RED Log3G10 approximation
    constexpr double kRedLinearSlope = 0.224282;
    constexpr double kRedBreak = 0.01;

    std::string to_lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }
}

double logc4_to_linear(double v) noexcept {
    const double x = v >= 0.0
        ? (std::pow(2.0, 14.0 * (v - kLogC4C) / kLogC4B + 6.0) - 64.0) / kLogC4A
        : v * kLogC4S + kLogC4T;
    return std::max(0.0, x);
}

double linear_to_logc4(double x) noexcept {
    if(x >= kLogC4T) {
        return (std::log2(kLogC4A * x + 64.0) - 6.0) / 14.0 * kLogC4B + kLogC4C;
    }
    return (x - kLogC4T) / kLogC4S;
}

double logc4_approx_to_linear(double v) noexcept {
    const double x = v > kApproxC
        ? std::pow(10.0, (v - kApproxD) / kApproxA) - kApproxB / kApproxA
        : (v - kApproxC) / kApproxB;
    return std::max(0.0, x);
}

double linear_to_logc4_approx(double x) noexcept {
    const double v = kApproxA * std::log10(std::max(x + kApproxB / kApproxA, kTinyLinear)) + kApproxD;
    if(v > kApproxC) return v;
    // The curve jumps at its break point; linear values below the jump map onto it.
    return kApproxC + kApproxB * std::min(x, 0.0);
}

double slog3_to_linear(double v) noexcept {
    if(v >= kSLog3Break) {
        return std::pow(10.0, (v * 1023.0 - 420.0) / 261.5) * (0.18 + 0.01) - 0.01;
    }
    return (v * 1023.0 - 95.0) * 0.01125 / (171.2102946929 - 95.0);
}

double linear_to_slog3(double x) noexcept {
    if(x >= 0.01125) {
        return (420.0 + std::log10((x + 0.01) / (0.18 + 0.01)) * 261.5) / 1023.0;
    }
    return (x * (171.2102946929 - 95.0) / 0.01125 + 95.0) / 1023.0;
}

double apple_log_approx_to_linear(double v) noexcept {
    return std::pow(10.0, (v - 0.3584) / 0.2471);
}

double linear_to_apple_log_approx(double x) noexcept {
    return 0.3584 + 0.2471 * std::log10(std::max(x, kTinyLinear));
}

double redlog3_approx_to_linear(double v) noexcept {
    const double x = v >= kRedBreak
        ? std::pow(10.0, (v * 1023.0 - 685.0) / 300.0) / 1023.0
        : v * kRedLinearSlope;
    return std::max(0.0, x);
}

double linear_to_redlog3_approx(double x) noexcept {
    if(x <= 0.0) return x / kRedLinearSlope;
    const double v = (300.0 * std::log10(x * 1023.0) + 685.0) / 1023.0;
    return v >= kRedBreak ? v : x / kRedLinearSlope;
}

double generic_log_to_linear(double v) noexcept {
    return std::pow(2.0, (v - 0.5) * 14.0);
}

double linear_to_generic_log(double x) noexcept {
    return 0.5 + std::log2(std::max(x, kTinyLinear)) / 14.0;
}

double decode(LogCurve curve, double v) noexcept {
    switch(curve) {
        case LogCurve::LinearIdentity: return v;
        case LogCurve::LogC4: return logc4_to_linear(v);
        case LogCurve::LogC4Approx: return logc4_approx_to_linear(v);
        case LogCurve::SLog3: return slog3_to_linear(v);
        case LogCurve::AppleLogApprox: return apple_log_approx_to_linear(v);
        case LogCurve::RedLog3Approx: return redlog3_approx_to_linear(v);
        case LogCurve::GenericFallback: return generic_log_to_linear(v);
    }
    return generic_log_to_linear(v);
}

double encode(LogCurve curve, double linear) noexcept {
    switch(curve) {
        case LogCurve::LinearIdentity: return linear;
        case LogCurve::LogC4: return linear_to_logc4(linear);
        case LogCurve::LogC4Approx: return linear_to_logc4_approx(linear);
        case LogCurve::SLog3: return linear_to_slog3(linear);
        case LogCurve::AppleLogApprox: return linear_to_apple_log_approx(linear);
        case LogCurve::RedLog3Approx: return linear_to_redlog3_approx(linear);
        case LogCurve::GenericFallback: return linear_to_generic_log(linear);
    }
    return linear_to_generic_log(linear);
}

image::Frame decode_frame(const image::Frame& log_frame, LogCurve curve) {
    if(curve == LogCurve::LinearIdentity) {
        return log_frame;
    }
    image::Frame out = log_frame;
    for(float& s : out.data) {
        s = static_cast<float>(decode(curve, static_cast<double>(s)));
    }
    return out;
}

LogCurve parse_log_curve(std::string_view name) {
    const std::string key = to_lower(name);
    if(key == "linear") return LogCurve::LinearIdentity;
    if(key == "logc4" || key == "log-c4") return LogCurve::LogC4;
    if(key == "logc4_approx") return LogCurve::LogC4Approx;
    if(key == "slog3" || key == "s-log3") return LogCurve::SLog3;
    if(key == "apple_log" || key == "applelog") return LogCurve::AppleLogApprox;
    if(key == "redlog3" || key == "log3g10") return LogCurve::RedLog3Approx;
    if(key == "generic") return LogCurve::GenericFallback;

    log::warn("Log curve '" + std::string(name) + "' not supported, using generic fallback decode");
    return LogCurve::GenericFallback;
}

const char* log_curve_name(LogCurve curve) noexcept {
    switch(curve) {
        case LogCurve::LinearIdentity: return "linear";
        case LogCurve::LogC4: return "logc4";
        case LogCurve::LogC4Approx: return "logc4_approx";
        case LogCurve::SLog3: return "slog3";
        case LogCurve::AppleLogApprox: return "apple_log";
        case LogCurve::RedLog3Approx: return "redlog3";
        case LogCurve::GenericFallback: return "generic";
    }
    return "generic";
}

std::string log_curve_display_name(LogCurve curve) {
    switch(curve) {
        case LogCurve::LinearIdentity: return "Scene Linear";
        case LogCurve::LogC4: return "ARRI LogC4";
        case LogCurve::LogC4Approx: return "ARRI LogC4 (approximation)";
        case LogCurve::SLog3: return "Sony S-Log3";
        case LogCurve::AppleLogApprox: return "Apple Log (approximation)";
        case LogCurve::RedLog3Approx: return "RED Log3G10 (approximation)";
        case LogCurve::GenericFallback: return "Generic Log";
    }
    return "Unknown";
}

std::vector<LogCurve> supported_log_curves() {
    return {
        LogCurve::LinearIdentity,
        LogCurve::LogC4,
        LogCurve::LogC4Approx,
        LogCurve::SLog3,
        LogCurve::AppleLogApprox,
        LogCurve::RedLog3Approx,
        LogCurve::GenericFallback
    };
}

} // namespace elz::color
