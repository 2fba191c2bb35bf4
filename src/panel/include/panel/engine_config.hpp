#pragma once

#include <optional>
#include <string>

#include "color/log_curve.hpp"
#include "core/error.hpp"
#include "draw/painter.hpp"
#include "image/image.hpp"

namespace elz::panel {

inline constexpr int32_t kMinOutputSide = 64;
inline constexpr int32_t kMaxOutputSide = 16384;
inline constexpr int32_t kMinScopeSide = 64;
inline constexpr int32_t kMaxScopeSide = 4096;

// Fixed for the lifetime of an Engine.
struct EngineConfig {
    color::LogCurve curve = color::LogCurve::LogC4;
    image::Size output_size{1920, 1080};
    image::Size scope_size{480, 540};
    image::Rgb8 background{0, 0, 0};
    draw::Backend painter = draw::Backend::Auto;
};

/**
 * Check sizes against the supported range.
 * @return InvalidConfig error describing the first offending field, or nullopt
 */
std::optional<core::Error> validate_config(const EngineConfig& config);

// Parses "WIDTHxHEIGHT" (e.g. "1920x1080").
std::optional<image::Size> parse_size(const std::string& text);

} // namespace elz::panel
