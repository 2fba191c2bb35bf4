#include "panel/engine_config.hpp"

#include <cstdlib>
#include <string>

namespace elz::panel {

namespace {
    std::optional<core::Error> check_size(const char* field, image::Size s, int32_t lo, int32_t hi) {
        if(s.width < lo || s.height < lo || s.width > hi || s.height > hi) {
            return core::Error{core::ErrorCode::InvalidConfig,
                               std::string(field) + " " + std::to_string(s.width) + "x" + std::to_string(s.height) +
                               " outside " + std::to_string(lo) + ".." + std::to_string(hi)};
        }
        return std::nullopt;
    }
}

std::optional<core::Error> validate_config(const EngineConfig& config) {
    if(auto err = check_size("output_size", config.output_size, kMinOutputSide, kMaxOutputSide)) return err;
    if(auto err = check_size("scope_size", config.scope_size, kMinScopeSide, kMaxScopeSide)) return err;
    return std::nullopt;
}

std::optional<image::Size> parse_size(const std::string& text) {
    const auto x = text.find_first_of("xX");
    if(x == std::string::npos || x == 0 || x + 1 >= text.size()) return std::nullopt;
    char* end = nullptr;
    const long w = std::strtol(text.c_str(), &end, 10);
    if(end != text.c_str() + x) return std::nullopt;
    const char* hs = text.c_str() + x + 1;
    const long h = std::strtol(hs, &end, 10);
    if(*end != '\0' || end == hs) return std::nullopt;
    if(w <= 0 || h <= 0 || w > kMaxOutputSide || h > kMaxOutputSide) return std::nullopt;
    return image::Size{static_cast<int32_t>(w), static_cast<int32_t>(h)};
}

} // namespace elz::panel
