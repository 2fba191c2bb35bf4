#pragma once
#include <string>

#include "core/expected.hpp"

namespace elz::core {

enum class ErrorCode {
    InvalidFrame,   // empty, mismatched or unsupported channel layout
    InvalidConfig,  // output/scope sizes outside the supported range
    RenderFailed    // unexpected failure while rendering a single frame
};

struct Error {
    ErrorCode code = ErrorCode::RenderFailed;
    std::string message;
};

inline const char* error_code_name(ErrorCode code) noexcept {
    switch(code) {
        case ErrorCode::InvalidFrame: return "invalid_frame";
        case ErrorCode::InvalidConfig: return "invalid_config";
        case ErrorCode::RenderFailed: return "render_failed";
    }
    return "unknown";
}

inline unexpected<Error> fail(ErrorCode code, std::string message) {
    return make_unexpected(Error{code, std::move(message)});
}

template <class T>
using Result = expected<T, Error>;

} // namespace elz::core
