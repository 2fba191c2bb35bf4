#pragma once

#include <optional>

#include "color/zone_table.hpp"
#include "core/error.hpp"
#include "draw/painter.hpp"
#include "panel/compositor.hpp"
#include "panel/engine_config.hpp"

namespace elz::panel {

/**
 * One-shot exposure panel renderer.
 *
 * Decodes the log frame, classifies it into EL zones, draws both scopes from
 * the recorded signal and composes the four-quadrant panel. The zone table and
 * painter are borrowed and must outlive the engine. process() keeps no state
 * between calls, so one engine may serve several worker threads at once.
 */
class Engine {
public:
    Engine(EngineConfig config, const color::ZoneTable& zones, const draw::Painter& painter);
    Engine(EngineConfig, const color::ZoneTable&&, const draw::Painter&) = delete;
    Engine(EngineConfig, const color::ZoneTable&, const draw::Painter&&) = delete;

    const EngineConfig& config() const noexcept { return config_; }

    // Set when the configuration was rejected; every process() call then fails with it.
    const std::optional<core::Error>& config_error() const noexcept { return config_error_; }

    core::Result<QuadrantLayout> process(const image::Frame& log_frame) const;

    // 8-bit interleaved input with 1-4 channels
    core::Result<QuadrantLayout> process_rgb8(const uint8_t* data, int32_t width, int32_t height,
                                              int32_t channels) const;

    // Float interleaved input with 1-4 channels
    core::Result<QuadrantLayout> process_channels(const float* data, int32_t width, int32_t height,
                                                  int32_t channels) const;

    // Signal level the waveform marks as 18% grey for the configured curve.
    double mid_grey_code() const noexcept { return mid_grey_code_; }

private:
    QuadrantLayout render(const image::Frame& log_frame) const;

    EngineConfig config_;
    const color::ZoneTable& zones_;
    const draw::Painter& painter_;
    double mid_grey_code_;
    std::optional<core::Error> config_error_;
};

} // namespace elz::panel
