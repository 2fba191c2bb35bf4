#include "panel/engine.hpp"

#include "color/log_curve.hpp"
#include "color/zone_classifier.hpp"
#include "core/log.hpp"
#include "core/stage_timer.hpp"
#include "scopes/vectorscope.hpp"
#include "scopes/waveform.hpp"

#include <exception>
#include <string>

namespace elz::panel {

namespace {
    bool known_curve(color::LogCurve c) {
        const int v = static_cast<int>(c);
        return v >= static_cast<int>(color::LogCurve::LinearIdentity) &&
               v <= static_cast<int>(color::LogCurve::GenericFallback);
    }

    std::string describe(int32_t w, int32_t h) {
        return std::to_string(w) + "x" + std::to_string(h);
    }
}

Engine::Engine(EngineConfig config, const color::ZoneTable& zones, const draw::Painter& painter)
    : config_(config), zones_(zones), painter_(painter),
      mid_grey_code_(color::encode(config.curve, color::kMidGrey)),
      config_error_(validate_config(config)) {
    if(!known_curve(config_.curve)) {
        log::warn("Unknown log curve id " + std::to_string(static_cast<int>(config_.curve)) +
                  ", decoding with the generic fallback");
        config_.curve = color::LogCurve::GenericFallback;
        mid_grey_code_ = color::encode(config_.curve, color::kMidGrey);
    }
    if(config_error_) {
        log::error("Engine configuration rejected: " + config_error_->message);
    } else {
        log::debug(std::string("Engine ready: curve=") + color::log_curve_name(config_.curve) +
                   " output=" + describe(config_.output_size.width, config_.output_size.height) +
                   " scopes=" + describe(config_.scope_size.width, config_.scope_size.height) +
                   " painter=" + painter_.name());
    }
}

QuadrantLayout Engine::render(const image::Frame& log_frame) const {
    core::StageTimer timer;

    const image::Frame linear = color::decode_frame(log_frame, config_.curve);
    timer.mark("decode");

    const image::Frame zone_map = color::ZoneClassifier(zones_).classify(linear);
    timer.mark("classify");

    const image::Canvas vector_scope = scopes::VectorScopeRenderer(painter_).render(log_frame, config_.scope_size);
    const image::Canvas waveform = scopes::WaveformRenderer(mid_grey_code_).render(log_frame, config_.scope_size);
    timer.mark("scopes");

    QuadrantLayout layout = Compositor(painter_, config_.background)
                                .compose(log_frame, zone_map, vector_scope, waveform, config_.output_size);
    timer.mark("compose");

    log::debug("Processed " + describe(log_frame.width, log_frame.height) + " frame: " + timer.summary());
    return layout;
}

core::Result<QuadrantLayout> Engine::process(const image::Frame& log_frame) const {
    if(config_error_) return make_unexpected(*config_error_);

    const size_t expected_len = (log_frame.width > 0 && log_frame.height > 0)
        ? static_cast<size_t>(log_frame.width) * static_cast<size_t>(log_frame.height) * 3 : 0;
    if(log_frame.empty() || log_frame.data.size() != expected_len) {
        log::error("Rejected frame " + describe(log_frame.width, log_frame.height) + " with " +
                   std::to_string(log_frame.data.size()) + " samples");
        return core::fail(core::ErrorCode::InvalidFrame,
                          "frame " + describe(log_frame.width, log_frame.height) + " carries " +
                          std::to_string(log_frame.data.size()) + " samples, expected " +
                          std::to_string(expected_len));
    }

    try {
        return render(log_frame);
    } catch(const std::exception& e) {
        log::error(std::string("Frame render failed: ") + e.what());
        return core::fail(core::ErrorCode::RenderFailed, e.what());
    }
}

core::Result<QuadrantLayout> Engine::process_rgb8(const uint8_t* data, int32_t width, int32_t height,
                                                  int32_t channels) const {
    auto frame = image::frame_from_u8(data, width, height, channels);
    if(!frame) {
        log::error("Rejected 8-bit input: " + frame.error().message);
        return make_unexpected(frame.error());
    }
    return process(*frame);
}

core::Result<QuadrantLayout> Engine::process_channels(const float* data, int32_t width, int32_t height,
                                                      int32_t channels) const {
    auto frame = image::frame_from_channels(data, width, height, channels);
    if(!frame) {
        log::error("Rejected float input: " + frame.error().message);
        return make_unexpected(frame.error());
    }
    return process(*frame);
}

} // namespace elz::panel
