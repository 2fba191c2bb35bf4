#pragma once
#include <string>
#include <functional>

namespace elz::log {

enum class Level { Trace, Debug, Info, Warn, Error, Critical };

using SinkFn = std::function<void(Level, const std::string&)>;

// Replace the output for all subsequent messages. Pass an empty function to
// restore the spdlog default.
void set_sink(SinkFn sink) noexcept;

void write(Level lvl, const std::string& msg) noexcept;

// Messages below this level are dropped before reaching any sink. Default Info.
void set_level(Level lvl) noexcept;
Level level() noexcept;

	// Thin wrapper over spdlog; JSON mode emits one object per line for log collectors.
	void set_json_mode(bool enabled) noexcept;
	bool json_mode() noexcept;
	void trace(const std::string& msg) noexcept;
	void debug(const std::string& msg) noexcept;
	void info(const std::string& msg) noexcept;
	void warn(const std::string& msg) noexcept;
	void error(const std::string& msg) noexcept;
	void critical(const std::string& msg) noexcept;

// Emits the warning only the first time a given key is seen in this process.
// Used for capability fallbacks that would otherwise repeat on every frame.
void warn_once(const std::string& key, const std::string& msg) noexcept;

const char* level_name(Level lvl) noexcept;

} // namespace elz::log
