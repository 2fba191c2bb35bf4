#include "core/log.hpp"
#include <mutex>
#include <iostream>
#include <atomic>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <unordered_set>
#include <cstdio>
#include <ctime>
#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace elz::log {

static SinkFn g_sink;
static std::mutex g_mutex;
static std::atomic<bool> g_json{false};
static std::atomic<int> g_min_level{static_cast<int>(Level::Info)};
static std::mutex g_once_mutex;
static std::unordered_set<std::string> g_once_keys;

const char* level_name(Level lvl) noexcept {
    switch(lvl) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Critical: return "critical";
    }
    return "unknown";
}

void set_sink(SinkFn sink) noexcept {
    std::scoped_lock lock(g_mutex);
    g_sink = std::move(sink);
}

void set_level(Level lvl) noexcept { g_min_level.store(static_cast<int>(lvl), std::memory_order_relaxed); }
Level level() noexcept { return static_cast<Level>(g_min_level.load(std::memory_order_relaxed)); }

static spdlog::level::level_enum to_spdlog(Level lvl) {
    switch(lvl) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Critical: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

// Colour console logger shared by the library and tools; level filtering happens in write().
static spdlog::logger& console() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        auto l = spdlog::get("elzone");
        if(!l) l = spdlog::stdout_color_mt("elzone");
        l->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        l->set_level(spdlog::level::trace);
        return l;
    }();
    return *logger;
}

void set_json_mode(bool enabled) noexcept { g_json.store(enabled, std::memory_order_relaxed); }
bool json_mode() noexcept { return g_json.load(std::memory_order_relaxed); }

static void default_emit(Level lvl, const std::string& msg) {
    if(json_mode()) {
        // {"ts":"ISO8601","level":"info","msg":"..."}
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
#if defined(_WIN32)
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        std::ostringstream ts;
        ts << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        ts << '.' << std::setw(3) << std::setfill('0') << ms.count();
        std::clog << '{' << "\"ts\":\"" << ts.str() << "\",\"level\":\"" << level_name(lvl) << "\",\"msg\":\"";
        for(char c: msg){
            if(c=='"') std::clog << "\\\"";
            else if(c=='\\') std::clog << "\\\\";
            else if(c=='\n') std::clog << "\\n";
            else std::clog << c;
        }
        std::clog << "\"}" << '\n';
    } else {
        console().log(to_spdlog(lvl), msg);
    }
}

void write(Level lvl, const std::string& msg) noexcept {
    if(static_cast<int>(lvl) < g_min_level.load(std::memory_order_relaxed)) return;
    try {
        std::scoped_lock lock(g_mutex);
        if(g_sink) { g_sink(lvl, msg); return; }
        default_emit(lvl, msg);
    } catch(const std::exception& e) {
        std::fprintf(stderr, "elz::log write failed: %s\n", e.what());
    }
}

void trace(const std::string& msg) noexcept { write(Level::Trace, msg); }
void debug(const std::string& msg) noexcept { write(Level::Debug, msg); }
void info(const std::string& msg) noexcept { write(Level::Info, msg); }
void warn(const std::string& msg) noexcept { write(Level::Warn, msg); }
void error(const std::string& msg) noexcept { write(Level::Error, msg); }
void critical(const std::string& msg) noexcept { write(Level::Critical, msg); }

void warn_once(const std::string& key, const std::string& msg) noexcept {
    bool first = false;
    try {
        std::scoped_lock lock(g_once_mutex);
        first = g_once_keys.insert(key).second;
    } catch(const std::exception&) {
        first = true;
    }
    if(first) warn(msg);
}

} // namespace elz::log
