#include <tileprint/util/log.h>

#include <fmt/core.h>

#include <cstdio>

namespace tileprint {

    LogLevel Log::_level = LogLevel::Warning;
    bool Log::_use_logger = true;
    Log::sink_type Log::_sink;

    std::string_view to_string(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "debug";
            case LogLevel::Info: return "info";
            case LogLevel::Warning: return "warning";
            case LogLevel::Error: return "error";
            case LogLevel::Off: return "off";
        }
        return "unknown";
    }

    void Log::set_level(LogLevel level) { _level = level; }

    LogLevel Log::level() { return _level; }

    void Log::set_sink(sink_type sink) { _sink = std::move(sink); }

    void Log::set_use_logger(bool value) { _use_logger = value; }

    bool Log::enabled(LogLevel level) {
        return _use_logger && level != LogLevel::Off && static_cast<int>(level) >= static_cast<int>(_level);
    }

    void Log::_print(LogLevel level, const std::string& msg) {
        if (_sink) {
            _sink(level, msg);
            return;
        }
        fmt::print(stderr, "[tileprint] {}: {}\n", to_string(level), msg);
    }

} // namespace tileprint
