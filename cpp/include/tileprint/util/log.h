#pragma once

#include <fmt/format.h>

#include <functional>
#include <string>
#include <string_view>

namespace tileprint {

    enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3, Off = 4 };

    [[nodiscard]] std::string_view to_string(LogLevel level);

    /**
     * @brief Process-wide diagnostic log for the inspection engine.
     *
     * Messages below the minimum level are dropped before formatting. By default
     * messages go to stderr prefixed with "[tileprint]"; a host (e.g. the debugger
     * binding) may install its own sink to route them into its console.
     */
    class Log {
    public:
        using sink_type = std::function<void(LogLevel, const std::string&)>;

        static void set_level(LogLevel level);
        [[nodiscard]] static LogLevel level();

        /**
         * @brief Replace the output sink. Passing an empty function restores stderr output.
         */
        static void set_sink(sink_type sink);

        /**
         * @brief When false, all messages are discarded regardless of level.
         */
        static void set_use_logger(bool value);

        [[nodiscard]] static bool enabled(LogLevel level);

        template<typename... Ts>
        static void debug(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
            if (enabled(LogLevel::Debug)) _print(LogLevel::Debug, fmt::format(fmt_str, std::forward<Ts>(xs)...));
        }

        template<typename... Ts>
        static void info(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
            if (enabled(LogLevel::Info)) _print(LogLevel::Info, fmt::format(fmt_str, std::forward<Ts>(xs)...));
        }

        template<typename... Ts>
        static void warning(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
            if (enabled(LogLevel::Warning)) _print(LogLevel::Warning, fmt::format(fmt_str, std::forward<Ts>(xs)...));
        }

        template<typename... Ts>
        static void error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
            if (enabled(LogLevel::Error)) _print(LogLevel::Error, fmt::format(fmt_str, std::forward<Ts>(xs)...));
        }

    private:
        static LogLevel _level;
        static bool _use_logger;
        static sink_type _sink;

        static void _print(LogLevel level, const std::string& msg);
    };

} // namespace tileprint
