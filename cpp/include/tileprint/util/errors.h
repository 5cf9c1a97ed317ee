#ifndef TILEPRINT_UTIL_ERRORS
#define TILEPRINT_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tileprint {

    /**
     * Raised when a type signature cannot be turned into a TypeNode tree at all
     * (empty input, a stray closing bracket, or unbalanced brackets under strict parsing).
     */
    struct ParseError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /**
     * Raised when the printer dispatch table is built with entries that can never be
     * selected (empty or duplicate patterns, or a pattern that is not a bare type name).
     */
    struct DispatchTableError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

    /**
     * Formats an exception escaping a printer the way it is shown inline in rendered output,
     * e.g. "{error: tensor_view: bad access}".
     */
    inline std::string format_error(std::string_view what, std::string_view context = {}) {
        if (context.empty()) return fmt::format("{{error: {}}}", what);
        return fmt::format("{{error: {}: {}}}", context, what);
    }

} // namespace tileprint

#endif // TILEPRINT_UTIL_ERRORS
