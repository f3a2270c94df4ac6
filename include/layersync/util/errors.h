#ifndef LAYERSYNC_UTIL_ERRORS
#define LAYERSYNC_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace layersync {

    /**
     * Raised when the synchronizer detects a broken internal invariant, for example a second mapping for the
     * same layer id or a group subscribed twice. This always signals a bug in the caller or in a renderer
     * adapter, it is never part of normal operation.
     */
    struct SyncInvariantError : std::logic_error {
        using std::logic_error::logic_error;
    };

    /**
     * Raised by the scene backend when its object collection is misused.
     */
    struct SceneError : std::runtime_error {
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
            "{}\nFile: {}({}:{}): {}", msg, loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace layersync

#endif // LAYERSYNC_UTIL_ERRORS
