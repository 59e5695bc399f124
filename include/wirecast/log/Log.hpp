#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// Process-wide log sinks. The conversion engine never logs; the I/O helpers
// report short transfers and expired deadlines here, and tests route their
// failures through the same sinks so a host application can capture them.

namespace wirecast::log {

enum class Level { Info, Error };

using LogHandler = std::function<void(std::string_view)>;

// An empty handler restores the default sink for that level.
void setLogHandler(Level level, LogHandler handler);
void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

void write(Level level, std::string_view message);

inline void logInfo(std::string_view message) { write(Level::Info, message); }
inline void logError(std::string_view message) { write(Level::Error, message); }

namespace detail {

template<typename... Args>
std::string concat(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename First, typename... Rest>
inline constexpr bool needsFormatting =
    sizeof...(Rest) > 0 || !std::is_convertible_v<std::decay_t<First>, std::string_view>;

} // namespace detail

template<typename First, typename... Rest,
         typename = std::enable_if_t<detail::needsFormatting<First, Rest...>>>
void logInfo(First&& first, Rest&&... rest) {
    write(Level::Info, detail::concat(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<detail::needsFormatting<First, Rest...>>>
void logError(First&& first, Rest&&... rest) {
    write(Level::Error, detail::concat(std::forward<First>(first), std::forward<Rest>(rest)...));
}

} // namespace wirecast::log

namespace wirecast {
using log::LogHandler;
using log::logError;
using log::logInfo;
} // namespace wirecast
