#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace printlink::log {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error
};

using LogHandler = std::function<void(LogLevel, std::string_view)>;

/// Install a sink for every level. Passing an empty handler restores the defaults.
void setLogHandler(LogHandler handler);
void resetLogHandler();

/// Messages below @p level are dropped before they reach the sink.
void setLogLevel(LogLevel level);
LogLevel logLevel();

const char* toString(LogLevel level);

void logMessage(LogLevel level, std::string_view message);

inline void logDebug(std::string_view message)   { logMessage(LogLevel::Debug, message); }
inline void logInfo(std::string_view message)    { logMessage(LogLevel::Info, message); }
inline void logWarning(std::string_view message) { logMessage(LogLevel::Warning, message); }
inline void logError(std::string_view message)   { logMessage(LogLevel::Error, message); }

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

template<typename First, typename... Rest>
inline constexpr bool needsFormatting =
    (sizeof...(Rest) > 0) || !IsStringViewConvertible<std::decay_t<First>>::value;

} // namespace detail

template<typename First, typename... Rest,
         typename = std::enable_if_t<detail::needsFormatting<First, Rest...>>>
void logDebug(First&& first, Rest&&... rest) {
    if (logLevel() > LogLevel::Debug) return;
    logMessage(LogLevel::Debug,
               detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<detail::needsFormatting<First, Rest...>>>
void logInfo(First&& first, Rest&&... rest) {
    logMessage(LogLevel::Info,
               detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<detail::needsFormatting<First, Rest...>>>
void logWarning(First&& first, Rest&&... rest) {
    logMessage(LogLevel::Warning,
               detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<detail::needsFormatting<First, Rest...>>>
void logError(First&& first, Rest&&... rest) {
    logMessage(LogLevel::Error,
               detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

} // namespace printlink::log

namespace printlink {
using log::LogLevel;
using log::LogHandler;
using log::setLogHandler;
using log::resetLogHandler;
using log::setLogLevel;
using log::logDebug;
using log::logInfo;
using log::logWarning;
using log::logError;
} // namespace printlink
