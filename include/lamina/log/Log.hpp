#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace lamina::log {

using LogHandler = std::function<void(std::string_view)>;

void logInfo(std::string_view message);
void logError(std::string_view message);

/**
 * @brief RAII helper that installs a pair of handlers and restores the
 * previous ones on destruction. An empty handler selects the default
 * stdout/stderr sink. Mostly used by tests to capture diagnostics.
 */
class ScopedLogHandlers {
public:
    ScopedLogHandlers(LogHandler infoHandler, LogHandler errorHandler);

    ScopedLogHandlers(const ScopedLogHandlers&) = delete;
    ScopedLogHandlers& operator=(const ScopedLogHandlers&) = delete;

    ~ScopedLogHandlers();

private:
    LogHandler previousInfo_;
    LogHandler previousError_;
};

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

} // namespace detail

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logInfo(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logInfo(msg);
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logError(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logError(msg);
}

} // namespace lamina::log

namespace lamina {
using log::LogHandler;
using log::logInfo;
using log::logError;
} // namespace lamina
