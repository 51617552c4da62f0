#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>
#include <vector>

namespace wellscan::log {

using LogHandler = std::function<void(std::string_view)>;

enum class LogLevel {
    Info,
    Error
};

void setLogHandler(LogLevel level, LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

void logInfo(std::string_view message);
void logError(std::string_view message);

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
    logInfo(std::string_view(msg));
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logError(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logError(std::string_view(msg));
}

/**
 * @brief Redirects both log levels into memory for the lifetime of the object.
 *
 * Used by tests and by the demo to assert on (or re-render) what the core
 * reported. Restores the default stdout/stderr handlers on destruction.
 */
class ScopedLogCapture {
public:
    ScopedLogCapture();
    ~ScopedLogCapture();

    ScopedLogCapture(const ScopedLogCapture&) = delete;
    ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

    std::vector<std::string> infoLines() const;
    std::vector<std::string> errorLines() const;

    /// True if any captured error line contains @p needle.
    bool errorContains(std::string_view needle) const;

private:
    struct Buffer;
    std::shared_ptr<Buffer> buffer;
};

} // namespace wellscan::log

namespace wellscan {
using log::LogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::logInfo;
using log::logError;
} // namespace wellscan
