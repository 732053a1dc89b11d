#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace awlights::log {

using LogHandler = std::function<void(std::string_view)>;

void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

void logInfo(std::string_view message);
void logError(std::string_view message);

/// Routed to the error sink with a "Warning: " prefix.
void logWarning(std::string_view message);

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

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logWarning(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logWarning(msg);
}

/**
 * @brief Log lines of one component, each prefixed with "[<component>] ".
 *
 * Components keep a file-scope instance and log through it:
 * @code
 * const log::Channel channel{"KeyboardDevice"};
 * channel.error("cannot encode effect\n");
 * @endcode
 * The tag must outlive the channel; string literals are the usual case.
 */
class Channel {
public:
    explicit constexpr Channel(std::string_view tag) : tag(tag) {}

    constexpr std::string_view name() const { return tag; }

    template<typename... Args>
    void info(Args&&... args) const {
        logInfo(detail::buildLogMessage("[", tag, "] ", std::forward<Args>(args)...));
    }

    template<typename... Args>
    void error(Args&&... args) const {
        logError(detail::buildLogMessage("[", tag, "] ", std::forward<Args>(args)...));
    }

    template<typename... Args>
    void warning(Args&&... args) const {
        logWarning(detail::buildLogMessage("[", tag, "] ", std::forward<Args>(args)...));
    }

private:
    std::string_view tag;
};

} // namespace awlights::log

namespace awlights {
using log::LogHandler;
using log::setInfoLogHandler;
using log::setErrorLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::logInfo;
using log::logError;
using log::logWarning;
} // namespace awlights
