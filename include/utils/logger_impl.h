#pragma once

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace strata {
namespace utils {
namespace detail {

// Format strings reach the logger at runtime (callers pass std::string as
// well as literals), so they go through fmt::runtime.
template<typename FormatString, typename... Args>
void logAt(const std::shared_ptr<spdlog::logger>& logger, spdlog::level::level_enum lvl,
           FormatString&& fmt, Args&&... args) {
    if (!logger || !logger->should_log(lvl)) {
        return;
    }
    const std::string& tag = Logger::context();
    if (tag.empty()) {
        logger->log(lvl, fmt::runtime(std::forward<FormatString>(fmt)), std::forward<Args>(args)...);
        return;
    }
    std::string message = fmt::format(fmt::runtime(std::forward<FormatString>(fmt)), std::forward<Args>(args)...);
    logger->log(lvl, "[{}] {}", tag, message);
}

} // namespace detail

template<typename FormatString, typename... Args>
void Logger::trace(FormatString&& fmt, Args&&... args) {
    detail::logAt(logger_, spdlog::level::trace, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::debug(FormatString&& fmt, Args&&... args) {
    detail::logAt(logger_, spdlog::level::debug, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::info(FormatString&& fmt, Args&&... args) {
    detail::logAt(logger_, spdlog::level::info, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::warn(FormatString&& fmt, Args&&... args) {
    detail::logAt(logger_, spdlog::level::warn, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::error(FormatString&& fmt, Args&&... args) {
    detail::logAt(logger_, spdlog::level::err, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::critical(FormatString&& fmt, Args&&... args) {
    detail::logAt(logger_, spdlog::level::critical, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

} // namespace utils
} // namespace strata
