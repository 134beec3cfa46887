#pragma once

// Windows compatibility - undef macros that conflict with Logger::Level
#ifdef ERROR
#undef ERROR
#endif

#include <string>
#include <memory>

namespace spdlog { class logger; }

namespace strata {
namespace utils {

class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    // Console (stderr) sink always; file sink only when log_file is non-empty.
    // Nothing is logged before init().
    static void init(const std::string& log_file = "strata.log", Level level = Level::INFO);
    static void shutdown();
    // Returns INFO on unknown names
    static Level levelFromString(const std::string& lvl);

    // Tag prepended to every message of the calling thread ("" = none)
    static const std::string& context();

    template<typename FormatString, typename... Args>
    static void trace(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void debug(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void info(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void warn(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void error(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void critical(FormatString&& fmt, Args&&... args);

private:
    friend class ScopedLogContext;

    static std::shared_ptr<spdlog::logger> logger_;
    static thread_local std::string context_;
};

/**
 * Tags the calling thread's log lines with the site and job they serve,
 * e.g. "[site1 3f2a...]". Restores the previous tag on destruction.
 */
class ScopedLogContext {
public:
    ScopedLogContext(const std::string& site, const std::string& job_id);
    ~ScopedLogContext();

    ScopedLogContext(const ScopedLogContext&) = delete;
    ScopedLogContext& operator=(const ScopedLogContext&) = delete;

private:
    std::string previous_;
};

} // namespace utils
} // namespace strata

// Include implementation
#include "utils/logger_impl.h"

// Logging macros
#define STRATA_TRACE(...) ::strata::utils::Logger::trace(__VA_ARGS__)
#define STRATA_DEBUG(...) ::strata::utils::Logger::debug(__VA_ARGS__)
#define STRATA_INFO(...) ::strata::utils::Logger::info(__VA_ARGS__)
#define STRATA_WARN(...) ::strata::utils::Logger::warn(__VA_ARGS__)
#define STRATA_ERROR(...) ::strata::utils::Logger::error(__VA_ARGS__)
#define STRATA_CRITICAL(...) ::strata::utils::Logger::critical(__VA_ARGS__)
