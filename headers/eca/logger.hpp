//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_LOGGER_HPP
#define ERRORCLUSTERANALYZER_LOGGER_HPP

/**
 * @file logger.hpp
 * @brief Library logging on top of spdlog.
 *
 * The library never creates a logger on its own. Until the host calls one
 * of the create_* functions every ECA_LOG_* statement is a no-op, so the
 * clustering pipeline stays silent when embedded.
 *
 * The create_* and reset functions swap the underlying logger and must
 * not race with each other; logging itself is thread safe.
 */

#include "eca/result.hpp"
#include "eca/error.hpp"

#include <fmt/core.h>
#include <spdlog/fwd.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace eca::logger {

    enum class level {
        trace,
        debug,
        info,
        warn,
        err,
        critical,
        off
    };

    /**
     * Parses "trace", "debug", "info", "warn"/"warning", "error",
     * "critical" or "off", case-insensitively.
     *
     * @return The level, or a ConfigError for an unknown name.
     */
    Result<level, Error> level_from_str(std::string_view name);

    /**
     * Logger settings, usually taken from the [logging] configuration section.
     */
    struct settings {
        level log_level = level::info;
        std::string file;       ///< Log file path; empty disables file output
        bool console = true;    ///< Also log to stderr
    };

    /**
     * Creates the logger from settings.
     *
     * @return Success, or an IoError if the log file cannot be opened.
     */
    Result<void, Error> create_logger(const settings& log_settings);

    /**
     * Creates a logger writing to stderr at info level.
     */
    void create_console_logger();

    /**
     * Creates a logger that discards everything. Intended for tests.
     */
    void create_blackhole_logger();

    /**
     * The underlying spdlog logger, or nullptr before initialization. The
     * handle stays valid after reset() or a new create_*() call.
     */
    std::shared_ptr<spdlog::logger> get();

    /**
     * Drops the logger; subsequent log statements become no-ops.
     */
    void reset();

    void set_level(level lvl);

    [[nodiscard]] bool should_log(level lvl);

    [[nodiscard]] bool is_initialized();

    void flush();

    /**
     * Flushes and drops the logger. Call before process exit.
     */
    void shutdown();

    namespace detail {
        void log(const char* file, int line, const char* function, level lvl, std::string_view msg);
    }  // namespace detail

    template<typename... Args>
    void log(const char* file, int line, const char* function, level lvl,
             fmt::format_string<Args...> msg, Args&&... args) {
        detail::log(file, line, function, lvl, fmt::format(msg, std::forward<Args>(args)...));
    }

}  // namespace eca::logger

#if defined(__GNUC__) || defined(__clang__)
#define ECA_LOGGER_FUNCTION __PRETTY_FUNCTION__
#else
#define ECA_LOGGER_FUNCTION __FUNCTION__
#endif

/**
 * Arguments are only evaluated when the level is enabled.
 */
#define ECA_LOG(severity, ...)                                                                     \
    do {                                                                                           \
        if (::eca::logger::should_log(severity)) {                                                 \
            ::eca::logger::log(__FILE__, __LINE__, ECA_LOGGER_FUNCTION, severity, __VA_ARGS__);   \
        }                                                                                          \
    } while (false)

#define ECA_LOG_TRACE(...) ECA_LOG(::eca::logger::level::trace, __VA_ARGS__)
#define ECA_LOG_DEBUG(...) ECA_LOG(::eca::logger::level::debug, __VA_ARGS__)
#define ECA_LOG_INFO(...) ECA_LOG(::eca::logger::level::info, __VA_ARGS__)
#define ECA_LOG_WARNING(...) ECA_LOG(::eca::logger::level::warn, __VA_ARGS__)
#define ECA_LOG_ERROR(...) ECA_LOG(::eca::logger::level::err, __VA_ARGS__)
#define ECA_LOG_CRITICAL(...) ECA_LOG(::eca::logger::level::critical, __VA_ARGS__)

#endif //ERRORCLUSTERANALYZER_LOGGER_HPP
