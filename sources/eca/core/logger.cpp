//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/logger.hpp"
#include "eca/utils/string_utils.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <vector>

namespace eca::logger {

    namespace {

    const std::string logger_name{"eca"};
    const std::string log_pattern{"[%Y-%m-%d %T.%e] [%^%l%$] [%t] %v"};

    std::shared_ptr<spdlog::logger> current_logger{};
    std::mutex logger_mutex;

    std::shared_ptr<spdlog::logger> acquire() {
        const std::scoped_lock lock(logger_mutex);
        return current_logger;
    }

    void install(std::shared_ptr<spdlog::logger> new_logger) {
        const std::scoped_lock lock(logger_mutex);
        if (current_logger) {
            current_logger->flush();
        }
        current_logger = std::move(new_logger);
    }

    spdlog::level::level_enum translate(const level lvl) {
        switch (lvl) {
            case level::trace:    return spdlog::level::trace;
            case level::debug:    return spdlog::level::debug;
            case level::info:     return spdlog::level::info;
            case level::warn:     return spdlog::level::warn;
            case level::err:      return spdlog::level::err;
            case level::critical: return spdlog::level::critical;
            case level::off:      return spdlog::level::off;
        }
        return spdlog::level::info;
    }

    }  // namespace

    Result<level, Error> level_from_str(const std::string_view name) {
        const auto lower = string_utils::to_lower(string_utils::trim(name));
        if (lower == "trace") return Result<level, Error>::success(level::trace);
        if (lower == "debug") return Result<level, Error>::success(level::debug);
        if (lower == "info") return Result<level, Error>::success(level::info);
        if (lower == "warn" || lower == "warning") return Result<level, Error>::success(level::warn);
        if (lower == "error" || lower == "err") return Result<level, Error>::success(level::err);
        if (lower == "critical") return Result<level, Error>::success(level::critical);
        if (lower == "off") return Result<level, Error>::success(level::off);

        return Result<level, Error>::failure(
            Error::config_error("Unknown log level", std::string(name))
        );
    }

    Result<void, Error> create_logger(const settings& log_settings) {
        std::vector<spdlog::sink_ptr> sinks;

        if (log_settings.console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }

        if (!log_settings.file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_settings.file));
            } catch (const spdlog::spdlog_ex& e) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to open log file", log_settings.file + ": " + e.what())
                );
            }
        }

        if (sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }

        auto new_logger = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());
        new_logger->set_level(translate(log_settings.log_level));
        new_logger->set_pattern(log_pattern);
        new_logger->flush_on(spdlog::level::err);

        install(std::move(new_logger));
        return Result<void, Error>::success();
    }

    void create_console_logger() {
        auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto new_logger = std::make_shared<spdlog::logger>(logger_name, std::move(stderr_sink));
        new_logger->set_level(spdlog::level::info);
        new_logger->set_pattern(log_pattern);
        install(std::move(new_logger));
    }

    void create_blackhole_logger() {
        auto new_logger = std::make_shared<spdlog::logger>(
            logger_name, std::make_shared<spdlog::sinks::null_sink_mt>());
        new_logger->set_level(spdlog::level::off);
        install(std::move(new_logger));
    }

    std::shared_ptr<spdlog::logger> get() {
        return acquire();
    }

    void reset() {
        install(nullptr);
    }

    void set_level(const level lvl) {
        if (const auto l = acquire()) {
            l->set_level(translate(lvl));
        }
    }

    bool should_log(const level lvl) {
        const auto l = acquire();
        return l && l->should_log(translate(lvl));
    }

    bool is_initialized() {
        return acquire() != nullptr;
    }

    void flush() {
        if (const auto l = acquire()) {
            l->flush();
        }
    }

    void shutdown() {
        flush();
        reset();
    }

    namespace detail {

        void log(const char* file, const int line, const char* function, const level lvl, const std::string_view msg) {
            if (const auto l = acquire()) {
                l->log(spdlog::source_loc{file, line, function}, translate(lvl), msg);
            }
        }

    }  // namespace detail

}  // namespace eca::logger
