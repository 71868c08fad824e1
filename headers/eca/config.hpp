//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_CONFIG_HPP
#define ERRORCLUSTERANALYZER_CONFIG_HPP

/**
 * @file config.hpp
 * @brief TOML configuration for the analyzer.
 *
 * Example:
 * @code
 *     [sources]
 *     paths = ["src/main/java", "legacy/src"]
 *     context_lines = 10
 *
 *     [fingerprint]
 *     frame_count = 5
 *     framework_prefixes = ["java.", "org.springframework."]
 *
 *     [merge]
 *     enabled = true
 *     similarity_threshold = 0.7
 *
 *     [parser]
 *     max_cause_depth = 64
 *
 *     [logging]
 *     level = "info"
 *     file = ""
 *     console = true
 * @endcode
 *
 * Every key is optional; missing keys keep their defaults.
 */

#include "eca/result.hpp"
#include "eca/error.hpp"
#include "eca/logger.hpp"
#include "eca/heuristics/config.hpp"

#include <filesystem>
#include <string>

namespace eca {

    struct LoggingConfig {
        std::string level = "info";
        std::string file;
        bool console = true;
    };

    class Config {
    public:
        Config() = default;

        heuristics::ParserConfig parser;
        heuristics::FingerprintConfig fingerprint;
        heuristics::MergeConfig merge;
        heuristics::ContextConfig context;
        LoggingConfig logging;

        /**
         * Loads configuration from a TOML file.
         *
         * @return The configuration, NotFound for a missing file, ParseError
         *         for invalid TOML, ConfigError for out-of-range values.
         */
        static Result<Config, Error> load_from_file(const std::filesystem::path& path);

        /**
         * Loads configuration from TOML text.
         */
        static Result<Config, Error> load_from_string(const std::string& content);

        static Config defaults();

        /**
         * Checks value ranges and the log level name.
         */
        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Logger settings for logger::create_logger().
         */
        [[nodiscard]] Result<logger::settings, Error> logger_settings() const;

        /**
         * Renders the configuration back to TOML.
         */
        [[nodiscard]] std::string to_string() const;
    };

}  // namespace eca

#endif //ERRORCLUSTERANALYZER_CONFIG_HPP
