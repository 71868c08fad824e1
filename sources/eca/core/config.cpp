//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/config.hpp"
#include "eca/utils/file_utils.hpp"
#include "eca/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <cstdint>
#include <optional>
#include <sstream>
#include <vector>

namespace eca {

    namespace {

    /**
     * The sub-table named key, or nullptr when it is absent or (recorded
     * in errors) not a table.
     */
    toml::table* read_section(toml::table& root, const std::string_view key, std::vector<std::string>& errors) {
        auto node = root[key];
        if (!node) {
            return nullptr;
        }
        auto* section = node.as_table();
        if (!section) {
            errors.push_back("[" + std::string(key) + "] must be a table");
        }
        return section;
    }

    /**
     * Reads a non-negative integer key. Negative or non-integer values are
     * recorded in errors and leave target untouched.
     */
    void read_count(toml::table& section, const std::string_view key,
                    std::size_t& target, std::vector<std::string>& errors) {
        auto node = section[key];
        if (!node) {
            return;
        }
        if (!node.is_integer()) {
            errors.push_back(std::string(key) + " must be an integer");
            return;
        }
        const auto value = node.value_or(std::int64_t{0});
        if (value < 0) {
            errors.push_back(std::string(key) + " must be non-negative");
            return;
        }
        target = static_cast<std::size_t>(value);
    }

    void read_bool(toml::table& section, const std::string_view key,
                   bool& target, std::vector<std::string>& errors) {
        auto node = section[key];
        if (!node) {
            return;
        }
        if (!node.is_boolean()) {
            errors.push_back(std::string(key) + " must be a boolean");
            return;
        }
        target = node.value_or(false);
    }

    /// Integers are accepted and widened.
    void read_number(toml::table& section, const std::string_view key,
                     double& target, std::vector<std::string>& errors) {
        auto node = section[key];
        if (!node) {
            return;
        }
        if (!node.is_number()) {
            errors.push_back(std::string(key) + " must be a number");
            return;
        }
        target = node.value<double>().value_or(0.0);
    }

    void read_string(toml::table& section, const std::string_view key,
                     std::string& target, std::vector<std::string>& errors) {
        auto node = section[key];
        if (!node) {
            return;
        }
        if (!node.is_string()) {
            errors.push_back(std::string(key) + " must be a string");
            return;
        }
        target = node.value_or(std::string{});
    }

    /**
     * Reads an array of strings. Returns nullopt when the key is absent or
     * when the value (recorded in errors) is not an array of strings.
     */
    std::optional<std::vector<std::string>> read_strings(toml::table& section, const std::string_view key,
                                                         std::vector<std::string>& errors) {
        auto node = section[key];
        if (!node) {
            return std::nullopt;
        }

        auto* array = node.as_array();
        if (!array) {
            errors.push_back(std::string(key) + " must be an array of strings");
            return std::nullopt;
        }

        std::vector<std::string> values;
        for (auto& item : *array) {
            auto value = item.value<std::string>();
            if (!item.is_string() || !value) {
                errors.push_back(std::string(key) + " must be an array of strings");
                return std::nullopt;
            }
            values.push_back(std::move(*value));
        }
        return values;
    }

    std::string quoted_list(const std::vector<std::string>& values) {
        std::ostringstream ss;
        ss << "[";
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << "\"" << values[i] << "\"";
        }
        ss << "]";
        return ss.str();
    }

    }  // namespace

    Result<Config, Error> Config::load_from_file(const std::filesystem::path& path) {
        return file_utils::read_file(path)
            .map_error([](const Error& error) { return error.with_context("loading configuration"); })
            .and_then([](const std::string& content) { return load_from_string(content); });
    }

    Result<Config, Error> Config::load_from_string(const std::string& content) {
        try {
            auto tbl = toml::parse(content);
            Config config;
            std::vector<std::string> errors;

            if (auto* sources = read_section(tbl, "sources", errors)) {
                if (auto paths = read_strings(*sources, "paths", errors)) {
                    config.context.source_paths.assign(paths->begin(), paths->end());
                }
                read_count(*sources, "context_lines", config.context.context_lines, errors);
                read_count(*sources, "max_resolved_clusters", config.context.max_resolved_clusters, errors);
            }

            if (auto* fingerprint = read_section(tbl, "fingerprint", errors)) {
                read_count(*fingerprint, "frame_count", config.fingerprint.frame_count, errors);
                if (auto prefixes = read_strings(*fingerprint, "framework_prefixes", errors)) {
                    config.fingerprint.framework_prefixes = std::move(*prefixes);
                }
            }

            if (auto* merge = read_section(tbl, "merge", errors)) {
                read_bool(*merge, "enabled", config.merge.enabled, errors);
                read_number(*merge, "similarity_threshold", config.merge.similarity_threshold, errors);
            }

            if (auto* parser = read_section(tbl, "parser", errors)) {
                read_count(*parser, "max_cause_depth", config.parser.max_cause_depth, errors);
            }

            if (auto* log = read_section(tbl, "logging", errors)) {
                read_string(*log, "level", config.logging.level, errors);
                read_string(*log, "file", config.logging.file, errors);
                read_bool(*log, "console", config.logging.console, errors);
            }

            if (!errors.empty()) {
                return Result<Config, Error>::failure(
                    Error::config_error("Configuration validation failed",
                                        string_utils::join(errors, "; "))
                );
            }

            if (auto validation_result = config.validate(); validation_result.is_err()) {
                return Result<Config, Error>::failure(validation_result.error());
            }

            return Result<Config, Error>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            return Result<Config, Error>::failure(
                Error::parse_error("Failed to parse TOML configuration", std::string(err.description()))
            );
        }
    }

    Config Config::defaults() {
        return Config{};
    }

    Result<void, Error> Config::validate() const {
        std::vector<std::string> errors;

        if (fingerprint.frame_count < 1) {
            errors.emplace_back("frame_count must be at least 1");
        }

        for (const auto& prefix : fingerprint.framework_prefixes) {
            if (prefix.empty()) {
                errors.emplace_back("framework_prefixes must not contain empty entries");
                break;
            }
        }

        if (merge.similarity_threshold < 0.0 || merge.similarity_threshold > 1.0) {
            errors.emplace_back("similarity_threshold must be between 0.0 and 1.0");
        }

        if (parser.max_cause_depth < 1) {
            errors.emplace_back("max_cause_depth must be at least 1");
        }

        for (const auto& path : context.source_paths) {
            if (path.empty()) {
                errors.emplace_back("source paths must not be empty");
                break;
            }
        }

        if (logger::level_from_str(logging.level).is_err()) {
            errors.emplace_back("unknown log level '" + logging.level + "'");
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Configuration validation failed", string_utils::join(errors, "; "))
            );
        }

        return Result<void, Error>::success();
    }

    Result<logger::settings, Error> Config::logger_settings() const {
        auto level = logger::level_from_str(logging.level);
        if (level.is_err()) {
            return Result<logger::settings, Error>::failure(level.error());
        }

        logger::settings settings;
        settings.log_level = level.value();
        settings.file = logging.file;
        settings.console = logging.console;
        return Result<logger::settings, Error>::success(std::move(settings));
    }

    std::string Config::to_string() const {
        std::ostringstream ss;

        std::vector<std::string> paths;
        for (const auto& path : context.source_paths) {
            paths.push_back(path.generic_string());
        }

        ss << "[sources]\n";
        ss << "paths = " << quoted_list(paths) << "\n";
        ss << "context_lines = " << context.context_lines << "\n";
        ss << "max_resolved_clusters = " << context.max_resolved_clusters << "\n\n";

        ss << "[fingerprint]\n";
        ss << "frame_count = " << fingerprint.frame_count << "\n";
        ss << "framework_prefixes = " << quoted_list(fingerprint.framework_prefixes) << "\n\n";

        ss << "[merge]\n";
        ss << "enabled = " << (merge.enabled ? "true" : "false") << "\n";
        ss << "similarity_threshold = " << merge.similarity_threshold << "\n\n";

        ss << "[parser]\n";
        ss << "max_cause_depth = " << parser.max_cause_depth << "\n\n";

        ss << "[logging]\n";
        ss << "level = \"" << logging.level << "\"\n";
        ss << "file = \"" << logging.file << "\"\n";
        ss << "console = " << (logging.console ? "true" : "false") << "\n";

        return ss.str();
    }

}  // namespace eca
