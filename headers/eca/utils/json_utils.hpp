//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_JSON_UTILS_HPP
#define ERRORCLUSTERANALYZER_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief JSON helpers built on nlohmann/json.
 *
 * All operations use Result<T, Error> for error handling.
 */

#include "eca/result.hpp"
#include "eca/error.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <optional>
#include <filesystem>
#include <fstream>

namespace eca::json_utils {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    /**
     * Parses a JSON string.
     */
    inline Result<json, Error> parse(std::string_view content) {
        try {
            return Result<json, Error>::success(json::parse(content));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", e.what())
            );
        }
    }

    /**
     * Writes a JSON value to a file, creating parent directories.
     *
     * @param indent Indentation level (-1 for compact output).
     */
    inline Result<void, Error> write_file(
        const fs::path& path,
        const json& data,
        int indent = 2
    ) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent, ec)
                );
            }
        }

        std::ofstream file(path);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        try {
            file << data.dump(indent);
        } catch (const json::type_error& e) {
            return Result<void, Error>::failure(
                Error::internal_error("JSON serialization error", e.what())
            );
        }

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write JSON file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    /**
     * Gets a value from a JSON object, or default_value when the key is
     * missing, null, or of the wrong type.
     */
    template<typename T>
    T get_or(const json& obj, const std::string& key, const T& default_value) {
        const auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            return default_value;
        }
        try {
            return it->template get<T>();
        } catch (const json::type_error&) {
            return default_value;
        }
    }

    /**
     * Gets an optional value: nullopt when the key is missing or null.
     *
     * @return The value, nullopt, or a ParseError on a type mismatch.
     */
    template<typename T>
    Result<std::optional<T>, Error> get_optional(const json& obj, const std::string& key) {
        const auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            return Result<std::optional<T>, Error>::success(std::nullopt);
        }
        try {
            return Result<std::optional<T>, Error>::success(it->template get<T>());
        } catch (const json::type_error& e) {
            return Result<std::optional<T>, Error>::failure(
                Error::parse_error("JSON type mismatch", key + ": " + e.what())
            );
        }
    }

}  // namespace eca::json_utils

#endif //ERRORCLUSTERANALYZER_JSON_UTILS_HPP
