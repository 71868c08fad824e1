//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_ERROR_HPP
#define ERRORCLUSTERANALYZER_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error value carried by Result<T, Error>.
 *
 * Malformed stack traces never surface here; the trace parser degrades to a
 * partial result instead. An Error describes a problem with the environment
 * the analysis runs in: a source root that cannot be listed, a record file
 * that is not JSON, a configuration value out of range.
 *
 * @code
 *     auto lines = file_utils::read_lines("src/OrderService.java");
 *     if (lines.is_err() && !lines.error().is_not_found()) {
 *         std::cerr << lines.error() << std::endl;
 *         // [IoError] Failed to read file (context: src/OrderService.java)
 *     }
 * @endcode
 */

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>

namespace eca {

    enum class ErrorCode {
        None,
        NotFound,       ///< Missing source file or record file
        ParseError,     ///< Record file, JSON or TOML that cannot be read
        IoError,
        ConfigError,    ///< Configuration loaded but failed validation
        InternalError
    };

    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:          return "None";
            case ErrorCode::NotFound:      return "NotFound";
            case ErrorCode::ParseError:    return "ParseError";
            case ErrorCode::IoError:       return "IoError";
            case ErrorCode::ConfigError:   return "ConfigError";
            case ErrorCode::InternalError: return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Immutable error with a code, a message and an optional context. The
     * context names the file, key or record the error refers to; wrapping
     * layers append to it with with_context().
     */
    class Error {
    public:
        Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error not_found(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        /// I/O failure reported by std::filesystem; context is "path: reason".
        static Error io_error(std::string message, const std::filesystem::path& path, const std::error_code& ec) {
            return {ErrorCode::IoError, std::move(message), path.string() + ": " + ec.message()};
        }

        static Error config_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
        }

        [[nodiscard]] ErrorCode code() const noexcept { return code_; }
        [[nodiscard]] const std::string& message() const noexcept { return message_; }
        [[nodiscard]] const std::optional<std::string>& context() const noexcept { return context_; }
        [[nodiscard]] bool has_context() const noexcept { return context_.has_value(); }

        /// Missing inputs are routine for context resolution and are not logged as failures.
        [[nodiscard]] bool is_not_found() const noexcept { return code_ == ErrorCode::NotFound; }

        /**
         * Returns a copy whose context has @p additional_context appended,
         * separated by "; ".
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (!context_) {
                return {code_, message_, std::move(additional_context)};
            }
            return {code_, message_, *context_ + "; " + additional_context};
        }

        /// "[Code] message" or "[Code] message (context: ...)".
        [[nodiscard]] std::string to_string() const {
            std::string out = std::string("[") + error_code_to_string(code_) + "] " + message_;
            if (context_) {
                out += " (context: " + *context_ + ")";
            }
            return out;
        }

        bool operator==(const Error& other) const = default;

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace eca

#endif //ERRORCLUSTERANALYZER_ERROR_HPP
