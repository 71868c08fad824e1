//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_TYPES_HPP
#define ERRORCLUSTERANALYZER_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures for error fingerprinting and clustering.
 *
 * Types are organized into categories:
 *
 * - Basic Types: Timestamp, LogLevel, CodeLocation
 * - Trace Data: StackFrame, ParsedTrace, ThrowableInfo
 * - Record Data: LogRecord
 * - Cluster Data: ClusterSeverity, ErrorCluster
 * - Source Data: CodeContext
 *
 * All types are plain values. ErrorCluster in particular exposes no
 * mutating operations; clusters are built and updated by the free
 * functions in analysis/cluster_aggregate.hpp.
 */

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <memory>
#include <chrono>
#include <filesystem>

namespace eca {

    namespace fs = std::filesystem;

    // ============================================================================
    // Basic Types
    // ============================================================================

    /**
     * Timestamp for absolute time points.
     */
    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * Log severity level, ordered from least to most severe.
     */
    enum class LogLevel {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Fatal
    };

    inline const char* to_string(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Trace: return "TRACE";
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info:  return "INFO";
            case LogLevel::Warn:  return "WARN";
            case LogLevel::Error: return "ERROR";
            case LogLevel::Fatal: return "FATAL";
        }
        return "INFO";
    }

    /**
     * Parses a level name case-insensitively.
     *
     * Accepts the canonical names plus "WARNING" and "SEVERE". Empty or
     * unknown names map to Info.
     */
    LogLevel log_level_from_string(std::string_view name);

    /**
     * True for levels that take part in clustering (Error and Fatal).
     */
    inline bool is_error_level(const LogLevel level) noexcept {
        return level == LogLevel::Error || level == LogLevel::Fatal;
    }

    /**
     * A resolved code location (class, method, file, line).
     *
     * Any field may be missing; an empty string means "not known".
     */
    struct CodeLocation {
        std::string class_name;
        std::string method_name;
        std::optional<std::string> file_name;
        std::optional<int> line;

        [[nodiscard]] bool has_location() const noexcept {
            return !class_name.empty() || file_name.has_value();
        }

        /**
         * Renders "class.method:line" using only the parts that are present.
         */
        [[nodiscard]] std::string to_string() const;

        bool operator==(const CodeLocation& other) const = default;
    };

    // ============================================================================
    // Trace Data
    // ============================================================================

    /**
     * One stack trace entry.
     *
     * For clustering purposes two frames are the same when class, method
     * and line agree; file name and the native flag are informational.
     */
    struct StackFrame {
        std::string class_name;
        std::string method_name;
        std::optional<std::string> file_name;
        int line = -1;
        bool native_method = false;

        /**
         * Class name without its package ("OrderService").
         */
        [[nodiscard]] std::string simple_class_name() const;

        /**
         * Package part of the class name, empty for the default package.
         */
        [[nodiscard]] std::string package_name() const;

        [[nodiscard]] bool has_source_info() const noexcept {
            return file_name.has_value() && line > 0;
        }

        /**
         * Grouping key of this frame: "class.method:line".
         */
        [[nodiscard]] std::string fingerprint() const;

        /**
         * Java-style rendering, e.g. "com.example.Foo.bar(Foo.java:12)".
         */
        [[nodiscard]] std::string to_string() const;

        bool operator==(const StackFrame& other) const noexcept {
            return line == other.line &&
                   class_name == other.class_name &&
                   method_name == other.method_name;
        }
    };

    /**
     * A structured exception with its frames and an owned cause chain.
     *
     * The chain is singly linked through caused_by and always finite; the
     * parser enforces a maximum depth when building it. A trace with no
     * frames is valid but cannot be fingerprinted through its frames.
     */
    struct ParsedTrace {
        std::string exception_type;
        std::optional<std::string> message;
        std::vector<StackFrame> frames;
        std::unique_ptr<ParsedTrace> caused_by;

        /**
         * The top of the stack, or nullptr for a frame-less trace.
         */
        [[nodiscard]] const StackFrame* top_frame() const noexcept {
            return frames.empty() ? nullptr : &frames.front();
        }

        /**
         * The innermost cause (this trace when there is no cause).
         */
        [[nodiscard]] const ParsedTrace& root_cause() const noexcept;

        /**
         * Number of causes below this trace.
         */
        [[nodiscard]] std::size_t cause_depth() const noexcept;

        /**
         * Re-renders the trace in the text form the parser accepts.
         */
        [[nodiscard]] std::string to_string() const;
    };

    /**
     * A throwable captured in structured form by the ingestion layer.
     *
     * This is the input of the structured parse entry point: no text is
     * involved, the frames are taken as they are.
     */
    struct ThrowableInfo {
        std::string type_name;
        std::optional<std::string> message;
        std::vector<StackFrame> frames;
        std::shared_ptr<const ThrowableInfo> cause;
    };

    // ============================================================================
    // Record Data
    // ============================================================================

    /**
     * One log event as delivered by the ingestion layer.
     *
     * A record may carry a stack trace as raw text, as a structured
     * throwable, or both; the text form takes precedence.
     */
    struct LogRecord {
        Timestamp timestamp{};
        LogLevel level = LogLevel::Info;
        std::string logger;
        std::string message;

        std::optional<std::string> stack_trace;
        std::shared_ptr<const ThrowableInfo> throwable;

        std::optional<std::string> class_name;
        std::optional<std::string> method_name;
        std::optional<std::string> file_name;
        std::optional<int> line;

        std::optional<std::string> correlation_id;
        std::optional<std::string> thread_name;

        [[nodiscard]] bool is_error() const noexcept {
            return is_error_level(level);
        }

        [[nodiscard]] bool has_stack_trace() const noexcept {
            return stack_trace.has_value() && !stack_trace->empty();
        }

        /**
         * True when any of the resolved class/method/line fields is set.
         */
        [[nodiscard]] bool has_explicit_location() const noexcept {
            return class_name.has_value() || method_name.has_value() || line.has_value();
        }

        /**
         * The resolved location, if the record carries a class or file name.
         */
        [[nodiscard]] std::optional<CodeLocation> location() const;
    };

    // ============================================================================
    // Cluster Data
    // ============================================================================

    /**
     * Coarse severity bucket derived purely from occurrence count.
     */
    enum class ClusterSeverity {
        Low,
        Medium,
        High,
        Critical
    };

    inline const char* to_string(ClusterSeverity severity) noexcept {
        switch (severity) {
            case ClusterSeverity::Low:      return "LOW";
            case ClusterSeverity::Medium:   return "MEDIUM";
            case ClusterSeverity::High:     return "HIGH";
            case ClusterSeverity::Critical: return "CRITICAL";
        }
        return "LOW";
    }

    /**
     * Aggregate of the records that share one fingerprint.
     *
     * The fingerprint is the identity. The id is a short display handle
     * derived from a 32-bit hash of the fingerprint; two clusters can share
     * an id, so it must never be used as a key.
     */
    struct ErrorCluster {
        std::string id;
        std::string fingerprint;

        std::optional<std::string> exception_type;
        std::optional<std::string> message_template;
        std::optional<CodeLocation> primary_location;

        std::vector<LogRecord> records;
        std::optional<Timestamp> first_seen;
        std::optional<Timestamp> last_seen;
        std::size_t occurrence_count = 0;
        ClusterSeverity severity = ClusterSeverity::Low;

        /**
         * "class.method:line" of the primary location, empty if unknown.
         */
        [[nodiscard]] std::string full_location() const;

        /**
         * The member with the latest timestamp, or nullptr for an empty cluster.
         */
        [[nodiscard]] const LogRecord* most_recent_record() const noexcept;

        /**
         * A representative sample: first, evenly spaced middle members, last.
         */
        [[nodiscard]] std::vector<LogRecord> sample_records(std::size_t max_samples) const;
    };

    // ============================================================================
    // Source Data
    // ============================================================================

    /**
     * A bounded excerpt of a source file around a target line.
     *
     * Line numbers are 1-based and inclusive. surrounding_lines holds the
     * lines start_line..end_line.
     */
    struct CodeContext {
        fs::path file_path;
        int target_line = 0;

        std::optional<std::string> class_name;
        std::optional<std::string> method_name;
        std::optional<std::string> method_body;

        std::vector<std::string> surrounding_lines;
        int start_line = 0;
        int end_line = 0;

        std::vector<std::string> imports;
        std::vector<std::string> class_fields;

        /**
         * Line-numbered excerpt with the target line marked by " >>> ".
         */
        [[nodiscard]] std::string formatted() const;

        /**
         * The excerpt joined with newlines, without numbering.
         */
        [[nodiscard]] std::string plain() const;
    };

}  // namespace eca

#endif //ERRORCLUSTERANALYZER_TYPES_HPP
