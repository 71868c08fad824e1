//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_JSON_EXPORTER_HPP
#define ERRORCLUSTERANALYZER_JSON_EXPORTER_HPP

/**
 * @file json_exporter.hpp
 * @brief JSON interchange for records, traces, clusters and code context.
 *
 * Timestamps are written and read as integer milliseconds since the Unix
 * epoch. Optional fields are omitted when absent.
 *
 * Record input is JSON Lines, one object per line:
 * @code
 *     {"timestamp": 1760870400000, "level": "ERROR", "logger": "orders",
 *      "message": "Order 42 failed", "stack_trace": "java.lang.NullPointerException\n\tat ..."}
 * @endcode
 */

#include "eca/types.hpp"
#include "eca/result.hpp"
#include "eca/error.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

namespace eca::analysis {
    struct AnalysisReport;
}

namespace eca::json_export {

    using json = nlohmann::json;

    /// Sample records embedded per cluster unless the caller asks otherwise
    inline constexpr std::size_t DEFAULT_SAMPLE_COUNT = 5;

    json to_json(const StackFrame& frame);
    json to_json(const ParsedTrace& trace);
    json to_json(const ThrowableInfo& throwable);
    json to_json(const CodeLocation& location);
    json to_json(const LogRecord& record);
    json to_json(const ErrorCluster& cluster, std::size_t max_samples = DEFAULT_SAMPLE_COUNT);
    json to_json(const CodeContext& context);
    json to_json(const analysis::AnalysisReport& report, std::size_t max_samples = DEFAULT_SAMPLE_COUNT);

    Result<StackFrame, Error> frame_from_json(const json& value);

    /**
     * Reads a throwable and its nested "cause" objects.
     */
    Result<ThrowableInfo, Error> throwable_from_json(const json& value);

    /**
     * Reads one record. Only "message" and "level" are commonly present;
     * every field is optional. Unknown level names read as INFO.
     *
     * @return The record, or a ParseError for a non-object or a field of
     *         the wrong type.
     */
    Result<LogRecord, Error> record_from_json(const json& value);

    /**
     * Parses JSON Lines content. Blank lines are skipped; the first bad
     * line fails the whole batch with its 1-based line number as context.
     */
    Result<std::vector<LogRecord>, Error> parse_records_jsonl(std::string_view content);

    Result<std::vector<LogRecord>, Error> read_records_jsonl(const std::filesystem::path& path);

    /**
     * Writes clusters as an indented JSON array.
     */
    Result<void, Error> write_clusters(
        const std::filesystem::path& path,
        const std::vector<ErrorCluster>& clusters,
        std::size_t max_samples = DEFAULT_SAMPLE_COUNT
    );

    Result<void, Error> write_report(
        const std::filesystem::path& path,
        const analysis::AnalysisReport& report
    );

}  // namespace eca::json_export

#endif //ERRORCLUSTERANALYZER_JSON_EXPORTER_HPP
