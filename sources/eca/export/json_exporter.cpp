//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/export/json_exporter.hpp"
#include "eca/analysis/analysis_engine.hpp"
#include "eca/utils/file_utils.hpp"
#include "eca/utils/json_utils.hpp"
#include "eca/utils/string_utils.hpp"
#include "eca/version.hpp"

#include <chrono>
#include <cstdint>
#include <iterator>
#include <memory>

namespace eca::json_export {

    namespace {

        std::int64_t to_epoch_ms(const Timestamp ts) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
        }

        Timestamp from_epoch_ms(const std::int64_t ms) {
            return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(ms))};
        }

        template<typename T>
        void put_optional(json& target, const char* key, const std::optional<T>& value) {
            if (value) {
                target[key] = *value;
            }
        }

        /**
         * Copies an optional field into target, failing on a type mismatch.
         */
        template<typename T>
        Result<void, Error> read_optional(const json& value, const std::string& key, std::optional<T>& target) {
            auto field = json_utils::get_optional<T>(value, key);
            if (field.is_err()) {
                return Result<void, Error>::failure(field.error());
            }
            target = std::move(field.value());
            return Result<void, Error>::success();
        }

        Result<std::vector<StackFrame>, Error> frames_from_json(const json& value) {
            std::vector<StackFrame> frames;
            const auto it = value.find("frames");
            if (it == value.end() || it->is_null()) {
                return Result<std::vector<StackFrame>, Error>::success(std::move(frames));
            }
            if (!it->is_array()) {
                return Result<std::vector<StackFrame>, Error>::failure(
                    Error::parse_error("Expected an array", "frames")
                );
            }

            for (const auto& item : *it) {
                auto frame = frame_from_json(item);
                if (frame.is_err()) {
                    return Result<std::vector<StackFrame>, Error>::failure(frame.error());
                }
                frames.push_back(std::move(frame.value()));
            }
            return Result<std::vector<StackFrame>, Error>::success(std::move(frames));
        }

        Result<ThrowableInfo, Error> single_throwable_from_json(const json& value) {
            if (!value.is_object()) {
                return Result<ThrowableInfo, Error>::failure(
                    Error::parse_error("Expected a JSON object", "throwable")
                );
            }

            ThrowableInfo throwable;
            throwable.type_name = json_utils::get_or<std::string>(value, "type", "");

            if (auto result = read_optional(value, "message", throwable.message); result.is_err()) {
                return Result<ThrowableInfo, Error>::failure(result.error());
            }

            auto frames = frames_from_json(value);
            if (frames.is_err()) {
                return Result<ThrowableInfo, Error>::failure(frames.error());
            }
            throwable.frames = std::move(frames.value());
            return Result<ThrowableInfo, Error>::success(std::move(throwable));
        }

    }  // namespace

    // ============================================================================
    // Serialization
    // ============================================================================

    json to_json(const StackFrame& frame) {
        json j;
        j["class_name"] = frame.class_name;
        j["method_name"] = frame.method_name;
        put_optional(j, "file_name", frame.file_name);
        j["line"] = frame.line;
        j["native_method"] = frame.native_method;
        return j;
    }

    json to_json(const ParsedTrace& trace) {
        json j;
        j["exception_type"] = trace.exception_type;
        put_optional(j, "message", trace.message);

        json frames = json::array();
        for (const auto& frame : trace.frames) {
            frames.push_back(to_json(frame));
        }
        j["frames"] = std::move(frames);

        if (trace.caused_by) {
            j["caused_by"] = to_json(*trace.caused_by);
        }
        return j;
    }

    json to_json(const ThrowableInfo& throwable) {
        json j;
        j["type"] = throwable.type_name;
        put_optional(j, "message", throwable.message);

        json frames = json::array();
        for (const auto& frame : throwable.frames) {
            frames.push_back(to_json(frame));
        }
        j["frames"] = std::move(frames);

        if (throwable.cause) {
            j["cause"] = to_json(*throwable.cause);
        }
        return j;
    }

    json to_json(const CodeLocation& location) {
        json j;
        j["class_name"] = location.class_name;
        j["method_name"] = location.method_name;
        put_optional(j, "file_name", location.file_name);
        put_optional(j, "line", location.line);
        return j;
    }

    json to_json(const LogRecord& record) {
        json j;
        j["timestamp"] = to_epoch_ms(record.timestamp);
        j["level"] = to_string(record.level);
        j["logger"] = record.logger;
        j["message"] = record.message;
        put_optional(j, "stack_trace", record.stack_trace);
        if (record.throwable) {
            j["throwable"] = to_json(*record.throwable);
        }
        put_optional(j, "class_name", record.class_name);
        put_optional(j, "method_name", record.method_name);
        put_optional(j, "file_name", record.file_name);
        put_optional(j, "line", record.line);
        put_optional(j, "correlation_id", record.correlation_id);
        put_optional(j, "thread_name", record.thread_name);
        return j;
    }

    json to_json(const ErrorCluster& cluster, const std::size_t max_samples) {
        json j;
        j["id"] = cluster.id;
        j["fingerprint"] = cluster.fingerprint;
        put_optional(j, "exception_type", cluster.exception_type);
        put_optional(j, "message_template", cluster.message_template);
        if (cluster.primary_location) {
            j["primary_location"] = to_json(*cluster.primary_location);
            j["full_location"] = cluster.full_location();
        }
        j["occurrence_count"] = cluster.occurrence_count;
        j["severity"] = to_string(cluster.severity);
        if (cluster.first_seen) {
            j["first_seen"] = to_epoch_ms(*cluster.first_seen);
        }
        if (cluster.last_seen) {
            j["last_seen"] = to_epoch_ms(*cluster.last_seen);
        }

        json samples = json::array();
        for (const auto& record : cluster.sample_records(max_samples)) {
            samples.push_back(to_json(record));
        }
        j["sample_records"] = std::move(samples);
        return j;
    }

    json to_json(const CodeContext& context) {
        json j;
        j["file_path"] = context.file_path.generic_string();
        j["target_line"] = context.target_line;
        put_optional(j, "class_name", context.class_name);
        put_optional(j, "method_name", context.method_name);
        put_optional(j, "method_body", context.method_body);
        j["start_line"] = context.start_line;
        j["end_line"] = context.end_line;
        j["surrounding_lines"] = context.surrounding_lines;
        j["imports"] = context.imports;
        j["class_fields"] = context.class_fields;
        return j;
    }

    json to_json(const analysis::AnalysisReport& report, const std::size_t max_samples) {
        json j;

        j["generator"] = {{"name", PROJECT_SHORT_NAME}, {"version", VERSION_STRING}};

        json summary;
        summary["total_records"] = report.total_records;
        summary["error_records"] = report.error_records;
        summary["cluster_count"] = report.clusters.size();
        summary["analysis_duration_ms"] = report.duration.count();
        j["summary"] = std::move(summary);

        json clusters = json::array();
        for (const auto& cluster : report.clusters) {
            auto entry = to_json(cluster, max_samples);
            if (const auto* context = report.context_for(cluster)) {
                entry["code_context"] = to_json(*context);
            }
            clusters.push_back(std::move(entry));
        }
        j["clusters"] = std::move(clusters);
        return j;
    }

    // ============================================================================
    // Deserialization
    // ============================================================================

    Result<StackFrame, Error> frame_from_json(const json& value) {
        if (!value.is_object()) {
            return Result<StackFrame, Error>::failure(
                Error::parse_error("Expected a JSON object", "frame")
            );
        }

        StackFrame frame;
        frame.class_name = json_utils::get_or<std::string>(value, "class_name", "");
        frame.method_name = json_utils::get_or<std::string>(value, "method_name", "");
        frame.line = json_utils::get_or<int>(value, "line", -1);
        frame.native_method = json_utils::get_or<bool>(value, "native_method", false);

        if (auto result = read_optional(value, "file_name", frame.file_name); result.is_err()) {
            return Result<StackFrame, Error>::failure(result.error());
        }
        return Result<StackFrame, Error>::success(std::move(frame));
    }

    Result<ThrowableInfo, Error> throwable_from_json(const json& value) {
        // Read the chain outermost first, then link it from the innermost cause up.
        std::vector<ThrowableInfo> chain;
        for (const json* current = &value; current && !current->is_null();) {
            auto throwable = single_throwable_from_json(*current);
            if (throwable.is_err()) {
                return throwable;
            }
            chain.push_back(std::move(throwable.value()));

            const auto cause = current->find("cause");
            current = cause == current->end() ? nullptr : &*cause;
        }

        std::shared_ptr<const ThrowableInfo> cause;
        for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
            it->cause = cause;
            if (std::next(it) == chain.rend()) {
                break;
            }
            cause = std::make_shared<const ThrowableInfo>(std::move(*it));
        }

        return Result<ThrowableInfo, Error>::success(std::move(chain.front()));
    }

    Result<LogRecord, Error> record_from_json(const json& value) {
        if (!value.is_object()) {
            return Result<LogRecord, Error>::failure(
                Error::parse_error("Expected a JSON object", "record")
            );
        }

        LogRecord record;

        std::optional<std::int64_t> timestamp;
        if (auto result = read_optional(value, "timestamp", timestamp); result.is_err()) {
            return Result<LogRecord, Error>::failure(result.error());
        }
        if (timestamp) {
            record.timestamp = from_epoch_ms(*timestamp);
        }

        std::optional<std::string> level;
        std::optional<std::string> logger_name;
        std::optional<std::string> message;
        for (auto [key, target] : {std::pair{"level", &level},
                                   std::pair{"logger", &logger_name},
                                   std::pair{"message", &message}}) {
            if (auto result = read_optional(value, key, *target); result.is_err()) {
                return Result<LogRecord, Error>::failure(result.error());
            }
        }
        record.level = log_level_from_string(level.value_or(""));
        record.logger = logger_name.value_or("");
        record.message = message.value_or("");

        for (auto [key, target] : {std::pair{"stack_trace", &record.stack_trace},
                                   std::pair{"class_name", &record.class_name},
                                   std::pair{"method_name", &record.method_name},
                                   std::pair{"file_name", &record.file_name},
                                   std::pair{"correlation_id", &record.correlation_id},
                                   std::pair{"thread_name", &record.thread_name}}) {
            if (auto result = read_optional(value, key, *target); result.is_err()) {
                return Result<LogRecord, Error>::failure(result.error());
            }
        }

        if (auto result = read_optional(value, "line", record.line); result.is_err()) {
            return Result<LogRecord, Error>::failure(result.error());
        }

        if (const auto it = value.find("throwable"); it != value.end() && !it->is_null()) {
            auto throwable = throwable_from_json(*it);
            if (throwable.is_err()) {
                return Result<LogRecord, Error>::failure(throwable.error());
            }
            record.throwable = std::make_shared<const ThrowableInfo>(std::move(throwable.value()));
        }

        return Result<LogRecord, Error>::success(std::move(record));
    }

    Result<std::vector<LogRecord>, Error> parse_records_jsonl(const std::string_view content) {
        std::vector<LogRecord> records;
        std::size_t line_number = 0;

        for (const auto line : string_utils::split_lines(content)) {
            ++line_number;
            const auto trimmed = string_utils::trim(line);
            if (trimmed.empty()) {
                continue;
            }

            const auto context = "line " + std::to_string(line_number);

            auto parsed = json_utils::parse(trimmed);
            if (parsed.is_err()) {
                return Result<std::vector<LogRecord>, Error>::failure(parsed.error().with_context(context));
            }

            auto record = record_from_json(parsed.value());
            if (record.is_err()) {
                return Result<std::vector<LogRecord>, Error>::failure(record.error().with_context(context));
            }
            records.push_back(std::move(record.value()));
        }

        return Result<std::vector<LogRecord>, Error>::success(std::move(records));
    }

    Result<std::vector<LogRecord>, Error> read_records_jsonl(const std::filesystem::path& path) {
        return file_utils::read_file(path).and_then([&path](const std::string& content) {
            return parse_records_jsonl(content).map_error([&path](const Error& error) {
                return error.with_context(path.string());
            });
        });
    }

    Result<void, Error> write_clusters(
        const std::filesystem::path& path,
        const std::vector<ErrorCluster>& clusters,
        const std::size_t max_samples
    ) {
        json output = json::array();
        for (const auto& cluster : clusters) {
            output.push_back(to_json(cluster, max_samples));
        }
        return json_utils::write_file(path, output);
    }

    Result<void, Error> write_report(
        const std::filesystem::path& path,
        const analysis::AnalysisReport& report
    ) {
        return json_utils::write_file(path, to_json(report));
    }

}  // namespace eca::json_export
