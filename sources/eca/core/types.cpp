//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/types.hpp"
#include "eca/utils/string_utils.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace eca {

    LogLevel log_level_from_string(const std::string_view name) {
        const auto upper = string_utils::to_upper(string_utils::trim(name));

        if (upper == "TRACE") return LogLevel::Trace;
        if (upper == "DEBUG") return LogLevel::Debug;
        if (upper == "INFO") return LogLevel::Info;
        if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
        if (upper == "ERROR" || upper == "SEVERE") return LogLevel::Error;
        if (upper == "FATAL") return LogLevel::Fatal;
        return LogLevel::Info;
    }

    std::string CodeLocation::to_string() const {
        std::string result = class_name;
        if (!method_name.empty()) {
            result += "." + method_name;
        }
        if (line.has_value()) {
            result += ":" + std::to_string(*line);
        }
        return result;
    }

    // ============================================================================
    // StackFrame
    // ============================================================================

    std::string StackFrame::simple_class_name() const {
        const auto dot = class_name.rfind('.');
        return dot == std::string::npos ? class_name : class_name.substr(dot + 1);
    }

    std::string StackFrame::package_name() const {
        const auto dot = class_name.rfind('.');
        return dot == std::string::npos ? std::string{} : class_name.substr(0, dot);
    }

    std::string StackFrame::fingerprint() const {
        return class_name + "." + method_name + ":" + std::to_string(line);
    }

    std::string StackFrame::to_string() const {
        std::string result = class_name + "." + method_name + "(";
        if (native_method) {
            result += "Native Method";
        } else if (!file_name.has_value()) {
            result += "Unknown Source";
        } else if (line > 0) {
            result += *file_name + ":" + std::to_string(line);
        } else {
            result += *file_name;
        }
        return result + ")";
    }

    // ============================================================================
    // ParsedTrace
    // ============================================================================

    const ParsedTrace& ParsedTrace::root_cause() const noexcept {
        const ParsedTrace* current = this;
        while (current->caused_by) {
            current = current->caused_by.get();
        }
        return *current;
    }

    std::size_t ParsedTrace::cause_depth() const noexcept {
        std::size_t depth = 0;
        for (const ParsedTrace* current = caused_by.get(); current; current = current->caused_by.get()) {
            ++depth;
        }
        return depth;
    }

    std::string ParsedTrace::to_string() const {
        std::string result;

        for (const ParsedTrace* current = this; current; current = current->caused_by.get()) {
            if (current != this) {
                result += "Caused by: ";
            }
            result += current->exception_type;
            if (current->message.has_value()) {
                result += ": " + *current->message;
            }
            result += "\n";

            for (const auto& frame : current->frames) {
                result += "\tat " + frame.to_string() + "\n";
            }
        }

        return result;
    }

    // ============================================================================
    // LogRecord
    // ============================================================================

    std::optional<CodeLocation> LogRecord::location() const {
        if (!class_name.has_value() && !file_name.has_value()) {
            return std::nullopt;
        }

        CodeLocation loc;
        loc.class_name = class_name.value_or("");
        loc.method_name = method_name.value_or("");
        loc.file_name = file_name;
        loc.line = line;
        return loc;
    }

    // ============================================================================
    // ErrorCluster
    // ============================================================================

    std::string ErrorCluster::full_location() const {
        if (!primary_location.has_value()) {
            return "";
        }
        return primary_location->to_string();
    }

    const LogRecord* ErrorCluster::most_recent_record() const noexcept {
        const LogRecord* latest = nullptr;
        for (const auto& record : records) {
            if (latest == nullptr || record.timestamp >= latest->timestamp) {
                latest = &record;
            }
        }
        return latest;
    }

    std::vector<LogRecord> ErrorCluster::sample_records(const std::size_t max_samples) const {
        if (max_samples == 0 || records.empty()) {
            return {};
        }
        if (records.size() <= max_samples) {
            return records;
        }
        if (max_samples == 1) {
            return {records.front()};
        }

        std::vector<LogRecord> samples;
        samples.reserve(max_samples);
        samples.push_back(records.front());

        const std::size_t step = records.size() / (max_samples - 1);
        for (std::size_t i = 1; i + 1 < max_samples; ++i) {
            samples.push_back(records[i * step]);
        }

        samples.push_back(records.back());
        return samples;
    }

    // ============================================================================
    // CodeContext
    // ============================================================================

    std::string CodeContext::formatted() const {
        std::string result;
        int number = start_line;

        for (const auto& line : surrounding_lines) {
            result += fmt::format("{}{:>4} | {}\n",
                                  number == target_line ? " >>> " : "     ",
                                  number,
                                  line);
            ++number;
        }

        return result;
    }

    std::string CodeContext::plain() const {
        return string_utils::join(surrounding_lines, "\n");
    }

}  // namespace eca
