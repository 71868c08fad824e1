//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/analysis/fingerprint_engine.hpp"
#include "eca/analysis/message_normalizer.hpp"

namespace eca::analysis {

    namespace {

        std::optional<std::string> location_fingerprint(const LogRecord& record) {
            if (!record.has_explicit_location()) {
                return std::nullopt;
            }

            std::string result;
            if (record.class_name) {
                result += *record.class_name;
            }
            if (record.method_name) {
                result += "." + *record.method_name;
            }
            if (record.line) {
                result += ":" + std::to_string(*record.line);
            }

            if (result.empty()) {
                return std::nullopt;
            }
            return result;
        }

        CodeLocation location_of(const StackFrame& frame) {
            CodeLocation location;
            location.class_name = frame.class_name;
            location.method_name = frame.method_name;
            location.file_name = frame.file_name;
            if (frame.line > 0) {
                location.line = frame.line;
            }
            return location;
        }

    }  // namespace

    FingerprintEngine::FingerprintEngine(
        heuristics::FingerprintConfig config,
        heuristics::ParserConfig parser_config
    )
        : config_(std::move(config))
        , classifier_(config_.framework_prefixes)
        , parser_(parser_config) {}

    std::string FingerprintEngine::fingerprint(const LogRecord& record) const {
        return analyze(record).fingerprint;
    }

    std::optional<ParsedTrace> FingerprintEngine::parse_trace(const LogRecord& record) const {
        if (record.has_stack_trace()) {
            if (auto trace = parser_.parse(*record.stack_trace)) {
                return trace;
            }
        }
        if (record.throwable) {
            return parser_.parse(*record.throwable);
        }
        return std::nullopt;
    }

    std::optional<std::string> FingerprintEngine::trace_fingerprint(const ParsedTrace& trace) const {
        const auto frames = classifier_.top_user_frames(trace, config_.frame_count);
        if (frames.empty()) {
            return std::nullopt;
        }

        std::string result = trace.exception_type.empty()
            ? std::string(UNKNOWN_EXCEPTION_TYPE)
            : trace.exception_type;

        for (const auto& frame : frames) {
            result += "|" + frame.fingerprint();
        }
        return result;
    }

    RecordAnalysis FingerprintEngine::analyze(const LogRecord& record) const {
        RecordAnalysis analysis;

        if (auto normalized = normalize_message(record.message); !normalized.empty()) {
            analysis.message_template = std::move(normalized);
        }

        const auto trace = parse_trace(record);
        if (trace && !trace->exception_type.empty()) {
            analysis.exception_type = trace->exception_type;
        }

        analysis.location = record.location();
        if (!analysis.location && trace) {
            if (const auto* frame = classifier_.first_user_frame(*trace)) {
                analysis.location = location_of(*frame);
            }
        }

        if (trace) {
            if (auto key = trace_fingerprint(*trace)) {
                analysis.fingerprint = std::move(*key);
                analysis.tier = FingerprintTier::StackTrace;
                return analysis;
            }
        }

        if (auto key = location_fingerprint(record)) {
            analysis.fingerprint = std::move(*key);
            analysis.tier = FingerprintTier::Location;
            return analysis;
        }

        analysis.fingerprint = analysis.message_template.value_or(std::string(EMPTY_MESSAGE_FINGERPRINT));
        analysis.tier = FingerprintTier::Message;
        return analysis;
    }

}  // namespace eca::analysis
