//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_FINGERPRINT_ENGINE_HPP
#define ERRORCLUSTERANALYZER_FINGERPRINT_ENGINE_HPP

/**
 * @file fingerprint_engine.hpp
 * @brief Derives the grouping key of a log record.
 *
 * Three tiers are tried in order and the first that applies wins:
 *
 * 1. Stack trace: the record's trace (text form first, structured form
 *    otherwise) has at least one user frame. The key is the exception type
 *    followed by up to frame_count leading user frames:
 *    "java.lang.NullPointerException|com.example.OrderService.processOrder:23".
 * 2. Location: the record names a class, method or line. The key is
 *    "class.method:line" built from the parts that are present.
 * 3. Message: the normalized message, or "<EMPTY>" if nothing is left.
 *
 * The result is never empty and depends only on the record.
 */

#include "eca/types.hpp"
#include "eca/heuristics/config.hpp"
#include "eca/analysis/frame_classifier.hpp"
#include "eca/parsers/trace_parser.hpp"

#include <optional>
#include <string>

namespace eca::analysis {

    enum class FingerprintTier {
        StackTrace,
        Location,
        Message
    };

    inline const char* to_string(FingerprintTier tier) noexcept {
        switch (tier) {
            case FingerprintTier::StackTrace: return "stack_trace";
            case FingerprintTier::Location:   return "location";
            case FingerprintTier::Message:    return "message";
        }
        return "message";
    }

    /**
     * Everything the clustering engine needs to know about one record.
     */
    struct RecordAnalysis {
        std::string fingerprint;
        FingerprintTier tier = FingerprintTier::Message;

        /// Exception type of the record's trace, if it has one
        std::optional<std::string> exception_type;

        /// Normalized message; nullopt when the message normalizes to nothing
        std::optional<std::string> message_template;

        /// Explicit record location, else the topmost user frame of the trace
        std::optional<CodeLocation> location;
    };

    inline constexpr std::string_view EMPTY_MESSAGE_FINGERPRINT = "<EMPTY>";
    inline constexpr std::string_view UNKNOWN_EXCEPTION_TYPE = "Unknown";

    class FingerprintEngine {
    public:
        explicit FingerprintEngine(
            heuristics::FingerprintConfig config = {},
            heuristics::ParserConfig parser_config = {}
        );

        /**
         * The grouping key of record.
         */
        [[nodiscard]] std::string fingerprint(const LogRecord& record) const;

        /**
         * Fingerprint plus the cluster attributes derived along the way.
         * The trace is parsed once.
         */
        [[nodiscard]] RecordAnalysis analyze(const LogRecord& record) const;

        /**
         * The record's trace: the text form when present and non-blank,
         * otherwise the structured throwable.
         */
        [[nodiscard]] std::optional<ParsedTrace> parse_trace(const LogRecord& record) const;

        /**
         * Tier 1 key of a trace, or nullopt when it has no user frames.
         */
        [[nodiscard]] std::optional<std::string> trace_fingerprint(const ParsedTrace& trace) const;

        [[nodiscard]] const FrameClassifier& classifier() const noexcept {
            return classifier_;
        }

        [[nodiscard]] const parsers::TraceParser& parser() const noexcept {
            return parser_;
        }

        [[nodiscard]] const heuristics::FingerprintConfig& config() const noexcept {
            return config_;
        }

    private:
        heuristics::FingerprintConfig config_;
        FrameClassifier classifier_;
        parsers::TraceParser parser_;
    };

}  // namespace eca::analysis

#endif //ERRORCLUSTERANALYZER_FINGERPRINT_ENGINE_HPP
