//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_TRACE_PARSER_HPP
#define ERRORCLUSTERANALYZER_TRACE_PARSER_HPP

/**
 * @file trace_parser.hpp
 * @brief Java-style stack trace parser.
 *
 * Turns the textual form of an exception into a ParsedTrace:
 *
 * @code
 *     com.example.OrderException: Order 42 not found
 *         at com.example.OrderService.processOrder(OrderService.java:23)
 *         at java.base/java.lang.Thread.run(Thread.java:833)
 *     Caused by: java.sql.SQLException: timeout
 *         at com.zaxxer.hikari.pool.HikariPool.getConnection(HikariPool.java:181)
 *         ... 12 more
 * @endcode
 *
 * Parsing never fails on malformed input. A header that is not a proper
 * exception line still yields a trace, and the first line that is neither
 * a frame, an elision nor a "Caused by:" line ends the parse, keeping what
 * was read so far.
 */

#include "eca/types.hpp"
#include "eca/heuristics/config.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace eca::parsers {

    /**
     * Stateless after construction; safe to share across threads.
     */
    class TraceParser {
    public:
        explicit TraceParser(heuristics::ParserConfig config = {});

        /**
         * Parses stack trace text.
         *
         * @return nullopt for empty or whitespace-only text, a trace otherwise.
         */
        [[nodiscard]] std::optional<ParsedTrace> parse(std::string_view text) const;

        /**
         * Converts a structured throwable. Frames are copied as they are;
         * the cause chain is cut at the configured maximum depth.
         */
        [[nodiscard]] ParsedTrace parse(const ThrowableInfo& throwable) const;

        /**
         * Parses a single "at class.method(location)" line.
         *
         * Leading whitespace is ignored and a JDK module prefix
         * ("java.base/") is stripped from the class name.
         */
        [[nodiscard]] static std::optional<StackFrame> parse_frame_line(std::string_view line);

        /**
         * The first non-empty line of text, trimmed.
         */
        [[nodiscard]] static std::optional<std::string> extract_exception_line(std::string_view text);

        /**
         * The exception type named by the first non-empty line of text.
         */
        [[nodiscard]] static std::optional<std::string> extract_exception_type(std::string_view text);

        /**
         * True when text contains at least one frame line.
         */
        [[nodiscard]] static bool looks_like_stack_trace(std::string_view text);

        [[nodiscard]] const heuristics::ParserConfig& config() const noexcept {
            return config_;
        }

    private:
        heuristics::ParserConfig config_;
    };

}  // namespace eca::parsers

#endif //ERRORCLUSTERANALYZER_TRACE_PARSER_HPP
