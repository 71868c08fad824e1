//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/parsers/trace_parser.hpp"
#include "eca/logger.hpp"
#include "eca/utils/string_utils.hpp"

#include <charconv>
#include <regex>
#include <vector>

namespace eca::parsers {

    namespace {

        constexpr std::string_view CAUSED_BY_PREFIX = "Caused by:";
        constexpr std::string_view NATIVE_METHOD = "Native Method";
        constexpr std::string_view UNKNOWN_SOURCE = "Unknown Source";

        // Optional module/class loader prefix ("java.base@17/", "app//") before the class.
        const std::regex frame_regex(R"(^at\s+(?:[\w.$@-]*/+)?([\w.$]+)\.([\w$<>]+)\(([^)]+)\)$)");
        const std::regex elision_regex(R"(^\.\.\.\s*\d+\s+more$)");

        struct Header {
            std::string type;
            std::optional<std::string> message;
        };

        /**
         * Splits "<type>: <message>" at the first colon. A line with no
         * colon (or one starting with a colon) is entirely the type.
         */
        Header parse_header(std::string_view line) {
            line = string_utils::trim(line);

            Header header;
            const auto colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0) {
                header.type = std::string(line);
                return header;
            }

            header.type = std::string(string_utils::trim(line.substr(0, colon)));
            if (const auto message = string_utils::trim(line.substr(colon + 1)); !message.empty()) {
                header.message = std::string(message);
            }
            return header;
        }

        void parse_location(const std::string_view location, StackFrame& frame) {
            if (location == NATIVE_METHOD) {
                frame.native_method = true;
                return;
            }
            if (location == UNKNOWN_SOURCE) {
                return;
            }

            const auto colon = location.rfind(':');
            if (colon != std::string_view::npos) {
                const auto digits = location.substr(colon + 1);
                int line = 0;
                const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), line);
                if (!digits.empty() && ec == std::errc{} && ptr == digits.data() + digits.size()) {
                    frame.file_name = std::string(location.substr(0, colon));
                    frame.line = line;
                    return;
                }
            }

            frame.file_name = std::string(location);
        }

        bool is_elision(const std::string_view trimmed) {
            const std::string line(trimmed);
            return std::regex_match(line, elision_regex);
        }

        std::optional<std::string_view> caused_by_header(const std::string_view trimmed) {
            if (!string_utils::starts_with(trimmed, CAUSED_BY_PREFIX)) {
                return std::nullopt;
            }
            const auto rest = string_utils::trim(trimmed.substr(CAUSED_BY_PREFIX.size()));
            if (rest.empty()) {
                return std::nullopt;
            }
            return rest;
        }

        std::optional<std::size_t> first_non_empty(const std::vector<std::string_view>& lines) {
            for (std::size_t i = 0; i < lines.size(); ++i) {
                if (!string_utils::trim(lines[i]).empty()) {
                    return i;
                }
            }
            return std::nullopt;
        }

    }  // namespace

    TraceParser::TraceParser(heuristics::ParserConfig config)
        : config_(std::move(config)) {}

    std::optional<ParsedTrace> TraceParser::parse(const std::string_view text) const {
        const auto lines = string_utils::split_lines(text);
        const auto start = first_non_empty(lines);
        if (!start) {
            return std::nullopt;
        }

        auto [type, message] = parse_header(lines[*start]);
        ParsedTrace root;
        root.exception_type = std::move(type);
        root.message = std::move(message);

        ParsedTrace* current = &root;
        std::size_t depth = 0;

        for (std::size_t i = *start + 1; i < lines.size(); ++i) {
            const auto trimmed = string_utils::trim(lines[i]);
            if (trimmed.empty() || is_elision(trimmed)) {
                continue;
            }

            if (auto frame = parse_frame_line(trimmed)) {
                current->frames.push_back(std::move(*frame));
                continue;
            }

            if (const auto cause = caused_by_header(trimmed)) {
                if (depth >= config_.max_cause_depth) {
                    ECA_LOG_WARNING("Cause chain of {} exceeds {} levels, dropping deeper causes",
                                    root.exception_type, config_.max_cause_depth);
                    break;
                }

                auto header = parse_header(*cause);
                current->caused_by = std::make_unique<ParsedTrace>();
                current = current->caused_by.get();
                current->exception_type = std::move(header.type);
                current->message = std::move(header.message);
                ++depth;
                continue;
            }

            ECA_LOG_TRACE("Stack trace of {} ends at unrecognized line {}", root.exception_type, i + 1);
            break;
        }

        return root;
    }

    ParsedTrace TraceParser::parse(const ThrowableInfo& throwable) const {
        ParsedTrace root;
        root.exception_type = throwable.type_name;
        root.message = throwable.message;
        root.frames = throwable.frames;

        ParsedTrace* current = &root;
        std::size_t depth = 0;

        for (const ThrowableInfo* cause = throwable.cause.get(); cause; cause = cause->cause.get()) {
            if (depth >= config_.max_cause_depth) {
                ECA_LOG_WARNING("Cause chain of {} exceeds {} levels, dropping deeper causes",
                                root.exception_type, config_.max_cause_depth);
                break;
            }

            current->caused_by = std::make_unique<ParsedTrace>();
            current = current->caused_by.get();
            current->exception_type = cause->type_name;
            current->message = cause->message;
            current->frames = cause->frames;
            ++depth;
        }

        return root;
    }

    std::optional<StackFrame> TraceParser::parse_frame_line(const std::string_view line) {
        const std::string trimmed(string_utils::trim(line));

        std::smatch match;
        if (!std::regex_match(trimmed, match, frame_regex)) {
            return std::nullopt;
        }

        StackFrame frame;
        frame.class_name = match[1].str();
        frame.method_name = match[2].str();
        const auto location = match[3].str();
        parse_location(string_utils::trim(location), frame);
        return frame;
    }

    std::optional<std::string> TraceParser::extract_exception_line(const std::string_view text) {
        const auto lines = string_utils::split_lines(text);
        const auto start = first_non_empty(lines);
        if (!start) {
            return std::nullopt;
        }
        return std::string(string_utils::trim(lines[*start]));
    }

    std::optional<std::string> TraceParser::extract_exception_type(const std::string_view text) {
        const auto line = extract_exception_line(text);
        if (!line) {
            return std::nullopt;
        }
        return parse_header(*line).type;
    }

    bool TraceParser::looks_like_stack_trace(const std::string_view text) {
        for (const auto line : string_utils::split_lines(text)) {
            if (parse_frame_line(line)) {
                return true;
            }
        }
        return false;
    }

}  // namespace eca::parsers
