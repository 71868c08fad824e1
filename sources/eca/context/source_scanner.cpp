//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/context/source_scanner.hpp"
#include "eca/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <regex>

namespace eca::context {

    namespace {

        const std::regex method_regex(
            R"(^\s*(?:(?:public|private|protected|static|final|abstract|synchronized|native|default)\s+)*)"
            R"((?:<[^>]+>\s*)?(\w+(?:<[^>]+>)?(?:\[\])?)\s+(\w+)\s*\()"
        );

        const std::regex class_regex(
            R"(^\s*(?:(?:public|private|protected|static|final|abstract|sealed|non-sealed)\s+)*)"
            R"((class|interface|enum|record)\s+(\w+))"
        );

        const std::regex import_regex(R"(^\s*import\s+(?:static\s+)?[\w.]+(?:\.\*)?;\s*$)");

        const std::regex field_regex(
            R"(^\s*(?:(?:public|private|protected|static|final|volatile|transient)\s+)*)"
            R"((\w+(?:<[^>]+>)?(?:\[\])?)\s+(\w+)\s*[;=])"
        );

        // Statements that look like "type name(" to the method pattern.
        constexpr std::array<std::string_view, 14> NON_DECLARATION_WORDS = {
            "return", "new", "throw", "else", "if", "for", "while", "switch",
            "catch", "synchronized", "class", "record", "interface", "enum"
        };

        bool is_non_declaration_word(const std::string& word) {
            return std::ranges::find(NON_DECLARATION_WORDS, word) != NON_DECLARATION_WORDS.end();
        }

        std::optional<std::string> match_method_name(const std::string& line) {
            std::smatch match;
            if (!std::regex_search(line, match, method_regex)) {
                return std::nullopt;
            }
            if (is_non_declaration_word(match[1].str()) || is_non_declaration_word(match[2].str())) {
                return std::nullopt;
            }
            return match[2].str();
        }

        std::optional<std::string> match_class_name(const std::string& line) {
            std::smatch match;
            if (!std::regex_search(line, match, class_regex)) {
                return std::nullopt;
            }
            return match[2].str();
        }

        /**
         * Closing minus opening braces on a line.
         */
        int brace_balance(const std::string_view line) {
            return static_cast<int>(string_utils::count_char(line, '}')) -
                   static_cast<int>(string_utils::count_char(line, '{'));
        }

        int find_method_end(const std::vector<std::string>& lines, const int start_line) {
            int depth = 0;
            bool opened = false;

            for (int i = start_line; i <= static_cast<int>(lines.size()); ++i) {
                for (const char c : lines[static_cast<std::size_t>(i - 1)]) {
                    if (c == '{') {
                        ++depth;
                        opened = true;
                    } else if (c == '}') {
                        --depth;
                    }
                }
                if (opened && depth == 0) {
                    return i;
                }
            }

            return static_cast<int>(lines.size());
        }

    }  // namespace

    std::optional<std::string> find_enclosing_class(
        const std::vector<std::string>& lines,
        const int target_line
    ) {
        std::optional<std::string> current;
        const auto limit = std::min(static_cast<std::size_t>(std::max(target_line, 0)), lines.size());

        for (std::size_t i = 0; i < limit; ++i) {
            if (auto name = match_class_name(lines[i])) {
                current = std::move(name);
            }
        }
        return current;
    }

    std::optional<MethodBounds> find_enclosing_method(
        const std::vector<std::string>& lines,
        const int target_line
    ) {
        if (target_line < 1 || target_line > static_cast<int>(lines.size())) {
            return std::nullopt;
        }

        int balance = 0;
        for (int i = target_line; i >= 1; --i) {
            const auto& line = lines[static_cast<std::size_t>(i - 1)];
            balance += brace_balance(line);

            auto name = match_method_name(line);
            if (!name) {
                continue;
            }
            if (i == target_line || balance < 0) {
                MethodBounds bounds;
                bounds.name = std::move(*name);
                bounds.start_line = i;
                bounds.end_line = find_method_end(lines, i);
                return bounds;
            }
        }

        return std::nullopt;
    }

    std::string extract_method_body(
        const std::vector<std::string>& lines,
        const MethodBounds& bounds
    ) {
        std::string body;
        const int last = std::min(bounds.end_line, static_cast<int>(lines.size()));

        for (int i = std::max(bounds.start_line, 1); i <= last; ++i) {
            body += lines[static_cast<std::size_t>(i - 1)];
            body += '\n';
        }
        return body;
    }

    std::vector<std::string> extract_imports(const std::vector<std::string>& lines) {
        std::vector<std::string> imports;

        for (const auto& line : lines) {
            if (std::regex_match(line, import_regex)) {
                imports.emplace_back(string_utils::trim(line));
            }
            if (match_class_name(line)) {
                break;
            }
        }
        return imports;
    }

    std::vector<std::string> extract_class_fields(
        const std::vector<std::string>& lines,
        const std::string_view class_name
    ) {
        std::vector<std::string> fields;
        if (class_name.empty()) {
            return fields;
        }

        bool in_class = false;
        bool opened = false;
        int depth = 0;

        for (const auto& line : lines) {
            if (!in_class) {
                const auto name = match_class_name(line);
                if (!name || *name != class_name) {
                    continue;
                }
                in_class = true;
            }

            for (const char c : line) {
                if (c == '{') {
                    ++depth;
                    opened = true;
                } else if (c == '}') {
                    --depth;
                }
            }

            if (depth == 1 && std::regex_search(line, field_regex)) {
                fields.emplace_back(string_utils::trim(line));
            }

            if (opened && depth <= 0) {
                break;
            }
        }

        return fields;
    }

    std::optional<CodeContext> extract_context(
        const std::filesystem::path& file_path,
        const std::vector<std::string>& lines,
        const int target_line,
        const std::size_t context_lines
    ) {
        const int line_count = static_cast<int>(lines.size());
        if (target_line < 1 || target_line > line_count) {
            return std::nullopt;
        }

        CodeContext context;
        context.file_path = file_path;
        context.target_line = target_line;
        context.imports = extract_imports(lines);
        context.class_name = find_enclosing_class(lines, target_line);

        if (const auto bounds = find_enclosing_method(lines, target_line)) {
            context.method_name = bounds->name;
            context.method_body = extract_method_body(lines, *bounds);
        }

        const int radius = static_cast<int>(std::min<std::size_t>(context_lines, static_cast<std::size_t>(line_count)));
        context.start_line = std::max(1, target_line - radius);
        context.end_line = std::min(line_count, target_line + radius);
        context.surrounding_lines.assign(
            lines.begin() + (context.start_line - 1),
            lines.begin() + context.end_line
        );

        if (context.class_name) {
            context.class_fields = extract_class_fields(lines, *context.class_name);
        }

        return context;
    }

}  // namespace eca::context
