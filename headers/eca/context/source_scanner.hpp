//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_SOURCE_SCANNER_HPP
#define ERRORCLUSTERANALYZER_SOURCE_SCANNER_HPP

/**
 * @file source_scanner.hpp
 * @brief Line-based structure recovery for Java source text.
 *
 * These functions do not parse Java. They match declarations line by line
 * and track scope by counting raw '{' and '}' characters, so braces inside
 * string literals or comments are counted too. Line numbers are 1-based.
 */

#include "eca/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eca::context {

    /**
     * Declaration line and last line of a method, both inclusive.
     */
    struct MethodBounds {
        std::string name;
        int start_line = 0;
        int end_line = 0;
    };

    /**
     * Name of the last class, interface, enum or record declared at or
     * above target_line.
     */
    std::optional<std::string> find_enclosing_class(
        const std::vector<std::string>& lines,
        int target_line
    );

    /**
     * Finds the method whose body contains target_line.
     *
     * Scans upwards keeping a brace balance. A declaration is accepted when
     * it is the target line itself or when an opening brace between it and
     * the target is still unclosed; declarations of methods that already
     * ended above the target are skipped.
     */
    std::optional<MethodBounds> find_enclosing_method(
        const std::vector<std::string>& lines,
        int target_line
    );

    /**
     * Text of start_line..end_line, each line followed by a newline.
     */
    std::string extract_method_body(
        const std::vector<std::string>& lines,
        const MethodBounds& bounds
    );

    /**
     * Trimmed import statements appearing before the first type declaration.
     */
    std::vector<std::string> extract_imports(const std::vector<std::string>& lines);

    /**
     * Trimmed field declarations directly inside the named class body.
     */
    std::vector<std::string> extract_class_fields(
        const std::vector<std::string>& lines,
        std::string_view class_name
    );

    /**
     * Builds the context for target_line with context_lines of surrounding
     * code on each side, clamped to the file.
     *
     * @return nullopt if target_line is outside 1..lines.size().
     */
    std::optional<CodeContext> extract_context(
        const std::filesystem::path& file_path,
        const std::vector<std::string>& lines,
        int target_line,
        std::size_t context_lines
    );

}  // namespace eca::context

#endif //ERRORCLUSTERANALYZER_SOURCE_SCANNER_HPP
