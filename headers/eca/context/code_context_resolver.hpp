//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_CODE_CONTEXT_RESOLVER_HPP
#define ERRORCLUSTERANALYZER_CODE_CONTEXT_RESOLVER_HPP

/**
 * @file code_context_resolver.hpp
 * @brief Locates source files under configured roots and extracts context.
 *
 * All resolve_* functions distinguish three outcomes:
 * - a CodeContext when the file exists and the line is inside it;
 * - nullopt when the file cannot be found or the line is out of range;
 * - an IoError when a file or directory exists but cannot be read.
 *
 * Reads are synchronous and nothing is cached.
 */

#include "eca/types.hpp"
#include "eca/result.hpp"
#include "eca/error.hpp"
#include "eca/heuristics/config.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace eca::context {

    using ContextResult = Result<std::optional<CodeContext>, Error>;

    class CodeContextResolver {
    public:
        explicit CodeContextResolver(heuristics::ContextConfig config);

        /**
         * Resolves a fully qualified class name ("com.example.Foo$Inner")
         * to Foo.java under the first source root that has it.
         */
        [[nodiscard]] ContextResult resolve_by_class(std::string_view class_name, int line) const;

        /**
         * Searches every source root, in order, for a file with this name.
         */
        [[nodiscard]] ContextResult resolve_by_file_name(std::string_view file_name, int line) const;

        [[nodiscard]] ContextResult resolve_in_file(const std::filesystem::path& path, int line) const;

        /**
         * Tries the class name first and falls back to the file name.
         * A location without a positive line resolves to nullopt.
         */
        [[nodiscard]] ContextResult resolve(const CodeLocation& location) const;

        /**
         * Path of the class' source file, nullopt if no root has it, or an
         * IoError if a candidate path cannot be examined.
         */
        [[nodiscard]] Result<std::optional<std::filesystem::path>, Error> find_source_file(
            std::string_view class_name
        ) const;

        [[nodiscard]] Result<std::optional<std::filesystem::path>, Error> find_source_file_by_name(
            std::string_view file_name
        ) const;

        [[nodiscard]] const heuristics::ContextConfig& config() const noexcept {
            return config_;
        }

    private:
        heuristics::ContextConfig config_;
    };

}  // namespace eca::context

#endif //ERRORCLUSTERANALYZER_CODE_CONTEXT_RESOLVER_HPP
