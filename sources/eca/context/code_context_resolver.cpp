//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/context/code_context_resolver.hpp"
#include "eca/context/source_scanner.hpp"
#include "eca/logger.hpp"
#include "eca/utils/file_utils.hpp"
#include "eca/utils/string_utils.hpp"

namespace eca::context {

    namespace fs = std::filesystem;

    namespace {

        /**
         * com.example.Foo$Bar -> com/example/Foo.java
         */
        fs::path relative_source_path(std::string_view class_name) {
            if (const auto dollar = class_name.find('$'); dollar != std::string_view::npos) {
                class_name = class_name.substr(0, dollar);
            }
            return fs::path(string_utils::replace_all(class_name, '.', '/') + ".java");
        }

    }  // namespace

    CodeContextResolver::CodeContextResolver(heuristics::ContextConfig config)
        : config_(std::move(config)) {}

    Result<std::optional<fs::path>, Error> CodeContextResolver::find_source_file(
        const std::string_view class_name
    ) const {
        using SearchResult = Result<std::optional<fs::path>, Error>;

        if (class_name.empty()) {
            return SearchResult::success(std::nullopt);
        }

        const auto relative = relative_source_path(class_name);
        for (const auto& root : config_.source_paths) {
            auto candidate = root / relative;
            const auto is_file = file_utils::is_regular_file(candidate);
            if (is_file.is_err()) {
                ECA_LOG_ERROR("Error checking source file {}: {}", candidate.string(), is_file.error().to_string());
                return SearchResult::failure(is_file.error());
            }
            if (is_file.value()) {
                return SearchResult::success(std::move(candidate));
            }
        }

        ECA_LOG_DEBUG("Source file not found for class {}", class_name);
        return SearchResult::success(std::nullopt);
    }

    Result<std::optional<fs::path>, Error> CodeContextResolver::find_source_file_by_name(
        const std::string_view file_name
    ) const {
        using SearchResult = Result<std::optional<fs::path>, Error>;

        if (file_name.empty()) {
            return SearchResult::success(std::nullopt);
        }

        for (const auto& root : config_.source_paths) {
            auto found = file_utils::find_file_by_name(root, file_name);
            if (found.is_err()) {
                ECA_LOG_ERROR("Error searching source root {}: {}", root.string(), found.error().to_string());
                return found;
            }
            if (found.value()) {
                return found;
            }
        }

        ECA_LOG_DEBUG("Source file {} not found under {} roots", file_name, config_.source_paths.size());
        return SearchResult::success(std::nullopt);
    }

    ContextResult CodeContextResolver::resolve_by_class(const std::string_view class_name, const int line) const {
        const auto path = find_source_file(class_name);
        if (path.is_err()) {
            return ContextResult::failure(path.error());
        }
        if (!path.value()) {
            return ContextResult::success(std::nullopt);
        }
        return resolve_in_file(*path.value(), line);
    }

    ContextResult CodeContextResolver::resolve_by_file_name(const std::string_view file_name, const int line) const {
        auto path = find_source_file_by_name(file_name);
        if (path.is_err()) {
            return ContextResult::failure(path.error());
        }
        if (!path.value()) {
            return ContextResult::success(std::nullopt);
        }
        return resolve_in_file(*path.value(), line);
    }

    ContextResult CodeContextResolver::resolve_in_file(const fs::path& path, const int line) const {
        auto lines = file_utils::read_lines(path);
        if (lines.is_err()) {
            if (lines.error().is_not_found()) {
                ECA_LOG_DEBUG("Source file {} does not exist", path.string());
                return ContextResult::success(std::nullopt);
            }
            ECA_LOG_ERROR("Error reading source file {}: {}", path.string(), lines.error().to_string());
            return ContextResult::failure(lines.error());
        }

        auto context = extract_context(path, lines.value(), line, config_.context_lines);
        if (!context) {
            ECA_LOG_WARNING("Line {} out of range for file {} (total lines: {})",
                            line, path.string(), lines.value().size());
        }
        return ContextResult::success(std::move(context));
    }

    ContextResult CodeContextResolver::resolve(const CodeLocation& location) const {
        if (!location.line || *location.line <= 0) {
            return ContextResult::success(std::nullopt);
        }

        if (!location.class_name.empty()) {
            if (auto resolved = resolve_by_class(location.class_name, *location.line);
                resolved.is_err() || resolved.value()) {
                return resolved;
            }
        }

        if (location.file_name && !location.file_name->empty()) {
            return resolve_by_file_name(*location.file_name, *location.line);
        }

        return ContextResult::success(std::nullopt);
    }

}  // namespace eca::context
