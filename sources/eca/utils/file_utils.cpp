//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/utils/file_utils.hpp"

#include <algorithm>

namespace eca::file_utils {

    namespace {

    using SearchResult = Result<std::optional<fs::path>, Error>;

    SearchResult search_directory(const fs::path& dir, const std::string_view file_name) {
        std::error_code ec;
        std::vector<fs::path> files;
        std::vector<fs::path> directories;

        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            const auto& entry = *it;
            std::error_code type_ec;
            if (entry.is_symlink(type_ec)) {
                continue;
            }
            if (entry.is_directory(type_ec)) {
                directories.push_back(entry.path());
            } else if (entry.is_regular_file(type_ec)) {
                files.push_back(entry.path());
            }
        }

        if (ec) {
            return SearchResult::failure(
                Error::io_error("Failed to list directory", dir, ec)
            );
        }

        std::ranges::sort(files);
        std::ranges::sort(directories);

        for (const auto& file : files) {
            if (file.filename().string() == file_name) {
                return SearchResult::success(file);
            }
        }

        for (const auto& sub : directories) {
            auto found = search_directory(sub, file_name);
            if (found.is_err() || found.value().has_value()) {
                return found;
            }
        }

        return SearchResult::success(std::nullopt);
    }

    }  // namespace

    Result<std::optional<fs::path>, Error> find_file_by_name(
        const fs::path& root,
        const std::string_view file_name
    ) {
        if (file_name.empty()) {
            return SearchResult::success(std::nullopt);
        }

        const auto status = file_status(root);
        if (status.is_err()) {
            return SearchResult::failure(status.error());
        }
        if (!fs::is_directory(status.value())) {
            return SearchResult::success(std::nullopt);
        }

        return search_directory(root, file_name);
    }

}  // namespace eca::file_utils
