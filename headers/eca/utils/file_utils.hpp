//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_FILE_UTILS_HPP
#define ERRORCLUSTERANALYZER_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system utilities.
 *
 * Reading source files and locating them under source roots. All
 * operations use Result<T, Error>; a missing file is reported as
 * NotFound, anything the file system refuses as IoError.
 */

#include "eca/result.hpp"
#include "eca/error.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace eca::file_utils {

    namespace fs = std::filesystem;

    /**
     * Status of path, following symlinks. A missing path yields a
     * not_found status; any other stat failure (permissions, symlink
     * loops) is an IoError.
     */
    inline Result<fs::file_status, Error> file_status(const fs::path& path) {
        std::error_code ec;
        const auto status = fs::status(path, ec);
        if (!fs::status_known(status)) {
            return Result<fs::file_status, Error>::failure(
                Error::io_error("Failed to access path", path, ec)
            );
        }
        return Result<fs::file_status, Error>::success(status);
    }

    /**
     * Reads an entire file into a string.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        const auto status = file_status(path);
        if (status.is_err()) {
            return Result<std::string, Error>::failure(status.error());
        }
        if (!fs::exists(status.value())) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    /**
     * Reads a file line by line. Carriage returns before the newline are
     * dropped so CRLF sources scan the same as LF sources.
     */
    inline Result<std::vector<std::string>, Error> read_lines(const fs::path& path) {
        const auto status = file_status(path);
        if (status.is_err()) {
            return Result<std::vector<std::string>, Error>::failure(status.error());
        }
        if (!fs::exists(status.value())) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path);
        if (!file) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::vector<std::string> lines;
        std::string line;

        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(std::move(line));
        }

        if (file.bad()) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::vector<std::string>, Error>::success(std::move(lines));
    }

    /**
     * Whether a regular file exists at path. A missing path is false, a
     * path that cannot be examined is an IoError.
     */
    inline Result<bool, Error> is_regular_file(const fs::path& path) {
        const auto status = file_status(path);
        if (status.is_err()) {
            return Result<bool, Error>::failure(status.error());
        }
        return Result<bool, Error>::success(fs::is_regular_file(status.value()));
    }

    /**
     * Depth-first search for a file with the given name below root.
     *
     * Files of a directory are checked before its subdirectories are
     * descended into, and entries are visited in sorted order so the
     * result does not depend on directory iteration order.
     *
     * @param root Directory to search.
     * @param file_name Exact file name to match (no path components).
     * @return The first match, nullopt when absent (a missing root
     *         included), or an I/O error.
     */
    Result<std::optional<fs::path>, Error> find_file_by_name(
        const fs::path& root,
        std::string_view file_name
    );

}  // namespace eca::file_utils

#endif //ERRORCLUSTERANALYZER_FILE_UTILS_HPP
