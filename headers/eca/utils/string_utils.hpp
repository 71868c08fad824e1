//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_STRING_UTILS_HPP
#define ERRORCLUSTERANALYZER_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String manipulation utilities.
 *
 * Trimming, splitting and matching helpers shared by the trace parser,
 * the fingerprint engine and the source scanner. Functions returning
 * string_view point into their argument and must not outlive it.
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace eca::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits a string by a delimiter character. Empty parts are kept.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    /**
     * Splits text into lines on "\n" or "\r\n".
     *
     * A trailing line terminator does not produce an extra empty line.
     */
    inline std::vector<std::string_view> split_lines(std::string_view s) {
        std::vector<std::string_view> lines;
        if (s.empty()) {
            return lines;
        }

        for (auto line : split(s, '\n')) {
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            lines.push_back(line);
        }

        if (s.back() == '\n') {
            lines.pop_back();
        }
        return lines;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        if (parts.empty()) {
            return "";
        }

        std::ostringstream oss;
        auto it = parts.begin();
        oss << *it;
        ++it;

        for (; it != parts.end(); ++it) {
            oss << delimiter << *it;
        }

        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    inline std::string to_upper(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return result;
    }

    /**
     * Replaces all occurrences of a character.
     */
    inline std::string replace_all(std::string_view s, const char from, const char to) {
        std::string result(s);
        std::ranges::replace(result, from, to);
        return result;
    }

    /**
     * Shortens a string to at most max_length characters, appending "..."
     * when something was cut.
     */
    inline std::string truncate(const std::string_view s, const std::size_t max_length) {
        if (s.size() <= max_length) {
            return std::string(s);
        }
        return std::string(s.substr(0, max_length)) + "...";
    }

    /**
     * Counts occurrences of a character.
     */
    inline std::size_t count_char(const std::string_view s, const char c) noexcept {
        return static_cast<std::size_t>(std::ranges::count(s, c));
    }

}  // namespace eca::string_utils

#endif //ERRORCLUSTERANALYZER_STRING_UTILS_HPP
