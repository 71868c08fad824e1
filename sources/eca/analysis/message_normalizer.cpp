//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/analysis/message_normalizer.hpp"
#include "eca/utils/string_utils.hpp"

#include <array>
#include <regex>
#include <utility>

namespace eca::analysis {

    namespace {

        struct Substitution {
            std::regex pattern;
            const char* replacement;
        };

        const std::array<Substitution, 8>& substitutions() {
            static const std::array<Substitution, 8> table = {{
                {std::regex(R"([0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12})",
                            std::regex::icase), "<UUID>"},
                {std::regex(R"(\b\d{6,}\b)"), "<ID>"},
                {std::regex(R"(\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}:\d{2})"), "<TIMESTAMP>"},
                {std::regex(R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)"), "<IP>"},
                {std::regex(R"([\w.+-]+@[\w.-]+\.[a-zA-Z]{2,})"), "<EMAIL>"},
                {std::regex(R"("[^"]+")"), "\"<STRING>\""},
                {std::regex(R"('[^']+')"), "'<STRING>'"},
                {std::regex(R"(\b\d+\b)"), "<NUM>"},
            }};
            return table;
        }

    }  // namespace

    std::string normalize_message(const std::string_view message) {
        std::string normalized(message);

        for (const auto& [pattern, replacement] : substitutions()) {
            normalized = std::regex_replace(normalized, pattern, replacement);
        }

        return std::string(string_utils::trim(normalized));
    }

}  // namespace eca::analysis
