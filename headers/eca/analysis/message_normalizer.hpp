//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_MESSAGE_NORMALIZER_HPP
#define ERRORCLUSTERANALYZER_MESSAGE_NORMALIZER_HPP

/**
 * @file message_normalizer.hpp
 * @brief Reduces log messages to templates by masking variable parts.
 */

#include <string>
#include <string_view>

namespace eca::analysis {

    /**
     * Replaces variable tokens with placeholders, in this order:
     *
     * | Token                               | Placeholder     |
     * |-------------------------------------|-----------------|
     * | UUID (any case)                     | `<UUID>`        |
     * | standalone run of 6+ digits         | `<ID>`          |
     * | yyyy-mm-dd[T ]hh:mm:ss              | `<TIMESTAMP>`   |
     * | dotted-quad IPv4 address            | `<IP>`          |
     * | e-mail address                      | `<EMAIL>`       |
     * | "double quoted"                     | `"<STRING>"`    |
     * | 'single quoted'                     | `'<STRING>'`    |
     * | any remaining standalone number     | `<NUM>`         |
     *
     * Each substitution runs on the output of the previous one, so order
     * matters: a UUID is never seen as digits, a timestamp never as numbers.
     * The result is trimmed.
     */
    std::string normalize_message(std::string_view message);

}  // namespace eca::analysis

#endif //ERRORCLUSTERANALYZER_MESSAGE_NORMALIZER_HPP
