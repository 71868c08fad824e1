//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_SIMILARITY_HPP
#define ERRORCLUSTERANALYZER_SIMILARITY_HPP

#include <cstddef>
#include <string_view>

namespace eca::analysis {

    /**
     * Byte-wise edit distance (insert, delete, substitute; unit costs).
     */
    std::size_t levenshtein_distance(std::string_view a, std::string_view b);

    /**
     * 1 - distance / max(len(a), len(b)); 1.0 for two empty strings.
     */
    double similarity(std::string_view a, std::string_view b);

}  // namespace eca::analysis

#endif //ERRORCLUSTERANALYZER_SIMILARITY_HPP
