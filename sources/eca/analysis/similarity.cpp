//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/analysis/similarity.hpp"

#include <algorithm>
#include <numeric>
#include <vector>

namespace eca::analysis {

    std::size_t levenshtein_distance(std::string_view a, std::string_view b) {
        if (a.size() < b.size()) {
            std::swap(a, b);
        }
        if (b.empty()) {
            return a.size();
        }

        // Two rows over the shorter string.
        std::vector<std::size_t> previous(b.size() + 1);
        std::vector<std::size_t> current(b.size() + 1);
        std::iota(previous.begin(), previous.end(), std::size_t{0});

        for (std::size_t i = 1; i <= a.size(); ++i) {
            current[0] = i;
            for (std::size_t j = 1; j <= b.size(); ++j) {
                const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
                current[j] = std::min({previous[j] + 1, current[j - 1] + 1, previous[j - 1] + cost});
            }
            std::swap(previous, current);
        }

        return previous[b.size()];
    }

    double similarity(const std::string_view a, const std::string_view b) {
        if (a == b) {
            return 1.0;
        }

        const std::size_t max_length = std::max(a.size(), b.size());
        if (max_length == 0) {
            return 1.0;
        }

        const auto distance = levenshtein_distance(a, b);
        return 1.0 - static_cast<double>(distance) / static_cast<double>(max_length);
    }

}  // namespace eca::analysis
