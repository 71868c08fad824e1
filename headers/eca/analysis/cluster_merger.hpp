//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_CLUSTER_MERGER_HPP
#define ERRORCLUSTERANALYZER_CLUSTER_MERGER_HPP

/**
 * @file cluster_merger.hpp
 * @brief Folds near-duplicate clusters together.
 */

#include "eca/types.hpp"
#include "eca/heuristics/config.hpp"

#include <vector>

namespace eca::analysis {

    /**
     * Single greedy pass over a cluster list.
     *
     * For each cluster that has not been absorbed yet, every later
     * unabsorbed cluster that matches it is folded into it. The pass is
     * order dependent and not transitive: if A matches B and B matches C
     * but A does not match C, C survives on its own.
     */
    class ClusterMerger {
    public:
        explicit ClusterMerger(heuristics::MergeConfig config = {});

        /**
         * Merges clusters, recomputes severities and re-sorts by count.
         */
        [[nodiscard]] std::vector<ErrorCluster> merge(std::vector<ErrorCluster> clusters) const;

        /**
         * Two clusters match when they have the same exception type and
         * similar message templates, or the same primary class, method and
         * line. Two clusters without an exception type count as the same
         * type; both templates must be present.
         */
        [[nodiscard]] bool should_merge(const ErrorCluster& a, const ErrorCluster& b) const;

        [[nodiscard]] const heuristics::MergeConfig& config() const noexcept {
            return config_;
        }

    private:
        [[nodiscard]] bool similar_messages(const ErrorCluster& a, const ErrorCluster& b) const;

        static bool same_location(const ErrorCluster& a, const ErrorCluster& b);

        heuristics::MergeConfig config_;
    };

}  // namespace eca::analysis

#endif //ERRORCLUSTERANALYZER_CLUSTER_MERGER_HPP
