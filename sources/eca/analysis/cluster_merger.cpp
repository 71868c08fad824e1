//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/analysis/cluster_merger.hpp"
#include "eca/analysis/cluster_aggregate.hpp"
#include "eca/analysis/similarity.hpp"
#include "eca/logger.hpp"

namespace eca::analysis {

    ClusterMerger::ClusterMerger(heuristics::MergeConfig config)
        : config_(config) {}

    bool ClusterMerger::similar_messages(const ErrorCluster& a, const ErrorCluster& b) const {
        if (a.exception_type != b.exception_type) {
            return false;
        }
        if (!a.message_template || !b.message_template) {
            return false;
        }
        return similarity(*a.message_template, *b.message_template) >= config_.similarity_threshold;
    }

    bool ClusterMerger::same_location(const ErrorCluster& a, const ErrorCluster& b) {
        if (!a.primary_location || !b.primary_location) {
            return false;
        }

        const auto& left = *a.primary_location;
        const auto& right = *b.primary_location;
        return !left.class_name.empty() &&
               left.class_name == right.class_name &&
               left.method_name == right.method_name &&
               left.line == right.line;
    }

    bool ClusterMerger::should_merge(const ErrorCluster& a, const ErrorCluster& b) const {
        return similar_messages(a, b) || same_location(a, b);
    }

    std::vector<ErrorCluster> ClusterMerger::merge(std::vector<ErrorCluster> clusters) const {
        if (clusters.size() <= 1) {
            return clusters;
        }

        std::vector<bool> merged(clusters.size(), false);
        std::vector<ErrorCluster> result;

        for (std::size_t i = 0; i < clusters.size(); ++i) {
            if (merged[i]) {
                continue;
            }

            auto& primary = clusters[i];
            for (std::size_t j = i + 1; j < clusters.size(); ++j) {
                if (merged[j] || !should_merge(primary, clusters[j])) {
                    continue;
                }

                ECA_LOG_DEBUG("Merging cluster {} ({}) into {} ({})",
                              clusters[j].id, clusters[j].occurrence_count,
                              primary.id, primary.occurrence_count);
                absorb_cluster(primary, std::move(clusters[j]));
                merged[j] = true;
            }

            result.push_back(std::move(primary));
        }

        for (auto& cluster : result) {
            refresh_severity(cluster);
        }
        sort_by_occurrence(result);
        return result;
    }

}  // namespace eca::analysis
