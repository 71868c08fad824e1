//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/analysis/cluster_engine.hpp"
#include "eca/analysis/cluster_aggregate.hpp"
#include "eca/logger.hpp"
#include "eca/utils/string_utils.hpp"

#include <string>
#include <unordered_map>

namespace eca::analysis {

    ClusterEngine::ClusterEngine(FingerprintEngine fingerprint_engine)
        : fingerprint_engine_(std::move(fingerprint_engine)) {}

    std::vector<ErrorCluster> ClusterEngine::cluster(const std::vector<LogRecord>& records) const {
        std::vector<ErrorCluster> clusters;
        std::unordered_map<std::string, std::size_t> index_by_fingerprint;

        for (const auto& record : records) {
            if (!record.is_error()) {
                continue;
            }

            auto analysis = fingerprint_engine_.analyze(record);

            auto [it, inserted] = index_by_fingerprint.try_emplace(analysis.fingerprint, clusters.size());
            if (inserted) {
                clusters.push_back(make_cluster(analysis));
                ECA_LOG_TRACE("New cluster {} for fingerprint {}", clusters.back().id,
                              string_utils::truncate(analysis.fingerprint, 120));
            }

            apply_record(clusters[it->second], record, analysis);
        }

        for (auto& cluster : clusters) {
            refresh_severity(cluster);
        }
        sort_by_occurrence(clusters);

        ECA_LOG_DEBUG("Clustered {} records into {} clusters", records.size(), clusters.size());
        return clusters;
    }

}  // namespace eca::analysis
