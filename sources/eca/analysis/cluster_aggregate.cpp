//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/analysis/cluster_aggregate.hpp"
#include "eca/heuristics/config.hpp"
#include "eca/utils/hash_utils.hpp"

#include <algorithm>
#include <iterator>

namespace eca::analysis {

    namespace {

        void widen_time_range(ErrorCluster& cluster, const Timestamp& timestamp) {
            if (!cluster.first_seen || timestamp < *cluster.first_seen) {
                cluster.first_seen = timestamp;
            }
            if (!cluster.last_seen || timestamp > *cluster.last_seen) {
                cluster.last_seen = timestamp;
            }
        }

    }  // namespace

    std::string make_short_id(const std::string_view fingerprint) {
        return "ERR-" + hash_utils::to_hex32(hash_utils::compute_hash32(fingerprint));
    }

    ClusterSeverity severity_for_count(const std::size_t count) noexcept {
        using heuristics::SeverityThresholds;

        if (count >= SeverityThresholds::critical) return ClusterSeverity::Critical;
        if (count >= SeverityThresholds::high) return ClusterSeverity::High;
        if (count >= SeverityThresholds::medium) return ClusterSeverity::Medium;
        return ClusterSeverity::Low;
    }

    ErrorCluster make_cluster(const RecordAnalysis& first) {
        ErrorCluster cluster;
        cluster.id = make_short_id(first.fingerprint);
        cluster.fingerprint = first.fingerprint;
        return cluster;
    }

    void apply_record(ErrorCluster& cluster, LogRecord record, const RecordAnalysis& analysis) {
        widen_time_range(cluster, record.timestamp);

        if (!cluster.exception_type) {
            cluster.exception_type = analysis.exception_type;
        }
        if (!cluster.message_template) {
            cluster.message_template = analysis.message_template;
        }

        const auto& location = analysis.location;
        if (!cluster.primary_location && location && location->has_location()) {
            cluster.primary_location = location;
        }

        cluster.records.push_back(std::move(record));
        cluster.occurrence_count = cluster.records.size();
    }

    void absorb_cluster(ErrorCluster& survivor, ErrorCluster&& absorbed) {
        if (absorbed.first_seen) {
            widen_time_range(survivor, *absorbed.first_seen);
        }
        if (absorbed.last_seen) {
            widen_time_range(survivor, *absorbed.last_seen);
        }

        if (!survivor.primary_location && absorbed.primary_location) {
            survivor.primary_location = std::move(absorbed.primary_location);
        }

        survivor.records.reserve(survivor.records.size() + absorbed.records.size());
        std::ranges::move(absorbed.records, std::back_inserter(survivor.records));
        absorbed.records.clear();

        survivor.occurrence_count = survivor.records.size();
        absorbed.occurrence_count = 0;
    }

    void refresh_severity(ErrorCluster& cluster) noexcept {
        cluster.severity = severity_for_count(cluster.occurrence_count);
    }

    void sort_by_occurrence(std::vector<ErrorCluster>& clusters) {
        std::ranges::stable_sort(clusters, [](const ErrorCluster& a, const ErrorCluster& b) {
            return a.occurrence_count > b.occurrence_count;
        });
    }

}  // namespace eca::analysis
