//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_CLUSTER_AGGREGATE_HPP
#define ERRORCLUSTERANALYZER_CLUSTER_AGGREGATE_HPP

/**
 * @file cluster_aggregate.hpp
 * @brief Operations that build and update ErrorCluster aggregates.
 *
 * ErrorCluster is a plain value; these functions are the only code that
 * changes one. They keep occurrence_count equal to records.size() and
 * first_seen/last_seen equal to the min/max member timestamp.
 */

#include "eca/types.hpp"
#include "eca/analysis/fingerprint_engine.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace eca::analysis {

    /**
     * "ERR-" followed by eight upper-case hex digits of a 32-bit hash of
     * the fingerprint. Different fingerprints may produce the same id.
     */
    std::string make_short_id(std::string_view fingerprint);

    /**
     * LOW below 10, MEDIUM from 10, HIGH from 50, CRITICAL from 100.
     */
    ClusterSeverity severity_for_count(std::size_t count) noexcept;

    /**
     * An empty cluster keyed by the analysis' fingerprint.
     */
    ErrorCluster make_cluster(const RecordAnalysis& first);

    /**
     * Appends record and updates counters and time range. Exception type,
     * message template and primary location are each set from analysis
     * when the cluster has none yet, and never overwritten.
     */
    void apply_record(ErrorCluster& cluster, LogRecord record, const RecordAnalysis& analysis);

    /**
     * Moves all members of absorbed into survivor. The survivor keeps its
     * identity and attributes; only a missing primary location is taken
     * over.
     */
    void absorb_cluster(ErrorCluster& survivor, ErrorCluster&& absorbed);

    void refresh_severity(ErrorCluster& cluster) noexcept;

    /**
     * Most frequent first; clusters with equal counts keep their order.
     */
    void sort_by_occurrence(std::vector<ErrorCluster>& clusters);

}  // namespace eca::analysis

#endif //ERRORCLUSTERANALYZER_CLUSTER_AGGREGATE_HPP
