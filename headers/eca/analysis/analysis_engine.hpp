//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_ANALYSIS_ENGINE_HPP
#define ERRORCLUSTERANALYZER_ANALYSIS_ENGINE_HPP

/**
 * @file analysis_engine.hpp
 * @brief End-to-end analysis of a record batch.
 *
 * Runs clustering, the optional merge pass and source context resolution
 * for the most frequent clusters.
 */

#include "eca/types.hpp"
#include "eca/config.hpp"
#include "eca/result.hpp"
#include "eca/error.hpp"
#include "eca/analysis/cluster_engine.hpp"
#include "eca/analysis/cluster_merger.hpp"
#include "eca/context/code_context_resolver.hpp"

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

namespace eca::analysis {

    /**
     * Result of one analysis run.
     */
    struct AnalysisReport {
        /// Clusters, most frequent first
        std::vector<ErrorCluster> clusters;

        /// Resolved source context by cluster fingerprint
        std::unordered_map<std::string, CodeContext> contexts;

        /// Records in the batch
        std::size_t total_records = 0;

        /// Records at ERROR or FATAL level
        std::size_t error_records = 0;

        /// Wall time spent in analyze()
        std::chrono::milliseconds duration{0};

        /**
         * The context resolved for cluster, or nullptr.
         */
        [[nodiscard]] const CodeContext* context_for(const ErrorCluster& cluster) const;
    };

    class AnalysisEngine {
    public:
        explicit AnalysisEngine(Config config = Config::defaults());

        /**
         * Clusters records and resolves code context for up to
         * context.max_resolved_clusters clusters that have a primary
         * location with a class or file and a positive line.
         *
         * @return The report, or the first I/O error hit while reading sources.
         */
        [[nodiscard]] Result<AnalysisReport, Error> analyze(const std::vector<LogRecord>& records) const;

        /**
         * Clustering plus the merge pass when merging is enabled.
         */
        [[nodiscard]] std::vector<ErrorCluster> cluster(const std::vector<LogRecord>& records) const;

        [[nodiscard]] const Config& config() const noexcept {
            return config_;
        }

        [[nodiscard]] const context::CodeContextResolver& resolver() const noexcept {
            return resolver_;
        }

    private:
        Result<void, Error> resolve_contexts(AnalysisReport& report) const;

        Config config_;
        ClusterEngine cluster_engine_;
        ClusterMerger merger_;
        context::CodeContextResolver resolver_;
    };

}  // namespace eca::analysis

#endif //ERRORCLUSTERANALYZER_ANALYSIS_ENGINE_HPP
