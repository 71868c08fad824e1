//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/analysis/analysis_engine.hpp"
#include "eca/logger.hpp"

#include <algorithm>

namespace eca::analysis {

    namespace {

        bool is_resolvable(const std::optional<CodeLocation>& location) {
            return location &&
                   location->has_location() &&
                   location->line.has_value() &&
                   *location->line > 0;
        }

    }  // namespace

    const CodeContext* AnalysisReport::context_for(const ErrorCluster& cluster) const {
        const auto it = contexts.find(cluster.fingerprint);
        return it == contexts.end() ? nullptr : &it->second;
    }

    AnalysisEngine::AnalysisEngine(Config config)
        : config_(std::move(config))
        , cluster_engine_(FingerprintEngine(config_.fingerprint, config_.parser))
        , merger_(config_.merge)
        , resolver_(config_.context) {}

    std::vector<ErrorCluster> AnalysisEngine::cluster(const std::vector<LogRecord>& records) const {
        auto clusters = cluster_engine_.cluster(records);
        if (config_.merge.enabled) {
            const auto before = clusters.size();
            clusters = merger_.merge(std::move(clusters));
            ECA_LOG_DEBUG("Merge pass reduced {} clusters to {}", before, clusters.size());
        }
        return clusters;
    }

    Result<AnalysisReport, Error> AnalysisEngine::analyze(const std::vector<LogRecord>& records) const {
        const auto start = std::chrono::steady_clock::now();

        AnalysisReport report;
        report.total_records = records.size();
        report.error_records = static_cast<std::size_t>(
            std::ranges::count_if(records, [](const LogRecord& record) { return record.is_error(); })
        );
        report.clusters = cluster(records);

        if (auto result = resolve_contexts(report); result.is_err()) {
            return Result<AnalysisReport, Error>::failure(result.error());
        }

        report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start
        );

        ECA_LOG_INFO("Analyzed {} records ({} errors): {} clusters, {} with source context",
                     report.total_records, report.error_records,
                     report.clusters.size(), report.contexts.size());

        return Result<AnalysisReport, Error>::success(std::move(report));
    }

    Result<void, Error> AnalysisEngine::resolve_contexts(AnalysisReport& report) const {
        if (config_.context.source_paths.empty()) {
            return Result<void, Error>::success();
        }

        std::size_t attempted = 0;
        for (const auto& cluster : report.clusters) {
            if (attempted >= config_.context.max_resolved_clusters) {
                break;
            }
            if (!is_resolvable(cluster.primary_location)) {
                continue;
            }
            ++attempted;

            auto resolved = resolver_.resolve(*cluster.primary_location);
            if (resolved.is_err()) {
                return Result<void, Error>::failure(
                    resolved.error().with_context("resolving " + cluster.id)
                );
            }
            if (resolved.value()) {
                report.contexts.emplace(cluster.fingerprint, std::move(*resolved.value()));
            }
        }

        return Result<void, Error>::success();
    }

}  // namespace eca::analysis
