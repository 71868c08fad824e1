//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_CLUSTER_ENGINE_HPP
#define ERRORCLUSTERANALYZER_CLUSTER_ENGINE_HPP

#include "eca/types.hpp"
#include "eca/analysis/fingerprint_engine.hpp"

#include <vector>

namespace eca::analysis {

    /**
     * Groups error records by fingerprint.
     *
     * Records below ERROR level are skipped. Clusters are created in order
     * of first appearance, then sorted by occurrence count (stable), so the
     * output is fully determined by the input order.
     */
    class ClusterEngine {
    public:
        explicit ClusterEngine(FingerprintEngine fingerprint_engine = FingerprintEngine{});

        [[nodiscard]] std::vector<ErrorCluster> cluster(const std::vector<LogRecord>& records) const;

        [[nodiscard]] const FingerprintEngine& fingerprint_engine() const noexcept {
            return fingerprint_engine_;
        }

    private:
        FingerprintEngine fingerprint_engine_;
    };

}  // namespace eca::analysis

#endif //ERRORCLUSTERANALYZER_CLUSTER_ENGINE_HPP
