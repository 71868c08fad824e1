//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_HEURISTICS_CONFIG_HPP
#define ERRORCLUSTERANALYZER_HEURISTICS_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Tunable parameters for fingerprinting, clustering and context extraction.
 *
 * Defaults follow the behaviour the clustering pipeline has always shipped
 * with: five user frames per fingerprint, a 0.7 similarity threshold for
 * merging, and a ten line window around a resolved source line.
 */

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace eca::heuristics
{
    /**
     * @brief Occurrence-count thresholds for severity tiers.
     *
     * These are fixed constants; they are deliberately not part of the
     * loadable configuration.
     */
    struct SeverityThresholds {
        static constexpr std::size_t critical = 100;
        static constexpr std::size_t high = 50;
        static constexpr std::size_t medium = 10;
    };

    /**
     * Namespaces treated as framework/library code when looking for user frames.
     */
    inline std::vector<std::string> default_framework_prefixes() {
        return {
            "java.",
            "javax.",
            "sun.",
            "com.sun.",
            "jdk.",
            "org.springframework.",
            "org.apache.",
            "org.hibernate.",
            "org.slf4j.",
            "ch.qos.logback.",
            "com.zaxxer.hikari.",
            "io.netty.",
            "reactor.",
            "com.fasterxml.jackson."
        };
    }

    /**
     * @brief Stack trace parsing limits.
     */
    struct ParserConfig {
        /// Maximum number of nested "Caused by" sections kept per trace.
        /// Anything deeper is dropped and a warning is logged.
        std::size_t max_cause_depth = 64;
    };

    /**
     * @brief Fingerprint derivation parameters.
     */
    struct FingerprintConfig {
        /// Number of leading user frames that make up a trace fingerprint
        std::size_t frame_count = 5;

        /// Class name prefixes classified as framework frames
        std::vector<std::string> framework_prefixes = default_framework_prefixes();
    };

    /**
     * @brief Cluster merge pass parameters.
     */
    struct MergeConfig {
        /// Whether the analysis engine runs the merge pass after clustering
        bool enabled = false;

        /// Minimum normalized Levenshtein similarity of two message templates
        double similarity_threshold = 0.7;
    };

    /**
     * @brief Source lookup parameters for code context resolution.
     */
    struct ContextConfig {
        /// Source roots searched in order; the first match wins
        std::vector<std::filesystem::path> source_paths;

        /// Lines included on each side of the target line
        std::size_t context_lines = 10;

        /// Maximum number of clusters whose context is resolved per analysis
        std::size_t max_resolved_clusters = 10;
    };

}  // namespace eca::heuristics

#endif //ERRORCLUSTERANALYZER_HEURISTICS_CONFIG_HPP
