//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_VERSION_HPP
#define ERRORCLUSTERANALYZER_VERSION_HPP

/**
 * @file version.hpp
 * @brief Error Cluster Analyzer version information.
 */

namespace eca {

    /**
     * Major version number.
     * Incremented when fingerprints change, since that regroups stored clusters.
     */
    constexpr int VERSION_MAJOR = 1;

    constexpr int VERSION_MINOR = 0;

    constexpr int VERSION_PATCH = 0;

    constexpr auto VERSION_STRING = "1.0.0";

    constexpr auto PROJECT_NAME = "Error Cluster Analyzer";

    constexpr auto PROJECT_SHORT_NAME = "eca";

}  // namespace eca

#endif //ERRORCLUSTERANALYZER_VERSION_HPP
