//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef ERRORCLUSTERANALYZER_ECA_HPP
#define ERRORCLUSTERANALYZER_ECA_HPP

/**
 * @file eca.hpp
 * @brief Main header for the Error Cluster Analyzer library.
 *
 * Pulls in the core types and the analysis entry point. Include specific
 * headers for more targeted dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "analysis/analysis_engine.hpp"

#endif //ERRORCLUSTERANALYZER_ECA_HPP
