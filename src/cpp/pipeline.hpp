#pragma once

#include <string>
#include <vector>

#include "config.hpp"
#include "site.hpp"
#include "site_csv.hpp"

namespace sitedensity {

  // Enriched sites and the diagnostics produced while computing them.
  struct AnalysisResult {
    std::vector<Site> sites;
    std::vector<std::string> messages;
  };

  /// @brief Runs density estimation, co-location grouping and
  /// classification over cleaned sites.
  ///
  /// Holds no state between calls. Configuration errors throw before
  /// any site is touched; an empty input yields an empty result and a
  /// single message.
  AnalysisResult process_sites(std::vector<Site> sites, const AnalysisConfig &config);

  /// @brief Validates a raw table, then runs process_sites on the rows
  /// that survive. Validation messages come first in the result.
  AnalysisResult process_table(const SiteTable &table, const AnalysisConfig &config);

}  // namespace sitedensity
