#pragma once

#include <json/json.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "pipeline.hpp"
#include "site.hpp"

namespace sitedensity {

  // Number of sites in each area class.
  struct AnalysisSummary {
    int rural{0};
    int suburban{0};
    int urban{0};
    int dense{0};
  };

  // What a caller receives for one analysis run.
  struct AnalysisResponse {
    AnalysisSummary summary;
    std::vector<Site> preview;
    int total_rows{0};
    std::vector<std::string> messages;
    std::optional<std::string> download_url;
  };

  AnalysisSummary summarize(const std::vector<Site> &sites);

  /// @brief The first `max_rows` sites.
  std::vector<Site> preview(const std::vector<Site> &sites, std::size_t max_rows = 50);

  AnalysisResponse build_response(const AnalysisResult &result, std::size_t preview_rows = 50);

  Json::Value to_json(const AnalysisSummary &summary);

  /// @brief One site as a JSON object; fields that were never computed
  /// are null.
  Json::Value to_json(const Site &site);

  Json::Value to_json(const AnalysisResponse &response);

  std::string render_json(const AnalysisResponse &response);

}  // namespace sitedensity
