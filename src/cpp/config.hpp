#pragma once

#include <optional>
#include <string>

#include "classify.hpp"

namespace sitedensity {

  // Every recognized analysis option, with its default.
  struct AnalysisConfig {
    double radius_km{2.0};
    double co_location_threshold_m{100.0};
    classify::ClassificationMode classification_mode{classify::ClassificationMode::Quantile};
    std::optional<classify::ClassificationThresholds> classification_thresholds;

    /// @brief Throws std::invalid_argument if an option is out of
    /// range: radius_km within [0.1, 100], co_location_threshold_m
    /// within [1, 10000], and thresholds finite and non-decreasing.
    void validate() const;
  };

  /// @brief Reads an AnalysisConfig from a YAML file. Keys that are
  /// absent keep their defaults; a partial classification_thresholds
  /// block is completed from the default thresholds.
  AnalysisConfig load_analysis_config(const std::string &path);

  // Same as load_analysis_config, for YAML text already in memory.
  AnalysisConfig parse_analysis_config(const std::string &yaml_text);

}  // namespace sitedensity
