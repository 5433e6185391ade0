#pragma once

#include <optional>
#include <string>
#include <vector>

#include "site.hpp"

namespace sitedensity {
  namespace classify {

    enum class ClassificationMode { Quantile, Threshold };

    /// @brief Parses "quantile" or "threshold". Anything else throws
    /// std::invalid_argument.
    ClassificationMode parse_mode(const std::string &mode);
    const char *mode_name(ClassificationMode mode);

    // Upper bounds (inclusive, sites/km^2) of the Rural, Suburban and
    // Urban tiers. Anything above `urban` is Dense.
    struct ClassificationThresholds {
      double rural{10.0};
      double suburban{50.0};
      double urban{200.0};
    };

    /// @brief Buckets `density` against three ascending cutoffs. Ties
    /// go to the lower tier.
    AreaClass bucket(double density, double rural, double suburban, double urban);

    /// @brief Classifies each site against the quartiles of the
    /// densities in its own cluster. `density` and `cluster_ids` are
    /// parallel arrays.
    std::vector<AreaClass> classify_quantile(const std::vector<double> &density,
                                             const std::vector<std::string> &cluster_ids);

    std::vector<AreaClass> classify_threshold(const std::vector<double> &density,
                                              const ClassificationThresholds &thresholds);

    /// @brief Classifies sites whose density has been estimated.
    ///
    /// Throws std::logic_error if any site lacks a density and
    /// std::invalid_argument for an unknown mode. Thresholds are only
    /// read in threshold mode and default to ClassificationThresholds{}.
    std::vector<AreaClass> classify_sites(const std::vector<Site> &sites, ClassificationMode mode,
                                          const std::optional<ClassificationThresholds> &thresholds = std::nullopt);

  }  // namespace classify
}  // namespace sitedensity
