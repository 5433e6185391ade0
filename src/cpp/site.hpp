#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "geo_point_sources.hpp"

namespace sitedensity {

  // Density tiers, in increasing order.
  enum class AreaClass { Rural, Suburban, Urban, Dense };

  const char *area_class_name(AreaClass area_class);

  /// @brief A geolocated site. The first block of fields comes from
  /// validated input; the optional block is filled in by the pipeline,
  /// one stage at a time.
  struct Site {
    std::string site_id;
    double lat;
    double lon;
    std::string cluster_id;

    // Columns the analysis does not interpret, in input order.
    std::vector<std::pair<std::string, std::string>> passthrough;

    std::optional<double> density;
    std::optional<std::string> group_id;
    std::optional<int> group_size;
    std::optional<AreaClass> area_class;

    Site();
    Site(std::string site_id, double lat, double lon, std::string cluster_id);
  };

  GeoPointSources site_points(const std::vector<Site> &sites);

}  // namespace sitedensity
