#include "site.hpp"

#include <stdexcept>

namespace sitedensity {

  const char *area_class_name(AreaClass area_class) {
    switch (area_class) {
      case AreaClass::Rural:
        return "Rural";
      case AreaClass::Suburban:
        return "Suburban";
      case AreaClass::Urban:
        return "Urban";
      case AreaClass::Dense:
        return "Dense";
    }
    throw std::invalid_argument("area_class_name: unknown area class");
  }

  Site::Site() : lat(0.0), lon(0.0) {}

  Site::Site(std::string site_id, double lat, double lon, std::string cluster_id)
      : site_id(std::move(site_id)), lat(lat), lon(lon), cluster_id(std::move(cluster_id)) {}

  GeoPointSources site_points(const std::vector<Site> &sites) {
    GeoPointSources points(sites.size());
    for (const Site &site : sites) {
      points.add(site.lat, site.lon);
    }
    return points;
  }

}  // namespace sitedensity
