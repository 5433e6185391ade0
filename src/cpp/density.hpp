#pragma once

#include <vector>

#include "geo_point_sources.hpp"
#include "kdtree.hpp"

namespace sitedensity {
  namespace density {

    // Count of how many indexed points lie within the radius of each
    // indexed point, the point itself included.
    struct CountsTable {
      std::vector<int> counts;
      double radius_km;

      CountsTable(const kdtree::KDTree &tree, double radius_km);
    };

    /// @brief Area of a disk of `radius_km` on the plane, in km^2.
    double disk_area_km2(double radius_km);

    /// @brief Neighbors per km^2 around each indexed point, in index
    /// order. The point itself is not counted as its own neighbor.
    std::vector<double> estimate_density(const kdtree::KDTree &tree, double radius_km);
    std::vector<double> estimate_density(const GeoPointSources &points, double radius_km);

  }  // namespace density
}  // namespace sitedensity
