#include "density.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sitedensity {
  namespace density {

    CountsTable::CountsTable(const kdtree::KDTree &tree, double radius_km) {
      if (!(radius_km > 0)) {
        throw std::invalid_argument("CountsTable: radius_km must be positive");
      }
      this->radius_km = radius_km;
      this->counts.reserve(tree.size());
      for (int i = 0; i < tree.size(); i++) {
        this->counts.push_back(tree.query_radius(i, radius_km).size());
      }
    }

    double disk_area_km2(double radius_km) { return M_PI * radius_km * radius_km; }

    std::vector<double> estimate_density(const kdtree::KDTree &tree, double radius_km) {
      CountsTable table(tree, radius_km);
      double area = disk_area_km2(radius_km);

      std::vector<double> density;
      density.reserve(table.counts.size());
      for (int count : table.counts) {
        density.push_back(std::max(0, count - 1) / area);
      }
      return density;
    }

    std::vector<double> estimate_density(const GeoPointSources &points, double radius_km) {
      return estimate_density(kdtree::build_kdtree(points), radius_km);
    }

  }  // namespace density
}  // namespace sitedensity
