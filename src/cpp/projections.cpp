#include "projections.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

using Eigen::Vector3d;

namespace sitedensity {
  namespace projections {

    double deg_to_rad(double deg) { return deg * M_PI / 180.0; }

    double haversine_km(double lat1, double lon1, double lat2, double lon2) {
      double lat1_rad = deg_to_rad(lat1);
      double lat2_rad = deg_to_rad(lat2);
      double dlat = lat2_rad - lat1_rad;
      double dlon = deg_to_rad(lon2) - deg_to_rad(lon1);

      double sin_dlat = std::sin(dlat / 2);
      double sin_dlon = std::sin(dlon / 2);
      double a = sin_dlat * sin_dlat + std::cos(lat1_rad) * std::cos(lat2_rad) * sin_dlon * sin_dlon;

      // Rounding can push a just past 1.0 for antipodal points.
      double c = 2 * std::asin(std::min(1.0, std::sqrt(a)));
      return EARTH_RADIUS_KM * c;
    }

    Vector3d unit_vector(double lat, double lon) {
      double lat_rad = deg_to_rad(lat);
      double lon_rad = deg_to_rad(lon);
      double cos_lat = std::cos(lat_rad);
      return Vector3d(cos_lat * std::cos(lon_rad), cos_lat * std::sin(lon_rad), std::sin(lat_rad));
    }

    double chord_length(double arc_km) {
      if (arc_km < 0) {
        throw std::invalid_argument("chord_length: arc_km must be non-negative");
      }
      double theta = arc_km / EARTH_RADIUS_KM;
      if (theta >= M_PI) {
        return 2.0;
      }
      return 2 * std::sin(theta / 2);
    }

  }  // namespace projections
}  // namespace sitedensity
