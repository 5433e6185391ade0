#pragma once

#include <Eigen/Dense>

using Eigen::Vector3d;

namespace sitedensity {
  namespace projections {
    // Mean earth radius used for every great-circle distance.
    constexpr double EARTH_RADIUS_KM = 6371.0;

    double deg_to_rad(double deg);

    /// @brief Great-circle distance in kilometers between two
    /// (lat, lon) points given in degrees, by the haversine formula.
    double haversine_km(double lat1, double lon1, double lat2, double lon2);

    /// @brief Project a (lat, lon) point in degrees onto the unit
    /// sphere.
    Vector3d unit_vector(double lat, double lon);

    /// @brief Straight-line distance through the unit sphere between
    /// two points separated by an arc of `arc_km` on the earth's
    /// surface. Arcs longer than half the circumference map to the
    /// diameter (2.0).
    double chord_length(double arc_km);
  }  // namespace projections
}  // namespace sitedensity
