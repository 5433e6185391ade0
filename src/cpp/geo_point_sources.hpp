#pragma once
#include <vector>

namespace sitedensity {
  // Column-wise storage of (lat, lon) points, in degrees.
  class GeoPointSources {
   public:
    std::vector<double> lat;
    std::vector<double> lon;

    GeoPointSources();
    GeoPointSources(std::vector<double> lat, std::vector<double> lon);
    GeoPointSources(int capacity);
    ~GeoPointSources();

    void add(double lat, double lon);
    int size() const;
  };
}  // namespace sitedensity
