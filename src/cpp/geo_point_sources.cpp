#include "geo_point_sources.hpp"

#include <stdexcept>

using sitedensity::GeoPointSources;

GeoPointSources::GeoPointSources() {}

GeoPointSources::GeoPointSources(std::vector<double> lat, std::vector<double> lon) {
  if (lat.size() != lon.size()) {
    throw std::invalid_argument("GeoPointSources: lat and lon must have the same length");
  }
  this->lat = lat;
  this->lon = lon;
}

GeoPointSources::GeoPointSources(int capacity) {
  this->lat.reserve(capacity);
  this->lon.reserve(capacity);
}

GeoPointSources::~GeoPointSources() {}

void GeoPointSources::add(double lat, double lon) {
  this->lat.push_back(lat);
  this->lon.push_back(lon);
}

int GeoPointSources::size() const { return this->lat.size(); }
