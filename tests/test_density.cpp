#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "density.hpp"
#include "geo_point_sources.hpp"
#include "kdtree.hpp"
#include "testutils.hpp"

using Catch::Approx;
using sitedensity::GeoPointSources;

namespace sdd = sitedensity::density;

TEST_CASE("two sites at the same coordinates", "[density]") {
  GeoPointSources gps({52.52, 52.52}, {13.405, 13.405});
  std::vector<double> density = sdd::estimate_density(gps, 2.0);

  REQUIRE(density.size() == 2);
  REQUIRE(density[0] == Approx(1.0 / (M_PI * 4.0)));
  REQUIRE(density[1] == density[0]);
}

TEST_CASE("an isolated site has zero density", "[density]") {
  GeoPointSources gps({0.0, 0.0, 10.0}, {0.0, 0.001, 10.0});
  std::vector<double> density = sdd::estimate_density(gps, 2.0);

  REQUIRE(density[0] > 0);
  REQUIRE(density[1] > 0);
  REQUIRE(density[2] == 0.0);
}

TEST_CASE("density counts every neighbor within the radius", "[density]") {
  GeoPointSources gps = random_points(500, -1.0, 1.0, -1.0, 1.0, 5);
  sitedensity::kdtree::KDTree tree = sitedensity::kdtree::build_kdtree(gps);
  double radius_km = 10.0;

  sdd::CountsTable table(tree, radius_km);
  std::vector<double> density = sdd::estimate_density(tree, radius_km);

  REQUIRE(table.counts.size() == 500);
  for (int i = 0; i < gps.size(); i++) {
    int expected = brute_force_radius(gps, gps.lat[i], gps.lon[i], radius_km).size();
    REQUIRE(table.counts[i] == expected);
    REQUIRE(density[i] >= 0);
    REQUIRE(density[i] == Approx((expected - 1) / sdd::disk_area_km2(radius_km)));
  }
}

TEST_CASE("empty input gives an empty result", "[density]") {
  REQUIRE(sdd::estimate_density(GeoPointSources(), 2.0).empty());
}

TEST_CASE("radius must be positive", "[density]") {
  GeoPointSources gps({0.0}, {0.0});
  REQUIRE_THROWS_AS(sdd::estimate_density(gps, 0.0), std::invalid_argument);
  REQUIRE_THROWS_AS(sdd::estimate_density(gps, -2.0), std::invalid_argument);
}
