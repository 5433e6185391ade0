#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

#include <Eigen/Dense>

#include "projections.hpp"

using Catch::Approx;
using Eigen::Vector3d;

namespace sp = sitedensity::projections;

TEST_CASE("haversine distance of a point to itself is zero", "[haversine]") {
  REQUIRE(sp::haversine_km(51.5, -0.12, 51.5, -0.12) == 0.0);
}

TEST_CASE("haversine distance along the equator", "[haversine]") {
  // One degree of longitude at the equator is R * pi / 180.
  double expected = sp::EARTH_RADIUS_KM * M_PI / 180.0;
  REQUIRE(sp::haversine_km(0.0, 0.0, 0.0, 1.0) == Approx(expected).epsilon(1e-12));
  REQUIRE(sp::haversine_km(0.0, 0.0, 1.0, 0.0) == Approx(expected).epsilon(1e-12));
}

TEST_CASE("haversine distance is symmetric", "[haversine]") {
  double ab = sp::haversine_km(40.7128, -74.0060, 34.0522, -118.2437);
  double ba = sp::haversine_km(34.0522, -118.2437, 40.7128, -74.0060);
  REQUIRE(ab == Approx(ba));
  // New York to Los Angeles on a 6371 km sphere.
  REQUIRE(ab == Approx(3935.75).epsilon(1e-3));
}

TEST_CASE("haversine distance across the antimeridian", "[haversine]") {
  double d = sp::haversine_km(0.0, 179.9995, 0.0, -179.9995);
  REQUIRE(d == Approx(sp::EARTH_RADIUS_KM * 0.001 * M_PI / 180.0).epsilon(1e-6));
}

TEST_CASE("haversine distance between antipodes is half the circumference", "[haversine]") {
  double d = sp::haversine_km(90.0, 0.0, -90.0, 0.0);
  REQUIRE(d == Approx(M_PI * sp::EARTH_RADIUS_KM));
  REQUIRE_FALSE(std::isnan(sp::haversine_km(0.0, 0.0, 0.0, 180.0)));
}

TEST_CASE("unit vectors", "[unit_vector]") {
  REQUIRE(sp::unit_vector(0.0, 0.0).isApprox(Vector3d(1.0, 0.0, 0.0)));
  REQUIRE(sp::unit_vector(0.0, 90.0).isApprox(Vector3d(0.0, 1.0, 0.0)));
  REQUIRE(sp::unit_vector(90.0, 0.0).isApprox(Vector3d(0.0, 0.0, 1.0)));
  REQUIRE(sp::unit_vector(-33.9, 151.2).norm() == Approx(1.0));
}

TEST_CASE("chord length matches the straight-line distance of unit vectors", "[chord_length]") {
  Vector3d a = sp::unit_vector(10.0, 20.0);
  Vector3d b = sp::unit_vector(10.5, 21.0);
  double arc = sp::haversine_km(10.0, 20.0, 10.5, 21.0);
  REQUIRE(sp::chord_length(arc) == Approx((a - b).norm()).epsilon(1e-9));

  REQUIRE(sp::chord_length(0.0) == 0.0);
  REQUIRE(sp::chord_length(1e6) == 2.0);
  REQUIRE_THROWS_AS(sp::chord_length(-1.0), std::invalid_argument);
}
