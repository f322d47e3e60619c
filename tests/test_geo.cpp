#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <geobeam/geo.hpp>

using Catch::Approx;
using namespace geobeam;

TEST_CASE("to_ecef on the equator and prime meridian") {
  const Ecef e = to_ecef(0.0, 0.0, 0.0);
  REQUIRE(e.x == Approx(kWgs84SemiMajorM));
  REQUIRE(e.y == Approx(0.0).margin(1e-6));
  REQUIRE(e.z == Approx(0.0).margin(1e-6));
}

TEST_CASE("to_ecef at the north pole gives the polar radius") {
  const Ecef e = to_ecef(90.0, 0.0, 0.0);
  REQUIRE(e.x == Approx(0.0).margin(1e-3));
  REQUIRE(e.y == Approx(0.0).margin(1e-3));
  REQUIRE(e.z == Approx(6356752.3142).margin(1e-3));
}

TEST_CASE("to_ecef matches reference values for Mountain View") {
  const Ecef e = to_ecef(37.417747, -122.086086, 10.0);
  REQUIRE(e.x == Approx(-2694191.434).margin(0.01));
  REQUIRE(e.y == Approx(-4297227.005).margin(0.01));
  REQUIRE(e.z == Approx(3854323.703).margin(0.01));
}

TEST_CASE("to_ecef is pure") {
  const Ecef a = to_ecef(51.5, -0.12, 35.0);
  const Ecef b = to_ecef(51.5, -0.12, 35.0);
  REQUIRE(a.x == b.x);
  REQUIRE(a.y == b.y);
  REQUIRE(a.z == b.z);
}

TEST_CASE("altitude moves the point along the ellipsoid normal") {
  const Ecef lo = to_ecef(0.0, 90.0, 0.0);
  const Ecef hi = to_ecef(0.0, 90.0, 100.0);
  REQUIRE(hi.y - lo.y == Approx(100.0));
  REQUIRE(hi.x == Approx(lo.x).margin(1e-6));
}

TEST_CASE("ecef_to_geodetic inverts to_ecef") {
  double lat = 0.0, lon = 0.0, alt = 0.0;
  ecef_to_geodetic(to_ecef(37.417747, -122.086086, 25.0), lat, lon, alt);
  REQUIRE(lat == Approx(37.417747).margin(1e-9));
  REQUIRE(lon == Approx(-122.086086).margin(1e-9));
  REQUIRE(alt == Approx(25.0).margin(1e-4));
}

TEST_CASE("ecef_to_enu of a point north of the origin") {
  const double lat0 = 37.0, lon0 = -122.0;
  const Ecef origin = to_ecef(lat0, lon0, 0.0);
  const Ecef north = to_ecef(lat0 + 0.001, lon0, 0.0);
  const Enu e = ecef_to_enu(north, origin, lat0, lon0);
  REQUIRE(e.north == Approx(111.0).margin(1.0));
  REQUIRE(e.east == Approx(0.0).margin(1e-3));
  REQUIRE(e.up == Approx(0.0).margin(0.01));
}

TEST_CASE("haversine_m: one degree of latitude") {
  REQUIRE(haversine_m(0.0, 0.0, 1.0, 0.0) == Approx(111195.0).margin(5.0));
  REQUIRE(haversine_m(10.0, 20.0, 10.0, 20.0) == Approx(0.0));
}

TEST_CASE("GeoPoint keeps ECEF derived from its coordinates") {
  GeoPoint p(37.0, -122.0);
  REQUIRE_FALSE(p.altitude().has_value());
  REQUIRE_FALSE(p.ecef().has_value());

  p.set_altitude(12.0);
  p.attach_ecef();
  REQUIRE(p.ecef().has_value());
  const Ecef expect = to_ecef(37.0, -122.0, 12.0);
  REQUIRE(p.ecef()->x == Approx(expect.x));

  // New altitude invalidates the old ECEF
  p.set_altitude(50.0);
  REQUIRE_FALSE(p.ecef().has_value());
}
