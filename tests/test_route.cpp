#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <geobeam/errors.hpp>
#include <geobeam/route.hpp>

using Catch::Approx;
using namespace geobeam;

namespace {

// Canned directions/elevation backend.
struct FakeProvider : RouteProvider {
  Directions canned;
  std::vector<double> alts;
  int direction_calls = 0;
  int elevation_calls = 0;

  Directions directions(const GeoPoint&, const GeoPoint&) override {
    ++direction_calls;
    return canned;
  }
  std::vector<double> elevations(const std::vector<GeoPoint>& points) override {
    ++elevation_calls;
    REQUIRE(points.size() == canned.points.size());
    return alts;
  }
};

FakeProvider two_leg_provider() {
  FakeProvider p;
  p.canned.points = {GeoPoint(37.0, -122.0), GeoPoint(37.0005, -122.0), GeoPoint(37.0005, -122.001)};
  p.canned.distances_m = {55.6, 88.7};
  p.canned.durations_s = {40.0, 63.0};
  p.canned.polyline = "_p~iF~ps|U_ulLnnqC";
  p.alts = {12.0, 14.5, 15.0};
  return p;
}

} // namespace

TEST_CASE("transport_speed presets") {
  REQUIRE(transport_speed("walking").value() == Approx(1.4));
  REQUIRE(transport_speed("running").value() == Approx(2.0));
  REQUIRE(transport_speed("biking").value() == Approx(3.0));
  REQUIRE(transport_speed("Walking").has_value());
  REQUIRE_FALSE(transport_speed("driving").has_value());
  REQUIRE_FALSE(transport_speed("").has_value());
}

TEST_CASE("create_route attaches altitudes and ECEF") {
  FakeProvider p = two_leg_provider();
  const Route r = create_route(p, GeoPoint(37.0, -122.0), GeoPoint(37.0005, -122.001));

  REQUIRE(p.direction_calls == 1);
  REQUIRE(p.elevation_calls == 1);
  REQUIRE(r.points.size() == 3);
  REQUIRE(r.segment_count() == 2);
  REQUIRE(r.distances[1] == Approx(88.7));
  REQUIRE(r.durations[0] == Approx(40.0));
  REQUIRE(r.polyline == "_p~iF~ps|U_ulLnnqC");

  for (std::size_t i = 0; i < r.points.size(); ++i) {
    REQUIRE(r.points[i].altitude().value() == Approx(p.alts[i]));
    REQUIRE(r.points[i].ecef().has_value());
  }
  const Ecef e = to_ecef(37.0005, -122.0, 14.5);
  REQUIRE(r.points[1].ecef()->y == Approx(e.y));
}

TEST_CASE("create_route with no points raises NoRouteFoundError") {
  FakeProvider p;
  REQUIRE_THROWS_AS(create_route(p, GeoPoint(0.0, 0.0), GeoPoint(1.0, 1.0)), NoRouteFoundError);
  // Elevation lookup is never attempted
  REQUIRE(p.elevation_calls == 0);
}

TEST_CASE("create_route rejects a mismatched elevation response") {
  FakeProvider p = two_leg_provider();
  p.alts.pop_back();
  REQUIRE_THROWS_AS(create_route(p, GeoPoint(37.0, -122.0), GeoPoint(37.0005, -122.001)),
                    std::invalid_argument);
}

TEST_CASE("create_route rejects directions breaking the length invariant") {
  FakeProvider p = two_leg_provider();
  p.canned.durations_s.pop_back();
  REQUIRE_THROWS_AS(create_route(p, GeoPoint(37.0, -122.0), GeoPoint(37.0005, -122.001)),
                    std::invalid_argument);
}

TEST_CASE("create_timed_route upsamples the provider route") {
  FakeProvider p = two_leg_provider();
  const TimedRoute tr = create_timed_route(p, GeoPoint(37.0, -122.0), GeoPoint(37.0005, -122.001), 1.4, 10.0);
  REQUIRE(tr.speed == Approx(1.4));
  REQUIRE(tr.frequency == Approx(10.0));
  REQUIRE(tr.route.points.size() == upsampled_point_count({55.6, 88.7}, 1.4, 10.0));
  REQUIRE(tr.route.points.front().altitude().value() == Approx(12.0));
  REQUIRE(tr.route.points.back().altitude().value() == Approx(15.0));
}

TEST_CASE("Route::validate") {
  Route r;
  REQUIRE_THROWS_AS(r.validate(), std::invalid_argument);
  r.points = {GeoPoint(1.0, 2.0)};
  REQUIRE_NOTHROW(r.validate());
  r.points.push_back(GeoPoint(1.0, 2.1));
  REQUIRE_THROWS_AS(r.validate(), std::invalid_argument);
  r.distances = {10.0};
  r.durations = {7.0};
  REQUIRE_NOTHROW(r.validate());
}
