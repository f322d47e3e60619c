#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <geobeam/geo.hpp>

namespace geobeam {

// Ordered waypoints plus per-segment distance/duration.
// Invariant: distances.size() == durations.size() == points.size() - 1.
struct Route {
  std::vector<GeoPoint> points;
  std::vector<double> distances;  // meters
  std::vector<double> durations;  // seconds
  std::string polyline;           // opaque, passed through

  std::size_t segment_count() const { return distances.size(); }

  // Throws std::invalid_argument if the length invariant does not hold.
  void validate() const;

  // Attach ECEF to every point (altitudes must already be set).
  void attach_ecef();
};

// A route traversed at `speed` m/s and sampled at `frequency` Hz.
struct TimedRoute {
  Route route;
  double speed = 0.0;      // m/s, > 0
  double frequency = 0.0;  // Hz, > 0
};

// Average speeds in meters per second.
std::optional<double> transport_speed(const std::string& mode);

// Raw provider output before altitudes are known.
struct Directions {
  std::vector<GeoPoint> points;
  std::vector<double> distances_m;
  std::vector<double> durations_s;
  std::string polyline;
};

// Directions / elevation backend (HTTP mapping service in production).
class RouteProvider {
public:
  virtual ~RouteProvider() = default;
  virtual Directions directions(const GeoPoint& start, const GeoPoint& end) = 0;
  // One altitude (meters) per input point, same order.
  virtual std::vector<double> elevations(const std::vector<GeoPoint>& points) = 0;
};

// Throws NoRouteFoundError when the provider yields no points.
Route create_route(RouteProvider& provider, const GeoPoint& start, const GeoPoint& end);

// create_route() followed by upsample().
TimedRoute create_timed_route(RouteProvider& provider, const GeoPoint& start, const GeoPoint& end,
                              double speed, double frequency);

// Number of copies of the first point emitted before motion starts.
inline constexpr std::size_t kPrimingSamples = 10;

// Resample onto a uniform speed/frequency grid. Returns a fresh route; the
// input is not modified. Throws InvalidSegmentError when a segment is too
// short to hold at least one interpolated point, std::invalid_argument on a
// non-positive speed/frequency, a NaN or infinite segment distance, or a
// broken length invariant.
TimedRoute upsample(const TimedRoute& in);

// Points upsample() will produce: kPrimingSamples + sum(floor(d*f/v) - 1) + 1.
std::size_t upsampled_point_count(const std::vector<double>& distances, double speed, double frequency);

} // namespace geobeam
