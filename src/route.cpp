#include <geobeam/route.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <geobeam/errors.hpp>

namespace geobeam {

void Route::validate() const {
  if (points.empty()) {
    throw std::invalid_argument("route has no points");
  }
  if (distances.size() + 1 != points.size() || durations.size() != distances.size()) {
    throw std::invalid_argument("route has " + std::to_string(points.size()) + " points but " +
                                std::to_string(distances.size()) + " distances and " +
                                std::to_string(durations.size()) + " durations");
  }
}

void Route::attach_ecef() {
  for (auto& p : points) p.attach_ecef();
}

static inline std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::optional<double> transport_speed(const std::string& mode) {
  const auto m = lower(mode);
  if (m == "walking") return 1.4;
  if (m == "running") return 2.0;
  if (m == "biking")  return 3.0;
  return std::nullopt;
}

Route create_route(RouteProvider& provider, const GeoPoint& start, const GeoPoint& end) {
  Directions d = provider.directions(start, end);
  if (d.points.empty()) {
    throw NoRouteFoundError("no routes between start and end points, try new points");
  }

  Route r;
  r.points = std::move(d.points);
  r.distances = std::move(d.distances_m);
  r.durations = std::move(d.durations_s);
  r.polyline = std::move(d.polyline);
  r.validate();

  const auto alts = provider.elevations(r.points);
  if (alts.size() != r.points.size()) {
    throw std::invalid_argument("elevation count " + std::to_string(alts.size()) +
                                " does not match " + std::to_string(r.points.size()) + " points");
  }
  for (std::size_t i = 0; i < r.points.size(); ++i) {
    r.points[i].set_altitude(alts[i]);
  }
  r.attach_ecef();
  return r;
}

TimedRoute create_timed_route(RouteProvider& provider, const GeoPoint& start, const GeoPoint& end,
                              double speed, double frequency) {
  TimedRoute tr{create_route(provider, start, end), speed, frequency};
  return upsample(tr);
}

} // namespace geobeam
