#include <geobeam/route.hpp>
#include <cmath>
#include <stdexcept>
#include <geobeam/errors.hpp>

namespace geobeam {

static void check_rate_(double speed, double frequency) {
  if (!(speed > 0.0) || !(frequency > 0.0)) {
    throw std::invalid_argument("speed and frequency must be positive");
  }
}

static long points_needed_(double distance_m, double points_per_meter) {
  if (!std::isfinite(distance_m)) {
    throw std::invalid_argument("segment distance must be finite");
  }
  return static_cast<long>(std::floor(distance_m * points_per_meter)) - 1;
}

static inline double lerp(double a, double b, double t) { return a + (b - a) * t; }

std::size_t upsampled_point_count(const std::vector<double>& distances, double speed, double frequency) {
  check_rate_(speed, frequency);
  const double ppm = frequency / speed;
  std::size_t n = kPrimingSamples + 1;
  for (std::size_t i = 0; i < distances.size(); ++i) {
    const long k = points_needed_(distances[i], ppm);
    if (k < 1) throw InvalidSegmentError(i, distances[i], k);
    n += static_cast<std::size_t>(k);
  }
  return n;
}

TimedRoute upsample(const TimedRoute& in) {
  check_rate_(in.speed, in.frequency);
  const Route& src = in.route;
  src.validate();

  const double points_per_meter = in.frequency / in.speed;

  std::vector<GeoPoint> out;
  out.reserve(upsampled_point_count(src.distances, in.speed, in.frequency));

  // Priming: hold the first position while the broadcaster warms up.
  const GeoPoint first = src.points.front().with_ecef();
  out.insert(out.end(), kPrimingSamples, first);

  for (std::size_t i = 0; i < src.segment_count(); ++i) {
    const GeoPoint& S = src.points[i];
    const GeoPoint& E = src.points[i + 1];
    const long needed = points_needed_(src.distances[i], points_per_meter);
    if (needed < 1) throw InvalidSegmentError(i, src.distances[i], needed);

    const double s_alt = S.altitude().value_or(0.0);
    const double e_alt = E.altitude().value_or(0.0);
    for (long j = 0; j < needed; ++j) {
      const double t = static_cast<double>(j) / static_cast<double>(needed);
      GeoPoint p(lerp(S.latitude(), E.latitude(), t),
                 lerp(S.longitude(), E.longitude(), t),
                 lerp(s_alt, e_alt, t));
      p.attach_ecef();
      out.push_back(p);
    }
  }
  out.push_back(src.points.back().with_ecef());

  TimedRoute result;
  result.speed = in.speed;
  result.frequency = in.frequency;
  result.route.polyline = src.polyline;
  const std::size_t segments = out.size() - 1;
  result.route.distances.assign(segments, in.speed / in.frequency);
  result.route.durations.assign(segments, 1.0 / in.frequency);
  result.route.points = std::move(out);
  return result;
}

} // namespace geobeam
