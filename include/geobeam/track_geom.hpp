#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <vector>
#include <geobeam/geo.hpp>
#include <geobeam/track_io.hpp>

namespace geobeam {

struct Vec2 {
  double x{};  // east (m)
  double y{};  // north (m)
};

// A broadcaster track flattened onto the east/north plane of its first
// sample, parameterized by time.
class LocalTrack {
public:
  LocalTrack() = default;

  // Samples without a time column are spaced at 1/default_frequency.
  static LocalTrack FromSamples(const std::vector<TrackSample>& samples, double default_frequency = 10.0) {
    LocalTrack t;
    if (samples.empty()) return t;

    const Ecef origin{samples.front().x, samples.front().y, samples.front().z};
    double lat = 0.0, lon = 0.0, alt = 0.0;
    ecef_to_geodetic(origin, lat, lon, alt);
    t.origin_lat_ = lat;
    t.origin_lon_ = lon;

    const double dt = default_frequency > 0.0 ? 1.0 / default_frequency : 0.1;
    t.pts_.reserve(samples.size());
    t.times_.reserve(samples.size());
    for (std::size_t i = 0; i < samples.size(); ++i) {
      const auto& s = samples[i];
      const Enu e = ecef_to_enu(Ecef{s.x, s.y, s.z}, origin, lat, lon);
      t.pts_.push_back({e.east, e.north});
      t.times_.push_back(s.time ? *s.time : static_cast<double>(i) * dt);
    }
    t.build_cumulative_();
    return t;
  }

  const std::vector<Vec2>& points() const { return pts_; }
  bool empty() const { return pts_.empty(); }
  double duration() const { return times_.empty() ? 0.0 : times_.back() - times_.front(); }
  double length() const { return length_; }
  double origin_latitude() const { return origin_lat_; }
  double origin_longitude() const { return origin_lon_; }

  // Position and heading at time t (clamped to the track's time span).
  void sample_pose(double t, double& x, double& y, double& heading_rad) const {
    if (pts_.empty()) { x = y = heading_rad = 0.0; return; }
    if (pts_.size() == 1 || t <= times_.front()) {
      x = pts_.front().x; y = pts_.front().y; heading_rad = heading_at_(1);
      return;
    }
    if (t >= times_.back()) {
      x = pts_.back().x; y = pts_.back().y; heading_rad = heading_at_(pts_.size() - 1);
      return;
    }

    auto it = std::upper_bound(times_.begin(), times_.end(), t);
    std::size_t i1 = std::clamp<std::size_t>(std::distance(times_.begin(), it), 1, pts_.size() - 1);
    std::size_t i0 = i1 - 1;

    const double span = times_[i1] - times_[i0];
    const double u = span > 0.0 ? (t - times_[i0]) / span : 0.0;
    x = pts_[i0].x + (pts_[i1].x - pts_[i0].x) * u;
    y = pts_[i0].y + (pts_[i1].y - pts_[i0].y) * u;
    heading_rad = heading_at_(i1);
  }

  // Distance travelled along the polyline up to sample index i.
  double distance_at(std::size_t i) const {
    return cum_.empty() ? 0.0 : cum_[std::min(i, cum_.size() - 1)];
  }

private:
  // Heading of the nearest moving segment ending at or after i (priming
  // samples repeat a point and have no direction of their own).
  double heading_at_(std::size_t i) const {
    for (std::size_t k = std::max<std::size_t>(i, 1); k < pts_.size(); ++k) {
      const double dx = pts_[k].x - pts_[k-1].x;
      const double dy = pts_[k].y - pts_[k-1].y;
      if (dx != 0.0 || dy != 0.0) return std::atan2(dy, dx);
    }
    return 0.0;
  }

  void build_cumulative_() {
    cum_.assign(pts_.size(), 0.0);
    for (std::size_t i = 1; i < pts_.size(); ++i) {
      const double dx = pts_[i].x - pts_[i-1].x;
      const double dy = pts_[i].y - pts_[i-1].y;
      cum_[i] = cum_[i-1] + std::sqrt(dx*dx + dy*dy);
    }
    length_ = cum_.empty() ? 0.0 : cum_.back();
  }

  std::vector<Vec2> pts_;
  std::vector<double> times_;
  std::vector<double> cum_;
  double length_{0.0};
  double origin_lat_{0.0};
  double origin_lon_{0.0};
};

} // namespace geobeam
