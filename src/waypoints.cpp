#include <geobeam/waypoints.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <geobeam/errors.hpp>

namespace geobeam {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  // No quoted fields in waypoint files.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.empty()) return false;
  const auto& c = cols[0];
  return c == "lat" || c == "latitude" || c == "Lat" || c == "Latitude";
}

static std::optional<double> to_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  try {
    std::size_t idx = 0;
    const double v = std::stod(s, &idx);
    if (idx != s.size()) return std::nullopt;
    return v;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::vector<GeoPoint> waypoints_from_csv_stream(std::istream& in) {
  std::vector<GeoPoint> out;
  std::string line;
  bool header_consumed = false;
  double prev_alt = 0.0;

  while (std::getline(in, line)) {
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    const auto cols = split_csv_line(raw);
    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }
    if (cols.size() < 2) continue;

    const auto lat = to_double(cols[0]);
    const auto lon = to_double(cols[1]);
    if (!lat || !lon) continue;
    if (*lat < -90.0 || *lat > 90.0 || *lon < -180.0 || *lon > 180.0) continue;

    double alt = prev_alt;
    if (cols.size() >= 3 && !cols[2].empty()) {
      const auto a = to_double(cols[2]);
      if (!a) continue;
      alt = *a;
    }
    prev_alt = alt;
    out.emplace_back(*lat, *lon, alt);
  }
  return out;
}

std::optional<std::vector<GeoPoint>> load_waypoints_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return waypoints_from_csv_stream(f);
}

std::optional<std::vector<GeoPoint>> load_waypoints(const std::string& path) {
  return is_gpx_path(path) ? load_waypoints_gpx(path) : load_waypoints_csv(path);
}

Route route_from_waypoints(const std::vector<GeoPoint>& points, double nominal_speed) {
  if (points.empty()) throw NoRouteFoundError("waypoint list is empty");
  if (!(nominal_speed > 0.0)) throw std::invalid_argument("nominal speed must be positive");

  Route r;
  r.points = points;
  r.distances.reserve(points.size() - 1);
  r.durations.reserve(points.size() - 1);
  for (std::size_t i = 1; i < points.size(); ++i) {
    const auto& a = points[i - 1];
    const auto& b = points[i];
    const double d = haversine_m(a.latitude(), a.longitude(), b.latitude(), b.longitude());
    r.distances.push_back(d);
    r.durations.push_back(d / nominal_speed);
  }
  r.attach_ecef();
  return r;
}

TimedRoute timed_route_from_waypoint_file(const std::string& path, double speed, double frequency) {
  const auto pts = load_waypoints(path);
  if (!pts) throw NoRouteFoundError("cannot open waypoint file: " + path);
  if (pts->empty()) throw NoRouteFoundError("no waypoints in " + path);
  TimedRoute tr{route_from_waypoints(*pts, speed), speed, frequency};
  return upsample(tr);
}

} // namespace geobeam
