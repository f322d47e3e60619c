#include <geobeam/track_io.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>
#include <geobeam/errors.hpp>

namespace geobeam {

static Ecef ecef_of(const GeoPoint& p) {
  if (p.ecef()) return *p.ecef();
  return to_ecef(p.latitude(), p.longitude(), p.altitude().value_or(0.0));
}

void write_route(std::ostream& out, const Route& route) {
  for (const auto& p : route.points) {
    const Ecef e = ecef_of(p);
    out << fmt::format("{},{},{}\n", e.x, e.y, e.z);
  }
}

void write_timed_route(std::ostream& out, const TimedRoute& route) {
  if (!(route.frequency > 0.0)) throw std::invalid_argument("frequency must be positive");
  const auto& pts = route.route.points;
  for (std::size_t i = 0; i < pts.size(); ++i) {
    const Ecef e = ecef_of(pts[i]);
    const double t = static_cast<double>(i) / route.frequency;
    out << fmt::format("{:.1f},{},{},{}\n", t, e.x, e.y, e.z);
  }
}

template <class Fn>
static void write_file_(const std::string& path, Fn&& fn) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) throw LogWriteError("cannot open track file for writing: " + path);
  fn(f);
  f.flush();
  if (!f) throw LogWriteError("failed writing track file: " + path);
}

void write_route_file(const std::string& path, const Route& route) {
  write_file_(path, [&](std::ostream& o){ write_route(o, route); });
}

void write_timed_route_file(const std::string& path, const TimedRoute& route) {
  write_file_(path, [&](std::ostream& o){ write_timed_route(o, route); });
}

static std::optional<double> parse_field_(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
  if (b == e) return std::nullopt;
  const std::string f = s.substr(b, e - b);
  try {
    std::size_t idx = 0;
    const double v = std::stod(f, &idx);
    if (idx != f.size()) return std::nullopt;
    return v;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::vector<TrackSample> read_track_stream(std::istream& in) {
  std::vector<TrackSample> out;
  std::string line;
  while (std::getline(in, line)) {
    std::vector<double> v;
    std::size_t start = 0;
    bool ok = true;
    while (ok) {
      const auto comma = line.find(',', start);
      const auto field = line.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
      const auto d = parse_field_(field);
      if (!d) { ok = false; break; }
      v.push_back(*d);
      if (comma == std::string::npos) break;
      start = comma + 1;
    }
    if (!ok) continue;

    TrackSample s;
    if (v.size() == 3) {
      s.x = v[0]; s.y = v[1]; s.z = v[2];
    } else if (v.size() == 4) {
      s.time = v[0]; s.x = v[1]; s.y = v[2]; s.z = v[3];
    } else {
      continue;
    }
    out.push_back(s);
  }
  return out;
}

std::optional<std::vector<TrackSample>> load_track_file(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return read_track_stream(f);
}

} // namespace geobeam
