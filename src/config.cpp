#include <geobeam/config.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>
#include <geobeam/errors.hpp>
#include <geobeam/logging.hpp>
#include <geobeam/route.hpp>
#include <geobeam/track_io.hpp>
#include <geobeam/waypoints.hpp>

namespace geobeam {

namespace fs = std::filesystem;

std::vector<SimulationSpec> PlaylistConfig::specs() const {
  std::vector<SimulationSpec> out;
  out.reserve(entries.size());
  for (const auto& e : entries) out.push_back(e.spec);
  return out;
}

static std::string resolve_(const std::string& p, const std::string& base_dir) {
  fs::path path(p);
  if (path.is_relative() && !base_dir.empty()) path = fs::path(base_dir) / path;
  return fs::absolute(path).lexically_normal().string();
}

static std::string where_(std::size_t i) {
  return "simulations[" + std::to_string(i) + "]";
}

template <class T>
static T required_(const YAML::Node& n, const char* key, const std::string& where) {
  const YAML::Node v = n[key];
  if (!v) throw ConfigError(where + ": missing '" + key + "'");
  try {
    return v.as<T>();
  } catch (const YAML::Exception&) {
    throw ConfigError(where + ": bad value for '" + key + "'");
  }
}

template <class T>
static std::optional<T> optional_(const YAML::Node& n, const char* key, const std::string& where) {
  const YAML::Node v = n[key];
  if (!v || v.IsNull()) return std::nullopt;
  try {
    return v.as<T>();
  } catch (const YAML::Exception&) {
    throw ConfigError(where + ": bad value for '" + key + "'");
  }
}

// Number in m/s or a transport preset name.
static double parse_speed_(const YAML::Node& n, const std::string& where) {
  const YAML::Node v = n["speed"];
  if (!v) throw ConfigError(where + ": missing 'speed'");
  if (!v.IsScalar()) throw ConfigError(where + ": bad value for 'speed'");
  const std::string text = v.as<std::string>();
  if (auto preset = transport_speed(text)) return *preset;
  try {
    const double s = v.as<double>();
    if (s > 0.0) return s;
  } catch (const YAML::Exception&) {
  }
  throw ConfigError(where + ": speed must be positive or one of walking/running/biking");
}

static PlaylistEntry parse_entry_(const YAML::Node& n, std::size_t i, const std::string& base_dir) {
  const std::string where = where_(i);
  if (!n.IsMap()) throw ConfigError(where + ": expected a mapping");

  PlaylistEntry e;
  e.spec.run_duration = optional_<int>(n, "run_duration", where);
  e.spec.gain = optional_<double>(n, "gain", where);

  const auto type = required_<std::string>(n, "type", where);
  if (type == "static") {
    StaticLocation s;
    s.latitude = required_<double>(n, "latitude", where);
    s.longitude = required_<double>(n, "longitude", where);
    if (s.latitude < -90.0 || s.latitude > 90.0 || s.longitude < -180.0 || s.longitude > 180.0) {
      throw ConfigError(where + ": latitude/longitude out of range");
    }
    e.spec.mode = s;
  } else if (type == "dynamic") {
    e.spec.mode = DynamicTrack{resolve_(required_<std::string>(n, "track_file", where), base_dir)};
  } else if (type == "route") {
    RouteJob job;
    job.waypoints_path = resolve_(required_<std::string>(n, "waypoints", where), base_dir);
    job.speed = parse_speed_(n, where);
    job.frequency = optional_<double>(n, "frequency", where).value_or(10.0);
    if (!(job.frequency > 0.0)) throw ConfigError(where + ": frequency must be positive");
    job.output_path = resolve_(required_<std::string>(n, "output", where), base_dir);
    e.spec.mode = DynamicTrack{job.output_path};
    e.route = job;
  } else {
    throw ConfigError(where + ": unknown type '" + type + "'");
  }
  return e;
}

PlaylistConfig playlist_config_from_yaml(const std::string& text, const std::string& base_dir) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("YAML parse error: ") + e.what());
  }
  if (!root.IsMap()) throw ConfigError("playlist config must be a mapping");

  PlaylistConfig cfg;
  if (const auto b = root["broadcaster"]) {
    cfg.broadcaster.program = optional_<std::string>(b, "program", "broadcaster").value_or(cfg.broadcaster.program);
    if (auto wd = optional_<std::string>(b, "working_dir", "broadcaster")) {
      cfg.broadcaster.working_dir = resolve_(*wd, base_dir);
    }
  }
  if (auto ms = optional_<int>(root, "shutdown_settle_ms", "config")) {
    if (*ms < 0) throw ConfigError("config: shutdown_settle_ms must be >= 0");
    cfg.settle = std::chrono::milliseconds(*ms);
  }
  if (auto ms = optional_<int>(root, "poll_interval_ms", "config")) {
    if (*ms < 0) throw ConfigError("config: poll_interval_ms must be >= 0");
    cfg.poll_interval = std::chrono::milliseconds(*ms);
  }
  if (auto d = optional_<std::string>(root, "log_dir", "config")) cfg.log_dir = resolve_(*d, base_dir);
  if (auto l = optional_<std::string>(root, "log_level", "config")) {
    if (!is_log_level(*l)) throw ConfigError("config: unknown log_level '" + *l + "'");
    cfg.log_level = *l;
  }

  const auto sims = root["simulations"];
  if (!sims || !sims.IsSequence() || sims.size() == 0) {
    throw ConfigError("config: 'simulations' must be a non-empty list");
  }
  for (std::size_t i = 0; i < sims.size(); ++i) {
    cfg.entries.push_back(parse_entry_(sims[i], i, base_dir));
  }
  return cfg;
}

PlaylistConfig load_playlist_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) throw ConfigError("cannot read playlist config: " + path);
  std::ostringstream ss;
  ss << f.rdbuf();
  return playlist_config_from_yaml(ss.str(), fs::path(path).parent_path().string());
}

std::size_t generate_route_tracks(const PlaylistConfig& cfg) {
  std::size_t n = 0;
  for (const auto& e : cfg.entries) {
    if (!e.route) continue;
    const auto& job = *e.route;
    const TimedRoute tr = timed_route_from_waypoint_file(job.waypoints_path, job.speed, job.frequency);
    write_timed_route_file(job.output_path, tr);
    log()->info("Wrote {} track points to {}", tr.route.points.size(), job.output_path);
    ++n;
  }
  return n;
}

} // namespace geobeam
