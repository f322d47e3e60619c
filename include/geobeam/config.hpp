#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <geobeam/simulation.hpp>

namespace geobeam {

// Waypoint file to be turned into a dynamic track before playback.
struct RouteJob {
  std::string waypoints_path;
  double speed = 0.0;      // m/s
  double frequency = 10.0; // Hz
  std::string output_path; // track file; also the simulation's track path
};

struct PlaylistEntry {
  SimulationSpec spec;
  std::optional<RouteJob> route;  // set for `type: route`
};

struct PlaylistConfig {
  BroadcasterConfig broadcaster{};
  std::chrono::milliseconds settle{1000};
  std::chrono::milliseconds poll_interval{50};
  std::string log_dir = "simulation_logs";
  std::string log_level = "info";
  std::vector<PlaylistEntry> entries;

  std::vector<SimulationSpec> specs() const;
};

// Parse YAML text. Relative file paths resolve against base_dir and are
// made absolute. Throws ConfigError.
PlaylistConfig playlist_config_from_yaml(const std::string& text, const std::string& base_dir);

// Throws ConfigError if the file cannot be read or is invalid.
PlaylistConfig load_playlist_config(const std::string& path);

// Write the track file of every route entry. Returns the number written.
std::size_t generate_route_tracks(const PlaylistConfig& cfg);

} // namespace geobeam
