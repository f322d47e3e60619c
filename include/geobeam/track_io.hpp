#pragma once
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <geobeam/route.hpp>

namespace geobeam {

// One row of a broadcaster track file.
struct TrackSample {
  std::optional<double> time;  // seconds; only in timed tracks
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
};

// Rows: x,y,z (ECEF meters). Points without ECEF get it computed on the fly.
void write_route(std::ostream& out, const Route& route);

// Rows: time,x,y,z with time = i/frequency formatted to one decimal.
void write_timed_route(std::ostream& out, const TimedRoute& route);

// Filesystem wrappers; throw LogWriteError if the file cannot be written.
void write_route_file(const std::string& path, const Route& route);
void write_timed_route_file(const std::string& path, const TimedRoute& route);

// Parses either row shape; malformed rows are skipped.
std::vector<TrackSample> read_track_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<TrackSample>> load_track_file(const std::string& path);

} // namespace geobeam
