#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace geobeam {

// Base for every failure the library reports by exception.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Route provider returned no usable route.
class NoRouteFoundError : public Error {
public:
  using Error::Error;
};

// A segment is too short for the requested sample density.
class InvalidSegmentError : public Error {
public:
  InvalidSegmentError(std::size_t segment, double distance_m, long points_needed)
    : Error("segment " + std::to_string(segment) + " (" + std::to_string(distance_m) +
            " m) yields " + std::to_string(points_needed) + " interpolated points"),
      segment_(segment), points_needed_(points_needed) {}

  std::size_t segment() const { return segment_; }
  long points_needed() const { return points_needed_; }

private:
  std::size_t segment_;
  long points_needed_;
};

// The broadcaster child process could not be started.
class LaunchError : public Error {
public:
  using Error::Error;
};

// Track or simulation log file could not be read/written.
class LogWriteError : public Error {
public:
  using Error::Error;
};

// A waypoint file is not a supported type or is not well-formed.
class TrackFileError : public Error {
public:
  using Error::Error;
};

class ConfigError : public Error {
public:
  using Error::Error;
};

} // namespace geobeam
