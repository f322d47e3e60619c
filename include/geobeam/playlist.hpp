#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <geobeam/clock.hpp>
#include <geobeam/input.hpp>
#include <geobeam/process.hpp>
#include <geobeam/simulation.hpp>

namespace geobeam {

// Append-only destination for finished-run records.
class LogSink {
public:
  virtual ~LogSink() = default;
  // Throws LogWriteError.
  virtual void append(const std::string& record) = 0;
};

// Appends each record to a file, opening it per record.
class FileLogSink : public LogSink {
public:
  explicit FileLogSink(std::string path) : path_(std::move(path)) {}
  void append(const std::string& record) override;
  const std::string& path() const { return path_; }

private:
  std::string path_;
};

// Rows per second of broadcast in a track file.
inline constexpr int kTrackRowsPerSecond = 10;

// Record for a finished run:
//   <spec repr>
//   Start Time: YYYY-MM-DD,HH:MM:SS
//   [first floor(elapsed*10) lines of the track file, dynamic only]
//   End Time: YYYY-MM-DD,HH:MM:SS
//   <blank line>
// The excerpt always starts at the top of the track file. Throws
// LogWriteError if the track file cannot be read.
std::string format_run_record(const SimulationRun& run);

struct PlaylistOptions {
  BroadcasterConfig broadcaster{};
  std::chrono::milliseconds settle{SimulationRun::kDefaultSettle};
  std::chrono::milliseconds poll_interval{50};
};

// Runs simulations one at a time and lets the operator step through them.
class Playlist {
public:
  Playlist(std::vector<SimulationSpec> specs,
           ProcessLauncher& launcher,
           Clock& clock,
           LogSink& sink,
           PlaylistOptions opts = {});

  // Start at index 0 and loop until Quit or the last run finishes.
  void run(const InputSource& input);

  // Out-of-range indices are ignored. Otherwise ends and logs the current
  // run, then starts a fresh run at new_index.
  void switch_to(std::ptrdiff_t new_index);

  std::size_t size() const { return runs_.size(); }
  const std::optional<std::size_t>& current_index() const { return current_; }
  const SimulationRun& run_at(std::size_t i) const { return runs_.at(i); }
  const SimulationRun* current_run() const;

  std::size_t start_count() const { return starts_; }
  std::size_t log_failures() const { return log_failures_; }

private:
  void end_and_log_current_();
  void start_at_(std::size_t index);

  std::vector<SimulationRun> runs_;
  ProcessLauncher& launcher_;
  Clock& clock_;
  LogSink& sink_;
  PlaylistOptions opts_;
  std::optional<std::size_t> current_{};
  std::size_t starts_{0};
  std::size_t log_failures_{0};
};

} // namespace geobeam
