#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <utility>
#include <vector>
#include <geobeam/clock.hpp>
#include <geobeam/process.hpp>

namespace geobeam {

// Broadcast a fixed location.
struct StaticLocation {
  double latitude = 0.0;   // decimal degrees
  double longitude = 0.0;  // decimal degrees
};

// Broadcast a motion track file (time,x,y,z rows).
struct DynamicTrack {
  std::string track_file_path;
};

struct SimulationSpec {
  std::variant<StaticLocation, DynamicTrack> mode;
  std::optional<int> run_duration;  // seconds
  std::optional<double> gain;       // broadcaster signal gain

  bool is_dynamic() const { return std::holds_alternative<DynamicTrack>(mode); }
  // nullptr unless dynamic
  const DynamicTrack* dynamic() const { return std::get_if<DynamicTrack>(&mode); }
};

// Deterministic textual form, e.g.
// StaticSimulation(latitude=27.417747, longitude=-112.086086, run_duration=60, gain=-2)
// DynamicSimulation(file_name=/tracks/walk.csv, run_duration=none, gain=none)
std::string spec_repr(const SimulationSpec& spec);

// External broadcaster wrapper script and where to run it.
struct BroadcasterConfig {
  std::string program = "./run_bladerfGPS.sh";
  std::string working_dir = "./bladeGPS";
};

// <program> -T now [-d D] [-a G] (-l "lat,lon" | -u path)
std::vector<std::string> broadcaster_command(const SimulationSpec& spec, const BroadcasterConfig& cfg);

enum class RunStatus { Idle, Running, Ended };

const char* run_status_name(RunStatus s);

// One broadcast of a spec. Idle -> Running -> Ended; a run is never restarted.
class SimulationRun {
public:
  // Wait between quit / terminate / kill.
  static constexpr std::chrono::milliseconds kDefaultSettle{1000};

  explicit SimulationRun(SimulationSpec spec) : spec_(std::move(spec)) {}

  SimulationRun(SimulationRun&&) = default;
  SimulationRun& operator=(SimulationRun&&) = default;

  // Records start_time and launches the broadcaster. On LaunchError the run
  // is Ended (end_time == start_time) and the error is rethrown.
  void run(ProcessLauncher& launcher, const BroadcasterConfig& cfg, Clock& clock);

  // Escalating shutdown: quit, then terminate, then kill, each followed by
  // `settle`. Records end_time and releases the child. Only acts when Running.
  void end(Clock& clock, std::chrono::milliseconds settle = kDefaultSettle);

  // True iff a child is held and has not exited.
  bool is_running() const;

  const SimulationSpec& spec() const { return spec_; }
  RunStatus status() const { return status_; }
  const std::optional<TimePoint>& start_time() const { return start_time_; }
  const std::optional<TimePoint>& end_time() const { return end_time_; }
  bool has_child() const { return static_cast<bool>(child_); }

private:
  SimulationSpec spec_;
  std::unique_ptr<ChildProcessHandle> child_;
  std::optional<TimePoint> start_time_;
  std::optional<TimePoint> end_time_;
  RunStatus status_{RunStatus::Idle};
};

} // namespace geobeam
