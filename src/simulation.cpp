#include <geobeam/simulation.hpp>
#include <spdlog/fmt/fmt.h>
#include <geobeam/errors.hpp>
#include <geobeam/logging.hpp>

namespace geobeam {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

template <class T>
static std::string opt_text(const std::optional<T>& v) {
  return v ? fmt::format("{}", *v) : std::string("none");
}

std::string spec_repr(const SimulationSpec& spec) {
  const std::string common = fmt::format("run_duration={}, gain={}",
                                         opt_text(spec.run_duration), opt_text(spec.gain));
  return std::visit(overloaded{
    [&](const StaticLocation& s) {
      return fmt::format("StaticSimulation(latitude={}, longitude={}, {})",
                         s.latitude, s.longitude, common);
    },
    [&](const DynamicTrack& d) {
      return fmt::format("DynamicSimulation(file_name={}, {})", d.track_file_path, common);
    }
  }, spec.mode);
}

std::vector<std::string> broadcaster_command(const SimulationSpec& spec, const BroadcasterConfig& cfg) {
  std::vector<std::string> cmd{cfg.program, "-T", "now"};
  if (spec.run_duration) {
    cmd.emplace_back("-d");
    cmd.push_back(std::to_string(*spec.run_duration));
  }
  if (spec.gain) {
    cmd.emplace_back("-a");
    cmd.push_back(fmt::format("{}", *spec.gain));
  }
  std::visit(overloaded{
    [&](const StaticLocation& s) {
      cmd.emplace_back("-l");
      cmd.push_back(fmt::format("{},{}", s.latitude, s.longitude));
    },
    [&](const DynamicTrack& d) {
      cmd.emplace_back("-u");
      cmd.push_back(d.track_file_path);
    }
  }, spec.mode);
  return cmd;
}

const char* run_status_name(RunStatus s) {
  switch (s) {
    case RunStatus::Idle:    return "idle";
    case RunStatus::Running: return "running";
    case RunStatus::Ended:   return "ended";
  }
  return "unknown";
}

void SimulationRun::run(ProcessLauncher& launcher, const BroadcasterConfig& cfg, Clock& clock) {
  if (status_ != RunStatus::Idle) return;

  start_time_ = clock.now();
  const auto argv = broadcaster_command(spec_, cfg);
  try {
    child_ = launcher.launch(argv, cfg.working_dir);
  } catch (const LaunchError&) {
    end_time_ = start_time_;
    status_ = RunStatus::Ended;
    throw;
  }
  status_ = RunStatus::Running;
  log()->info("Started {}", spec_repr(spec_));
}

void SimulationRun::end(Clock& clock, std::chrono::milliseconds settle) {
  if (status_ != RunStatus::Running) return;

  while (child_ && !child_->poll()) {
    log()->info("Quitting simulation...");
    child_->signal_quit();
    clock.sleep_for(settle);
    if (!child_->poll()) {
      log()->info("Terminating subprocess...");
      child_->terminate();
      clock.sleep_for(settle);
    }
    if (!child_->poll()) {
      log()->info("Killing subprocess...");
      child_->kill();
      clock.sleep_for(settle);
    }
  }
  end_time_ = clock.now();
  child_.reset();
  status_ = RunStatus::Ended;
  log()->info("Subprocess closed.");
}

bool SimulationRun::is_running() const {
  return child_ && !child_->poll();
}

} // namespace geobeam
