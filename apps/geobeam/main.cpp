#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <geobeam/clock.hpp>
#include <geobeam/config.hpp>
#include <geobeam/errors.hpp>
#include <geobeam/input.hpp>
#include <geobeam/logging.hpp>
#include <geobeam/playlist.hpp>
#include <geobeam/process.hpp>
#include <geobeam/route.hpp>
#include <geobeam/track_io.hpp>
#include <geobeam/waypoints.hpp>

using namespace geobeam;

namespace {

constexpr int kExitRuntime = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInterrupted = 130;

void print_usage(const char* prog) {
  std::cout << "Usage:\n"
            << "  " << prog << " route <waypoints.csv|track.gpx> <out.csv> [options]\n"
            << "  " << prog << " play <playlist.yaml> [--log-level L]\n\n"
            << "route options:\n"
            << "  --speed <m/s|walking|running|biking>  Travel speed (default: walking)\n"
            << "  --frequency <Hz>                      Samples per second (default: 10)\n"
            << "  --plain                               Write x,y,z rows of the raw waypoints\n"
            << "  --log-level <level>                   trace|debug|info|warn|error (default: info)\n\n"
            << "play keys: n = next simulation, p = previous, q = quit\n";
}

struct Args {
  std::vector<std::string> positional;
  std::optional<std::string> speed;
  std::optional<std::string> frequency;
  std::optional<std::string> log_level;
  bool plain = false;
};

// Returns nullopt on an unknown flag or a flag missing its value.
std::optional<Args> parse_args(int argc, char** argv, int first) {
  Args a;
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    auto value = [&](std::optional<std::string>& dst) {
      if (i + 1 >= argc) return false;
      dst = argv[++i];
      return true;
    };
    if (arg == "--speed") { if (!value(a.speed)) return std::nullopt; }
    else if (arg == "--frequency") { if (!value(a.frequency)) return std::nullopt; }
    else if (arg == "--log-level") { if (!value(a.log_level)) return std::nullopt; }
    else if (arg == "--plain") { a.plain = true; }
    else if (arg.rfind("--", 0) == 0) { return std::nullopt; }
    else { a.positional.push_back(arg); }
  }
  return a;
}

std::optional<double> parse_positive(const std::string& s) {
  try {
    std::size_t idx = 0;
    const double v = std::stod(s, &idx);
    if (idx != s.size() || !(v > 0.0)) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

int cmd_route(const char* prog, const Args& a) {
  if (a.positional.size() != 2) { print_usage(prog); return kExitUsage; }
  const std::string& in_path = a.positional[0];
  const std::string& out_path = a.positional[1];

  const std::string speed_text = a.speed.value_or("walking");
  std::optional<double> speed = transport_speed(speed_text);
  if (!speed) speed = parse_positive(speed_text);
  const auto frequency = parse_positive(a.frequency.value_or("10"));
  if (!speed || !frequency) {
    std::cerr << "speed and frequency must be positive numbers\n";
    return kExitUsage;
  }

  if (a.plain) {
    const auto pts = load_waypoints(in_path);
    if (!pts) throw NoRouteFoundError("cannot open waypoint file: " + in_path);
    write_route_file(out_path, route_from_waypoints(*pts, *speed));
    log()->info("Wrote {} waypoints to {}", pts->size(), out_path);
    return 0;
  }

  const TimedRoute tr = timed_route_from_waypoint_file(in_path, *speed, *frequency);
  write_timed_route_file(out_path, tr);
  log()->info("Wrote {} track points ({:.1f} s at {} Hz) to {}",
              tr.route.points.size(),
              static_cast<double>(tr.route.points.size() - 1) / tr.frequency,
              tr.frequency, out_path);
  return 0;
}

int cmd_play(const char* prog, const Args& a) {
  if (a.positional.size() != 1) { print_usage(prog); return kExitUsage; }

  PlaylistConfig cfg = load_playlist_config(a.positional[0]);
  init_logging(a.log_level.value_or(cfg.log_level));

  generate_route_tracks(cfg);

  std::error_code ec;
  std::filesystem::create_directories(cfg.log_dir, ec);
  if (ec) throw LogWriteError("cannot create log directory " + cfg.log_dir + ": " + ec.message());

  SystemClock clock;
  FileLogSink sink((std::filesystem::path(cfg.log_dir) / log_file_name(clock.now())).string());
  PosixProcessLauncher launcher;
  TerminalKeyReader keys;
  StopSignalGuard stop_guard;

  PlaylistOptions opts;
  opts.broadcaster = cfg.broadcaster;
  opts.settle = cfg.settle;
  opts.poll_interval = cfg.poll_interval;

  Playlist playlist(cfg.specs(), launcher, clock, sink, opts);
  playlist.run(quit_on_stop(keys.as_input_source()));

  log()->info("Simulation log: {}", sink.path());
  if (stop_requested()) return kExitInterrupted;
  return playlist.log_failures() == 0 ? 0 : kExitRuntime;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) { print_usage(argv[0]); return kExitUsage; }
  const std::string cmd = argv[1];

  const auto args = parse_args(argc, argv, 2);
  if (!args) { print_usage(argv[0]); return kExitUsage; }
  if (args->log_level && !is_log_level(*args->log_level)) {
    std::cerr << "unknown log level '" << *args->log_level << "'\n";
    print_usage(argv[0]);
    return kExitUsage;
  }
  init_logging(args->log_level.value_or("info"));

  try {
    if (cmd == "route") return cmd_route(argv[0], *args);
    if (cmd == "play")  return cmd_play(argv[0], *args);
  } catch (const Error& e) {
    log()->error("{}", e.what());
    return kExitRuntime;
  } catch (const std::invalid_argument& e) {
    log()->error("{}", e.what());
    return kExitRuntime;
  }

  print_usage(argv[0]);
  return kExitUsage;
}
