#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdio>
#include <deque>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <geobeam/playlist.hpp>
#include "fakes.hpp"

using namespace geobeam;
using namespace geobeam::testing;
using namespace std::chrono_literals;

namespace {

// Replays a fixed key sequence, then reports no input. `on_call` runs before
// each read with the 0-based call number.
struct ScriptedInput {
  std::deque<Command> script;
  std::function<void(int)> on_call;
  int calls = 0;

  InputSource source() {
    return [this]() {
      if (on_call) on_call(calls);
      ++calls;
      if (script.empty()) return Command::None;
      const Command c = script.front();
      script.pop_front();
      return c;
    };
  }
};

SimulationSpec static_at(double lat, double lon) {
  return SimulationSpec{StaticLocation{lat, lon}, {}, {}};
}

std::vector<SimulationSpec> three_specs() {
  return {static_at(1.5, 1.5), static_at(2.5, 2.5), static_at(3.5, 3.5)};
}

PlaylistOptions fast_options() {
  PlaylistOptions o;
  o.settle = 0ms;
  return o;
}

std::string write_track_file(const std::string& path, int rows) {
  std::ofstream f(path, std::ios::trunc);
  for (int i = 0; i < rows; ++i) f << i / 10 << "." << i % 10 << ",1,2,3\n";
  return path;
}

std::vector<std::string> lines_of(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream ss(s);
  std::string line;
  while (std::getline(ss, line)) out.push_back(line);
  return out;
}

} // namespace

TEST_CASE("Playlist steps through runs and logs each one in order") {
  const std::string track = write_track_file("geobeam_test_playlist_track.csv", 50);
  FakeClock clock;
  FakeLauncher launcher;
  MemoryLogSink sink;
  std::vector<SimulationSpec> specs{static_at(1.5, 1.5), static_at(2.5, 2.5),
                                    SimulationSpec{DynamicTrack{track}, {}, {}}};
  Playlist pl(std::move(specs), launcher, clock, sink, fast_options());

  ScriptedInput in{{Command::None, Command::None, Command::Next, Command::Next, Command::Quit}};
  pl.run(in.source());

  REQUIRE(pl.start_count() == 3);
  REQUIRE(launcher.launches.size() == 3);
  for (const auto& c : launcher.children) {
    REQUIRE(c->quits == 1);
    REQUIRE(c->destroyed);
  }
  REQUIRE(sink.records.size() == 3);
  REQUIRE(sink.records[0].rfind("StaticSimulation(latitude=1.5,", 0) == 0);
  REQUIRE(sink.records[1].rfind("StaticSimulation(latitude=2.5,", 0) == 0);
  REQUIRE(sink.records[2].rfind("DynamicSimulation(file_name=" + track, 0) == 0);
  REQUIRE(launcher.launches[2].back() == track);
  REQUIRE_FALSE(pl.current_index().has_value());
  REQUIRE(pl.current_run() == nullptr);
  for (std::size_t i = 0; i < pl.size(); ++i) REQUIRE(pl.run_at(i).status() == RunStatus::Ended);
  std::remove(track.c_str());
}

TEST_CASE("Playlist record layout") {
  FakeClock clock;
  FakeLauncher launcher;
  MemoryLogSink sink;
  Playlist pl({static_at(1.5, -2.25)}, launcher, clock, sink, fast_options());

  ScriptedInput in{{Command::None, Command::Quit}};
  pl.run(in.source());

  REQUIRE(sink.records.size() == 1);
  const auto lines = lines_of(sink.records[0]);
  REQUIRE(lines.size() == 4);
  REQUIRE(lines[0] == "StaticSimulation(latitude=1.5, longitude=-2.25, run_duration=none, gain=none)");
  REQUIRE(lines[1] == "Start Time: 2020-08-15,05:00:00");
  REQUIRE(lines[2].rfind("End Time: 2020-08-15,05:00:00", 0) == 0);
  REQUIRE(lines[3].empty());
}

TEST_CASE("switch_to ignores out-of-range indices") {
  FakeClock clock;
  FakeLauncher launcher;
  MemoryLogSink sink;
  Playlist pl(three_specs(), launcher, clock, sink, fast_options());

  pl.switch_to(0);
  REQUIRE(pl.current_index() == 0u);

  pl.switch_to(-1);
  pl.switch_to(3);
  REQUIRE(pl.current_index() == 0u);
  REQUIRE(pl.start_count() == 1);
  REQUIRE(sink.records.empty());
  REQUIRE(pl.run_at(0).is_running());

  pl.switch_to(2);
  REQUIRE(pl.current_index() == 2u);
  REQUIRE(sink.records.size() == 1);
  REQUIRE(pl.run_at(0).status() == RunStatus::Ended);
  REQUIRE(pl.run_at(1).status() == RunStatus::Idle);
}

TEST_CASE("Prev revisits a slot with a fresh run") {
  FakeClock clock;
  FakeLauncher launcher;
  MemoryLogSink sink;
  Playlist pl(three_specs(), launcher, clock, sink, fast_options());

  ScriptedInput in{{Command::Prev, Command::Next, Command::Prev, Command::Quit}};
  pl.run(in.source());

  // 0 -> (prev ignored) -> 1 -> 0 -> quit
  REQUIRE(pl.start_count() == 3);
  REQUIRE(launcher.launches.size() == 3);
  REQUIRE(launcher.launches[2] == launcher.launches[0]);
  REQUIRE(sink.records.size() == 3);
  REQUIRE(sink.records[2].rfind("StaticSimulation(latitude=1.5,", 0) == 0);
}

TEST_CASE("Playlist advances when a run finishes by itself") {
  FakeClock clock;
  FakeLauncher launcher;
  MemoryLogSink sink;
  Playlist pl(three_specs(), launcher, clock, sink, fast_options());

  // Each broadcaster exits on its own right after launch
  ScriptedInput in;
  in.on_call = [&](int) {
    for (auto& c : launcher.children) c->alive = false;
  };
  pl.run(in.source());

  REQUIRE(pl.start_count() == 3);
  REQUIRE(sink.records.size() == 3);
  for (const auto& c : launcher.children) REQUIRE(c->quits == 0);
  REQUIRE_FALSE(pl.current_index().has_value());
}

TEST_CASE("Playlist waits between polls") {
  FakeClock clock;
  FakeLauncher launcher;
  MemoryLogSink sink;
  Playlist pl({static_at(1.0, 1.0)}, launcher, clock, sink, fast_options());

  ScriptedInput in{{Command::None, Command::None, Command::None, Command::Quit}};
  pl.run(in.source());

  // 3 idle polls at 50 ms; the quit iteration exits before waiting
  REQUIRE(clock.slept == 3 * 50ms);
}

TEST_CASE("Playlist shuts down and logs the current run on a stop request") {
  clear_stop_request();
  FakeClock clock;
  FakeLauncher launcher;
  MemoryLogSink sink;
  Playlist pl(three_specs(), launcher, clock, sink, fast_options());

  // Interrupt arrives while the first broadcaster is still running
  ScriptedInput in;
  in.on_call = [](int call) {
    if (call == 1) request_stop();
  };
  pl.run(quit_on_stop(in.source()));

  REQUIRE(pl.start_count() == 1);
  REQUIRE(launcher.launches.size() == 1);
  REQUIRE(launcher.children[0]->quits == 1);
  REQUIRE(launcher.children[0]->destroyed);
  REQUIRE(sink.records.size() == 1);
  REQUIRE(sink.records[0].rfind("StaticSimulation(latitude=1.5,", 0) == 0);
  REQUIRE(pl.run_at(0).status() == RunStatus::Ended);
  REQUIRE_FALSE(pl.current_index().has_value());
  clear_stop_request();
}

TEST_CASE("Playlist skips a run whose broadcaster fails to launch") {
  FakeClock clock;
  FakeLauncher launcher;
  launcher.fail_at = {true};
  MemoryLogSink sink;
  Playlist pl(three_specs(), launcher, clock, sink, fast_options());

  ScriptedInput in{{Command::None, Command::None, Command::Quit}};
  pl.run(in.source());

  REQUIRE(launcher.launches.size() == 2);
  REQUIRE(pl.run_at(0).status() == RunStatus::Ended);
  REQUIRE(pl.run_at(0).start_time() == pl.run_at(0).end_time());
  REQUIRE(sink.records.size() == 2);
  REQUIRE(launcher.children[0]->quits == 1);
}

TEST_CASE("Playlist keeps going when the log cannot be written") {
  FakeClock clock;
  FakeLauncher launcher;
  MemoryLogSink sink;
  sink.fail = true;
  Playlist pl(three_specs(), launcher, clock, sink, fast_options());

  ScriptedInput in{{Command::Next, Command::Next, Command::Quit}};
  REQUIRE_NOTHROW(pl.run(in.source()));
  REQUIRE(pl.start_count() == 3);
  REQUIRE(pl.log_failures() == 3);
}

TEST_CASE("Playlist with no simulations returns immediately") {
  FakeClock clock;
  FakeLauncher launcher;
  MemoryLogSink sink;
  Playlist pl({}, launcher, clock, sink);
  ScriptedInput in;
  pl.run(in.source());
  REQUIRE(in.calls == 0);
  REQUIRE(launcher.launches.empty());
}

TEST_CASE("format_run_record copies track rows for the elapsed time") {
  const std::string path = write_track_file("geobeam_test_record_track.csv", 100);
  FakeClock clock;
  FakeLauncher launcher;
  SimulationRun run(SimulationSpec{DynamicTrack{path}, {}, {}});

  run.run(launcher, {}, clock);
  clock.advance(2300ms);
  run.end(clock, 0ms);

  const auto lines = lines_of(format_run_record(run));
  // repr, start, 23 rows, end, blank
  REQUIRE(lines.size() == 27);
  REQUIRE(lines[0] == "DynamicSimulation(file_name=" + path + ", run_duration=none, gain=none)");
  REQUIRE(lines[1] == "Start Time: 2020-08-15,05:00:00");
  // Excerpt is taken from the top of the file, not from where the
  // broadcaster was in the track.
  REQUIRE(lines[2] == "0.0,1,2,3");
  REQUIRE(lines[24] == "2.2,1,2,3");
  REQUIRE(lines[25] == "End Time: 2020-08-15,05:00:02");

  SECTION("excerpt stops at the end of the track") {
    const std::string short_path = write_track_file("geobeam_test_short_track.csv", 5);
    SimulationRun shorter(SimulationSpec{DynamicTrack{short_path}, {}, {}});
    shorter.run(launcher, {}, clock);
    clock.advance(60s);
    shorter.end(clock, 0ms);
    REQUIRE(lines_of(format_run_record(shorter)).size() == 2 + 5 + 2);
    std::remove(short_path.c_str());
  }
  std::remove(path.c_str());
}

TEST_CASE("format_run_record fails when the track is unreadable") {
  FakeClock clock;
  FakeLauncher launcher;
  SimulationRun run(SimulationSpec{DynamicTrack{"this_file_does_not_exist.csv"}, {}, {}});
  run.run(launcher, {}, clock);
  run.end(clock, 0ms);
  REQUIRE_THROWS_AS(format_run_record(run), LogWriteError);
}

TEST_CASE("FileLogSink appends records") {
  const std::string path = "geobeam_test_sink.log";
  std::remove(path.c_str());
  FileLogSink sink(path);
  sink.append("one\n");
  sink.append("two\n");
  std::ifstream f(path);
  std::stringstream ss;
  ss << f.rdbuf();
  REQUIRE(ss.str() == "one\ntwo\n");
  std::remove(path.c_str());

  FileLogSink bad("/nonexistent_dir/sim.log");
  REQUIRE_THROWS_AS(bad.append("x"), LogWriteError);
}
