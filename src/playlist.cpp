#include <geobeam/playlist.hpp>
#include <fstream>
#include <sstream>
#include <geobeam/errors.hpp>
#include <geobeam/logging.hpp>

namespace geobeam {

void FileLogSink::append(const std::string& record) {
  std::ofstream f(path_, std::ios::app | std::ios::binary);
  if (!f) throw LogWriteError("cannot open simulation log: " + path_);
  f << record;
  f.flush();
  if (!f) throw LogWriteError("failed writing simulation log: " + path_);
}

// floor(elapsed_seconds * kTrackRowsPerSecond), computed on integer ticks.
static std::size_t excerpt_lines_(TimePoint start, TimePoint end) {
  using std::chrono::microseconds;
  const auto us = std::chrono::duration_cast<microseconds>(end - start).count();
  if (us <= 0) return 0;
  return static_cast<std::size_t>(us / (1000000 / kTrackRowsPerSecond));
}

std::string format_run_record(const SimulationRun& run) {
  const TimePoint start = run.start_time().value_or(TimePoint{});
  const TimePoint end = run.end_time().value_or(start);

  std::ostringstream out;
  out << spec_repr(run.spec()) << "\n";
  out << "Start Time: " << format_log_time(start) << "\n";

  if (const DynamicTrack* d = run.spec().dynamic()) {
    std::ifstream track(d->track_file_path, std::ios::binary);
    if (!track) throw LogWriteError("cannot read track file: " + d->track_file_path);
    // TODO: slice from the row the broadcaster actually started at once the
    // run records its offset into the track; this always reads from row 0.
    const std::size_t wanted = excerpt_lines_(start, end);
    std::string line;
    for (std::size_t i = 0; i < wanted && std::getline(track, line); ++i) {
      out << line << "\n";
    }
  }

  out << "End Time: " << format_log_time(end) << "\n\n";
  return out.str();
}

Playlist::Playlist(std::vector<SimulationSpec> specs,
                   ProcessLauncher& launcher,
                   Clock& clock,
                   LogSink& sink,
                   PlaylistOptions opts)
  : launcher_(launcher), clock_(clock), sink_(sink), opts_(std::move(opts)) {
  runs_.reserve(specs.size());
  for (auto& s : specs) runs_.emplace_back(std::move(s));
}

const SimulationRun* Playlist::current_run() const {
  return current_ ? &runs_[*current_] : nullptr;
}

void Playlist::run(const InputSource& input) {
  if (runs_.empty()) return;
  log()->info("Press 'n' to go to next sim, 'p' to go to previous sim, or 'q' to quit");

  switch_to(0);
  while (current_ && *current_ < runs_.size()) {
    const SimulationRun& cur = runs_[*current_];
    const bool running = cur.is_running();
    const Command cmd = input ? input() : Command::None;
    const bool last = *current_ + 1 >= runs_.size();

    if (cmd == Command::Quit || (!running && last)) {
      end_and_log_current_();
      break;
    } else if (cmd == Command::Next || !running) {
      switch_to(static_cast<std::ptrdiff_t>(*current_) + 1);
    } else if (cmd == Command::Prev) {
      switch_to(static_cast<std::ptrdiff_t>(*current_) - 1);
    }
    clock_.sleep_for(opts_.poll_interval);
  }
  log()->info("Simulation set ending...");
  current_.reset();
}

void Playlist::switch_to(std::ptrdiff_t new_index) {
  if (new_index < 0) {
    log()->info("Already on first simulation");
    return;
  }
  if (static_cast<std::size_t>(new_index) >= runs_.size()) {
    log()->info("Already on last simulation");
    return;
  }
  if (current_) end_and_log_current_();
  start_at_(static_cast<std::size_t>(new_index));
}

void Playlist::end_and_log_current_() {
  SimulationRun& cur = runs_[*current_];
  cur.end(clock_, opts_.settle);
  try {
    sink_.append(format_run_record(cur));
  } catch (const LogWriteError& e) {
    ++log_failures_;
    log()->error("Could not log simulation {}: {}", *current_, e.what());
  }
}

void Playlist::start_at_(std::size_t index) {
  // Runs are single-use: revisiting a slot gets a fresh run of the same spec.
  if (runs_[index].status() != RunStatus::Idle) {
    runs_[index] = SimulationRun(runs_[index].spec());
  }
  current_ = index;
  ++starts_;
  try {
    runs_[index].run(launcher_, opts_.broadcaster, clock_);
  } catch (const LaunchError& e) {
    log()->error("Simulation {} failed to launch: {}", index, e.what());
  }
}

} // namespace geobeam
