#include <geobeam/track_player.hpp>
#include <chrono>

namespace geobeam {

PlaybackSnapshot snapshot_at(const LocalTrack& track, double t, std::uint64_t tick) {
  PlaybackSnapshot s{};
  s.time = t < 0.0 ? 0.0 : t;
  s.tick = tick;
  track.sample_pose(s.time, s.x, s.y, s.heading_rad);
  s.finished = s.time >= track.duration();
  return s;
}

void TrackPlayer::start() {
  if (running_.load()) return;
  running_.store(true);
  th_ = std::thread(&TrackPlayer::thread_main_, this);
}

void TrackPlayer::stop() {
  if (!running_.load()) return;
  running_.store(false);
  if (th_.joinable()) th_.join();
}

void TrackPlayer::thread_main_() {
  using clock = std::chrono::steady_clock;
  const double base_dt = 1.0 / 120.0; // 120 Hz wall cadence
  const auto tick_ns = std::chrono::nanoseconds((long long)(base_dt * 1e9));
  auto next = clock::now();
  double t = 0.0;
  std::uint64_t tick = 0;

  while (running_.load(std::memory_order_relaxed)) {
    if (pending_restart_.load(std::memory_order_acquire)) {
      pending_restart_.store(false, std::memory_order_relaxed);
      t = 0.0;
      tick = 0;
    }

    const double warp = time_scale.load(std::memory_order_relaxed);
    if (warp > 0.0 && t < track_.duration()) t += base_dt * warp;
    ++tick; // heartbeats continue while paused

    buffer_.publish(snapshot_at(track_, t, tick));

    next += tick_ns;
    std::this_thread::sleep_until(next);
  }
}

} // namespace geobeam
