#pragma once
#include <atomic>
#include <cstdint>
#include <thread>
#include <utility>
#include <geobeam/snap_buffer.hpp>
#include <geobeam/track_geom.hpp>

namespace geobeam {

// Position on a track at one instant of playback.
struct PlaybackSnapshot {
  double time = 0.0;         // playback time (s)
  double x = 0.0;            // east (m)
  double y = 0.0;            // north (m)
  double heading_rad = 0.0;
  bool finished = false;     // reached the last sample
  std::uint64_t tick = 0;
};

PlaybackSnapshot snapshot_at(const LocalTrack& track, double t, std::uint64_t tick = 0);

// Replays a track in real time on its own thread and publishes snapshots.
class TrackPlayer {
public:
  explicit TrackPlayer(LocalTrack track) : track_(std::move(track)) {}
  ~TrackPlayer() { stop(); }
  TrackPlayer(const TrackPlayer&) = delete;
  TrackPlayer& operator=(const TrackPlayer&) = delete;

  void start();
  void stop();
  void request_restart() { pending_restart_.store(true, std::memory_order_release); }

  const LocalTrack& track() const { return track_; }
  LatestBuffer<PlaybackSnapshot>& buffer() { return buffer_; }

  // 0.0 = paused
  std::atomic<double> time_scale{1.0};

private:
  void thread_main_();

  LocalTrack track_;
  LatestBuffer<PlaybackSnapshot> buffer_;
  std::thread th_;
  std::atomic<bool> running_{false};
  std::atomic<bool> pending_restart_{false};
};

} // namespace geobeam
