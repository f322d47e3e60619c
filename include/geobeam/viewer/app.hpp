#pragma once
#include <cstdint>
#include <string>
#include <geobeam/track_player.hpp>

namespace geobeam {

// RAII window that draws a track and the replay marker.
class ViewerApp {
public:
  ViewerApp(TrackPlayer& player, std::string title);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void pump_snapshots_();
  // Rendering
  void render_frame_();
  void draw_track_(float scale_px_per_m);
  void draw_hud_();
  void fit_to_track_();

  struct Vec2f { float x; float y; };
  Vec2f worldToScreen_(double x, double y, float scale) const;

  TrackPlayer& player_;
  std::string title_;
  PlaybackSnapshot last_snap_{};
  std::uint64_t cursor_{0};

  // UI state
  float scale_px_per_m_{2.0f};
  float pan_x_m_{0.0f};
  float pan_y_m_{0.0f};
};

} // namespace geobeam
