#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>

#include <geobeam/viewer/app.hpp>

namespace geobeam {

namespace {

const char* warpLabel(double w) {
  if (w == 0.0)  return "Paused";
  if (w == 0.25) return "0.25x";
  if (w == 0.5)  return "0.5x";
  if (w == 1.0)  return "1x";
  if (w == 2.0)  return "2x";
  if (w == 4.0)  return "4x";
  return "custom";
}

void fmt_clock(double s, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (s < 0.0 || !std::isfinite(s)) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  const int minutes = (int)(s / 60.0);
  const double rem = s - minutes * 60.0;
  std::snprintf(out, (size_t)cap, "%d:%04.1f", minutes, rem);
}

// --- HUD layout (keep in sync with draw_hud_) ---
constexpr int kHudLine1Y = 20;  // size 20
constexpr int kHudLine2Y = 46;  // size 18
constexpr int kHudLine3Y = 72;  // size 14

} // namespace

ViewerApp::ViewerApp(TrackPlayer& player, std::string title)
  : player_(player), title_(std::move(title)) {}

ViewerApp::Vec2f ViewerApp::worldToScreen_(double x, double y, float scale) const {
  const float cx = GetScreenWidth()  * 0.5f - pan_x_m_ * scale;
  const float cy = GetScreenHeight() * 0.5f + pan_y_m_ * scale;
  return { cx + float(x * scale), cy - float(y * scale) };
}

void ViewerApp::fit_to_track_() {
  const auto& pts = player_.track().points();
  if (pts.empty()) return;
  double min_x = pts[0].x, max_x = pts[0].x, min_y = pts[0].y, max_y = pts[0].y;
  for (const auto& p : pts) {
    min_x = std::min(min_x, p.x); max_x = std::max(max_x, p.x);
    min_y = std::min(min_y, p.y); max_y = std::max(max_y, p.y);
  }
  pan_x_m_ = float(0.5 * (min_x + max_x));
  pan_y_m_ = float(0.5 * (min_y + max_y));
  const double span = std::max({max_x - min_x, max_y - min_y, 10.0});
  scale_px_per_m_ = float(0.8 * std::min(GetScreenWidth(), GetScreenHeight()) / span);
}

int ViewerApp::run() {
  const int W = 1024, H = 768;
  InitWindow(W, H, ("geobeam - " + title_).c_str());
  SetTargetFPS(60);
  fit_to_track_();

  while (!WindowShouldClose()) {
    process_input_();
    pump_snapshots_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  // Time warp controls
  if (IsKeyPressed(KEY_SPACE)) {
    const double cur = player_.time_scale.load();
    player_.time_scale.store(cur == 0.0 ? 1.0 : 0.0);
  }
  if (IsKeyPressed(KEY_ONE))   player_.time_scale.store(0.25);
  if (IsKeyPressed(KEY_TWO))   player_.time_scale.store(0.5);
  if (IsKeyPressed(KEY_THREE)) player_.time_scale.store(1.0);
  if (IsKeyPressed(KEY_FOUR))  player_.time_scale.store(2.0);
  if (IsKeyPressed(KEY_FIVE))  player_.time_scale.store(4.0);
  if (IsKeyPressed(KEY_R))     player_.request_restart();

  // Zoom
  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_KP_ADD))      scale_px_per_m_ *= 1.01f;
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_KP_SUBTRACT)) scale_px_per_m_ *= 0.99f;

  // Camera pan, in screen pixels per frame
  const float pan_step = 4.0f / std::max(scale_px_per_m_, 0.001f);
  if (IsKeyDown(KEY_LEFT))  pan_x_m_ -= pan_step;
  if (IsKeyDown(KEY_RIGHT)) pan_x_m_ += pan_step;
  if (IsKeyDown(KEY_UP))    pan_y_m_ += pan_step;
  if (IsKeyDown(KEY_DOWN))  pan_y_m_ -= pan_step;
  if (IsKeyPressed(KEY_C))  fit_to_track_();
}

void ViewerApp::pump_snapshots_() {
  while (player_.buffer().try_consume_latest(cursor_, last_snap_)) {}
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{24, 28, 34, 255});

  draw_track_(scale_px_per_m_);

  const auto p = worldToScreen_(last_snap_.x, last_snap_.y, scale_px_per_m_);
  const Vector2 pos{p.x, p.y};
  const float len = 12.0f, wid = 6.0f;
  const float c = std::cos(float(last_snap_.heading_rad)), s = std::sin(float(last_snap_.heading_rad));
  const Vector2 nose  = { pos.x + c*len,         pos.y - s*len };
  const Vector2 tailL = { pos.x - c*len + s*wid, pos.y + s*len + c*wid };
  const Vector2 tailR = { pos.x - c*len - s*wid, pos.y + s*len - c*wid };
  DrawTriangle(nose, tailL, tailR, Color{241, 196, 15, 255});
  DrawCircleV(pos, 3.0f, Color{231, 76, 60, 255});

  draw_hud_();
  EndDrawing();
}

void ViewerApp::draw_track_(float scale_px_per_m) {
  const auto& pts = player_.track().points();
  if (pts.size() < 2) return;

  for (std::size_t i = 1; i < pts.size(); ++i) {
    auto a = worldToScreen_(pts[i-1].x, pts[i-1].y, scale_px_per_m);
    auto b = worldToScreen_(pts[i].x,   pts[i].y,   scale_px_per_m);
    DrawLineEx({a.x,a.y}, {b.x,b.y}, 3.0f, Color{90,110,130,255});
  }

  // Start and end markers
  auto a = worldToScreen_(pts.front().x, pts.front().y, scale_px_per_m);
  auto b = worldToScreen_(pts.back().x,  pts.back().y,  scale_px_per_m);
  DrawCircleV({a.x,a.y}, 6.0f, Color{46,204,113,255});
  DrawCircleV({b.x,b.y}, 6.0f, Color{231,76,60,255});

  // 100 m scale bar
  const float bar_px = 100.0f * scale_px_per_m;
  const int y = GetScreenHeight() - 30;
  DrawLineEx({20.0f, float(y)}, {20.0f + bar_px, float(y)}, 3.0f, Color{220,220,230,255});
  DrawText("100 m", 20, y - 22, 16, Color{220,220,230,255});
}

void ViewerApp::draw_hud_() {
  const auto& track = player_.track();
  const double warp = player_.time_scale.load();

  char now_buf[32], dur_buf[32];
  fmt_clock(last_snap_.time, now_buf, sizeof(now_buf));
  fmt_clock(track.duration(), dur_buf, sizeof(dur_buf));

  DrawText(TextFormat("%s  points=%d  length=%.0f m  origin=%.6f,%.6f",
                      title_.c_str(),
                      (int)track.points().size(),
                      track.length(),
                      track.origin_latitude(),
                      track.origin_longitude()),
           20, kHudLine1Y, 20, Color{220,235,220,255});

  DrawText(TextFormat("t=%s / %s  warp=%s%s", now_buf, dur_buf, warpLabel(warp),
                      last_snap_.finished ? "  (finished)" : ""),
           20, kHudLine2Y, 18, Color{235,220,220,255});

  DrawText("Space: Pause/Resume | 1..5: 0.25x 0.5x 1x 2x 4x | R: Restart | W/S or +/-: Zoom | Arrows: Pan | C: Fit",
           20, kHudLine3Y, 14, Color{190,205,190,255});
}

} // namespace geobeam
