#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

#include <pxtank/viewer/app.hpp>

namespace pxtank {

namespace {

static constexpr Color kBackground{18, 20, 26, 255};
static constexpr Color kBorder{52, 56, 68, 255};
static constexpr Color kGrid{32, 36, 46, 255};
static constexpr Color kHudText{218, 218, 218, 255};

// --- Layout (keep in sync with draw_playfield_ / draw_hud_) ---
static constexpr int kBorderInflate   = 12;
static constexpr float kBorderWidth   = 6.0f;
static constexpr int kGridCells       = 5;   // grid step in sprite pixels
static constexpr int kHudFontSize     = 22;
static constexpr int kHudGapBelow     = 12;
static constexpr int kHudLineHeight   = 26;
static constexpr int kBannerY         = 36;
static constexpr int kBannerFontSize  = 22;

static const char* banner_for(RoundState s) {
  switch (s) {
    case RoundState::Victory: return "Victory! Press ESC to quit";
    case RoundState::Defeat:  return "Defeat... Press ESC to quit";
    case RoundState::Playing: return nullptr;
  }
  return nullptr;
}

static bool any_down(int a, int b) { return IsKeyDown(a) || IsKeyDown(b); }

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(ArenaConfig cfg, std::mt19937::result_type seed)
  : arena_(std::move(cfg), seed) {
  TraceLog(LOG_INFO, "PXTANK: round 1 seed=%u obstacles=%d",
           static_cast<unsigned>(seed), static_cast<int>(arena_.obstacles().size()));
  if (arena_.obstacles().size() < arena_.config().placement.count) {
    TraceLog(LOG_WARNING, "PXTANK: placed %d of %d obstacles",
             static_cast<int>(arena_.obstacles().size()),
             static_cast<int>(arena_.config().placement.count));
  }
}

int ViewerApp::run() {
  const auto& cfg = arena_.config();
  InitWindow(cfg.window_width, cfg.window_height, "Pixel Tank Duel");
  SetTargetFPS(cfg.fps);
  SetExitKey(KEY_NULL); // ESC only quits once the round is over

  sprites_.load(cfg.pixel_size);
  last_snap_ = arena_.snapshot();

  while (!WindowShouldClose() && !quit_requested_) {
    const double dt = static_cast<double>(GetFrameTime());
    const auto now_ms = static_cast<std::int64_t>(std::llround(GetTime() * 1000.0));

    arena_.step(read_tick_input_(dt, now_ms));
    last_snap_ = arena_.snapshot();
    log_round_end_once_();
    process_round_keys_();

    render_frame_();
  }

  sprites_.unload();
  CloseWindow();
  return 0;
}

TickInput ViewerApp::read_tick_input_(double dt, std::int64_t now_ms) const {
  TickInput in{};
  in.dt = dt;
  in.now_ms = now_ms;
  if (any_down(KEY_A, KEY_LEFT))  in.move.x -= 1.0f;
  if (any_down(KEY_D, KEY_RIGHT)) in.move.x += 1.0f;
  if (any_down(KEY_W, KEY_UP))    in.move.y -= 1.0f;
  if (any_down(KEY_S, KEY_DOWN))  in.move.y += 1.0f;
  in.fire = any_down(KEY_SPACE, KEY_LEFT_CONTROL);
  return in;
}

void ViewerApp::process_round_keys_() {
  if (arena_.state() == RoundState::Playing) return;

  if (IsKeyPressed(KEY_ESCAPE) || IsKeyPressed(KEY_Q)) {
    quit_requested_ = true;
    return;
  }
  if (IsKeyPressed(KEY_R)) {
    arena_.reset();
    last_snap_ = arena_.snapshot();
    round_end_logged_ = false;
    ++rounds_played_;
    TraceLog(LOG_INFO, "PXTANK: round %u obstacles=%d",
             rounds_played_, static_cast<int>(arena_.obstacles().size()));
  }
}

void ViewerApp::log_round_end_once_() {
  if (round_end_logged_ || last_snap_.state == RoundState::Playing) return;
  round_end_logged_ = true;
  TraceLog(LOG_INFO, "PXTANK: round %u %s after %.2fs (%llu ticks) hp %d/%d",
           rounds_played_, round_state_name(last_snap_.state), last_snap_.sim_time,
           static_cast<unsigned long long>(last_snap_.tick),
           last_snap_.player_health, last_snap_.enemy_health);
}

void ViewerApp::render_frame_() {
  const ArenaSnapshot& draw = last_snap_;

  BeginDrawing();
  ClearBackground(kBackground);

  draw_playfield_(draw.arena);
  for (const auto& e : draw.entities) draw_entity_(e);
  draw_hud_(draw);

  EndDrawing();
}

void ViewerApp::draw_playfield_(const Rect& arena) {
  const Rectangle border{
    static_cast<float>(arena.left() - kBorderInflate),
    static_cast<float>(arena.top() - kBorderInflate),
    static_cast<float>(arena.w + 2 * kBorderInflate),
    static_cast<float>(arena.h + 2 * kBorderInflate),
  };
  DrawRectangleLinesEx(border, kBorderWidth, kBorder);

  const int step = std::max(1, arena_.config().pixel_size * kGridCells);
  for (int x = arena.left(); x <= arena.right(); x += step) {
    DrawLine(x, arena.top(), x, arena.bottom(), kGrid);
  }
  for (int y = arena.top(); y <= arena.bottom(); y += step) {
    DrawLine(arena.left(), y, arena.right(), y, kGrid);
  }
}

void ViewerApp::draw_entity_(const EntityPose& e) {
  const Texture2D& tex = sprites_.texture(e.kind, e.facing);
  const Point c = e.aabb.center();
  // Centered on the box; sideways tank sprites overhang it slightly.
  const int x = c.x - tex.width / 2;
  const int y = c.y - tex.height / 2;
  if (tex.id != 0) {
    DrawTexture(tex, x, y, WHITE);
  } else {
    DrawRectangle(e.aabb.x, e.aabb.y, e.aabb.w, e.aabb.h, kHudText);
  }
}

void ViewerApp::draw_hud_(const ArenaSnapshot& draw) {
  char line[64];
  const int x = draw.arena.left();
  const int y = draw.arena.bottom() + kHudGapBelow;

  std::snprintf(line, sizeof(line), "Player HP: %d", std::max(0, draw.player_health));
  DrawText(line, x, y, kHudFontSize, kHudText);
  std::snprintf(line, sizeof(line), "Enemy HP: %d", std::max(0, draw.enemy_health));
  DrawText(line, x, y + kHudLineHeight, kHudFontSize, kHudText);

  if (const char* banner = banner_for(draw.state)) {
    const int w = MeasureText(banner, kBannerFontSize);
    DrawText(banner, (GetScreenWidth() - w) / 2, kBannerY - kBannerFontSize / 2,
             kBannerFontSize, kHudText);
    const int hw = MeasureText("R: new round", kHudFontSize - 6);
    DrawText("R: new round", (GetScreenWidth() - hw) / 2, kBannerY + kBannerFontSize, kHudFontSize - 6, kHudText);
  }
}

} // namespace pxtank
