#pragma once
#include <cstdint>
#include <random>
#include <pxtank/arena.hpp>
#include <pxtank/snap.hpp>
#include <pxtank/viewer/sprites.hpp>

namespace pxtank {

// RAII application that drives the arena once per frame and renders it.
class ViewerApp {
public:
  explicit ViewerApp(ArenaConfig cfg, std::mt19937::result_type seed = std::mt19937::default_seed);
  int run(); // returns 0 on normal exit

private:
  // Input & stepping
  TickInput read_tick_input_(double dt, std::int64_t now_ms) const;
  void process_round_keys_();
  void log_round_end_once_();

  // Rendering
  void render_frame_();
  void draw_playfield_(const Rect& arena);
  void draw_entity_(const EntityPose& e);
  void draw_hud_(const ArenaSnapshot& draw);

  Arena arena_;
  SpriteSet sprites_{};
  ArenaSnapshot last_snap_{};

  // UI state
  bool quit_requested_{false};
  bool round_end_logged_{false};
  std::uint32_t rounds_played_{1};
};

} // namespace pxtank
