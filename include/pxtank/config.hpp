#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <pxtank/collision.hpp>
#include <pxtank/controller.hpp>
#include <pxtank/geometry.hpp>
#include <pxtank/placement.hpp>
#include <pxtank/projectile.hpp>
#include <pxtank/tank.hpp>

namespace pxtank {

// Sprite pattern footprints in cells.
struct PatternCells {
  int w;
  int h;
};
inline constexpr PatternCells kTankCells{13, 14};
inline constexpr PatternCells kBulletCells{5, 5};
inline constexpr PatternCells kObstacleCells{25, 8};

// Every tunable of a round. Defaults are the stock game.
struct ArenaConfig {
  // Window and display
  int window_width{640};
  int window_height{480};
  int fps{60};
  int pixel_size{4};
  int arena_margin{48};     // playfield inset from the window edge

  // Entities. Default sizes are the pattern cells at pixel_size 4;
  // with_pixel_size() keeps them in step when the scale changes.
  TankParams player_tank{.width = 52, .height = 56, .speed = 140.0f, .health = 4, .reload_ms = 450};
  TankParams enemy_tank{.width = 52, .height = 56, .speed = 110.0f, .health = 4, .reload_ms = 450};
  ProjectileParams bullet{.width = 20, .height = 20, .speed = 360.0f};

  // Obstacles
  PlacementParams placement{};

  // Movement
  CollisionParams collision{};

  // Spawn points, measured from the player's bottom-left and the enemy's top-right corner
  int player_spawn_offset_x{70};
  int player_spawn_offset_y{70};
  int enemy_spawn_offset_x{70};
  int enemy_spawn_offset_y{70};

  // Opponent
  ControllerParams ai{};
};

// Playfield rectangle inside the window.
Rect arena_bounds(const ArenaConfig& cfg);
Point player_spawn(const ArenaConfig& cfg);
Point enemy_spawn(const ArenaConfig& cfg);

// Sets pixel_size (clamped to [1,16]) and resizes tanks, bullets and
// obstacles to their pattern cells at that scale.
ArenaConfig with_pixel_size(ArenaConfig cfg, int pixel_size);

// Clamps out-of-range values: probabilities to [0,1], sizes to [0,window],
// margin to half the window, obstacle count to max_attempts, decision window
// ordered.
ArenaConfig sanitized(ArenaConfig cfg);

// Stream-based "key,value" loader applied on top of base.
// Accepts an optional header row; ignores lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Unknown keys and bad values are skipped.
// Rows apply in file order, so a size row after pixel_size overrides it.
ArenaConfig arena_config_from_csv_stream(std::istream& in, ArenaConfig base = {});

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<ArenaConfig> load_arena_config_csv(const std::string& path, ArenaConfig base = {});

// Named opponent tuning.
struct AiProfile {
  std::string key;                 // e.g., "Classic"
  double decision_min_s;           // seconds
  double decision_max_s;           // seconds
  double seek_probability;         // 0..1
  double random_fire_probability;  // 0..1
  int    align_tolerance_px;       // pixels
};

// Built-in tiny catalog (default/fallback).
const std::vector<AiProfile>& ai_profile_catalog();

// Lookup helpers
std::optional<AiProfile> ai_profile_by_key(const std::string& key);
std::optional<AiProfile> ai_profile_by_key_in(const std::vector<AiProfile>& cat, const std::string& key);

// Columns: key,decision_min_s,decision_max_s,seek_probability,random_fire_probability,align_tolerance_px
// Same comment/blank/trim rules as the config loader. Invalid rows are skipped.
std::vector<AiProfile> ai_profile_catalog_from_csv_stream(std::istream& in);
std::optional<std::vector<AiProfile>> load_ai_profile_catalog_csv(const std::string& path);

// Looks key up in loaded first, then in the built-in catalog.
std::optional<AiProfile> resolve_ai_profile(const std::string& key, const std::vector<AiProfile>& loaded);

// Convenience: derive ControllerParams from a profile.
inline ControllerParams ai_profile_params(const AiProfile& p) {
  return ControllerParams{p.decision_min_s, p.decision_max_s, p.seek_probability,
                          p.random_fire_probability, p.align_tolerance_px};
}

} // namespace pxtank
