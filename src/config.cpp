#include <pxtank/config.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace pxtank {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  // No quoted fields.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static double to_double_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    double v = std::stod(s, &idx);
    ok = idx == s.size() && std::isfinite(v);
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0.0;
  }
}

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

// CSV values are finite but unbounded; keep them inside the target type first.
static constexpr double kMaxCsvMagnitude = 1.0e9;

static inline double bounded(double v) {
  return std::clamp(v, -kMaxCsvMagnitude, kMaxCsvMagnitude);
}

static inline int as_int(double v) { return static_cast<int>(std::lround(bounded(v))); }
static inline float as_float(double v) { return static_cast<float>(bounded(v)); }

static constexpr int kMaxWindowPx = 16384;
static constexpr int kMaxFps = 1000;
static constexpr int kMaxPixelSize = 16;
static constexpr int kMaxAttempts = 1000000;
static constexpr float kMaxSpeed = 100000.0f;

// ---------- ArenaConfig ----------

Rect arena_bounds(const ArenaConfig& cfg) {
  const int m = cfg.arena_margin;
  const auto inner = [m](int extent) {
    const std::int64_t v = std::int64_t{extent} - 2 * std::int64_t{m};
    return static_cast<int>(std::clamp<std::int64_t>(v, 0, std::max(0, extent)));
  };
  return Rect{m, m, inner(cfg.window_width), inner(cfg.window_height)};
}

Point player_spawn(const ArenaConfig& cfg) {
  const Rect a = arena_bounds(cfg);
  return {a.left() + cfg.player_spawn_offset_x, a.bottom() - cfg.player_spawn_offset_y};
}

Point enemy_spawn(const ArenaConfig& cfg) {
  const Rect a = arena_bounds(cfg);
  return {a.right() - cfg.enemy_spawn_offset_x, a.top() + cfg.enemy_spawn_offset_y};
}

ArenaConfig with_pixel_size(ArenaConfig cfg, int pixel_size) {
  const int px = std::clamp(pixel_size, 1, kMaxPixelSize);
  cfg.pixel_size = px;
  for (TankParams* t : {&cfg.player_tank, &cfg.enemy_tank}) {
    t->width = kTankCells.w * px;
    t->height = kTankCells.h * px;
  }
  cfg.bullet.width = kBulletCells.w * px;
  cfg.bullet.height = kBulletCells.h * px;
  cfg.placement.obstacle.width = kObstacleCells.w * px;
  cfg.placement.obstacle.height = kObstacleCells.h * px;
  return cfg;
}

static inline int clamp_size(int v, int limit) { return std::clamp(v, 0, limit); }

static void sanitize_tank(TankParams& t, int max_w, int max_h) {
  t.width = clamp_size(t.width, max_w);
  t.height = clamp_size(t.height, max_h);
  t.speed = std::clamp(t.speed, 0.0f, kMaxSpeed);
  if (t.health < 1) t.health = 1;
  if (t.reload_ms < 0) t.reload_ms = 0;
}

ArenaConfig sanitized(ArenaConfig cfg) {
  cfg.window_width = clamp_size(cfg.window_width, kMaxWindowPx);
  cfg.window_height = clamp_size(cfg.window_height, kMaxWindowPx);
  cfg.fps = std::clamp(cfg.fps, 1, kMaxFps);
  cfg.pixel_size = std::clamp(cfg.pixel_size, 1, kMaxPixelSize);

  const int w = cfg.window_width;
  const int h = cfg.window_height;
  const int span = std::max(w, h);
  cfg.arena_margin = clamp_size(cfg.arena_margin, std::min(w, h) / 2);

  sanitize_tank(cfg.player_tank, w, h);
  sanitize_tank(cfg.enemy_tank, w, h);
  cfg.bullet.width = clamp_size(cfg.bullet.width, w);
  cfg.bullet.height = clamp_size(cfg.bullet.height, h);
  cfg.bullet.speed = std::clamp(cfg.bullet.speed, 0.0f, kMaxSpeed);

  auto& pl = cfg.placement;
  pl.inset = clamp_size(pl.inset, span);
  pl.min_distance = std::clamp(pl.min_distance, 0.0f, static_cast<float>(span));
  pl.safe_radius = std::clamp(pl.safe_radius, 0.0f, static_cast<float>(span));
  pl.max_attempts = clamp_size(pl.max_attempts, kMaxAttempts);
  pl.count = std::min(pl.count, static_cast<std::size_t>(pl.max_attempts));
  pl.obstacle.width = clamp_size(pl.obstacle.width, w);
  pl.obstacle.height = clamp_size(pl.obstacle.height, h);

  cfg.collision.overlap_threshold = clamp_size(cfg.collision.overlap_threshold, span);
  cfg.collision.push_distance = std::clamp(cfg.collision.push_distance, 0.0f, static_cast<float>(span));

  cfg.player_spawn_offset_x = clamp_size(cfg.player_spawn_offset_x, w);
  cfg.player_spawn_offset_y = clamp_size(cfg.player_spawn_offset_y, h);
  cfg.enemy_spawn_offset_x = clamp_size(cfg.enemy_spawn_offset_x, w);
  cfg.enemy_spawn_offset_y = clamp_size(cfg.enemy_spawn_offset_y, h);

  auto& ai = cfg.ai;
  ai.decision_min_s = std::max(0.0, ai.decision_min_s);
  ai.decision_max_s = std::max(0.0, ai.decision_max_s);
  if (ai.decision_max_s < ai.decision_min_s) std::swap(ai.decision_min_s, ai.decision_max_s);
  ai.seek_probability = clamp01(ai.seek_probability);
  ai.random_fire_probability = clamp01(ai.random_fire_probability);
  ai.align_tolerance_px = clamp_size(ai.align_tolerance_px, span);
  return cfg;
}

namespace {

struct ConfigKey {
  const char* key;
  void (*apply)(ArenaConfig&, double);
};

// One row per CSV key; "tank_*" applies to both tanks.
static const ConfigKey kConfigKeys[] = {
  {"window_width",            [](ArenaConfig& c, double v){ c.window_width = as_int(v); }},
  {"window_height",           [](ArenaConfig& c, double v){ c.window_height = as_int(v); }},
  {"fps",                     [](ArenaConfig& c, double v){ c.fps = as_int(v); }},
  {"pixel_size",              [](ArenaConfig& c, double v){ c = with_pixel_size(std::move(c), as_int(v)); }},
  {"arena_margin",            [](ArenaConfig& c, double v){ c.arena_margin = as_int(v); }},
  {"tank_width",              [](ArenaConfig& c, double v){ c.player_tank.width = c.enemy_tank.width = as_int(v); }},
  {"tank_height",             [](ArenaConfig& c, double v){ c.player_tank.height = c.enemy_tank.height = as_int(v); }},
  {"tank_health",             [](ArenaConfig& c, double v){ c.player_tank.health = c.enemy_tank.health = as_int(v); }},
  {"tank_reload_ms",          [](ArenaConfig& c, double v){ c.player_tank.reload_ms = c.enemy_tank.reload_ms = std::llround(bounded(v)); }},
  {"player_speed",            [](ArenaConfig& c, double v){ c.player_tank.speed = as_float(v); }},
  {"enemy_speed",             [](ArenaConfig& c, double v){ c.enemy_tank.speed = as_float(v); }},
  {"bullet_width",            [](ArenaConfig& c, double v){ c.bullet.width = as_int(v); }},
  {"bullet_height",           [](ArenaConfig& c, double v){ c.bullet.height = as_int(v); }},
  {"bullet_speed",            [](ArenaConfig& c, double v){ c.bullet.speed = as_float(v); }},
  {"obstacle_count",          [](ArenaConfig& c, double v){ c.placement.count = static_cast<std::size_t>(std::max(0, as_int(v))); }},
  {"obstacle_width",          [](ArenaConfig& c, double v){ c.placement.obstacle.width = as_int(v); }},
  {"obstacle_height",         [](ArenaConfig& c, double v){ c.placement.obstacle.height = as_int(v); }},
  {"obstacle_inset",          [](ArenaConfig& c, double v){ c.placement.inset = as_int(v); }},
  {"obstacle_min_distance",   [](ArenaConfig& c, double v){ c.placement.min_distance = as_float(v); }},
  {"obstacle_safe_radius",    [](ArenaConfig& c, double v){ c.placement.safe_radius = as_float(v); }},
  {"obstacle_max_attempts",   [](ArenaConfig& c, double v){ c.placement.max_attempts = as_int(v); }},
  {"collision_threshold",     [](ArenaConfig& c, double v){ c.collision.overlap_threshold = as_int(v); }},
  {"collision_push_distance", [](ArenaConfig& c, double v){ c.collision.push_distance = as_float(v); }},
  {"player_spawn_offset_x",   [](ArenaConfig& c, double v){ c.player_spawn_offset_x = as_int(v); }},
  {"player_spawn_offset_y",   [](ArenaConfig& c, double v){ c.player_spawn_offset_y = as_int(v); }},
  {"enemy_spawn_offset_x",    [](ArenaConfig& c, double v){ c.enemy_spawn_offset_x = as_int(v); }},
  {"enemy_spawn_offset_y",    [](ArenaConfig& c, double v){ c.enemy_spawn_offset_y = as_int(v); }},
  {"ai_decision_min_s",       [](ArenaConfig& c, double v){ c.ai.decision_min_s = bounded(v); }},
  {"ai_decision_max_s",       [](ArenaConfig& c, double v){ c.ai.decision_max_s = bounded(v); }},
  {"ai_seek_probability",     [](ArenaConfig& c, double v){ c.ai.seek_probability = v; }},
  {"ai_random_fire_probability", [](ArenaConfig& c, double v){ c.ai.random_fire_probability = v; }},
  {"ai_align_tolerance_px",   [](ArenaConfig& c, double v){ c.ai.align_tolerance_px = as_int(v); }},
};

} // namespace

ArenaConfig arena_config_from_csv_stream(std::istream& in, ArenaConfig base) {
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = split_csv_line(raw);
    if (cols.size() < 2 || cols[0].empty()) continue;

    if (!header_consumed && (cols[0] == "key" || cols[0] == "Key")) {
      header_consumed = true;
      continue;
    }

    bool ok = false;
    const double v = to_double_safe(cols[1], ok);
    if (!ok) continue;

    auto it = std::find_if(std::begin(kConfigKeys), std::end(kConfigKeys),
                           [&](const ConfigKey& k){ return cols[0] == k.key; });
    if (it == std::end(kConfigKeys)) continue;
    it->apply(base, v);
  }
  return sanitized(base);
}

std::optional<ArenaConfig> load_arena_config_csv(const std::string& path, ArenaConfig base) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return arena_config_from_csv_stream(f, base);
}

// ---------- AiProfile catalog ----------

static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.size() < 6) return false;
  return (cols[0] == "key" || cols[0] == "Key");
}

static std::optional<AiProfile> parse_profile_row(const std::vector<std::string>& cols) {
  if (cols.size() < 6) return std::nullopt;
  const std::string key = cols[0];
  if (key.empty()) return std::nullopt;
  bool ok1, ok2, ok3, ok4, ok5;
  double lo   = to_double_safe(cols[1], ok1);
  double hi   = to_double_safe(cols[2], ok2);
  double seek = to_double_safe(cols[3], ok3);
  double fire = to_double_safe(cols[4], ok4);
  double tol  = to_double_safe(cols[5], ok5);
  if (!(ok1 && ok2 && ok3 && ok4 && ok5)) return std::nullopt;

  lo = std::max(0.0, lo);
  hi = std::max(0.0, hi);
  if (hi < lo) std::swap(lo, hi);

  return AiProfile{key, lo, hi, clamp01(seek), clamp01(fire), std::max(0, as_int(tol))};
}

static std::vector<AiProfile> make_catalog_builtin() {
  return {
    {"Classic",    0.35, 0.90, 0.60, 0.008, 18},
    {"Aggressive", 0.20, 0.60, 0.85, 0.020, 24},
    {"Cautious",   0.50, 1.20, 0.30, 0.004, 12},
  };
}

const std::vector<AiProfile>& ai_profile_catalog() {
  static const std::vector<AiProfile> cat = make_catalog_builtin();
  return cat;
}

std::optional<AiProfile> ai_profile_by_key(const std::string& key) {
  return ai_profile_by_key_in(ai_profile_catalog(), key);
}

std::optional<AiProfile> ai_profile_by_key_in(const std::vector<AiProfile>& cat, const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(), [&](const AiProfile& p){ return p.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::vector<AiProfile> ai_profile_catalog_from_csv_stream(std::istream& in) {
  std::vector<AiProfile> out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = split_csv_line(raw);

    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (auto row = parse_profile_row(cols); row.has_value()) {
      out.push_back(*row);
    }
  }
  return out;
}

std::optional<std::vector<AiProfile>> load_ai_profile_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return ai_profile_catalog_from_csv_stream(f);
}

std::optional<AiProfile> resolve_ai_profile(const std::string& key, const std::vector<AiProfile>& loaded) {
  if (auto p = ai_profile_by_key_in(loaded, key)) return p;
  return ai_profile_by_key(key);
}

} // namespace pxtank
