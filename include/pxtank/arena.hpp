#pragma once
#include <cstdint>
#include <random>
#include <utility>
#include <vector>
#include <pxtank/collision.hpp>
#include <pxtank/config.hpp>
#include <pxtank/controller.hpp>
#include <pxtank/obstacle.hpp>
#include <pxtank/projectile.hpp>
#include <pxtank/snap.hpp>
#include <pxtank/tank.hpp>

namespace pxtank {

inline constexpr UnitId kPlayerId = 1;
inline constexpr UnitId kEnemyId  = 2;
inline constexpr EntityId kFirstObstacleId = 100;

// Everything the frame loop feeds into one tick.
struct TickInput {
  Vec2 move{};              // components in {-1, 0, 1}
  bool fire{false};
  double dt{0.0};           // seconds since last tick
  std::int64_t now_ms{0};   // monotonic clock
};

// One round: player vs. controller-driven enemy among random obstacles.
// Single-threaded; step() runs the whole tick in a fixed order.
class Arena {
public:
  explicit Arena(ArenaConfig cfg = {}, std::mt19937::result_type seed = std::mt19937::default_seed);

  // Fresh round: full health, new obstacles, empty bullet lists.
  void reset();

  // player move -> player fire -> enemy decide/move/fire -> bullets advance ->
  // bullets vs. obstacles -> bullets vs. tanks. No-op once the round is over.
  void step(const TickInput& in);

  ArenaSnapshot snapshot() const;

  // Replaces the sampled obstacles (tests, fixed layouts).
  void set_obstacles(std::vector<Obstacle> obstacles) { obstacles_ = std::move(obstacles); }

  RoundState state() const { return state_; }
  const ArenaConfig& config() const { return cfg_; }
  const Rect& bounds() const { return bounds_; }
  std::uint64_t tick() const { return tick_; }
  double sim_time() const { return sim_time_; }

  const Tank& player() const { return player_; }
  const Tank& enemy() const { return enemy_; }
  Tank& player() { return player_; }
  Tank& enemy() { return enemy_; }
  const EnemyController& controller() const { return controller_; }
  const std::vector<Obstacle>& obstacles() const { return obstacles_; }
  const std::vector<Projectile>& player_bullets() const { return player_bullets_; }
  const std::vector<Projectile>& enemy_bullets() const { return enemy_bullets_; }

private:
  std::vector<Blocker> blockers_for_(UnitId mover) const;
  void drop_bullets_on_obstacles_(std::vector<Projectile>& bullets) const;
  static void advance_bullets_(std::vector<Projectile>& bullets, double dt);
  static bool bullets_hit_(const Tank& target, std::vector<Projectile>& bullets);

  ArenaConfig cfg_;
  Rect bounds_;
  std::mt19937 rng_;
  Tank player_;
  Tank enemy_;
  EnemyController controller_;
  std::vector<Obstacle> obstacles_;
  std::vector<Projectile> player_bullets_;
  std::vector<Projectile> enemy_bullets_;
  RoundState state_{RoundState::Playing};
  std::uint64_t tick_{0};
  double sim_time_{0.0};
};

} // namespace pxtank
