#pragma once
#include <cstdint>
#include <random>
#include <vector>
#include <pxtank/collision.hpp>
#include <pxtank/geometry.hpp>
#include <pxtank/projectile.hpp>
#include <pxtank/tank.hpp>

namespace pxtank {

struct ControllerParams {
  double decision_min_s{0.35};          // commit window lower bound
  double decision_max_s{0.9};           // commit window upper bound
  double seek_probability{0.6};         // chance a decision heads for the target
  double random_fire_probability{0.008};// per-tick chance to fire off-axis
  int    align_tolerance_px{18};        // perpendicular slack for an aligned shot
};

// Deciding: pick a new direction this tick.
// Committed: keep the last direction until the timer runs out.
enum class ControllerState : std::uint8_t { Deciding, Committed };

// Drives the opponent tank. Holds no reference to it; the tank and the
// random source are handed in per tick.
class EnemyController {
public:
  explicit EnemyController(ControllerParams params = {});

  // One tick: maybe re-decide, move, maybe fire. Returns true if it fired.
  bool update(Tank& tank,
              double dt,
              Point target,
              const std::vector<Blocker>& blockers,
              std::vector<Projectile>& bullets,
              const ProjectileParams& bullet,
              std::int64_t now_ms,
              std::mt19937& rng);

  // Axis toward target with seek_probability (hold on a tie), otherwise one
  // of the four cardinals or hold, uniformly.
  Vec2 pick_direction(Point self, Point target, std::mt19937& rng) const;

  // Aligned on the axis we face, or a random off-axis shot.
  bool wants_to_fire(const Tank& tank, Point target, std::mt19937& rng) const;

  void reset();

  ControllerState state() const { return state_; }
  const Vec2& direction() const { return direction_; }
  double timer() const { return timer_; }
  const ControllerParams& params() const { return params_; }

private:
  void decide_(Point self, Point target, std::mt19937& rng);

  ControllerParams params_;
  ControllerState state_{ControllerState::Deciding};
  Vec2 direction_{0.0f, -1.0f};
  double timer_{0.0};
};

} // namespace pxtank
