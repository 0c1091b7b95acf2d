#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include <pxtank/collision.hpp>
#include <pxtank/geometry.hpp>
#include <pxtank/projectile.hpp>

namespace pxtank {

struct TankParams {
  int   width{52};
  int   height{56};
  float speed{140.0f};       // px per second
  int   health{4};
  std::int64_t reload_ms{450};
};

// Mobile unit: owns position, facing, health and reload timer.
class Tank {
public:
  Tank(UnitId id, Point spawn, const TankParams& params, const Rect& arena,
       const CollisionParams& collision = {});

  // Moves along direction (any length; zero keeps facing) for dt seconds,
  // resolving collisions against blockers. A negative or non-finite dt counts
  // as 0: facing still turns, position stays.
  void move(Vec2 direction, double dt, const std::vector<Blocker>& blockers = {});

  bool can_fire(std::int64_t now_ms) const;

  // Spawns a projectile flush with the edge we face. No-op while reloading.
  bool shoot(std::vector<Projectile>& out, std::int64_t now_ms, const ProjectileParams& bullet);

  // Returns true once health drops to zero or below.
  bool take_hit();

  UnitId id() const { return id_; }
  const Vec2& position() const { return body_.position; }
  const Rect& aabb() const { return body_.aabb; }
  Point center() const { return body_.aabb.center(); }
  Facing facing() const { return facing_; }
  float speed() const { return speed_; }
  int health() const { return health_; }
  bool alive() const { return health_ > 0; }
  std::int64_t reload_ms() const { return reload_ms_; }
  std::optional<std::int64_t> last_shot_ms() const { return last_shot_ms_; }

  Blocker as_blocker() const { return Blocker{BlockerKind::Unit, id_, body_.aabb}; }

private:
  UnitId id_;
  Body body_{};
  Facing facing_{Facing::Up};
  float speed_;
  int health_;
  std::int64_t reload_ms_;
  std::optional<std::int64_t> last_shot_ms_{}; // empty until the first shot
  Rect arena_;
  CollisionParams collision_;
};

} // namespace pxtank
