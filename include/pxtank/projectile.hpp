#pragma once
#include <pxtank/collision.hpp>
#include <pxtank/geometry.hpp>

namespace pxtank {

using UnitId = EntityId;

struct ProjectileParams {
  int   width{20};
  int   height{20};
  float speed{360.0f}; // px per second
};

// Straight-line bullet. Expires once its box leaves the arena.
class Projectile {
public:
  // A zero direction is replaced by Up.
  Projectile(Vec2 center, Vec2 direction, const ProjectileParams& params,
             const Rect& arena, UnitId owner);

  // Advances by direction * speed * dt. Returns true when expired.
  bool update(double dt);

  const Vec2& position() const { return body_.position; }
  const Rect& aabb() const { return body_.aabb; }
  const Vec2& direction() const { return direction_; }
  Facing facing() const { return facing_of(direction_); }
  float speed() const { return speed_; }
  UnitId owner() const { return owner_; }
  bool expired() const { return expired_; }

private:
  Body body_{};
  Vec2 direction_{0.0f, -1.0f};
  float speed_{0.0f};
  Rect arena_{};
  UnitId owner_{0};
  bool expired_{false};
};

} // namespace pxtank
