#include <pxtank/projectile.hpp>
#include <cmath>

namespace pxtank {

Projectile::Projectile(Vec2 center, Vec2 direction, const ProjectileParams& params,
                       const Rect& arena, UnitId owner)
  : speed_(params.speed), arena_(arena), owner_(owner) {
  direction_ = direction.is_zero() ? Vec2{0.0f, -1.0f} : direction.normalized();
  body_.aabb = Rect::centered_at(round_point(center), params.width, params.height);
  body_.position = to_vec(body_.aabb.center());
}

bool Projectile::update(double dt) {
  if (expired_) return true;
  if (dt > 0.0 && std::isfinite(dt)) {
    body_.position += direction_ * (speed_ * static_cast<float>(dt));
    body_.sync();
  }
  if (!overlaps(arena_, body_.aabb)) expired_ = true;
  return expired_;
}

} // namespace pxtank
