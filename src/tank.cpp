#include <pxtank/tank.hpp>
#include <cmath>

namespace pxtank {

Tank::Tank(UnitId id, Point spawn, const TankParams& params, const Rect& arena,
           const CollisionParams& collision)
  : id_(id),
    speed_(params.speed < 0.0f ? 0.0f : params.speed),
    health_(params.health),
    reload_ms_(params.reload_ms < 0 ? 0 : params.reload_ms),
    arena_(arena),
    collision_(collision) {
  body_.aabb = Rect::centered_at(spawn, params.width, params.height);
  body_.position = to_vec(body_.aabb.center());
}

void Tank::move(Vec2 direction, double dt, const std::vector<Blocker>& blockers) {
  if (direction.is_zero()) return;

  const Vec2 unit = direction.normalized();
  facing_ = facing_of(unit);
  if (!(dt > 0.0) || !std::isfinite(dt)) return;

  const Vec2 displacement = unit * (speed_ * static_cast<float>(dt));
  resolve_move(body_, displacement, arena_, blockers, id_, collision_);
}

bool Tank::can_fire(std::int64_t now_ms) const {
  if (!last_shot_ms_) return true;
  return now_ms - *last_shot_ms_ >= reload_ms_;
}

bool Tank::shoot(std::vector<Projectile>& out, std::int64_t now_ms, const ProjectileParams& bullet) {
  if (!can_fire(now_ms)) return false;

  const Rect& r = body_.aabb;
  const Point c = r.center();
  Point muzzle{};
  switch (facing_) {
    case Facing::Up:    muzzle = {c.x, r.top() - bullet.height / 2};    break;
    case Facing::Down:  muzzle = {c.x, r.bottom() + bullet.height / 2}; break;
    case Facing::Left:  muzzle = {r.left() - bullet.width / 2, c.y};    break;
    case Facing::Right: muzzle = {r.right() + bullet.width / 2, c.y};   break;
  }

  out.emplace_back(to_vec(muzzle), facing_vector(facing_), bullet, arena_, id_);
  last_shot_ms_ = now_ms;
  return true;
}

bool Tank::take_hit() {
  --health_;
  return health_ <= 0;
}

} // namespace pxtank
