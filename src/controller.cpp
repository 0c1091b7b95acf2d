#include <pxtank/controller.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace pxtank {

static const Vec2 kWanderChoices[] = {
  {1.0f, 0.0f}, {-1.0f, 0.0f}, {0.0f, 1.0f}, {0.0f, -1.0f}, {0.0f, 0.0f},
};

EnemyController::EnemyController(ControllerParams params) : params_(params) {
  if (params_.decision_min_s < 0.0) params_.decision_min_s = 0.0;
  if (params_.decision_max_s < params_.decision_min_s) std::swap(params_.decision_min_s, params_.decision_max_s);
  if (params_.decision_min_s < 0.0) params_.decision_min_s = 0.0;
}

void EnemyController::reset() {
  state_ = ControllerState::Deciding;
  direction_ = {0.0f, -1.0f};
  timer_ = 0.0;
}

Vec2 EnemyController::pick_direction(Point self, Point target, std::mt19937& rng) const {
  std::uniform_real_distribution<double> U(0.0, 1.0);
  if (U(rng) < params_.seek_probability) {
    const int dx = target.x - self.x;
    const int dy = target.y - self.y;
    if (std::abs(dx) > std::abs(dy)) return {dx > 0 ? 1.0f : -1.0f, 0.0f};
    if (std::abs(dy) > std::abs(dx)) return {0.0f, dy > 0 ? 1.0f : -1.0f};
    return {}; // tie: hold
  }
  constexpr int kCount = static_cast<int>(sizeof(kWanderChoices) / sizeof(kWanderChoices[0]));
  std::uniform_int_distribution<int> pick(0, kCount - 1);
  return kWanderChoices[pick(rng)];
}

bool EnemyController::wants_to_fire(const Tank& tank, Point target, std::mt19937& rng) const {
  const Point c = tank.center();
  const bool same_row = std::abs(c.y - target.y) <= params_.align_tolerance_px;
  const bool same_col = std::abs(c.x - target.x) <= params_.align_tolerance_px;
  const bool horizontal = is_horizontal(tank.facing());
  if (same_row && horizontal) return true;
  if (same_col && !horizontal) return true;
  std::uniform_real_distribution<double> U(0.0, 1.0);
  return U(rng) < params_.random_fire_probability;
}

void EnemyController::decide_(Point self, Point target, std::mt19937& rng) {
  direction_ = pick_direction(self, target, rng);
  std::uniform_real_distribution<double> T(params_.decision_min_s, params_.decision_max_s);
  timer_ = T(rng);
  state_ = ControllerState::Committed;
}

bool EnemyController::update(Tank& tank,
                             double dt,
                             Point target,
                             const std::vector<Blocker>& blockers,
                             std::vector<Projectile>& bullets,
                             const ProjectileParams& bullet,
                             std::int64_t now_ms,
                             std::mt19937& rng) {
  if (!(dt >= 0.0) || !std::isfinite(dt)) dt = 0.0;

  timer_ -= dt;
  if (timer_ <= 0.0) state_ = ControllerState::Deciding;
  if (state_ == ControllerState::Deciding) decide_(tank.center(), target, rng);

  const Point before = tank.center();
  tank.move(direction_, dt, blockers);
  if (tank.center() == before && !direction_.is_zero()) {
    // Wedged: choose again next tick.
    timer_ = 0.0;
    state_ = ControllerState::Deciding;
  }

  if (wants_to_fire(tank, target, rng) && tank.can_fire(now_ms)) {
    return tank.shoot(bullets, now_ms, bullet);
  }
  return false;
}

} // namespace pxtank
