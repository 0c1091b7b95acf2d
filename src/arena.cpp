#include <pxtank/arena.hpp>
#include <pxtank/placement.hpp>
#include <cmath>
#include <utility>

namespace pxtank {

Arena::Arena(ArenaConfig cfg, std::mt19937::result_type seed)
  : cfg_(sanitized(std::move(cfg))),
    bounds_(arena_bounds(cfg_)),
    rng_(seed),
    player_(kPlayerId, player_spawn(cfg_), cfg_.player_tank, bounds_, cfg_.collision),
    enemy_(kEnemyId, enemy_spawn(cfg_), cfg_.enemy_tank, bounds_, cfg_.collision),
    controller_(cfg_.ai) {
  reset();
}

void Arena::reset() {
  const Point ps = player_spawn(cfg_);
  const Point es = enemy_spawn(cfg_);
  player_ = Tank(kPlayerId, ps, cfg_.player_tank, bounds_, cfg_.collision);
  enemy_  = Tank(kEnemyId, es, cfg_.enemy_tank, bounds_, cfg_.collision);
  controller_.reset();
  obstacles_ = place_obstacles(bounds_, ps, es, cfg_.placement, rng_, kFirstObstacleId);
  player_bullets_.clear();
  enemy_bullets_.clear();
  state_ = RoundState::Playing;
  tick_ = 0;
  sim_time_ = 0.0;
}

std::vector<Blocker> Arena::blockers_for_(UnitId mover) const {
  std::vector<Blocker> out;
  out.reserve(obstacles_.size() + 1);
  if (mover != kPlayerId && player_.alive()) out.push_back(player_.as_blocker());
  if (mover != kEnemyId && enemy_.alive())   out.push_back(enemy_.as_blocker());
  for (const auto& o : obstacles_) out.push_back(o.as_blocker());
  return out;
}

void Arena::advance_bullets_(std::vector<Projectile>& bullets, double dt) {
  for (auto& b : bullets) b.update(dt);
  std::erase_if(bullets, [](const Projectile& p){ return p.expired(); });
}

void Arena::drop_bullets_on_obstacles_(std::vector<Projectile>& bullets) const {
  std::erase_if(bullets, [this](const Projectile& p){
    for (const auto& o : obstacles_) {
      if (overlaps(p.aabb(), o.aabb())) return true;
    }
    return false;
  });
}

bool Arena::bullets_hit_(const Tank& target, std::vector<Projectile>& bullets) {
  const auto removed = std::erase_if(bullets, [&](const Projectile& p){
    return overlaps(p.aabb(), target.aabb());
  });
  return removed > 0;
}

void Arena::step(const TickInput& in) {
  if (state_ != RoundState::Playing) return;
  const double dt = (in.dt > 0.0 && std::isfinite(in.dt)) ? in.dt : 0.0;

  if (player_.alive()) {
    player_.move(in.move, dt, blockers_for_(kPlayerId));
    if (in.fire) player_.shoot(player_bullets_, in.now_ms, cfg_.bullet);
  }

  if (enemy_.alive()) {
    controller_.update(enemy_, dt, player_.center(), blockers_for_(kEnemyId),
                       enemy_bullets_, cfg_.bullet, in.now_ms, rng_);
  }

  advance_bullets_(player_bullets_, dt);
  advance_bullets_(enemy_bullets_, dt);

  drop_bullets_on_obstacles_(player_bullets_);
  drop_bullets_on_obstacles_(enemy_bullets_);

  // A tick that destroys both tanks ends as Defeat: the player is checked last.
  if (enemy_.alive() && bullets_hit_(enemy_, player_bullets_)) {
    if (enemy_.take_hit()) state_ = RoundState::Victory;
  }
  if (player_.alive() && bullets_hit_(player_, enemy_bullets_)) {
    if (player_.take_hit()) state_ = RoundState::Defeat;
  }

  sim_time_ += dt;
  ++tick_;
}

ArenaSnapshot Arena::snapshot() const {
  ArenaSnapshot s{};
  s.tick = tick_;
  s.sim_time = sim_time_;
  s.state = state_;
  s.arena = bounds_;
  s.player_health = player_.health();
  s.enemy_health = enemy_.health();

  s.entities.reserve(obstacles_.size() + 2 + player_bullets_.size() + enemy_bullets_.size());
  for (const auto& o : obstacles_) {
    s.entities.push_back(EntityPose{EntityKind::Obstacle, o.id(), o.aabb(), Facing::Up});
  }
  if (player_.alive()) {
    s.entities.push_back(EntityPose{EntityKind::Player, player_.id(), player_.aabb(), player_.facing()});
  }
  if (enemy_.alive()) {
    s.entities.push_back(EntityPose{EntityKind::Enemy, enemy_.id(), enemy_.aabb(), enemy_.facing()});
  }
  for (const auto& b : player_bullets_) {
    s.entities.push_back(EntityPose{EntityKind::PlayerBullet, b.owner(), b.aabb(), b.facing()});
  }
  for (const auto& b : enemy_bullets_) {
    s.entities.push_back(EntityPose{EntityKind::EnemyBullet, b.owner(), b.aabb(), b.facing()});
  }
  return s;
}

} // namespace pxtank
