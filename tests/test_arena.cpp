#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <vector>

#include <pxtank/arena.hpp>

using Catch::Approx;
using namespace pxtank;

// Snapshot order rank: obstacles, player, enemy, player bullets, enemy bullets.
static int draw_rank(EntityKind k) {
  switch (k) {
    case EntityKind::Obstacle:     return 0;
    case EntityKind::Player:       return 1;
    case EntityKind::Enemy:        return 2;
    case EntityKind::PlayerBullet: return 3;
    case EntityKind::EnemyBullet:  return 4;
  }
  return 5;
}

// Stationary opponent that never moves and fires at most once.
static ArenaConfig quiet_enemy_config() {
  ArenaConfig cfg{};
  cfg.placement.count = 0;
  cfg.enemy_tank.speed = 0.0f;
  cfg.enemy_tank.reload_ms = 1000000;
  cfg.ai.seek_probability = 0.0;
  cfg.ai.random_fire_probability = 0.0;
  return cfg;
}

static TickInput tick_at(int tick, Vec2 move = {}, bool fire = false) {
  TickInput in{};
  in.move = move;
  in.fire = fire;
  in.dt = 0.05;
  in.now_ms = static_cast<std::int64_t>(tick) * 50;
  return in;
}

TEST_CASE("Arena starts a round at the spawn points with full health") {
  Arena arena(ArenaConfig{}, 42);
  REQUIRE(arena.state() == RoundState::Playing);
  REQUIRE(arena.tick() == 0);
  REQUIRE(arena.player().center() == Point{118, 362});
  REQUIRE(arena.enemy().center() == Point{522, 118});
  REQUIRE(arena.player().id() == kPlayerId);
  REQUIRE(arena.enemy().id() == kEnemyId);
  REQUIRE(arena.player().health() == 4);
  REQUIRE(arena.enemy().health() == 4);
  REQUIRE(arena.obstacles().size() <= 6);
  REQUIRE(arena.player_bullets().empty());
  REQUIRE(arena.enemy_bullets().empty());

  for (const auto& o : arena.obstacles()) {
    REQUIRE(distance(o.center(), arena.player().center()) >= arena.config().placement.safe_radius);
    REQUIRE(distance(o.center(), arena.enemy().center()) >= arena.config().placement.safe_radius);
  }
}

TEST_CASE("Arena layout is reproducible for a seed") {
  Arena a(ArenaConfig{}, 2024);
  Arena b(ArenaConfig{}, 2024);
  REQUIRE(a.obstacles().size() == b.obstacles().size());
  for (std::size_t i = 0; i < a.obstacles().size(); ++i) {
    REQUIRE(a.obstacles()[i].aabb() == b.obstacles()[i].aabb());
    REQUIRE(a.obstacles()[i].id() == kFirstObstacleId + i);
  }
}

TEST_CASE("Arena snapshot lists obstacles, tanks, then bullets") {
  Arena arena(quiet_enemy_config(), 42);
  arena.set_obstacles({Obstacle(kFirstObstacleId, {320, 240}, ObstacleParams{})});
  arena.step(tick_at(0, {}, true));
  const ArenaSnapshot snap = arena.snapshot();

  REQUIRE(snap.tick == 1);
  REQUIRE(snap.sim_time == Approx(0.05));
  REQUIRE(snap.arena == arena.bounds());
  REQUIRE(snap.player_health == 4);
  REQUIRE(snap.enemy_health == 4);
  REQUIRE(snap.entities.size() == 4);
  REQUIRE(snap.entities[0].kind == EntityKind::Obstacle);
  REQUIRE(snap.entities[0].id == kFirstObstacleId);
  REQUIRE(snap.entities[1].kind == EntityKind::Player);
  REQUIRE(snap.entities[2].kind == EntityKind::Enemy);
  REQUIRE(snap.entities[3].kind == EntityKind::PlayerBullet);
  REQUIRE(snap.entities[3].id == kPlayerId);
  REQUIRE(snap.entities[3].facing == Facing::Up);
}

TEST_CASE("Arena snapshot order holds with random layouts") {
  Arena arena(ArenaConfig{}, 42);
  for (int i = 0; i < 30; ++i) arena.step(tick_at(i, {1.0f, -1.0f}, true));
  const ArenaSnapshot snap = arena.snapshot();
  REQUIRE(snap.entities.size() == arena.obstacles().size() + 2 +
                                  arena.player_bullets().size() + arena.enemy_bullets().size());
  for (std::size_t i = 1; i < snap.entities.size(); ++i) {
    REQUIRE(draw_rank(snap.entities[i - 1].kind) <= draw_rank(snap.entities[i].kind));
  }
}

TEST_CASE("Arena treats a bad dt as a zero-length tick") {
  Arena arena(quiet_enemy_config(), 1);
  TickInput in = tick_at(0, {1.0f, 0.0f});
  in.dt = -1.0;
  arena.step(in);
  in.dt = std::numeric_limits<double>::quiet_NaN();
  arena.step(in);
  REQUIRE(arena.player().center() == Point{118, 362});
  REQUIRE(arena.player().facing() == Facing::Right);
  REQUIRE(arena.tick() == 2);
  REQUIRE(arena.sim_time() == Approx(0.0));
}

TEST_CASE("Arena keeps the player out of obstacles") {
  Arena arena(quiet_enemy_config(), 1);
  const Obstacle wall(kFirstObstacleId, {250, 362}, ObstacleParams{}); // x 200..300
  arena.set_obstacles({wall});

  for (int i = 0; i < 120; ++i) {
    arena.step(tick_at(i, {1.0f, 0.0f}));
    REQUIRE_FALSE(overlaps(arena.player().aabb(), wall.aabb()));
  }
  REQUIRE(arena.player().aabb().right() == wall.aabb().left());
}

TEST_CASE("Tanks stop flush against each other") {
  ArenaConfig cfg = quiet_enemy_config();
  cfg.player_spawn_offset_y = 314; // same row as the enemy
  Arena arena(cfg, 1);
  const Point enemy_at = arena.enemy().center();
  REQUIRE(arena.player().center().y == enemy_at.y);

  for (int i = 0; i < 120; ++i) {
    arena.step(tick_at(i, {1.0f, 0.0f}));
    REQUIRE_FALSE(overlaps(arena.player().aabb(), arena.enemy().aabb()));
    REQUIRE(arena.enemy().center() == enemy_at);
  }
  REQUIRE(arena.player().aabb().right() == arena.enemy().aabb().left());
  REQUIRE(arena.player().center() == Point{470, 118});
  REQUIRE(arena.state() == RoundState::Playing);
}

TEST_CASE("Obstacles absorb bullets") {
  Arena arena(quiet_enemy_config(), 1);
  const Obstacle wall(kFirstObstacleId, {118, 250}, ObstacleParams{});
  arena.set_obstacles({wall});

  arena.step(tick_at(0, {}, true)); // player faces up, wall is straight ahead
  REQUIRE(arena.player_bullets().size() == 1);
  for (int i = 1; i < 20; ++i) arena.step(tick_at(i));
  REQUIRE(arena.player_bullets().empty());
  REQUIRE(arena.enemy().health() == 4);
}

TEST_CASE("Destroying the enemy wins the round") {
  ArenaConfig cfg = quiet_enemy_config();
  cfg.player_spawn_offset_y = 314; // same row as the enemy
  Arena arena(cfg, 5);
  REQUIRE(arena.player().center().y == arena.enemy().center().y);

  arena.step(tick_at(0, {1.0f, 0.0f}, true));
  int tick = 1;
  for (; tick < 400 && arena.state() == RoundState::Playing; ++tick) {
    arena.step(tick_at(tick, {}, true));
  }

  REQUIRE(arena.state() == RoundState::Victory);
  REQUIRE(arena.enemy().health() == 0);
  REQUIRE(arena.player().health() >= 3);

  const ArenaSnapshot snap = arena.snapshot();
  REQUIRE(snap.state == RoundState::Victory);
  for (const auto& e : snap.entities) REQUIRE(e.kind != EntityKind::Enemy);

  // Round over: further ticks change nothing
  const auto frozen = arena.tick();
  arena.step(tick_at(tick, {0.0f, -1.0f}, true));
  REQUIRE(arena.tick() == frozen);

  arena.reset();
  REQUIRE(arena.state() == RoundState::Playing);
  REQUIRE(arena.enemy().health() == 4);
  REQUIRE(arena.player().health() == 4);
  REQUIRE(arena.player_bullets().empty());
  REQUIRE(arena.enemy_bullets().empty());
  REQUIRE(arena.tick() == 0);
}

// Enemy straight above the player, seeking downward without moving.
static ArenaConfig column_duel_config() {
  ArenaConfig cfg{};
  cfg.placement.count = 0;
  cfg.player_spawn_offset_x = 474; // same column as the enemy
  cfg.enemy_tank.speed = 0.0f;
  cfg.ai.seek_probability = 1.0;
  cfg.ai.random_fire_probability = 0.0;
  return cfg;
}

TEST_CASE("Losing all health is a defeat") {
  Arena arena(column_duel_config(), 9);
  REQUIRE(arena.player().center().x == arena.enemy().center().x);

  for (int tick = 0; tick < 400 && arena.state() == RoundState::Playing; ++tick) {
    arena.step(tick_at(tick));
  }
  REQUIRE(arena.state() == RoundState::Defeat);
  REQUIRE(arena.player().health() == 0);
  REQUIRE(arena.enemy().health() == 4);
}

TEST_CASE("Mutual destruction in one tick counts as a defeat") {
  Arena arena(column_duel_config(), 9);

  // Player faces up at the enemy; both fire on the same ticks over equal distances.
  for (int tick = 0; tick < 400 && arena.state() == RoundState::Playing; ++tick) {
    arena.step(tick_at(tick, {}, true));
  }
  REQUIRE(arena.state() == RoundState::Defeat);
  REQUIRE(arena.player().health() == 0);
  REQUIRE(arena.enemy().health() == 0);
}
