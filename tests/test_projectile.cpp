#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <pxtank/projectile.hpp>

using Catch::Approx;
using namespace pxtank;

static const Rect kArena{48, 48, 544, 384}; // right 592, bottom 432

TEST_CASE("Projectile advances by direction * speed * dt") {
  Projectile p({300.0f, 200.0f}, {1.0f, 0.0f}, ProjectileParams{}, kArena, 1);
  REQUIRE(p.aabb() == Rect{290, 190, 20, 20});
  REQUIRE(p.speed() == Approx(360.0f));

  REQUIRE_FALSE(p.update(0.25));
  REQUIRE(p.position().x == Approx(390.0f));
  REQUIRE(p.position().y == Approx(200.0f));
  REQUIRE(p.aabb().center() == Point{390, 200});

  REQUIRE_FALSE(p.update(0.1));
  REQUIRE(p.position().x == Approx(426.0f));
}

TEST_CASE("Projectile direction is normalized, zero becomes up") {
  Projectile diag({300.0f, 200.0f}, {3.0f, 4.0f}, ProjectileParams{}, kArena, 1);
  REQUIRE(diag.direction().x == Approx(0.6f));
  REQUIRE(diag.direction().y == Approx(0.8f));

  Projectile none({300.0f, 200.0f}, {0.0f, 0.0f}, ProjectileParams{}, kArena, 2);
  REQUIRE(none.direction() == Vec2{0.0f, -1.0f});
  REQUIRE(none.facing() == Facing::Up);
  REQUIRE(none.owner() == 2);
}

TEST_CASE("Projectile expires on the first tick its box leaves the arena") {
  Projectile p({580.0f, 200.0f}, {1.0f, 0.0f}, ProjectileParams{}, kArena, 1);
  // 9 px per tick: boxes 579..599, 588..608, 597..617
  REQUIRE_FALSE(p.update(0.025));
  REQUIRE_FALSE(p.expired());
  REQUIRE_FALSE(p.update(0.025));
  REQUIRE(p.update(0.025));
  REQUIRE(p.expired());

  const Vec2 last = p.position();
  REQUIRE(p.update(0.025));
  REQUIRE(p.position() == last);
}

TEST_CASE("Projectile ignores non-positive and non-finite dt") {
  Projectile p({300.0f, 200.0f}, {0.0f, 1.0f}, ProjectileParams{}, kArena, 1);
  REQUIRE_FALSE(p.update(0.0));
  REQUIRE_FALSE(p.update(-1.0));
  REQUIRE_FALSE(p.update(std::numeric_limits<double>::quiet_NaN()));
  REQUIRE(p.aabb().center() == Point{300, 200});
}
