#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <pxtank/geometry.hpp>

using Catch::Approx;
using namespace pxtank;

TEST_CASE("facing_of picks the dominant axis, ties go vertical, zero is up") {
  REQUIRE(facing_of(Vec2{0.0f, 0.0f}) == Facing::Up);

  REQUIRE(facing_of(Vec2{1.0f, 0.0f})  == Facing::Right);
  REQUIRE(facing_of(Vec2{-1.0f, 0.0f}) == Facing::Left);
  REQUIRE(facing_of(Vec2{0.0f, 1.0f})  == Facing::Down);
  REQUIRE(facing_of(Vec2{0.0f, -1.0f}) == Facing::Up);

  REQUIRE(facing_of(Vec2{3.0f, 2.0f})   == Facing::Right);
  REQUIRE(facing_of(Vec2{-5.0f, 4.9f})  == Facing::Left);
  REQUIRE(facing_of(Vec2{-2.0f, -3.0f}) == Facing::Up);

  // |x| == |y| is not "strictly greater", so vertical wins
  REQUIRE(facing_of(Vec2{1.0f, 1.0f})  == Facing::Down);
  REQUIRE(facing_of(Vec2{1.0f, -1.0f}) == Facing::Up);
  REQUIRE(facing_of(Vec2{-7.0f, 7.0f}) == Facing::Down);
}

TEST_CASE("facing_vector maps back to the unit cardinal") {
  for (Facing f : {Facing::Up, Facing::Down, Facing::Left, Facing::Right}) {
    REQUIRE(facing_of(facing_vector(f)) == f);
    REQUIRE(facing_vector(f).length() == Approx(1.0f));
  }
  REQUIRE(is_horizontal(Facing::Left));
  REQUIRE_FALSE(is_horizontal(Facing::Down));
}

TEST_CASE("Rect center round-trips through set_center") {
  Rect r{0, 0, 52, 56};
  r.set_center({100, 200});
  REQUIRE(r.x == 74);
  REQUIRE(r.y == 172);
  REQUIRE(r.center() == Point{100, 200});

  // odd sizes still round-trip
  Rect odd = Rect::centered_at({31, 17}, 25, 9);
  REQUIRE(odd.center() == Point{31, 17});
}

TEST_CASE("overlaps is strict and ignores empty rects") {
  const Rect a{0, 0, 10, 10};
  REQUIRE(overlaps(a, Rect{9, 9, 10, 10}));
  REQUIRE_FALSE(overlaps(a, Rect{10, 0, 10, 10}));  // shared edge
  REQUIRE_FALSE(overlaps(a, Rect{0, 10, 10, 10}));
  REQUIRE_FALSE(overlaps(a, Rect{5, 5, 0, 10}));    // empty
  REQUIRE(contains(a, Rect{0, 0, 10, 10}));
  REQUIRE_FALSE(contains(a, Rect{1, 1, 10, 10}));
}

TEST_CASE("clamped_into moves a rect back inside, centering oversized axes") {
  const Rect bounds{48, 48, 544, 384};

  SECTION("left overflow") {
    const Rect r = clamped_into(Rect{-5, 300, 52, 56}, bounds);
    REQUIRE(r.x == 48);
    REQUIRE(r.y == 300);
  }
  SECTION("bottom-right overflow") {
    const Rect r = clamped_into(Rect{580, 420, 52, 56}, bounds);
    REQUIRE(r.right() == bounds.right());
    REQUIRE(r.bottom() == bounds.bottom());
  }
  SECTION("wider than bounds") {
    const Rect r = clamped_into(Rect{0, 100, 600, 10}, bounds);
    REQUIRE(r.x == 48 + 272 - 300);
    REQUIRE(r.y == 100);
  }
}

TEST_CASE("round_to_int rounds halves away from zero") {
  REQUIRE(round_to_int(2.5f) == 3);
  REQUIRE(round_to_int(-2.5f) == -3);
  REQUIRE(round_to_int(2.49f) == 2);
  REQUIRE(round_point(Vec2{1.5f, -0.4f}) == Point{2, 0});
}
