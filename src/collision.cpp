#include <pxtank/collision.hpp>
#include <cmath>
#include <cstdlib>

namespace pxtank {

namespace {

enum class Axis { X, Y };

static bool is_self(const Blocker& b, EntityId self_id) {
  return b.kind == BlockerKind::Unit && b.id == self_id;
}

static void clamp_to_bounds(Body& body, const Rect& bounds) {
  if (contains(bounds, body.aabb)) return;
  body.aabb = clamped_into(body.aabb, bounds);
  body.position = to_vec(body.aabb.center());
}

// Applies one displacement component from the current position, then puts the
// leading edge flush against every blocker still overlapped (last one wins).
static bool slide_axis(Body& body, Axis axis, float delta,
                       const std::vector<Blocker>& blockers, EntityId self_id) {
  if (axis == Axis::X) {
    body.position.x += delta;
    body.aabb.set_center_x(round_to_int(body.position.x));
  } else {
    body.position.y += delta;
    body.aabb.set_center_y(round_to_int(body.position.y));
  }

  bool hit = false;
  for (const auto& b : blockers) {
    if (is_self(b, self_id) || !overlaps(body.aabb, b.aabb)) continue;
    hit = true;
    if (axis == Axis::X) {
      if (delta > 0.0f)      body.aabb.set_right(b.aabb.left());
      else if (delta < 0.0f) body.aabb.set_left(b.aabb.right());
      body.position.x = static_cast<float>(body.aabb.center().x);
    } else {
      if (delta > 0.0f)      body.aabb.set_bottom(b.aabb.top());
      else if (delta < 0.0f) body.aabb.set_top(b.aabb.bottom());
      body.position.y = static_cast<float>(body.aabb.center().y);
    }
  }
  return hit;
}

} // namespace

bool overlaps_any(const Rect& aabb, const std::vector<Blocker>& blockers, EntityId self_id) {
  for (const auto& b : blockers) {
    if (!is_self(b, self_id) && overlaps(aabb, b.aabb)) return true;
  }
  return false;
}

void resolve_move(Body& body,
                  Vec2 displacement,
                  const Rect& bounds,
                  const std::vector<Blocker>& blockers,
                  EntityId self_id,
                  const CollisionParams& params) {
  if (displacement.is_zero()) return;

  const Body origin = body;

  // Full diagonal step first.
  body.position += displacement;
  body.sync();
  clamp_to_bounds(body, bounds);

  // Push-apart: nudge along the dominant axis of the center delta.
  bool touched = false;
  for (const auto& b : blockers) {
    if (is_self(b, self_id) || !overlaps(body.aabb, b.aabb)) continue;
    touched = true;
    const Point mc = body.aabb.center();
    const Point bc = b.aabb.center();
    const int dx = mc.x - bc.x;
    const int dy = mc.y - bc.y;
    if (dx == 0 && dy == 0) continue; // coincident centers have no "away"
    if (std::abs(dx) < params.overlap_threshold && std::abs(dy) < params.overlap_threshold) {
      if (std::abs(dx) > std::abs(dy)) body.position.x += dx > 0 ? params.push_distance : -params.push_distance;
      else                             body.position.y += dy > 0 ? params.push_distance : -params.push_distance;
      body.sync();
    }
  }

  if (touched && overlaps_any(body.aabb, blockers, self_id)) {
    // Slide: retry from the pre-move position on the dominant axis only.
    body = origin;
    const bool x_major = std::fabs(displacement.x) > std::fabs(displacement.y);
    const Axis major = x_major ? Axis::X : Axis::Y;
    const Axis minor = x_major ? Axis::Y : Axis::X;
    const float major_delta = x_major ? displacement.x : displacement.y;
    const float minor_delta = x_major ? displacement.y : displacement.x;

    if (slide_axis(body, major, major_delta, blockers, self_id) && minor_delta != 0.0f) {
      slide_axis(body, minor, minor_delta, blockers, self_id);
    }
  }

  clamp_to_bounds(body, bounds);
}

} // namespace pxtank
