#pragma once
#include <cstdint>
#include <vector>
#include <pxtank/geometry.hpp>

namespace pxtank {

using EntityId = std::uint32_t;

enum class BlockerKind : std::uint8_t { Unit, Obstacle };

// One solid footprint the mover must not end up inside.
// Assembled fresh each tick by whoever owns the entities.
struct Blocker {
  BlockerKind kind{BlockerKind::Obstacle};
  EntityId id{0};
  Rect aabb{};
};

struct CollisionParams {
  int   overlap_threshold{35}; // push-apart only below this center delta on both axes
  float push_distance{2.0f};   // nudge per overlapping blocker
};

// Authoritative float position plus the integer box derived from it.
struct Body {
  Vec2 position{};
  Rect aabb{};

  void sync() { aabb.set_center(round_point(position)); }
};

// Moves body by displacement inside bounds and resolves overlaps against
// blockers: clamp to bounds, one push-apart pass, then an axis-restricted
// slide with flush contact if anything still overlaps. Unit blockers carrying
// self_id are the mover itself and are ignored.
//
// Single pass over the blockers; three or more mutually overlapping bodies
// can be left with residual overlap.
void resolve_move(Body& body,
                  Vec2 displacement,
                  const Rect& bounds,
                  const std::vector<Blocker>& blockers,
                  EntityId self_id,
                  const CollisionParams& params = {});

// True if body overlaps any blocker other than itself.
bool overlaps_any(const Rect& aabb, const std::vector<Blocker>& blockers, EntityId self_id);

} // namespace pxtank
