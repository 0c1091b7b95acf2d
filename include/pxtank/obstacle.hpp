#pragma once
#include <pxtank/collision.hpp>
#include <pxtank/geometry.hpp>

namespace pxtank {

struct ObstacleParams {
  int width{100};
  int height{32};
};

// Immobile footprint; fixed for the whole round.
class Obstacle {
public:
  Obstacle(EntityId id, Point center, const ObstacleParams& params)
    : id_(id), aabb_(Rect::centered_at(center, params.width, params.height)) {}

  EntityId id() const { return id_; }
  const Rect& aabb() const { return aabb_; }
  Point center() const { return aabb_.center(); }

  Blocker as_blocker() const { return Blocker{BlockerKind::Obstacle, id_, aabb_}; }

private:
  EntityId id_;
  Rect aabb_;
};

} // namespace pxtank
