#pragma once
#include <cstddef>
#include <random>
#include <vector>
#include <pxtank/geometry.hpp>
#include <pxtank/obstacle.hpp>

namespace pxtank {

struct PlacementParams {
  std::size_t count{6};
  int   inset{100};          // candidates stay this far inside every arena edge
  float min_distance{100.0f}; // center-to-center spacing between obstacles
  float safe_radius{80.0f};   // keep-out around each spawn point
  int   max_attempts{1000};
  ObstacleParams obstacle{};
};

// Rejection sampling. Stops at params.count or when attempts run out, so the
// result may hold fewer obstacles than requested. Ids start at first_id.
// Deterministic with caller-provided rng.
std::vector<Obstacle> place_obstacles(const Rect& arena,
                                      Point player_spawn,
                                      Point enemy_spawn,
                                      const PlacementParams& params,
                                      std::mt19937& rng,
                                      EntityId first_id = 100);

// The acceptance test used by place_obstacles, exposed for tests and tools.
bool is_position_clear(const Rect& candidate,
                       const std::vector<Obstacle>& placed,
                       Point player_spawn,
                       Point enemy_spawn,
                       const PlacementParams& params);

} // namespace pxtank
