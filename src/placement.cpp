#include <pxtank/placement.hpp>
#include <algorithm>

namespace pxtank {

bool is_position_clear(const Rect& candidate,
                       const std::vector<Obstacle>& placed,
                       Point player_spawn,
                       Point enemy_spawn,
                       const PlacementParams& params) {
  const Point c = candidate.center();
  if (distance(c, player_spawn) < params.safe_radius) return false;
  if (distance(c, enemy_spawn) < params.safe_radius) return false;

  for (const auto& o : placed) {
    if (overlaps(candidate, o.aabb())) return false;
    if (distance(c, o.center()) < params.min_distance) return false;
  }
  return true;
}

std::vector<Obstacle> place_obstacles(const Rect& arena,
                                      Point player_spawn,
                                      Point enemy_spawn,
                                      const PlacementParams& params,
                                      std::mt19937& rng,
                                      EntityId first_id) {
  std::vector<Obstacle> out;
  const int min_x = arena.left() + params.inset;
  const int max_x = arena.right() - params.inset;
  const int min_y = arena.top() + params.inset;
  const int max_y = arena.bottom() - params.inset;
  if (params.count == 0 || min_x > max_x || min_y > max_y) return out;

  out.reserve(std::min(params.count, static_cast<std::size_t>(std::max(0, params.max_attempts))));
  std::uniform_int_distribution<int> X(min_x, max_x);
  std::uniform_int_distribution<int> Y(min_y, max_y);

  for (int attempts = 0; out.size() < params.count && attempts < params.max_attempts; ++attempts) {
    const Point p{X(rng), Y(rng)};
    const Rect candidate = Rect::centered_at(p, params.obstacle.width, params.obstacle.height);
    if (!is_position_clear(candidate, out, player_spawn, enemy_spawn, params)) continue;
    out.emplace_back(first_id + static_cast<EntityId>(out.size()), p, params.obstacle);
  }
  return out;
}

} // namespace pxtank
