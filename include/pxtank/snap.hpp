#pragma once
#include <cstdint>
#include <vector>
#include <pxtank/collision.hpp>
#include <pxtank/geometry.hpp>

namespace pxtank {

enum class RoundState : std::uint8_t { Playing, Victory, Defeat };

enum class EntityKind : std::uint8_t { Player, Enemy, Obstacle, PlayerBullet, EnemyBullet };

// One live entity as the renderer sees it.
struct EntityPose {
  EntityKind kind{EntityKind::Obstacle};
  EntityId id{0};
  Rect aabb{};
  Facing facing{Facing::Up};
};

// Single immutable sample of world state for the client
struct ArenaSnapshot {
  std::uint64_t tick = 0;     // sim tick index
  double sim_time = 0.0;      // accumulated sim time (s)
  RoundState state = RoundState::Playing;
  Rect arena{};               // playfield bounds
  int player_health = 0;      // may be negative; show max(0, hp)
  int enemy_health = 0;
  std::vector<EntityPose> entities; // obstacles, tanks, then bullets
};

inline const char* round_state_name(RoundState s) {
  switch (s) {
    case RoundState::Playing: return "playing";
    case RoundState::Victory: return "victory";
    case RoundState::Defeat:  return "defeat";
  }
  return "playing";
}

} // namespace pxtank
