#pragma once
#include "inv/game/Config.hpp"
#include <cstdint>

namespace inv::game {

// Position (+ depth for draw order) and uniform scale
struct Transform {
  float x = 0.f;
  float y = 0.f;
  float z = 0.f;
  float scale = 1.f;
};

// Direction in velocity units; the movement system scales it by kBaseSpeed
struct Velocity {
  float vx = 0.f;
  float vy = 0.f;
};

// Unscaled collision extent
struct SpriteSize {
  float w = 0.f;
  float h = 0.f;
};

struct Movable {
  bool autoDespawn = false;
};

// Tags
struct Player {};
struct EnemyTag {};
struct Laser {};
struct FromPlayer {};
struct FromEnemy {};

// Post-respawn shield; removed when timeLeft runs out
struct Invincible {
  float timeLeft = 0.f;
};

/// Elliptical flight path of one enemy. pivot, radius and speed drift at
/// their *Delta rates; the deltas are re-rolled every kFormationChangeInterval.
struct Formation {
  Vec2 start;
  Vec2 pivot;
  Vec2 radius;
  float speed = config::kBaseSpeed;
  float angle = 0.f;       // last locked-in angle on the ellipse
  float changeTimer = 0.f; // time since the deltas were rolled
  Vec2 pivotDelta;
  Vec2 radiusDelta;
  float speedDelta = 0.f;
};

// Marker entity: "something died here", turned into an Explosion next pass
struct PendingExplosion {
  float x = 0.f;
  float y = 0.f;
  float z = 0.f;
};

struct Explosion {
  std::uint32_t frame = 0;
  float timer = 0.f; // repeating, fires every kExplosionFrameInterval
};

} // namespace inv::game
