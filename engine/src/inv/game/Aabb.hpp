#pragma once
#include "inv/game/Components.hpp"

namespace inv::game {

struct Aabb {
  float minX = 0.f;
  float minY = 0.f;
  float maxX = 0.f;
  float maxY = 0.f;
};

// Box centered on the transform, half-extent = size * scale / 2
inline Aabb makeAabb(const Transform &t, const SpriteSize &s) {
  float hw = s.w * t.scale * 0.5f;
  float hh = s.h * t.scale * 0.5f;
  return Aabb{t.x - hw, t.y - hh, t.x + hw, t.y + hh};
}

// Touching edges count as overlap
inline bool intersects(const Aabb &a, const Aabb &b) {
  return a.minX <= b.maxX && b.minX <= a.maxX && a.minY <= b.maxY &&
         b.minY <= a.maxY;
}

} // namespace inv::game
