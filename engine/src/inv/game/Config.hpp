#pragma once
#include <cmath>
#include <cstdint>
#include <optional>

namespace inv::game {

struct Vec2 {
  float x = 0.f;
  float y = 0.f;
};

inline bool operator==(const Vec2 &a, const Vec2 &b) {
  return a.x == b.x && a.y == b.y;
}
inline bool operator!=(const Vec2 &a, const Vec2 &b) { return !(a == b); }

// Playfield extent in world units. The origin sits at the center, +y is up.
struct Playfield {
  float w = 598.f;
  float h = 676.f;
};

// Both extents finite and strictly positive
inline bool validPlayfield(const Playfield &field) {
  return std::isfinite(field.w) && std::isfinite(field.h) && field.w > 0.f &&
         field.h > 0.f;
}

struct WorldConfig {
  Playfield playfield{};
  std::optional<std::uint32_t> seed; // unset: seeded from std::random_device
};

namespace config {

// Speeds
constexpr float kBaseSpeed = 500.f;
constexpr float kPlayerSpeed = 1.f; // velocity units, scaled by kBaseSpeed

// Sprites (unscaled pixel sizes)
constexpr float kSpriteScale = 0.5f;
constexpr Vec2 kPlayerSize{144.f, 75.f};
constexpr Vec2 kPlayerLaserSize{9.f, 54.f};
constexpr Vec2 kEnemySize{144.f, 75.f};
constexpr Vec2 kEnemyLaserSize{17.f, 55.f};
constexpr float kPlayerLaserOffsetY = 15.f;
constexpr float kEnemyLaserOffsetY = 15.f;
constexpr float kShipDepth = 10.f;

// Explosion sheet: 4x4 grid of 64px frames
constexpr std::uint32_t kExplosionFrames = 16;
constexpr int kExplosionSheetCols = 4;
constexpr int kExplosionSheetRows = 4;
constexpr float kExplosionFramePx = 64.f;
constexpr float kExplosionFrameInterval = 0.05f;

// Player lifecycle
constexpr double kPlayerRespawnDelay = 2.0;
constexpr float kPlayerSpawnCheckInterval = 0.5f;
constexpr float kInvincibleDuration = 2.f;
constexpr float kPlayerSpawnLift = 5.f;

// Enemies
constexpr std::uint32_t kEnemyMax = 2;
constexpr std::uint32_t kFormationMembersMax = 2;
constexpr float kEnemySpawnInterval = 1.f;
constexpr double kEnemyFireChance = 1.0 / 60.0;

// Formation generation and drift
constexpr float kFormationStartMargin = 100.f;
constexpr float kFormationPivotTopMargin = 50.f;
constexpr float kFormationRadiusXMin = 80.f;
constexpr float kFormationRadiusXMax = 150.f;
constexpr float kFormationRadiusY = 100.f;
constexpr float kFormationChangeInterval = 0.5f;
constexpr float kPivotDriftRange = 20.f;
constexpr float kRadiusDriftRange = 10.f;
constexpr float kSpeedDriftRange = 10.f;
constexpr float kRadiusXClampMin = 50.f;
constexpr float kRadiusXClampMax = 200.f;
constexpr float kRadiusYClampMin = 50.f;
constexpr float kRadiusYClampMax = 150.f;
constexpr float kSpeedClampMinFactor = 0.5f;
constexpr float kSpeedClampMaxFactor = 1.5f;
// Angle locks in once the ship is within speed * dt * speed / 20 of its target
constexpr float kAngleLockDivisor = 20.f;

// Lasers leaving the playfield by more than this are despawned
constexpr float kDespawnMargin = 200.f;

} // namespace config
} // namespace inv::game
