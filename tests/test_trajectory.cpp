#include "inv/game/Config.hpp"
#include "inv/game/FormationMaker.hpp"
#include "inv/game/Trajectory.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <random>

using namespace inv::game;

namespace {

void expectWithinLimits(const Formation &f, const Playfield &field) {
  float hSpan = field.h / 3.f - config::kFormationPivotTopMargin;
  EXPECT_GE(f.pivot.x, -field.w / 4.f);
  EXPECT_LE(f.pivot.x, field.w / 4.f);
  EXPECT_GE(f.pivot.y, 0.f);
  EXPECT_LE(f.pivot.y, hSpan);
  EXPECT_GE(f.radius.x, config::kRadiusXClampMin);
  EXPECT_LE(f.radius.x, config::kRadiusXClampMax);
  EXPECT_GE(f.radius.y, config::kRadiusYClampMin);
  EXPECT_LE(f.radius.y, config::kRadiusYClampMax);
  EXPECT_GE(f.speed, config::kBaseSpeed * config::kSpeedClampMinFactor);
  EXPECT_LE(f.speed, config::kBaseSpeed * config::kSpeedClampMaxFactor);
}

} // namespace

TEST(Trajectory, DriftStaysInsideLimitsOverLongRuns) {
  std::mt19937 rng(99);
  Playfield field{};
  FormationMaker maker(rng);
  Formation f = maker.make(field);
  Transform t{f.start.x, f.start.y, config::kShipDepth, config::kSpriteScale};

  const float dt = 1.f / 60.f;
  for (int i = 0; i < 20000; ++i) {
    driftFormation(f, dt, rng, field);
    trackFormation(f, t, dt);
    expectWithinLimits(f, field);
    ASSERT_FALSE(std::isnan(t.x));
    ASSERT_FALSE(std::isnan(t.y));
    ASSERT_LE(std::abs(f.angle), 3.1416f);
  }
}

TEST(Trajectory, ClampPullsExtremeValuesBack) {
  Playfield field{};
  Formation f;
  f.pivot = {10000.f, -500.f};
  f.radius = {1.f, 1000.f};
  f.speed = 1e6f;
  clampFormation(f, field);
  expectWithinLimits(f, field);
  EXPECT_FLOAT_EQ(f.pivot.x, field.w / 4.f);
  EXPECT_FLOAT_EQ(f.pivot.y, 0.f);
  EXPECT_FLOAT_EQ(f.radius.x, config::kRadiusXClampMin);
  EXPECT_FLOAT_EQ(f.radius.y, config::kRadiusYClampMax);
  EXPECT_FLOAT_EQ(f.speed, config::kBaseSpeed * config::kSpeedClampMaxFactor);
}

TEST(Trajectory, ClampOnTinyPlayfieldKeepsPivotBoxNonEmpty) {
  Playfield field{100.f, 90.f}; // h/3 - 50 < 0
  Formation f;
  f.pivot = {0.f, 20.f};
  f.radius = {100.f, 100.f};
  clampFormation(f, field);
  EXPECT_FLOAT_EQ(f.pivot.y, 0.f);
}

TEST(Trajectory, DriftRerollsOnlyAfterChangeInterval) {
  std::mt19937 rng(5);
  Playfield field{};
  Formation f;
  f.radius = {100.f, 100.f};
  f.speedDelta = 0.f;
  f.pivotDelta = {0.f, 0.f};
  f.radiusDelta = {0.f, 0.f};

  driftFormation(f, 0.25f, rng, field);
  EXPECT_FLOAT_EQ(f.changeTimer, 0.25f);
  EXPECT_FLOAT_EQ(f.speedDelta, 0.f);
  driftFormation(f, 0.25f, rng, field); // exactly the interval: not yet
  EXPECT_FLOAT_EQ(f.changeTimer, 0.5f);
  driftFormation(f, 0.01f, rng, field);
  EXPECT_FLOAT_EQ(f.changeTimer, 0.f);
}

TEST(Trajectory, DirectionFollowsEntrySide) {
  Formation left;
  left.start = {-400.f, 0.f};
  Formation right;
  right.start = {400.f, 0.f};
  EXPECT_FLOAT_EQ(formationDirection(left), 1.f);
  EXPECT_FLOAT_EQ(formationDirection(right), -1.f);

  left.radius = right.radius = {100.f, 100.f};
  EXPECT_GT(nextFormationAngle(left, 0.1f), left.angle);
  EXPECT_LT(nextFormationAngle(right, 0.1f), right.angle);
}

TEST(Trajectory, ShipOnTargetDoesNotMoveOrProduceNaN) {
  Formation f;
  f.start = {-400.f, 0.f};
  f.pivot = {0.f, 100.f};
  f.radius = {120.f, 100.f};
  f.angle = 0.3f;
  const float dt = 1.f / 60.f;

  float expectedAngle = nextFormationAngle(f, dt);
  Vec2 target = formationPoint(f, expectedAngle);
  Transform t{target.x, target.y, config::kShipDepth, config::kSpriteScale};

  trackFormation(f, t, dt);
  EXPECT_FALSE(std::isnan(t.x));
  EXPECT_FALSE(std::isnan(t.y));
  EXPECT_FLOAT_EQ(t.x, target.x);
  EXPECT_FLOAT_EQ(t.y, target.y);
  EXPECT_FLOAT_EQ(f.angle, expectedAngle);
}

TEST(Trajectory, FarShipStepsAtMostSpeedTimesDtAndKeepsAngle) {
  Formation f;
  f.start = {-400.f, 0.f};
  f.pivot = {0.f, 100.f};
  f.radius = {120.f, 100.f};
  f.angle = 1.f;
  const float dt = 1.f / 60.f;
  Transform t{-400.f, -300.f, config::kShipDepth, config::kSpriteScale};

  trackFormation(f, t, dt);
  float moved = std::hypot(t.x + 400.f, t.y + 300.f);
  EXPECT_NEAR(moved, f.speed * dt, 1e-3f);
  EXPECT_FLOAT_EQ(f.angle, 1.f);
}

TEST(Trajectory, NearShipLandsOnTargetWithoutOvershoot) {
  Formation f;
  f.start = {400.f, 0.f};
  f.pivot = {0.f, 100.f};
  f.radius = {120.f, 100.f};
  const float dt = 1.f / 60.f;

  Vec2 target = formationPoint(f, nextFormationAngle(f, dt));
  Transform t{target.x + 1.f, target.y - 0.5f, config::kShipDepth, config::kSpriteScale};
  trackFormation(f, t, dt);
  EXPECT_FLOAT_EQ(t.x, target.x);
  EXPECT_FLOAT_EQ(t.y, target.y);
}

TEST(Trajectory, LockedAngleIsWrapped) {
  Formation f;
  f.start = {-400.f, 0.f};
  f.pivot = {0.f, 100.f};
  f.radius = {120.f, 100.f};
  f.angle = 100.f;
  const float dt = 1.f / 60.f;

  float raw = nextFormationAngle(f, dt);
  Vec2 target = formationPoint(f, raw);
  Transform t{target.x, target.y, config::kShipDepth, config::kSpriteScale};
  trackFormation(f, t, dt);

  EXPECT_LE(std::abs(f.angle), 3.1416f);
  // Same point on the ellipse as the unwrapped angle
  Vec2 wrapped = formationPoint(f, f.angle);
  EXPECT_NEAR(wrapped.x, target.x, 1e-2f);
  EXPECT_NEAR(wrapped.y, target.y, 1e-2f);
}
