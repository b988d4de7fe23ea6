#include "inv/game/Components.hpp"
#include "inv/game/Config.hpp"
#include "inv/game/FormationMaker.hpp"
#include "inv/game/Spawn.hpp"
#include "inv/game/State.hpp"
#include "inv/game/Systems.hpp"
#include <cstdint>
#include <gtest/gtest.h>
#include <random>

using namespace inv::game;
using inv::ecs::NullEntity;
using inv::ecs::Registry;

TEST(PlayerRespawn, OnlyStrictlyAfterDelay) {
  Registry r;
  Playfield field{};
  PlayerState state;
  SimClock clock;
  PlayerSpawnSystem spawner(state, clock, field);

  state.killed(10.0);
  EXPECT_EQ(spawner.trySpawn(r, 10.0 + config::kPlayerRespawnDelay - 0.01), NullEntity);
  EXPECT_EQ(spawner.trySpawn(r, 10.0 + config::kPlayerRespawnDelay), NullEntity);
  EXPECT_TRUE(r.query<Player>().empty());

  auto p = spawner.trySpawn(r, 10.0 + config::kPlayerRespawnDelay + 0.01);
  ASSERT_NE(p, NullEntity);
  EXPECT_TRUE(state.alive());

  auto *t = r.get<Transform>(p);
  EXPECT_FLOAT_EQ(t->x, 0.f);
  EXPECT_FLOAT_EQ(t->y, -field.h / 2.f + config::kPlayerSize.y / 2.f * config::kSpriteScale + 5.f);
  EXPECT_FLOAT_EQ(t->z, config::kShipDepth);
  EXPECT_FLOAT_EQ(t->scale, config::kSpriteScale);
  ASSERT_TRUE(r.has<Invincible>(p));
  EXPECT_FLOAT_EQ(r.get<Invincible>(p)->timeLeft, config::kInvincibleDuration);
  EXPECT_FLOAT_EQ(r.get<Velocity>(p)->vx, 0.f);

  // Alive: no second player
  EXPECT_EQ(spawner.trySpawn(r, 100.0), NullEntity);
  EXPECT_EQ(r.query<Player>().size(), 1u);
}

TEST(PlayerRespawn, FirstSpawnNeedsNoDeath) {
  Registry r;
  Playfield field{};
  PlayerState state;
  SimClock clock;
  PlayerSpawnSystem spawner(state, clock, field);
  EXPECT_NE(spawner.trySpawn(r, 0.0), NullEntity);
}

TEST(PlayerRespawn, ChecksOnlyOnTheSpawnCadence) {
  Registry r;
  Playfield field{};
  PlayerState state;
  SimClock clock;
  SimStats stats;
  PlayerSpawnSystem spawner(state, clock, field, &stats);

  clock.elapsed = 0.25;
  spawner.update(r, 0.25f);
  EXPECT_TRUE(r.query<Player>().empty());
  clock.elapsed = 0.5;
  spawner.update(r, 0.25f);
  EXPECT_EQ(r.query<Player>().size(), 1u);
  EXPECT_EQ(stats.playerSpawns, 1u);
}

TEST(PlayerState, KillAndSpawnTransitions) {
  PlayerState s;
  EXPECT_FALSE(s.alive());
  EXPECT_TRUE(s.canRespawn(0.0, 2.0));
  s.spawned();
  EXPECT_FALSE(s.canRespawn(50.0, 2.0));
  s.killed(4.0);
  EXPECT_FALSE(s.alive());
  EXPECT_FALSE(s.canRespawn(6.0, 2.0));
  EXPECT_TRUE(s.canRespawn(6.001, 2.0));
}

TEST(Invincibility, ExpiresAfterDuration) {
  Registry r;
  Playfield field{};
  InvincibilitySystem shield;
  auto p = spawnPlayer(r, field);

  shield.update(r, 1.f);
  ASSERT_TRUE(r.has<Invincible>(p));
  EXPECT_FLOAT_EQ(r.get<Invincible>(p)->timeLeft, config::kInvincibleDuration - 1.f);
  shield.update(r, 1.f);
  EXPECT_FALSE(r.has<Invincible>(p));
  EXPECT_TRUE(r.alive(p));
}

TEST(Explosion, MarkerBecomesAnimatedExplosion) {
  Registry r;
  ExplosionSpawnSystem materialize;
  auto marker = spawnPendingExplosion(r, Transform{12.f, -30.f, 10.f, 0.5f});

  materialize.update(r, 0.f);
  EXPECT_TRUE(r.pendingDestroy(marker));
  auto blasts = r.query<Explosion, Transform>();
  ASSERT_EQ(blasts.size(), 1u);
  auto *t = r.get<Transform>(blasts.front());
  EXPECT_FLOAT_EQ(t->x, 12.f);
  EXPECT_FLOAT_EQ(t->y, -30.f);
  EXPECT_FLOAT_EQ(t->z, 10.f);
  EXPECT_EQ(r.get<Explosion>(blasts.front())->frame, 0u);

  r.flushDestroyed();
  materialize.update(r, 0.f);
  EXPECT_EQ(r.query<Explosion>().size(), 1u);
}

TEST(Explosion, DespawnsAfterLastFrame) {
  Registry r;
  ExplosionAnimationSystem animate;
  auto e = spawnExplosion(r, PendingExplosion{0.f, 0.f, 0.f});

  for (std::uint32_t i = 0; i + 1 < config::kExplosionFrames; ++i) {
    animate.update(r, config::kExplosionFrameInterval);
  }
  EXPECT_EQ(r.get<Explosion>(e)->frame, config::kExplosionFrames - 1);
  EXPECT_FALSE(r.pendingDestroy(e));

  animate.update(r, config::kExplosionFrameInterval);
  EXPECT_TRUE(r.pendingDestroy(e));
  r.flushDestroyed();
  EXPECT_FALSE(r.alive(e));
}

TEST(Explosion, LargeStepAdvancesSeveralFrames) {
  Registry r;
  ExplosionAnimationSystem animate;
  auto e = spawnExplosion(r, PendingExplosion{});
  animate.update(r, config::kExplosionFrameInterval * 3.5f);
  EXPECT_EQ(r.get<Explosion>(e)->frame, 3u);
  animate.update(r, 10.f);
  EXPECT_TRUE(r.pendingDestroy(e));
}

TEST(EnemyCount, CountsUpAndDown) {
  EnemyCount c;
  c.increment();
  c.increment();
  EXPECT_EQ(c.value(), 2u);
  c.decrement();
  EXPECT_EQ(c.value(), 1u);
}

TEST(EnemyCountDeathTest, NeverGoesBelowZero) {
  EnemyCount c;
  EXPECT_DEBUG_DEATH(c.decrement(), "underflow");
  EXPECT_EQ(c.value(), 0u);
}

TEST(EnemySpawn, RespectsPopulationCap) {
  Registry r;
  std::mt19937 rng(11);
  Playfield field{};
  FormationMaker maker(rng);
  EnemyCount count;
  EnemySpawnSystem spawner(maker, count, field);

  auto a = spawner.trySpawn(r);
  auto b = spawner.trySpawn(r);
  ASSERT_NE(a, NullEntity);
  ASSERT_NE(b, NullEntity);
  EXPECT_EQ(spawner.trySpawn(r), NullEntity);
  EXPECT_EQ(count.value(), config::kEnemyMax);
  EXPECT_EQ(r.query<EnemyTag>().size(), config::kEnemyMax);

  // Both members of one batch start at the same point
  auto *fa = r.get<Formation>(a);
  auto *fb = r.get<Formation>(b);
  EXPECT_EQ(fa->start, fb->start);
  EXPECT_FLOAT_EQ(r.get<Transform>(a)->x, fa->start.x);
  EXPECT_FLOAT_EQ(r.get<Transform>(a)->z, config::kShipDepth);

  count.decrement();
  EXPECT_NE(spawner.trySpawn(r), NullEntity);
}

TEST(EnemySpawn, OnePerInterval) {
  Registry r;
  std::mt19937 rng(12);
  Playfield field{};
  FormationMaker maker(rng);
  EnemyCount count;
  EnemySpawnSystem spawner(maker, count, field);

  spawner.update(r, 0.5f);
  EXPECT_EQ(count.value(), 0u);
  spawner.update(r, 0.5f);
  EXPECT_EQ(count.value(), 1u);
  spawner.update(r, 0.5f);
  EXPECT_EQ(count.value(), 1u);
}
