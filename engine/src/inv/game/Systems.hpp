#pragma once
#include "inv/ecs/Registry.hpp"
#include "inv/game/Components.hpp"
#include "inv/game/Config.hpp"
#include "inv/game/FormationMaker.hpp"
#include "inv/game/State.hpp"
#include <random>

namespace inv::game {

// Counters for the run, updated by the collision pass
struct SimStats {
  std::uint32_t enemiesSpawned = 0;
  std::uint32_t enemiesKilled = 0;
  std::uint32_t playerDeaths = 0;
  std::uint32_t playerSpawns = 0;
};

// Respawns the player on a fixed cadence once the respawn delay has passed
class PlayerSpawnSystem : public ecs::System {
public:
  PlayerSpawnSystem(PlayerState &state, const SimClock &clock,
                    const Playfield &field, SimStats *stats = nullptr)
      : state_(state), clock_(clock), field_(field), stats_(stats) {}
  void update(ecs::Registry &r, float dt) override;
  // One spawn check at time `now`; returns the new player or NullEntity.
  ecs::Entity trySpawn(ecs::Registry &r, double now);

private:
  PlayerState &state_;
  const SimClock &clock_;
  Playfield field_;
  SimStats *stats_;
  float timer_ = 0.f;
};

// Spawns one enemy per interval while the population is under the cap
class EnemySpawnSystem : public ecs::System {
public:
  EnemySpawnSystem(FormationMaker &maker, EnemyCount &count,
                   const Playfield &field, SimStats *stats = nullptr)
      : maker_(maker), count_(count), field_(field), stats_(stats) {}
  void update(ecs::Registry &r, float dt) override;
  ecs::Entity trySpawn(ecs::Registry &r);

private:
  FormationMaker &maker_;
  EnemyCount &count_;
  Playfield field_;
  SimStats *stats_;
  float timer_ = 0.f;
};

// Key states -> player velocity
class PlayerControlSystem : public ecs::System {
public:
  explicit PlayerControlSystem(const InputState &input) : input_(input) {}
  void update(ecs::Registry &r, float dt) override;

private:
  const InputState &input_;
};

// Fires a pair of lasers on the fire key's press edge
class PlayerFireSystem : public ecs::System {
public:
  explicit PlayerFireSystem(const InputState &input) : input_(input) {}
  void update(ecs::Registry &r, float dt) override;

private:
  const InputState &input_;
};

// Every enemy fires together, on a random frame
class EnemyFireSystem : public ecs::System {
public:
  explicit EnemyFireSystem(std::mt19937 &rng,
                           double chance = config::kEnemyFireChance)
      : rng_(rng), chance_(chance) {}
  void update(ecs::Registry &r, float dt) override;

private:
  std::mt19937 &rng_;
  double chance_;
};

// Straight-line motion for Velocity + Movable; auto-despawns off-field lasers
class MovementSystem : public ecs::System {
public:
  explicit MovementSystem(const Playfield &field) : field_(field) {}
  void update(ecs::Registry &r, float dt) override;

private:
  Playfield field_;
};

// Keeps the player's sprite inside the playfield
class PlayerBoundsSystem : public ecs::System {
public:
  explicit PlayerBoundsSystem(const Playfield &field) : field_(field) {}
  void update(ecs::Registry &r, float dt) override;

private:
  Playfield field_;
};

// Drift + ellipse tracking for every entity with a Formation
class FormationSystem : public ecs::System {
public:
  FormationSystem(std::mt19937 &rng, const Playfield &field)
      : rng_(rng), field_(field) {}
  void update(ecs::Registry &r, float dt) override;

private:
  std::mt19937 &rng_;
  Playfield field_;
};

// Player lasers vs enemies, enemy lasers vs the player
class CollisionSystem : public ecs::System {
public:
  CollisionSystem(EnemyCount &enemies, PlayerState &player,
                  const SimClock &clock,
                  EventQueue<ExplosionSoundEvent> &sounds,
                  SimStats *stats = nullptr)
      : enemies_(enemies), player_(player), clock_(clock), sounds_(sounds),
        stats_(stats) {}
  void update(ecs::Registry &r, float dt) override;

private:
  void playerLasersVsEnemies(ecs::Registry &r);
  void enemyLasersVsPlayer(ecs::Registry &r);

  EnemyCount &enemies_;
  PlayerState &player_;
  const SimClock &clock_;
  EventQueue<ExplosionSoundEvent> &sounds_;
  SimStats *stats_;
};

// PendingExplosion markers -> animated Explosion entities
class ExplosionSpawnSystem : public ecs::System {
public:
  void update(ecs::Registry &r, float dt) override;
};

class ExplosionAnimationSystem : public ecs::System {
public:
  void update(ecs::Registry &r, float dt) override;
};

// Counts down Invincible and removes it on expiry
class InvincibilitySystem : public ecs::System {
public:
  void update(ecs::Registry &r, float dt) override;
};

} // namespace inv::game
