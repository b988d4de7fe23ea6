#pragma once
#include "inv/ecs/Registry.hpp"
#include "inv/game/Config.hpp"
#include "inv/game/FormationMaker.hpp"
#include "inv/game/State.hpp"
#include "inv/game/Systems.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace inv::game {

/**
 * @brief The whole simulation: entity store, shared state and the ordered
 * list of per-frame systems.
 *
 * Per step: player spawn check -> enemy spawn -> input -> firing ->
 * linear motion -> player bounds -> formations -> collisions ->
 * explosions -> invincibility, then queued destroys are applied.
 * Systems hold references into this object, so it is neither copyable nor
 * movable.
 */
class World {
public:
  explicit World(const WorldConfig &config = WorldConfig{});
  ~World() = default;

  World(const World &) = delete;
  World &operator=(const World &) = delete;
  World(World &&) = delete;
  World &operator=(World &&) = delete;

  // Advance one frame. Negative dt is treated as zero.
  void step(float dt, const InputState &input);

  // Kill-sound cues produced by the last step; undrained cues are dropped
  // at the start of the next one.
  std::vector<ExplosionSoundEvent> drainSoundEvents() { return sounds_.drain(); }

  // Back to an empty field with fresh state (same playfield and seed stream).
  void reset();

  ecs::Registry &registry() { return registry_; }
  const ecs::Registry &registry() const { return registry_; }
  const Playfield &playfield() const { return config_.playfield; }
  const PlayerState &playerState() const { return player_; }
  const EnemyCount &enemyCount() const { return enemies_; }
  const SimClock &clock() const { return clock_; }
  const SimStats &stats() const { return stats_; }
  std::uint32_t seed() const { return seed_; }

  // Live player entity, or NullEntity while dead
  ecs::Entity player();

private:
  void installSystems();

  WorldConfig config_;
  std::uint32_t seed_;
  std::mt19937 rng_;
  FormationMaker formations_;
  PlayerState player_;
  EnemyCount enemies_;
  SimClock clock_;
  SimStats stats_;
  InputState input_;
  EventQueue<ExplosionSoundEvent> sounds_;
  ecs::Registry registry_; // last: its systems point at the members above
};

} // namespace inv::game
