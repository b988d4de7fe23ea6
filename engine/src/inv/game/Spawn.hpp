#pragma once
#include "inv/ecs/Registry.hpp"
#include "inv/game/Components.hpp"
#include "inv/game/Config.hpp"

namespace inv::game {

// Bottom-center spawn point of the player ship
Transform playerSpawnTransform(const Playfield &field);

// Player with zero velocity and a fresh invincibility window
ecs::Entity spawnPlayer(ecs::Registry &r, const Playfield &field);

ecs::Entity spawnEnemy(ecs::Registry &r, const Formation &formation);

ecs::Entity spawnPlayerLaser(ecs::Registry &r, float x, float y);
ecs::Entity spawnEnemyLaser(ecs::Registry &r, float x, float y);

ecs::Entity spawnPendingExplosion(ecs::Registry &r, const Transform &at);
ecs::Entity spawnExplosion(ecs::Registry &r, const PendingExplosion &at);

} // namespace inv::game
