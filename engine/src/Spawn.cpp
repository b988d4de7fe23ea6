#include "inv/game/Spawn.hpp"

using namespace inv::game;
using inv::ecs::Entity;
using inv::ecs::Registry;

Transform inv::game::playerSpawnTransform(const Playfield& field) {
    float bottom = -field.h / 2.f;
    return Transform{0.f,
                     bottom + config::kPlayerSize.y / 2.f * config::kSpriteScale + config::kPlayerSpawnLift,
                     config::kShipDepth, config::kSpriteScale};
}

Entity inv::game::spawnPlayer(Registry& r, const Playfield& field) {
    auto e = r.create();
    r.emplace<Transform>(e, playerSpawnTransform(field));
    r.emplace<Player>(e, {});
    r.emplace<SpriteSize>(e, {config::kPlayerSize.x, config::kPlayerSize.y});
    r.emplace<Movable>(e, {false});
    r.emplace<Velocity>(e, {0.f, 0.f});
    r.emplace<Invincible>(e, {config::kInvincibleDuration});
    return e;
}

Entity inv::game::spawnEnemy(Registry& r, const Formation& formation) {
    auto e = r.create();
    r.emplace<Transform>(e, {formation.start.x, formation.start.y, config::kShipDepth, config::kSpriteScale});
    r.emplace<EnemyTag>(e, {});
    r.emplace<Formation>(e, formation);
    r.emplace<SpriteSize>(e, {config::kEnemySize.x, config::kEnemySize.y});
    return e;
}

Entity inv::game::spawnPlayerLaser(Registry& r, float x, float y) {
    auto b = r.create();
    r.emplace<Transform>(b, {x, y, 0.f, config::kSpriteScale});
    r.emplace<Laser>(b, {});
    r.emplace<FromPlayer>(b, {});
    r.emplace<SpriteSize>(b, {config::kPlayerLaserSize.x, config::kPlayerLaserSize.y});
    r.emplace<Movable>(b, {true});
    r.emplace<Velocity>(b, {0.f, 1.f});
    return b;
}

Entity inv::game::spawnEnemyLaser(Registry& r, float x, float y) {
    auto b = r.create();
    r.emplace<Transform>(b, {x, y, 0.f, config::kSpriteScale});
    r.emplace<Laser>(b, {});
    r.emplace<FromEnemy>(b, {});
    r.emplace<SpriteSize>(b, {config::kEnemyLaserSize.x, config::kEnemyLaserSize.y});
    r.emplace<Movable>(b, {true});
    r.emplace<Velocity>(b, {0.f, -1.f});
    return b;
}

Entity inv::game::spawnPendingExplosion(Registry& r, const Transform& at) {
    auto e = r.create();
    r.emplace<PendingExplosion>(e, {at.x, at.y, at.z});
    return e;
}

Entity inv::game::spawnExplosion(Registry& r, const PendingExplosion& at) {
    auto e = r.create();
    r.emplace<Transform>(e, {at.x, at.y, at.z, 1.f});
    r.emplace<Explosion>(e, {});
    return e;
}
