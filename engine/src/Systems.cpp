#include <cmath>
#include <algorithm>
#include <random>
#include <sstream>
#include <unordered_set>
#include <vector>
#include "inv/game/Systems.hpp"
#include "inv/game/Aabb.hpp"
#include "inv/game/Spawn.hpp"
#include "inv/game/Trajectory.hpp"
#include "inv/util/Log.hpp"
using namespace inv::game;
using inv::ecs::Entity;
using inv::ecs::NullEntity;
using inv::ecs::Registry;

void PlayerSpawnSystem::update(Registry& r, float dt) {
    timer_ += dt;
    if (timer_ < config::kPlayerSpawnCheckInterval) return;
    timer_ -= config::kPlayerSpawnCheckInterval;
    trySpawn(r, clock_.elapsed);
}

Entity PlayerSpawnSystem::trySpawn(Registry& r, double now) {
    if (!state_.canRespawn(now, config::kPlayerRespawnDelay)) return NullEntity;
    auto e = spawnPlayer(r, field_);
    state_.spawned();
    if (stats_) stats_->playerSpawns += 1;
    inv::log::debug("Player spawned at t=" + std::to_string(now));
    return e;
}

void EnemySpawnSystem::update(Registry& r, float dt) {
    timer_ += dt;
    if (timer_ < config::kEnemySpawnInterval) return;
    timer_ -= config::kEnemySpawnInterval;
    trySpawn(r);
}

Entity EnemySpawnSystem::trySpawn(Registry& r) {
    if (count_.value() >= config::kEnemyMax) return NullEntity;
    Formation f = maker_.make(field_);
    auto e = spawnEnemy(r, f);
    count_.increment();
    if (stats_) stats_->enemiesSpawned += 1;
    if (inv::log::enabled(inv::log::Level::Debug)) {
        std::ostringstream os;
        os << "Spawn enemy at (" << f.start.x << "," << f.start.y << ") count=" << count_.value();
        inv::log::debug(os.str());
    }
    return e;
}

void PlayerControlSystem::update(Registry& r, float dt) {
    (void)dt;
    for (auto& [e, _] : r.storage<Player>().data()) {
        (void)_;
        auto* v = r.get<Velocity>(e);
        if (!v) continue;
        float vx = 0.f, vy = 0.f;
        if (input_.left)  vx -= 1.f;
        if (input_.right) vx += 1.f;
        if (input_.up)    vy += 1.f;
        if (input_.down)  vy -= 1.f;
        // Same speed on diagonals
        float len2 = vx * vx + vy * vy;
        if (len2 > 0.f) {
            float len = std::sqrt(len2);
            vx = vx / len * config::kPlayerSpeed;
            vy = vy / len * config::kPlayerSpeed;
        }
        v->vx = vx;
        v->vy = vy;
    }
}

void PlayerFireSystem::update(Registry& r, float dt) {
    (void)dt;
    if (!input_.firePressed) return;
    auto players = r.query<Player, Transform>();
    if (players.empty()) return;
    auto* t = r.get<Transform>(players.front());
    float x = t->x, y = t->y;
    // One laser from each wing
    float xOffset = config::kPlayerSize.x / 2.f * config::kSpriteScale - 5.f;
    spawnPlayerLaser(r, x + xOffset, y + config::kPlayerLaserOffsetY);
    spawnPlayerLaser(r, x - xOffset, y + config::kPlayerLaserOffsetY);
}

void EnemyFireSystem::update(Registry& r, float dt) {
    (void)dt;
    std::bernoulli_distribution fire(chance_);
    if (!fire(rng_)) return;
    for (auto e : r.query<EnemyTag, Transform>()) {
        if (r.pendingDestroy(e)) continue;
        auto* t = r.get<Transform>(e);
        spawnEnemyLaser(r, t->x, t->y - config::kEnemyLaserOffsetY);
    }
}

void MovementSystem::update(Registry& r, float dt) {
    float maxX = field_.w / 2.f + config::kDespawnMargin;
    float maxY = field_.h / 2.f + config::kDespawnMargin;
    for (auto& [e, mv] : r.storage<Movable>().data()) {
        auto* v = r.get<Velocity>(e);
        auto* t = r.get<Transform>(e);
        if (!v || !t) continue;
        t->x += v->vx * dt * config::kBaseSpeed;
        t->y += v->vy * dt * config::kBaseSpeed;
        if (!mv.autoDespawn) continue;
        if (t->y > maxY || t->y < -maxY || t->x > maxX || t->x < -maxX) {
            r.queueDestroy(e);
        }
    }
}

void PlayerBoundsSystem::update(Registry& r, float dt) {
    (void)dt;
    for (auto& [e, _] : r.storage<Player>().data()) {
        (void)_;
        auto* t = r.get<Transform>(e);
        auto* sz = r.get<SpriteSize>(e);
        if (!t || !sz) continue;
        float halfW = std::min(sz->w * t->scale / 2.f, field_.w / 2.f);
        float halfH = std::min(sz->h * t->scale / 2.f, field_.h / 2.f);
        t->x = std::clamp(t->x, -field_.w / 2.f + halfW, field_.w / 2.f - halfW);
        t->y = std::clamp(t->y, -field_.h / 2.f + halfH, field_.h / 2.f - halfH);
    }
}

void FormationSystem::update(Registry& r, float dt) {
    for (auto& [e, f] : r.storage<Formation>().data()) {
        auto* t = r.get<Transform>(e);
        if (!t) continue;
        driftFormation(f, dt, rng_, field_);
        trackFormation(f, *t, dt);
    }
}

void CollisionSystem::update(Registry& r, float dt) {
    (void)dt;
    playerLasersVsEnemies(r);
    enemyLasersVsPlayer(r);
}

void CollisionSystem::playerLasersVsEnemies(Registry& r) {
    auto lasers = r.query<Laser, FromPlayer>();
    auto enemies = r.query<EnemyTag>();
    if (lasers.empty() || enemies.empty()) return;

    // Each entity dies at most once per frame, however many overlaps it has
    std::unordered_set<Entity> destroyed;
    for (auto laser : lasers) {
        if (destroyed.count(laser) || r.pendingDestroy(laser)) continue;
        auto* lt = r.get<Transform>(laser);
        auto* ls = r.get<SpriteSize>(laser);
        if (!lt || !ls) continue;
        Aabb laserBox = makeAabb(*lt, *ls);

        for (auto enemy : enemies) {
            if (destroyed.count(enemy) || r.pendingDestroy(enemy)) continue;
            auto* et = r.get<Transform>(enemy);
            auto* es = r.get<SpriteSize>(enemy);
            if (!et || !es) continue;
            if (!intersects(laserBox, makeAabb(*et, *es))) continue;

            r.queueDestroy(enemy);
            r.queueDestroy(laser);
            destroyed.insert(enemy);
            destroyed.insert(laser);
            enemies_.decrement();
            spawnPendingExplosion(r, *et);
            sounds_.push(ExplosionSoundEvent{et->x, et->y});
            if (stats_) stats_->enemiesKilled += 1;
            break; // this laser is spent
        }
    }
}

void CollisionSystem::enemyLasersVsPlayer(Registry& r) {
    auto players = r.query<Player>();
    if (players.empty()) return; // dead: nothing to hit
    Entity player = players.front();
    // Shielded after respawn: enemy fire passes through
    if (r.has<Invincible>(player) || r.pendingDestroy(player)) return;
    auto* pt = r.get<Transform>(player);
    auto* ps = r.get<SpriteSize>(player);
    if (!pt || !ps) return;
    Aabb playerBox = makeAabb(*pt, *ps);

    for (auto laser : r.query<Laser, FromEnemy>()) {
        if (r.pendingDestroy(laser)) continue;
        auto* lt = r.get<Transform>(laser);
        auto* ls = r.get<SpriteSize>(laser);
        if (!lt || !ls) continue;
        if (!intersects(makeAabb(*lt, *ls), playerBox)) continue;

        r.queueDestroy(player);
        r.queueDestroy(laser);
        player_.killed(clock_.elapsed);
        spawnPendingExplosion(r, *pt);
        if (stats_) stats_->playerDeaths += 1;
        inv::log::debug("Player hit at t=" + std::to_string(clock_.elapsed));
        break; // the player only dies once per frame
    }
}

void ExplosionSpawnSystem::update(Registry& r, float dt) {
    (void)dt;
    for (auto e : r.query<PendingExplosion>()) {
        if (r.pendingDestroy(e)) continue;
        PendingExplosion at = *r.get<PendingExplosion>(e);
        spawnExplosion(r, at);
        r.queueDestroy(e);
    }
}

void ExplosionAnimationSystem::update(Registry& r, float dt) {
    for (auto& [e, ex] : r.storage<Explosion>().data()) {
        if (r.pendingDestroy(e)) continue;
        ex.timer += dt;
        while (ex.timer >= config::kExplosionFrameInterval) {
            ex.timer -= config::kExplosionFrameInterval;
            ex.frame += 1;
            if (ex.frame >= config::kExplosionFrames) {
                r.queueDestroy(e);
                break;
            }
        }
    }
}

void InvincibilitySystem::update(Registry& r, float dt) {
    std::vector<Entity> expired;
    for (auto& [e, shield] : r.storage<Invincible>().data()) {
        shield.timeLeft -= dt;
        if (shield.timeLeft <= 0.f) {
            shield.timeLeft = 0.f;
            expired.push_back(e);
        }
    }
    for (auto e : expired) r.remove<Invincible>(e);
}
