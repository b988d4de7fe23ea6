#include "inv/game/World.hpp"
#include "inv/util/Log.hpp"
#include <memory>
#include <sstream>

using namespace inv::game;

namespace {
std::uint32_t resolveSeed(const WorldConfig &config) {
    if (config.seed) return *config.seed;
    return std::random_device{}();
}

WorldConfig checked(WorldConfig config) {
    if (!validPlayfield(config.playfield)) {
        std::ostringstream os;
        os << "Invalid playfield " << config.playfield.w << "x" << config.playfield.h
           << ", using the default";
        inv::log::error(os.str());
        config.playfield = Playfield{};
    }
    return config;
}
}

World::World(const WorldConfig& config)
    : config_(checked(config)), seed_(resolveSeed(config)), rng_(seed_), formations_(rng_) {
    installSystems();
    std::ostringstream os;
    os << "World ready: playfield " << config_.playfield.w << "x" << config_.playfield.h
       << " seed=" << seed_;
    inv::log::info(os.str());
}

void World::installSystems() {
    const Playfield& field = config_.playfield;
    registry_.addSystem(std::make_unique<PlayerSpawnSystem>(player_, clock_, field, &stats_));
    registry_.addSystem(std::make_unique<EnemySpawnSystem>(formations_, enemies_, field, &stats_));
    registry_.addSystem(std::make_unique<PlayerControlSystem>(input_));
    registry_.addSystem(std::make_unique<PlayerFireSystem>(input_));
    registry_.addSystem(std::make_unique<EnemyFireSystem>(rng_));
    registry_.addSystem(std::make_unique<MovementSystem>(field));
    registry_.addSystem(std::make_unique<PlayerBoundsSystem>(field));
    registry_.addSystem(std::make_unique<FormationSystem>(rng_, field));
    registry_.addSystem(std::make_unique<CollisionSystem>(enemies_, player_, clock_, sounds_, &stats_));
    registry_.addSystem(std::make_unique<ExplosionSpawnSystem>());
    registry_.addSystem(std::make_unique<ExplosionAnimationSystem>());
    registry_.addSystem(std::make_unique<InvincibilitySystem>());
}

void World::step(float dt, const InputState& input) {
    if (dt < 0.f) dt = 0.f;
    sounds_.clear();
    input_ = input;
    clock_.elapsed += dt;
    clock_.frame += 1;
    registry_.update(dt);
    registry_.flushDestroyed();
}

void World::reset() {
    registry_.clear();
    registry_.clearSystems();
    formations_.reset();
    player_ = PlayerState{};
    enemies_ = EnemyCount{};
    clock_ = SimClock{};
    stats_ = SimStats{};
    input_ = InputState{};
    sounds_.clear();
    installSystems(); // fresh spawn timers
    inv::log::info("World reset");
}

inv::ecs::Entity World::player() {
    auto players = registry_.query<Player>();
    return players.empty() ? inv::ecs::NullEntity : players.front();
}
