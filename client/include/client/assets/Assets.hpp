#pragma once
#include <raylib.h>
#include <string>

namespace client {
namespace assets {

// Textures and sounds for the game. Anything missing is drawn as a plain
// rectangle or stays silent.
class Assets {
public:
    Assets() = default;
    ~Assets();

    Assets(const Assets&) = delete;
    Assets& operator=(const Assets&) = delete;

    // Needs an open window (textures) and an initialized audio device (sounds).
    void load();
    void unload();

    // Round-robin over a small pool so overlapping explosions all play
    void playExplosion();

    bool hasPlayer() const { return _playerLoaded; }
    bool hasPlayerLaser() const { return _playerLaserLoaded; }
    bool hasEnemy() const { return _enemyLoaded; }
    bool hasEnemyLaser() const { return _enemyLaserLoaded; }
    bool hasExplosionSheet() const { return _explosionLoaded; }

    const Texture2D& player() const { return _player; }
    const Texture2D& playerLaser() const { return _playerLaser; }
    const Texture2D& enemy() const { return _enemy; }
    const Texture2D& enemyLaser() const { return _enemyLaser; }
    const Texture2D& explosionSheet() const { return _explosion; }

    static constexpr int MAX_EXPLOSION_SOUNDS = 4;

private:
    std::string findAssetPath(const char* name) const;
    bool loadTexture(const char* name, Texture2D& out);

    Texture2D _player{};
    Texture2D _playerLaser{};
    Texture2D _enemy{};
    Texture2D _enemyLaser{};
    Texture2D _explosion{};
    bool _playerLoaded = false;
    bool _playerLaserLoaded = false;
    bool _enemyLoaded = false;
    bool _enemyLaserLoaded = false;
    bool _explosionLoaded = false;

    Sound _explosionSoundPool[MAX_EXPLOSION_SOUNDS]{};
    bool _explosionSoundLoaded = false;
    int _nextExplosionSound = 0;
};

} // namespace assets
} // namespace client
