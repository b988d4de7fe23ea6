#include "client/assets/Assets.hpp"
#include "inv/util/Log.hpp"
#include <raylib.h>
#include <string>
#include <vector>

namespace client {
namespace assets {

std::string Assets::findAssetPath(const char *name) const {
  std::vector<std::string> candidates;
  auto add = [&](std::string base) {
    if (base.empty())
      return;
    if (base.back() != '/' && base.back() != '\\')
      base += '/';
    candidates.emplace_back(base + "assets/" + name);
    candidates.emplace_back(base + "../assets/" + name);
    candidates.emplace_back(base + "../../assets/" + name); // build/bin -> root/assets
  };

  add(GetApplicationDirectory());
  add("./");
  for (const auto &c : candidates) {
    inv::log::debug("Checking asset path: " + c);
    if (FileExists(c.c_str())) {
      inv::log::info("Found asset: " + c);
      return c;
    }
  }
  inv::log::warn(std::string("Asset not found: ") + name);
  return {};
}

bool Assets::loadTexture(const char *name, Texture2D &out) {
  std::string path = findAssetPath(name);
  if (path.empty())
    return false;
  out = LoadTexture(path.c_str());
  if (out.id == 0) {
    inv::log::error(std::string("Failed to load texture ") + path);
    return false;
  }
  return true;
}

void Assets::load() {
  if (!_playerLoaded)
    _playerLoaded = loadTexture("player_a_01.png", _player);
  if (!_playerLaserLoaded)
    _playerLaserLoaded = loadTexture("laser_a_01.png", _playerLaser);
  if (!_enemyLoaded)
    _enemyLoaded = loadTexture("enemy_a_01.png", _enemy);
  if (!_enemyLaserLoaded)
    _enemyLaserLoaded = loadTexture("laser_b_01.png", _enemyLaser);
  if (!_explosionLoaded)
    _explosionLoaded = loadTexture("explo_a_sheet.png", _explosion);

  if (_explosionSoundLoaded || !IsAudioDeviceReady())
    return;
  std::string path = findAssetPath("enemy_explosion.ogg");
  if (path.empty())
    return;
  bool allLoaded = true;
  int loaded = 0;
  for (; loaded < MAX_EXPLOSION_SOUNDS; ++loaded) {
    _explosionSoundPool[loaded] = LoadSound(path.c_str());
    if (_explosionSoundPool[loaded].frameCount == 0) {
      allLoaded = false;
      break;
    }
  }
  if (!allLoaded) {
    for (int i = 0; i < loaded; ++i)
      UnloadSound(_explosionSoundPool[i]);
    inv::log::error("Failed to load explosion sound from " + path);
    return;
  }
  _explosionSoundLoaded = true;
  _nextExplosionSound = 0;
  inv::log::info("Explosion sound loaded (" +
                 std::to_string(MAX_EXPLOSION_SOUNDS) + " instances)");
}

void Assets::playExplosion() {
  if (!_explosionSoundLoaded)
    return;
  PlaySound(_explosionSoundPool[_nextExplosionSound]);
  _nextExplosionSound = (_nextExplosionSound + 1) % MAX_EXPLOSION_SOUNDS;
}

void Assets::unload() {
  auto drop = [](Texture2D &t, bool &loaded) {
    if (loaded) {
      UnloadTexture(t);
      loaded = false;
    }
  };
  drop(_player, _playerLoaded);
  drop(_playerLaser, _playerLaserLoaded);
  drop(_enemy, _enemyLoaded);
  drop(_enemyLaser, _enemyLaserLoaded);
  drop(_explosion, _explosionLoaded);
  if (_explosionSoundLoaded) {
    for (int i = 0; i < MAX_EXPLOSION_SOUNDS; ++i)
      UnloadSound(_explosionSoundPool[i]);
    _explosionSoundLoaded = false;
  }
}

Assets::~Assets() {
  if (IsWindowReady())
    unload();
}

} // namespace assets
} // namespace client
