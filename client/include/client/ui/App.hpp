#pragma once
#include "client/assets/Assets.hpp"
#include "inv/game/World.hpp"
#include <raylib.h>

namespace client {
namespace ui {

class App {
public:
    explicit App(const inv::game::WorldConfig& config);
    ~App();
    void run();

private:
    inv::game::InputState pollInput() const;
    void playSounds();
    void drawWorld();
    void drawHud(int w, int h);
    Vector2 toScreen(float x, float y) const;

    inv::game::WorldConfig _config;
    inv::game::World _world;
    assets::Assets _assets;
    bool _paused = false;
    bool _audioReady = false;
};

} // namespace ui
} // namespace client
