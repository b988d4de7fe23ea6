#include "client/ui/App.hpp"
#include "inv/game/Components.hpp"
#include "inv/util/Log.hpp"
#include <raylib.h>
#include <algorithm>
#include <string>
#include <vector>

using namespace client::ui;
using namespace inv::game;

namespace {

struct Drawable {
    float z;
    inv::ecs::Entity e;
};

void drawFallback(Vector2 center, float w, float h, Color color) {
    DrawRectangleV({center.x - w / 2.f, center.y - h / 2.f}, {w, h}, color);
}

void drawCentered(const Texture2D& tex, Vector2 center, float w, float h, bool flipY) {
    Rectangle src{0.f, 0.f, (float)tex.width, flipY ? -(float)tex.height : (float)tex.height};
    Rectangle dst{center.x - w / 2.f, center.y - h / 2.f, w, h};
    DrawTexturePro(tex, src, dst, {0.f, 0.f}, 0.f, WHITE);
}

} // namespace

App::App(const WorldConfig& config) : _config(config), _world(config) {}

App::~App() {
    if (_audioReady) {
        CloseAudioDevice();
        _audioReady = false;
    }
}

Vector2 App::toScreen(float x, float y) const {
    // World origin is the center of the window, +y up
    return Vector2{_config.playfield.w / 2.f + x, _config.playfield.h / 2.f - y};
}

InputState App::pollInput() const {
    InputState in{};
    in.left = IsKeyDown(KEY_LEFT);
    in.right = IsKeyDown(KEY_RIGHT);
    in.up = IsKeyDown(KEY_UP);
    in.down = IsKeyDown(KEY_DOWN);
    in.firePressed = IsKeyPressed(KEY_SPACE);
    return in;
}

void App::playSounds() {
    // One cue per kill, even when several land on the same frame
    for (const auto& cue : _world.drainSoundEvents()) {
        (void)cue;
        _assets.playExplosion();
    }
}

void App::drawWorld() {
    auto& r = _world.registry();

    // Back to front by depth
    std::vector<Drawable> order;
    for (auto& [e, t] : r.storage<Transform>().data()) order.push_back({t.z, e});
    std::sort(order.begin(), order.end(), [](const Drawable& a, const Drawable& b) { return a.z < b.z; });

    for (const auto& d : order) {
        auto* t = r.get<Transform>(d.e);
        if (!t) continue;
        Vector2 c = toScreen(t->x, t->y);

        if (auto* ex = r.get<Explosion>(d.e)) {
            float px = config::kExplosionFramePx;
            if (_assets.hasExplosionSheet()) {
                int col = (int)ex->frame % config::kExplosionSheetCols;
                int row = (int)ex->frame / config::kExplosionSheetCols;
                Rectangle src{col * px, row * px, px, px};
                Rectangle dst{c.x - px / 2.f, c.y - px / 2.f, px, px};
                DrawTexturePro(_assets.explosionSheet(), src, dst, {0.f, 0.f}, 0.f, WHITE);
            } else {
                float k = 1.f - (float)ex->frame / (float)config::kExplosionFrames;
                DrawCircleV(c, px / 2.f * (1.f - k * 0.5f), Color{255, 160, 40, (unsigned char)(255 * k)});
            }
            continue;
        }

        auto* sz = r.get<SpriteSize>(d.e);
        if (!sz) continue;
        float w = sz->w * t->scale;
        float h = sz->h * t->scale;

        if (r.has<Player>(d.e)) {
            if (_assets.hasPlayer()) drawCentered(_assets.player(), c, w, h, false);
            else drawFallback(c, w, h, Color{100, 200, 255, 255});
            if (r.has<Invincible>(d.e)) {
                float radius = std::max(w, h) * 0.6f;
                DrawCircleV(c, radius, Color{80, 170, 255, 80});
                DrawCircleLines((int)c.x, (int)c.y, radius, Color{120, 200, 255, 180});
            }
        } else if (r.has<EnemyTag>(d.e)) {
            if (_assets.hasEnemy()) drawCentered(_assets.enemy(), c, w, h, false);
            else drawFallback(c, w, h, Color{255, 85, 85, 255});
        } else if (r.has<FromPlayer>(d.e)) {
            if (_assets.hasPlayerLaser()) drawCentered(_assets.playerLaser(), c, w, h, false);
            else drawFallback(c, w, h, Color{255, 255, 85, 255});
        } else if (r.has<FromEnemy>(d.e)) {
            // Enemy lasers point down
            if (_assets.hasEnemyLaser()) drawCentered(_assets.enemyLaser(), c, w, h, true);
            else drawFallback(c, w, h, Color{255, 170, 0, 255});
        }
    }
}

void App::drawHud(int w, int h) {
    const auto& st = _world.stats();
    std::string line = "Kills " + std::to_string(st.enemiesKilled) +
                       "   Deaths " + std::to_string(st.playerDeaths);
    DrawText(line.c_str(), 10, 10, 20, RAYWHITE);
    if (!_world.playerState().alive()) {
        const char* msg = "Respawning...";
        DrawText(msg, (w - MeasureText(msg, 20)) / 2, h - 40, 20, LIGHTGRAY);
    }
    if (_paused) {
        DrawRectangle(0, 0, w, h, Color{0, 0, 0, 160});
        const char* msg = "Paused";
        int size = (int)(h * 0.08f);
        DrawText(msg, (w - MeasureText(msg, size)) / 2, (int)(h * 0.4f), size, RAYWHITE);
    }
}

void App::run() {
    const int w = (int)_config.playfield.w;
    const int h = (int)_config.playfield.h;
    InitWindow(w, h, "Invaders");
    // ESC pauses instead of closing the window
    SetExitKey(KEY_NULL);
    SetTargetFPS(60);

    InitAudioDevice();
    _audioReady = IsAudioDeviceReady();
    if (!_audioReady) inv::log::error("Audio device failed to initialize");

    _assets.load();

    while (!WindowShouldClose()) {
        if (IsKeyPressed(KEY_ESCAPE)) _paused = !_paused;
        if (IsKeyPressed(KEY_R)) _world.reset();

        if (!_paused) {
            _world.step(GetFrameTime(), pollInput());
            playSounds();
        }

        BeginDrawing();
        ClearBackground(Color{10, 10, 10, 255});
        drawWorld();
        drawHud(w, h);
        EndDrawing();
    }

    // GPU resources go before the window
    _assets.unload();
    if (_audioReady) {
        CloseAudioDevice();
        _audioReady = false;
    }
    CloseWindow();
}
