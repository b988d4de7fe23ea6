#include "inv/game/Trajectory.hpp"
#include "inv/game/FormationMaker.hpp"
#include <algorithm>
#include <cmath>

using namespace inv::game;

namespace {
constexpr float kPi = 3.14159265358979323846f;
}

void inv::game::clampFormation(Formation &f, const Playfield &field) {
    float wSpan = field.w / 4.f;
    float hSpan = std::max(0.f, field.h / 3.f - config::kFormationPivotTopMargin);
    f.pivot.x = std::clamp(f.pivot.x, -wSpan, wSpan);
    f.pivot.y = std::clamp(f.pivot.y, 0.f, hSpan);
    f.radius.x = std::clamp(f.radius.x, config::kRadiusXClampMin, config::kRadiusXClampMax);
    f.radius.y = std::clamp(f.radius.y, config::kRadiusYClampMin, config::kRadiusYClampMax);
    f.speed = std::clamp(f.speed, config::kBaseSpeed * config::kSpeedClampMinFactor,
                         config::kBaseSpeed * config::kSpeedClampMaxFactor);
}

void inv::game::driftFormation(Formation &f, float dt, std::mt19937 &rng, const Playfield &field) {
    f.changeTimer += dt;
    if (f.changeTimer > config::kFormationChangeInterval) {
        rollFormationDeltas(f, rng);
        f.changeTimer = 0.f;
    }
    f.pivot.x += f.pivotDelta.x * dt;
    f.pivot.y += f.pivotDelta.y * dt;
    f.radius.x += f.radiusDelta.x * dt;
    f.radius.y += f.radiusDelta.y * dt;
    f.speed += f.speedDelta * dt;
    clampFormation(f, field);
}

float inv::game::formationDirection(const Formation &f) {
    return f.start.x < 0.f ? 1.f : -1.f;
}

float inv::game::nextFormationAngle(const Formation &f, float dt) {
    float quarter = std::min(f.radius.x, f.radius.y) * kPi / 2.f;
    return f.angle + formationDirection(f) * f.speed * dt / quarter;
}

Vec2 inv::game::formationPoint(const Formation &f, float angle) {
    return Vec2{f.radius.x * std::cos(angle) + f.pivot.x,
                f.radius.y * std::sin(angle) + f.pivot.y};
}

void inv::game::trackFormation(Formation &f, Transform &t, float dt) {
    float maxDistance = dt * f.speed;
    float angle = nextFormationAngle(f, dt);
    Vec2 dst = formationPoint(f, angle);

    float dx = t.x - dst.x;
    float dy = t.y - dst.y;
    float distance = std::sqrt(dx * dx + dy * dy);
    float ratio = distance == 0.f ? 0.f : maxDistance / distance;

    float x = t.x - dx * ratio;
    x = dx > 0.f ? std::max(x, dst.x) : std::min(x, dst.x);
    float y = t.y - dy * ratio;
    y = dy > 0.f ? std::max(y, dst.y) : std::min(y, dst.y);

    if (distance < maxDistance * f.speed / config::kAngleLockDivisor) {
        f.angle = std::remainder(angle, 2.f * kPi);
    }
    t.x = x;
    t.y = y;
}
