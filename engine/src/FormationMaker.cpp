#include "inv/game/FormationMaker.hpp"
#include "inv/util/Log.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

using namespace inv::game;

void inv::game::rollFormationDeltas(Formation &f, std::mt19937 &rng) {
    std::uniform_real_distribution<float> pivotD(-config::kPivotDriftRange, config::kPivotDriftRange);
    std::uniform_real_distribution<float> radiusD(-config::kRadiusDriftRange, config::kRadiusDriftRange);
    std::uniform_real_distribution<float> speedD(-config::kSpeedDriftRange, config::kSpeedDriftRange);
    f.pivotDelta = {pivotD(rng), pivotD(rng)};
    f.radiusDelta = {radiusD(rng), radiusD(rng)};
    f.speedDelta = speedD(rng);
}

Formation FormationMaker::make(const Playfield& field) {
    if (current_ && members_ < batchSize_) {
        ++members_;
        return *current_;
    }
    Formation f = roll(field);
    current_ = f;
    members_ = 1;
    return f;
}

void FormationMaker::reset() {
    current_.reset();
    members_ = 0;
}

Formation FormationMaker::roll(const Playfield& field) {
    Formation f{};

    // Start just outside the left or right edge, anywhere vertically (+margin)
    float wSpan = field.w / 2.f + config::kFormationStartMargin;
    float hSpan = field.h / 2.f + config::kFormationStartMargin;
    std::bernoulli_distribution side(0.5);
    std::uniform_real_distribution<float> startY(-hSpan, hSpan);
    f.start.x = side(rng_) ? wSpan : -wSpan;
    f.start.y = startY(rng_);

    // Pivot in the middle half horizontally, upper part of the screen
    float pivotW = field.w / 4.f;
    float pivotH = std::max(0.f, field.h / 3.f - config::kFormationPivotTopMargin);
    std::uniform_real_distribution<float> pivotX(-pivotW, pivotW);
    std::uniform_real_distribution<float> pivotY(0.f, pivotH);
    f.pivot.x = pivotX(rng_);
    f.pivot.y = pivotY(rng_);

    std::uniform_real_distribution<float> radiusX(config::kFormationRadiusXMin, config::kFormationRadiusXMax);
    f.radius.x = radiusX(rng_);
    f.radius.y = config::kFormationRadiusY;

    // Enter the ellipse on the bearing from the spawn point to the pivot
    f.angle = std::atan2(f.start.y - f.pivot.y, f.start.x - f.pivot.x);
    f.speed = config::kBaseSpeed;
    f.changeTimer = 0.f;
    rollFormationDeltas(f, rng_);

    if (inv::log::enabled(inv::log::Level::Debug)) {
        std::ostringstream os;
        os << "New formation: start=(" << f.start.x << "," << f.start.y << ") pivot=("
           << f.pivot.x << "," << f.pivot.y << ") radius=(" << f.radius.x << "," << f.radius.y << ")";
        inv::log::debug(os.str());
    }
    return f;
}
