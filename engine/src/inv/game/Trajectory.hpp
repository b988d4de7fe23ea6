#pragma once
#include "inv/game/Components.hpp"
#include "inv/game/Config.hpp"
#include <random>

namespace inv::game {

// Accumulates changeTimer, re-rolls the drift rates when it expires, applies
// them and clamps pivot/radius/speed back into their allowed ranges.
void driftFormation(Formation &f, float dt, std::mt19937 &rng,
                    const Playfield &field);

// Clamp of pivot (playfield-derived box), radius and speed.
void clampFormation(Formation &f, const Playfield &field);

// +1 for ships entering from the left, -1 from the right.
float formationDirection(const Formation &f);

// Candidate angle after dt at the current speed and radius.
float nextFormationAngle(const Formation &f, float dt);

// Point on the (current) ellipse at the given angle.
Vec2 formationPoint(const Formation &f, float angle);

/// Moves the ship toward the candidate ellipse point by at most speed * dt,
/// never overshooting it on either axis. The angle is only locked in once
/// the ship is close to the target, so it never runs ahead of the ship when
/// the ellipse drifts away. The locked angle is kept in [-pi, pi].
void trackFormation(Formation &f, Transform &t, float dt);

} // namespace inv::game
