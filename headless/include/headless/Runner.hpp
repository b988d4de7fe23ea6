#pragma once
#include "inv/game/State.hpp"
#include "inv/game/World.hpp"
#include <cstdint>

namespace headless {

struct RunnerOptions {
  inv::game::WorldConfig world{};
  std::uint64_t frames = 60 * 60; // one simulated minute at 60 Hz
  double tickRate = 60.0;
  bool realtime = false;    // pace ticks to the wall clock
  int reportEverySeconds = 5;
};

/**
 * @brief Fixed-tick driver for World without a window.
 *
 * An autopilot stands in for the keyboard: it steers under the nearest enemy
 * and fires on a short cadence, so every system gets exercised.
 */
class Runner {
public:
  explicit Runner(const RunnerOptions &options);

  // Runs the configured number of frames; returns the number actually run.
  std::uint64_t run();

  std::uint64_t soundCues() const { return soundCues_; }

private:
  inv::game::InputState autopilot();
  void report() const;

  RunnerOptions options_;
  inv::game::World world_;
  std::uint64_t soundCues_ = 0;
  std::uint32_t fireCooldown_ = 0;
};

} // namespace headless
