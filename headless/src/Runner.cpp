#include "headless/Runner.hpp"
#include "inv/game/Components.hpp"
#include "inv/util/Log.hpp"
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <thread>

using namespace headless;
using namespace inv::game;

Runner::Runner(const RunnerOptions &options)
    : options_(options), world_(options.world) {}

InputState Runner::autopilot() {
  InputState in{};
  auto &reg = world_.registry();
  auto player = world_.player();
  if (player == inv::ecs::NullEntity)
    return in;
  auto *pt = reg.get<Transform>(player);
  if (!pt)
    return in;

  // Nearest enemy on the x axis
  float bestDx = std::numeric_limits<float>::infinity();
  for (auto e : reg.query<EnemyTag, Transform>()) {
    auto *et = reg.get<Transform>(e);
    float dx = et->x - pt->x;
    if (std::abs(dx) < std::abs(bestDx))
      bestDx = dx;
  }
  if (std::isinf(bestDx))
    return in;
  constexpr float kDeadZone = 8.f;
  in.left = bestDx < -kDeadZone;
  in.right = bestDx > kDeadZone;

  if (fireCooldown_ > 0) {
    --fireCooldown_;
  } else if (std::abs(bestDx) < 40.f) {
    in.firePressed = true;
    fireCooldown_ = 12;
  }
  return in;
}

void Runner::report() const {
  const auto &st = world_.stats();
  std::cout << "[sim] t=" << world_.clock().elapsed
            << "s enemies=" << world_.enemyCount().value()
            << " spawned=" << st.enemiesSpawned
            << " killed=" << st.enemiesKilled
            << " deaths=" << st.playerDeaths
            << " entities=" << world_.registry().entityCount()
            << std::endl;
}

std::uint64_t Runner::run() {
  using clock = std::chrono::steady_clock;
  const double dt = 1.0 / options_.tickRate;
  const std::uint64_t reportEvery =
      options_.reportEverySeconds > 0
          ? static_cast<std::uint64_t>(options_.reportEverySeconds * options_.tickRate)
          : 0;
  auto next = clock::now();

  std::uint64_t frame = 0;
  for (; frame < options_.frames; ++frame) {
    if (options_.realtime) {
      next += std::chrono::duration_cast<clock::duration>(
          std::chrono::duration<double>(dt));
      std::this_thread::sleep_until(next);
    }
    world_.step(static_cast<float>(dt), autopilot());
    soundCues_ += world_.drainSoundEvents().size();
    if (reportEvery && (frame + 1) % reportEvery == 0 &&
        inv::log::enabled(inv::log::Level::Info))
      report();
  }
  if (inv::log::enabled(inv::log::Level::Info))
    report();
  return frame;
}
