#pragma once
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace inv::game {

// Key states for one frame, filled by whoever owns the keyboard
struct InputState {
  bool left = false;
  bool right = false;
  bool up = false;
  bool down = false;
  bool firePressed = false; // just-pressed edge, not held
};

struct SimClock {
  double elapsed = 0.0; // seconds of simulated time, including this frame
  std::uint64_t frame = 0;
};

class PlayerState {
public:
  bool alive() const { return alive_; }
  const std::optional<double> &lastDeath() const { return lastDeath_; }

  // A player that never died may spawn at once; otherwise only strictly
  // after the respawn delay has passed.
  bool canRespawn(double now, double delay) const {
    if (alive_)
      return false;
    return !lastDeath_ || now > *lastDeath_ + delay;
  }

  void killed(double now) {
    alive_ = false;
    lastDeath_ = now;
  }

  void spawned() {
    alive_ = true;
    lastDeath_.reset();
  }

private:
  bool alive_ = false;
  std::optional<double> lastDeath_;
};

class EnemyCount {
public:
  std::uint32_t value() const { return value_; }
  void increment() { ++value_; }
  // Never goes below zero: asserts in debug, logs and clamps in release.
  void decrement();

private:
  std::uint32_t value_ = 0;
};

struct ExplosionSoundEvent {
  float x = 0.f;
  float y = 0.f;
};

/// Events pushed during a frame and drained once by the consumer.
template <typename T> class EventQueue {
public:
  void push(T event) { events_.push_back(std::move(event)); }
  std::size_t size() const { return events_.size(); }
  bool empty() const { return events_.empty(); }
  void clear() { events_.clear(); }

  std::vector<T> drain() {
    std::vector<T> out;
    out.swap(events_);
    return out;
  }

private:
  std::vector<T> events_;
};

} // namespace inv::game
