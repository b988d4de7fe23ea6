#pragma once
#include "inv/game/Components.hpp"
#include "inv/game/Config.hpp"
#include <cstdint>
#include <optional>
#include <random>

namespace inv::game {

/**
 * @brief Hands out flight paths for new enemies.
 *
 * The first enemy of a batch gets a freshly rolled formation, which is kept
 * as the template; the next members of the batch get exact copies of it, so
 * a cohort flies the same ellipse one after another. Once the batch holds
 * kFormationMembersMax members the next call rolls a new template.
 */
class FormationMaker {
public:
  explicit FormationMaker(std::mt19937 &rng,
                          std::uint32_t batchSize = config::kFormationMembersMax)
      : rng_(rng), batchSize_(batchSize) {}

  Formation make(const Playfield &field);

  bool hasTemplate() const { return current_.has_value(); }
  std::uint32_t members() const { return members_; }
  void reset();

private:
  Formation roll(const Playfield &field);

  std::mt19937 &rng_;
  std::uint32_t batchSize_;
  std::optional<Formation> current_;
  std::uint32_t members_ = 0;
};

// Fresh drift rates: pivot +-20/s, radius +-10/s, speed +-10/s
void rollFormationDeltas(Formation &f, std::mt19937 &rng);

} // namespace inv::game
