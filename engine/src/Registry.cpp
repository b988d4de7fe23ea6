#include "inv/ecs/Registry.hpp"
#include "inv/util/Log.hpp"

namespace inv::ecs {

Entity Registry::create() {
  std::uint32_t index = 0;
  if (!freeSlots_.empty()) {
    index = freeSlots_.back();
    freeSlots_.pop_back();
  } else {
    if (generations_.size() > kIndexMask) {
      inv::log::error("Registry: entity slots exhausted");
      return NullEntity;
    }
    index = static_cast<std::uint32_t>(generations_.size());
    generations_.push_back(0);
    occupied_.push_back(false);
  }
  occupied_[index] = true;
  ++liveCount_;
  return makeEntity(index, generations_[index]);
}

bool Registry::alive(Entity e) const {
  auto index = entityIndex(e);
  if (index == 0 || index >= generations_.size())
    return false;
  return occupied_[index] && generations_[index] == entityGeneration(e);
}

void Registry::destroy(Entity e) {
  if (!alive(e))
    return;
  for (auto &[_, s] : storages_) {
    (void)_;
    s->remove(e);
  }
  auto index = entityIndex(e);
  occupied_[index] = false;
  generations_[index] = (generations_[index] + 1) & kGenerationMask;
  freeSlots_.push_back(index);
  --liveCount_;
}

void Registry::queueDestroy(Entity e) {
  if (!alive(e))
    return;
  if (pendingSet_.insert(e).second)
    pending_.push_back(e);
}

std::size_t Registry::flushDestroyed() {
  std::size_t removed = 0;
  std::vector<Entity> batch;
  batch.swap(pending_);
  pendingSet_.clear();
  for (auto e : batch) {
    if (alive(e)) {
      destroy(e);
      ++removed;
    }
  }
  return removed;
}

void Registry::addSystem(std::unique_ptr<System> system) {
  if (system)
    systems_.push_back(std::move(system));
}

void Registry::update(float dt) {
  for (auto &s : systems_)
    s->update(*this, dt);
}

void Registry::clear() {
  for (auto &[_, s] : storages_) {
    (void)_;
    s->clear();
  }
  // Bump every live slot so handles from before the clear stay stale.
  for (std::uint32_t i = 1; i < generations_.size(); ++i) {
    if (!occupied_[i])
      continue;
    occupied_[i] = false;
    generations_[i] = (generations_[i] + 1) & kGenerationMask;
    freeSlots_.push_back(i);
  }
  liveCount_ = 0;
  pending_.clear();
  pendingSet_.clear();
}

} // namespace inv::ecs
