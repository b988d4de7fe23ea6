#pragma once
#include "inv/ecs/Storage.hpp"
#include "inv/ecs/Types.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace inv::ecs {

class Registry;

/**
 * @brief One per-frame pass over the registry.
 *
 * Systems are run by Registry::update() in the order they were added.
 */
class System {
public:
  virtual ~System() = default;
  virtual void update(Registry &r, float dt) = 0;
};

/**
 * @brief Generational entity arena with one sparse storage per component type.
 *
 * Destroying an entity bumps the generation of its slot, so handles kept
 * around after a destroy no longer resolve to anything. Destruction can be
 * immediate (destroy) or deferred until flushDestroyed() (queueDestroy).
 */
class Registry {
public:
  Registry() = default;
  ~Registry() = default;

  Registry(const Registry &) = delete;
  Registry &operator=(const Registry &) = delete;

  Entity create();
  bool alive(Entity e) const;
  void destroy(Entity e);
  std::size_t entityCount() const { return liveCount_; }

  // Deferred destruction, applied by flushDestroyed()
  void queueDestroy(Entity e);
  bool pendingDestroy(Entity e) const { return pendingSet_.count(e) != 0; }
  std::size_t pendingCount() const { return pending_.size(); }
  std::size_t flushDestroyed();

  template <typename T> T &emplace(Entity e, T value) {
    return storage<T>().emplace(e, std::move(value));
  }

  template <typename T> T *get(Entity e) { return storage<T>().get(e); }

  template <typename T> bool has(Entity e) const {
    auto *s = findStorage<T>();
    return s && s->contains(e);
  }

  template <typename T> void remove(Entity e) { storage<T>().remove(e); }

  template <typename T> Storage<T> &storage() {
    auto key = std::type_index(typeid(T));
    auto it = storages_.find(key);
    if (it == storages_.end()) {
      it = storages_.emplace(key, std::make_unique<Storage<T>>()).first;
    }
    return *static_cast<Storage<T> *>(it->second.get());
  }

  /// Snapshot of every entity holding all of the listed components.
  template <typename First, typename... Rest> std::vector<Entity> query() {
    std::vector<Entity> out;
    auto &first = storage<First>();
    out.reserve(first.size());
    for (auto &[e, _] : first.data()) {
      (void)_;
      if ((has<Rest>(e) && ...))
        out.push_back(e);
    }
    return out;
  }

  void addSystem(std::unique_ptr<System> system);
  void update(float dt);
  void clearSystems() { systems_.clear(); }
  std::size_t systemCount() const { return systems_.size(); }
  // Destroys every entity; systems are kept.
  void clear();

private:
  template <typename T> const Storage<T> *findStorage() const {
    auto it = storages_.find(std::type_index(typeid(T)));
    if (it == storages_.end())
      return nullptr;
    return static_cast<const Storage<T> *>(it->second.get());
  }

  std::vector<std::uint32_t> generations_{0}; // slot 0 reserved for null
  std::vector<bool> occupied_{false};
  std::vector<std::uint32_t> freeSlots_;
  std::size_t liveCount_ = 0;

  std::unordered_map<std::type_index, std::unique_ptr<IStorage>> storages_;

  std::vector<Entity> pending_;
  std::unordered_set<Entity> pendingSet_;

  std::vector<std::unique_ptr<System>> systems_;
};

} // namespace inv::ecs
