#pragma once
#include "inv/ecs/Types.hpp"
#include <cstddef>
#include <unordered_map>
#include <utility>

namespace inv::ecs {

class IStorage {
public:
  virtual ~IStorage() = default;
  virtual bool contains(Entity e) const = 0;
  virtual void remove(Entity e) = 0;
  virtual void clear() = 0;
  virtual std::size_t size() const = 0;
};

/// Sparse column of one component type, keyed by the full entity handle.
template <typename T> class Storage final : public IStorage {
public:
  using Map = std::unordered_map<Entity, T>;

  T &emplace(Entity e, T value) {
    auto it = data_.find(e);
    if (it != data_.end()) {
      it->second = std::move(value);
      return it->second;
    }
    return data_.emplace(e, std::move(value)).first->second;
  }

  T *get(Entity e) {
    auto it = data_.find(e);
    return it == data_.end() ? nullptr : &it->second;
  }

  const T *get(Entity e) const {
    auto it = data_.find(e);
    return it == data_.end() ? nullptr : &it->second;
  }

  bool contains(Entity e) const override { return data_.count(e) != 0; }
  void remove(Entity e) override { data_.erase(e); }
  void clear() override { data_.clear(); }
  std::size_t size() const override { return data_.size(); }

  Map &data() { return data_; }
  const Map &data() const { return data_; }

private:
  Map data_;
};

} // namespace inv::ecs
