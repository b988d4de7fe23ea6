#pragma once
#include <cstdint>

namespace inv::ecs {

// Entity handle: low 20 bits are the slot index, high 12 bits the generation.
// Slot 0 is never handed out, so a zero handle is always null.
using Entity = std::uint32_t;

constexpr Entity NullEntity = 0;
constexpr std::uint32_t kIndexBits = 20;
constexpr std::uint32_t kIndexMask = (1u << kIndexBits) - 1u;
constexpr std::uint32_t kGenerationMask = (1u << (32u - kIndexBits)) - 1u;

constexpr std::uint32_t entityIndex(Entity e) { return e & kIndexMask; }
constexpr std::uint32_t entityGeneration(Entity e) { return e >> kIndexBits; }
constexpr Entity makeEntity(std::uint32_t index, std::uint32_t generation) {
  return ((generation & kGenerationMask) << kIndexBits) | (index & kIndexMask);
}

} // namespace inv::ecs
