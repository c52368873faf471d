#pragma once

#include "chronoid/domain/identifier.hpp"

#include <array>
#include <cstdint>

namespace chronoid {
namespace codec {
namespace detail {

// Small-radix arithmetic on a 128-bit Identifier, carried out on four
// 32-bit limbs so every intermediate fits in a uint64_t.

inline std::array<std::uint32_t, 4> to_limbs(const Identifier& id) {
  return {static_cast<std::uint32_t>(id.hi >> 32),
          static_cast<std::uint32_t>(id.hi),
          static_cast<std::uint32_t>(id.lo >> 32),
          static_cast<std::uint32_t>(id.lo)};
}

inline Identifier from_limbs(const std::array<std::uint32_t, 4>& limbs) {
  Identifier id;
  id.hi = (static_cast<std::uint64_t>(limbs[0]) << 32) | limbs[1];
  id.lo = (static_cast<std::uint64_t>(limbs[2]) << 32) | limbs[3];
  return id;
}

// value /= divisor; returns value % divisor. divisor must be non-zero.
inline std::uint32_t divmod_small(Identifier& value, std::uint32_t divisor) {
  auto limbs = to_limbs(value);
  std::uint64_t rem = 0;
  for (auto& limb : limbs) {
    std::uint64_t cur = (rem << 32) | limb;
    limb = static_cast<std::uint32_t>(cur / divisor);
    rem = cur % divisor;
  }
  value = from_limbs(limbs);
  return static_cast<std::uint32_t>(rem);
}

// value = value * mul + add. Returns false if the result overflows 128 bits
// (value is then unspecified).
inline bool mul_add_small(Identifier& value, std::uint32_t mul,
                          std::uint32_t add) {
  auto limbs = to_limbs(value);
  std::uint64_t carry = add;
  for (auto it = limbs.rbegin(); it != limbs.rend(); ++it) {
    std::uint64_t cur = static_cast<std::uint64_t>(*it) * mul + carry;
    *it = static_cast<std::uint32_t>(cur);
    carry = cur >> 32;
  }
  value = from_limbs(limbs);
  return carry == 0;
}

}  // namespace detail
}  // namespace codec
}  // namespace chronoid
