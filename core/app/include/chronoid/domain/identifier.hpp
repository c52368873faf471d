#pragma once

#include <cstddef>
#include <cstdint>

namespace chronoid {

// -----------------------------------------------------------------------------
// Identifier — a 128-bit UUID value held as two big-endian 64-bit words
// -----------------------------------------------------------------------------
//
// @brief  Value type for every identifier the library produces or parses.
//
// @details
// `hi` carries bits 0-63 of the UUID (most significant first) and `lo`
// carries bits 64-127. With that split the version-7 fields line up as:
//
//   hi: | unix_ts_ms (48) | ver (4) | rand_a (12) |
//   lo: | var (2) |             rand_b (62)       |
//
// Comparing (hi, lo) lexicographically is the same as comparing the two
// 128-bit integers, which is the same as comparing the 16 big-endian bytes,
// the hex string, or the canonical string. That equivalence is what makes
// time-ordered identifiers sortable in every representation.
//
// Thread model:
//   Plain value type. Safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
struct Identifier {
  std::uint64_t hi{0};
  std::uint64_t lo{0};

  /// All 128 bits zero. Reserved sentinel, not a genuine v7 value.
  static constexpr Identifier nil() { return Identifier{0, 0}; }

  /// All 128 bits one. Reserved sentinel, not a genuine v7 value.
  static constexpr Identifier max() {
    return Identifier{~std::uint64_t{0}, ~std::uint64_t{0}};
  }

  /// The 4-bit `ver` field (bits 48-51).
  constexpr std::uint8_t version() const {
    return static_cast<std::uint8_t>((hi >> 12) & 0xF);
  }

  /// The 2-bit `var` field (bits 64-65).
  constexpr std::uint8_t variant() const {
    return static_cast<std::uint8_t>(lo >> 62);
  }

  constexpr bool is_nil() const { return hi == 0 && lo == 0; }
  constexpr bool is_max() const {
    return hi == ~std::uint64_t{0} && lo == ~std::uint64_t{0};
  }
};

constexpr bool operator==(const Identifier& a, const Identifier& b) {
  return a.hi == b.hi && a.lo == b.lo;
}
constexpr bool operator!=(const Identifier& a, const Identifier& b) {
  return !(a == b);
}
constexpr bool operator<(const Identifier& a, const Identifier& b) {
  return a.hi < b.hi || (a.hi == b.hi && a.lo < b.lo);
}
constexpr bool operator>(const Identifier& a, const Identifier& b) {
  return b < a;
}
constexpr bool operator<=(const Identifier& a, const Identifier& b) {
  return !(b < a);
}
constexpr bool operator>=(const Identifier& a, const Identifier& b) {
  return !(a < b);
}

// Hash functor so identifiers can key unordered containers.
struct IdentifierHash {
  std::size_t operator()(const Identifier& id) const noexcept {
    // hi holds the timestamp, lo holds most of the entropy; mixing both
    // keeps buckets even for ids generated in the same millisecond.
    return static_cast<std::size_t>(id.lo ^ (id.hi * 0x9E3779B97F4A7C15ULL));
  }
};

}  // namespace chronoid
