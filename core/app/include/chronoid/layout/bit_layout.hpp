#pragma once

#include "chronoid/domain/identifier.hpp"

#include <cstdint>

namespace chronoid {
namespace layout {

// -----------------------------------------------------------------------------
// BitLayout — pure pack/unpack between UUIDv7 fields and a 128-bit value
// -----------------------------------------------------------------------------
//
// @brief  Stateless mapping between the five named fields of a version-7
//         UUID and an Identifier.
//
// @details
// Field table (big-endian, bit 0 is the most significant):
//
//   bits   0-47   unix_ts_ms   milliseconds since the Unix epoch
//   bits  48-51   ver          always 0b0111
//   bits  52-63   rand_a       top 12 bits of the 20-bit sub-ms field
//   bits  64-65   var          always 0b10
//   bits  66-127  rand_b       low 8 bits of the sub-ms field (66-73)
//                              followed by 54 bits of randomness
//
// pack() takes only the variable bits and forces ver/var. unpack() is the
// arithmetic inverse and validates nothing; checking ver/var is the
// caller's job (principally the TimestampExtractor).
//
// Thread-safety: All functions are pure. Safe from any thread.
// -----------------------------------------------------------------------------

constexpr std::uint8_t kVersion = 7;
constexpr std::uint8_t kVariant = 2;

constexpr std::uint64_t kUnixTsMsMask = 0xFFFFFFFFFFFFULL;          // 48 bits
constexpr std::uint64_t kRandAMask = 0xFFFULL;                       // 12 bits
constexpr std::uint64_t kRandBMask = 0x3FFFFFFFFFFFFFFFULL;          // 62 bits
constexpr std::uint64_t kRandomBitsMask = 0x3FFFFFFFFFFFFFULL;       // 54 bits

/// Width of the sub-millisecond field split across rand_a and rand_b.
constexpr unsigned kSubMsBits = 20;
constexpr std::uint32_t kSubMsMax = (1U << kSubMsBits) - 1;

/// Number of sub-ms bits that spill into the top of rand_b.
constexpr unsigned kSubMsLowBits = 8;
/// Position of those spilled bits inside the 62-bit rand_b.
constexpr unsigned kSubMsShiftInRandB = 54;

/// Unpacked view of an Identifier.
struct Uuid7Fields {
  std::uint64_t unix_ts_ms{0};
  std::uint8_t ver{0};
  std::uint16_t rand_a{0};
  std::uint8_t var{0};
  std::uint64_t rand_b{0};
};

// -------------------------------------------------------------------------
// pack
// -------------------------------------------------------------------------
// @brief  Assembles an Identifier from the variable fields.
//
// @param  unix_ts_ms  Milliseconds; bits above 48 are discarded.
// @param  rand_a      12-bit field; bits above 12 are discarded.
// @param  rand_b      62-bit field; bits above 62 are discarded.
// @return Identifier with ver=7 and var=0b10.
// -------------------------------------------------------------------------
Identifier pack(std::uint64_t unix_ts_ms, std::uint16_t rand_a,
                std::uint64_t rand_b);

// -------------------------------------------------------------------------
// unpack
// -------------------------------------------------------------------------
// @brief  Splits an Identifier into its five fields. No validation.
// -------------------------------------------------------------------------
Uuid7Fields unpack(const Identifier& id);

// Builds the (rand_a, rand_b) pair that carries a 20-bit sub-ms field plus
// 54 random bits.
struct RandomFields {
  std::uint16_t rand_a{0};
  std::uint64_t rand_b{0};
};
RandomFields fields_for_sub_ms(std::uint32_t sub_ms, std::uint64_t random_bits);

/// Reassembles the 20-bit sub-ms field from rand_a and the top of rand_b.
std::uint32_t sub_ms_of(const Uuid7Fields& fields);

}  // namespace layout
}  // namespace chronoid
