#pragma once

#include "chronoid/domain/identifier.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace chronoid {
namespace compact {

// -----------------------------------------------------------------------------
// Compact encoding (id25) — 25 base-35 symbols, most significant first
// -----------------------------------------------------------------------------
//
// @brief  Renders the 128-bit value as a fixed 25-character string that
//         sorts exactly like the number it encodes.
//
// @details
// 25 is the shortest length that covers 128 bits with a single-case
// alphanumeric alphabet (35^25 ≈ 2^128.2). Using 35 instead of 36 symbols
// costs nothing in length and lets each case drop one look-alike:
//
//   Lower  0123456789abcdefghijkmnopqrstuvwxyz   (no 'l', reads as '1')
//   Upper  0123456789ABCDEFGHIJKLMNPQRSTUVWXYZ   (no 'O', reads as '0')
//
// Both alphabets keep digits first and letters in order, so symbol order
// equals digit value order and lexicographic order equals numeric order.
// Because of the 0.2 bits of slack, some 25-character strings decode to
// values above 2^128 - 1; those are rejected.
//
// Thread-safety: Pure functions. Safe from any thread.
// -----------------------------------------------------------------------------

constexpr std::size_t kCompactLength = 25;
constexpr unsigned kCompactRadix = 35;

inline constexpr std::string_view kLowerAlphabet =
    "0123456789abcdefghijkmnopqrstuvwxyz";
inline constexpr std::string_view kUpperAlphabet =
    "0123456789ABCDEFGHIJKLMNPQRSTUVWXYZ";

enum class LetterCase {
  Lower,  // id25
  Upper,  // ID25
};

std::string encode(const Identifier& id, LetterCase letter_case = LetterCase::Lower);

// -------------------------------------------------------------------------
// decode
// -------------------------------------------------------------------------
// @brief  Inverse of encode() for either alphabet.
//
// @details
// Any upper-case letter selects the upper alphabet; otherwise the lower
// alphabet applies. A string mixing both cases therefore fails on the
// first foreign symbol.
//
// @throws MalformedIdentifier on a length other than 25, a symbol outside
//         the selected alphabet, or a value above 2^128 - 1.
// -------------------------------------------------------------------------
Identifier decode(std::string_view text);

// Which alphabet decode() would pick for `text`.
LetterCase detect_case(std::string_view text);

}  // namespace compact
}  // namespace chronoid
