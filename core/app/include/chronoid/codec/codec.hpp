#pragma once

#include "chronoid/domain/identifier.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace chronoid {
namespace codec {

// -----------------------------------------------------------------------------
// Codec — conversions between an Identifier and its standard representations
// -----------------------------------------------------------------------------
//
// @brief  Stateless, total, mutually inverse conversions for every 128-bit
//         value (nil and max included):
//
//   ByteArray   16 bytes, big-endian
//   hex         32 lowercase hex digits        017f22e279b07cc398c4dc0c0c07398f
//   canonical   8-4-4-4-12 dashed groups       017f22e2-79b0-7cc3-98c4-dc0c0c07398f
//   decimal     the unsigned 128-bit integer   1989357241971137676463954034883508623
//
// These encodings are the wire format. They must stay byte-for-byte stable.
//
// Parsing accepts upper- or lower-case hex digits and throws
// MalformedIdentifier on a wrong length or a character outside the set.
//
// Thread-safety: Pure functions. Safe from any thread.
// -----------------------------------------------------------------------------

using ByteArray = std::array<std::uint8_t, 16>;

constexpr std::size_t kHexLength = 32;
constexpr std::size_t kCanonicalLength = 36;

ByteArray to_bytes(const Identifier& id);
Identifier from_bytes(const ByteArray& bytes);
// Throws MalformedIdentifier unless `size` is exactly 16.
Identifier from_bytes(const std::uint8_t* data, std::size_t size);

std::string to_hex(const Identifier& id);
Identifier from_hex(std::string_view text);

std::string to_canonical(const Identifier& id);
// Requires dashes at offsets 8, 13, 18 and 23 and hex digits elsewhere.
Identifier from_canonical(std::string_view text);

std::string to_decimal(const Identifier& id);
// Plain decimal digits only; values above 2^128 - 1 are rejected.
Identifier from_decimal(std::string_view text);

// -------------------------------------------------------------------------
// parse
// -------------------------------------------------------------------------
// @brief  Auto-detecting parser for the string forms.
//
// @details
// Exactly 25 characters with no dash → compact (id25) form. Otherwise all
// dashes are removed and exactly 32 hex digits must remain, which covers
// the hex and canonical forms. Anything else is MalformedIdentifier.
// -------------------------------------------------------------------------
Identifier parse(std::string_view text);

}  // namespace codec
}  // namespace chronoid
