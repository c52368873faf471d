#include "chronoid/codec/codec.hpp"
#include "chronoid/codec/compact_codec.hpp"
#include "chronoid/domain/errors.hpp"
#include "radix.hpp"

#include <algorithm>

namespace chronoid {
namespace codec {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

// Offsets of the four dashes in the 8-4-4-4-12 form.
constexpr std::size_t kDashPositions[] = {8, 13, 18, 23};

// Returns 0-15, or -1 for a non-hex character.
int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool is_dash_position(std::size_t i) {
  return std::find(std::begin(kDashPositions), std::end(kDashPositions), i) !=
         std::end(kDashPositions);
}

std::string quoted(std::string_view text) {
  return "'" + std::string(text) + "'";
}

// Folds hex digits from `text` into an Identifier, skipping the given
// positions. The caller has already checked the digit count is 32.
Identifier fold_hex(std::string_view text, bool skip_dashes) {
  Identifier id;
  std::size_t nibble = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (skip_dashes && is_dash_position(i)) {
      continue;
    }
    int v = hex_value(text[i]);
    if (v < 0) {
      throw MalformedIdentifier("invalid hex character in " + quoted(text));
    }
    std::uint64_t& word = nibble < 16 ? id.hi : id.lo;
    word = (word << 4) | static_cast<std::uint64_t>(v);
    ++nibble;
  }
  return id;
}

}  // namespace

ByteArray to_bytes(const Identifier& id) {
  ByteArray out{};
  for (int i = 0; i < 8; ++i) {
    out[i] = static_cast<std::uint8_t>(id.hi >> (56 - 8 * i));
    out[8 + i] = static_cast<std::uint8_t>(id.lo >> (56 - 8 * i));
  }
  return out;
}

Identifier from_bytes(const ByteArray& bytes) {
  Identifier id;
  for (int i = 0; i < 8; ++i) {
    id.hi = (id.hi << 8) | bytes[i];
    id.lo = (id.lo << 8) | bytes[8 + i];
  }
  return id;
}

Identifier from_bytes(const std::uint8_t* data, std::size_t size) {
  if (data == nullptr || size != 16) {
    throw MalformedIdentifier("identifier must be exactly 16 bytes, got " +
                              std::to_string(size));
  }
  ByteArray bytes{};
  std::copy(data, data + 16, bytes.begin());
  return from_bytes(bytes);
}

std::string to_hex(const Identifier& id) {
  std::string out(kHexLength, '0');
  for (std::size_t i = 0; i < 16; ++i) {
    out[i] = kHexDigits[(id.hi >> (60 - 4 * i)) & 0xF];
    out[16 + i] = kHexDigits[(id.lo >> (60 - 4 * i)) & 0xF];
  }
  return out;
}

Identifier from_hex(std::string_view text) {
  if (text.size() != kHexLength) {
    throw MalformedIdentifier("hex identifier must be 32 characters: " +
                              quoted(text));
  }
  return fold_hex(text, false);
}

std::string to_canonical(const Identifier& id) {
  const std::string hex = to_hex(id);
  std::string out;
  out.reserve(kCanonicalLength);
  out.append(hex, 0, 8).push_back('-');
  out.append(hex, 8, 4).push_back('-');
  out.append(hex, 12, 4).push_back('-');
  out.append(hex, 16, 4).push_back('-');
  out.append(hex, 20, 12);
  return out;
}

Identifier from_canonical(std::string_view text) {
  if (text.size() != kCanonicalLength) {
    throw MalformedIdentifier("canonical identifier must be 36 characters: " +
                              quoted(text));
  }
  for (std::size_t pos : kDashPositions) {
    if (text[pos] != '-') {
      throw MalformedIdentifier("expected '-' at offset " +
                                std::to_string(pos) + " in " + quoted(text));
    }
  }
  return fold_hex(text, true);
}

std::string to_decimal(const Identifier& id) {
  if (id.is_nil()) {
    return "0";
  }
  std::string out;
  Identifier rest = id;
  while (!rest.is_nil()) {
    out.push_back(static_cast<char>('0' + detail::divmod_small(rest, 10)));
  }
  std::reverse(out.begin(), out.end());
  return out;
}

Identifier from_decimal(std::string_view text) {
  if (text.empty()) {
    throw MalformedIdentifier("decimal identifier is empty");
  }
  Identifier id;
  for (char c : text) {
    if (c < '0' || c > '9') {
      throw MalformedIdentifier("invalid decimal character in " + quoted(text));
    }
    if (!detail::mul_add_small(id, 10, static_cast<std::uint32_t>(c - '0'))) {
      throw MalformedIdentifier("decimal identifier exceeds 128 bits: " +
                                quoted(text));
    }
  }
  return id;
}

Identifier parse(std::string_view text) {
  const bool has_dash = text.find('-') != std::string_view::npos;
  if (!has_dash && text.size() == compact::kCompactLength) {
    return compact::decode(text);
  }

  std::string digits;
  digits.reserve(text.size());
  for (char c : text) {
    if (c != '-') {
      digits.push_back(c);
    }
  }
  if (digits.size() != kHexLength) {
    throw MalformedIdentifier("identifier string has the wrong length: " +
                              quoted(text));
  }
  return fold_hex(digits, false);
}

}  // namespace codec
}  // namespace chronoid
