#include "chronoid/codec/compact_codec.hpp"
#include "chronoid/domain/errors.hpp"
#include "radix.hpp"

namespace chronoid {
namespace compact {

std::string encode(const Identifier& id, LetterCase letter_case) {
  const std::string_view alphabet =
      letter_case == LetterCase::Upper ? kUpperAlphabet : kLowerAlphabet;

  std::string out(kCompactLength, alphabet[0]);
  Identifier rest = id;
  for (std::size_t i = kCompactLength; i-- > 0;) {
    out[i] = alphabet[codec::detail::divmod_small(rest, kCompactRadix)];
  }
  return out;
}

LetterCase detect_case(std::string_view text) {
  for (char c : text) {
    if (c >= 'A' && c <= 'Z') {
      return LetterCase::Upper;
    }
  }
  return LetterCase::Lower;
}

Identifier decode(std::string_view text) {
  if (text.size() != kCompactLength) {
    throw MalformedIdentifier("compact identifier must be 25 characters: '" +
                              std::string(text) + "'");
  }

  const std::string_view alphabet =
      detect_case(text) == LetterCase::Upper ? kUpperAlphabet : kLowerAlphabet;

  Identifier id;
  for (char c : text) {
    std::size_t digit = alphabet.find(c);
    if (digit == std::string_view::npos) {
      throw MalformedIdentifier("symbol '" + std::string(1, c) +
                                "' is not in the compact alphabet: '" +
                                std::string(text) + "'");
    }
    if (!codec::detail::mul_add_small(id, kCompactRadix,
                                      static_cast<std::uint32_t>(digit))) {
      throw MalformedIdentifier("compact identifier exceeds 128 bits: '" +
                                std::string(text) + "'");
    }
  }
  return id;
}

}  // namespace compact
}  // namespace chronoid
