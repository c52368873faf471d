#include "chronoid/layout/bit_layout.hpp"

namespace chronoid {
namespace layout {

Identifier pack(std::uint64_t unix_ts_ms, std::uint16_t rand_a,
                std::uint64_t rand_b) {
  Identifier id;
  id.hi = ((unix_ts_ms & kUnixTsMsMask) << 16) |
          (static_cast<std::uint64_t>(kVersion) << 12) |
          (static_cast<std::uint64_t>(rand_a) & kRandAMask);
  id.lo = (static_cast<std::uint64_t>(kVariant) << 62) | (rand_b & kRandBMask);
  return id;
}

Uuid7Fields unpack(const Identifier& id) {
  Uuid7Fields f;
  f.unix_ts_ms = id.hi >> 16;
  f.ver = static_cast<std::uint8_t>((id.hi >> 12) & 0xF);
  f.rand_a = static_cast<std::uint16_t>(id.hi & kRandAMask);
  f.var = static_cast<std::uint8_t>(id.lo >> 62);
  f.rand_b = id.lo & kRandBMask;
  return f;
}

RandomFields fields_for_sub_ms(std::uint32_t sub_ms,
                               std::uint64_t random_bits) {
  RandomFields out;
  out.rand_a = static_cast<std::uint16_t>((sub_ms >> kSubMsLowBits) & kRandAMask);
  out.rand_b = (static_cast<std::uint64_t>(sub_ms & 0xFF) << kSubMsShiftInRandB) |
               (random_bits & kRandomBitsMask);
  return out;
}

std::uint32_t sub_ms_of(const Uuid7Fields& fields) {
  return (static_cast<std::uint32_t>(fields.rand_a) << kSubMsLowBits) |
         static_cast<std::uint32_t>((fields.rand_b >> kSubMsShiftInRandB) & 0xFF);
}

}  // namespace layout
}  // namespace chronoid
