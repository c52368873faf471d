// =============================================================================
// bit_layout_test.cpp
// =============================================================================
// Unit tests for chronoid::layout (pack / unpack of the UUIDv7 fields).
//
// Validates:
//   - The interoperability fixture packs to the published hex value
//   - ver and var are forced regardless of what the caller passes
//   - unpack() is the arithmetic inverse of pack()
//   - The 20-bit sub-ms field splits 12/8 across rand_a and rand_b
// =============================================================================

#include "chronoid/codec/codec.hpp"
#include "chronoid/layout/bit_layout.hpp"

#include <gtest/gtest.h>

using namespace chronoid;

namespace {
constexpr std::uint64_t kFixtureMs = 0x17F22E279B0ULL;
constexpr std::uint16_t kFixtureRandA = 0xCC3;
constexpr std::uint64_t kFixtureRandB = 0x18C4DC0C0C07398FULL;
}  // namespace

// -----------------------------------------------------------------------------
// 1. The conformance fixture. Any other implementation must agree on it.
// -----------------------------------------------------------------------------
TEST(BitLayoutTest, PacksConformanceFixture) {
  Identifier id = layout::pack(kFixtureMs, kFixtureRandA, kFixtureRandB);

  EXPECT_EQ(id.hi, 0x017F22E279B07CC3ULL);
  EXPECT_EQ(id.lo, 0x98C4DC0C0C07398FULL);
  EXPECT_EQ(codec::to_hex(id), "017f22e279b07cc398c4dc0c0c07398f");
}

// -----------------------------------------------------------------------------
// 2. Oversized inputs are truncated to their field widths; ver/var survive.
// -----------------------------------------------------------------------------
TEST(BitLayoutTest, ForcesVersionAndVariant) {
  Identifier id = layout::pack(~std::uint64_t{0}, 0xFFFF, ~std::uint64_t{0});

  EXPECT_EQ(id.version(), 7);
  EXPECT_EQ(id.variant(), 2);

  layout::Uuid7Fields f = layout::unpack(id);
  EXPECT_EQ(f.unix_ts_ms, layout::kUnixTsMsMask);
  EXPECT_EQ(f.rand_a, 0xFFF);
  EXPECT_EQ(f.rand_b, layout::kRandBMask);
}

TEST(BitLayoutTest, ZeroFieldsStillCarryVersionAndVariant) {
  Identifier id = layout::pack(0, 0, 0);
  EXPECT_EQ(codec::to_canonical(id), "00000000-0000-7000-8000-000000000000");
}

// -----------------------------------------------------------------------------
// 3. unpack() reads back exactly what pack() wrote.
// -----------------------------------------------------------------------------
TEST(BitLayoutTest, UnpackInvertsPack) {
  layout::Uuid7Fields f =
      layout::unpack(layout::pack(kFixtureMs, kFixtureRandA, kFixtureRandB));

  EXPECT_EQ(f.unix_ts_ms, kFixtureMs);
  EXPECT_EQ(f.ver, 7);
  EXPECT_EQ(f.rand_a, kFixtureRandA);
  EXPECT_EQ(f.var, 2);
  EXPECT_EQ(f.rand_b, kFixtureRandB);
}

// unpack() does not validate: a v4 value comes back with ver == 4.
TEST(BitLayoutTest, UnpackDoesNotValidate) {
  Identifier v4{0x0123456789AB4DEFULL, 0x0123456789ABCDEFULL};
  layout::Uuid7Fields f = layout::unpack(v4);
  EXPECT_EQ(f.ver, 4);
  EXPECT_EQ(f.var, 0);
}

// -----------------------------------------------------------------------------
// 4. Sub-ms field: top 12 bits in rand_a, low 8 bits at rand_b bits 54-61,
//    54 random bits underneath.
// -----------------------------------------------------------------------------
TEST(BitLayoutTest, SubMsFieldSplitsTwelveAndEight) {
  layout::RandomFields r =
      layout::fields_for_sub_ms(0xCC362, 0x01020304050607ULL);

  EXPECT_EQ(r.rand_a, 0xCC3);
  EXPECT_EQ(r.rand_b >> 54, 0x62u);
  EXPECT_EQ(r.rand_b & layout::kRandomBitsMask, 0x01020304050607ULL);

  layout::Uuid7Fields f;
  f.rand_a = r.rand_a;
  f.rand_b = r.rand_b;
  EXPECT_EQ(layout::sub_ms_of(f), 0xCC362u);
}

TEST(BitLayoutTest, RandomBitsAboveFiftyFourAreDiscarded) {
  layout::RandomFields r = layout::fields_for_sub_ms(0, ~std::uint64_t{0});
  EXPECT_EQ(r.rand_a, 0);
  EXPECT_EQ(r.rand_b, layout::kRandomBitsMask);
}

TEST(BitLayoutTest, FixtureSubMsField) {
  layout::Uuid7Fields f =
      layout::unpack(layout::pack(kFixtureMs, kFixtureRandA, kFixtureRandB));
  EXPECT_EQ(layout::sub_ms_of(f), 836451u);
}
