// =============================================================================
// monotonic_state_test.cpp
// =============================================================================
// Unit tests for chronoid::MonotonicState.
//
// Validates:
//   - Starts at {0, 0}
//   - A stamp that already sorts after the last one passes through
//   - OnExactMatch: only an exact repeat is bumped; other stamps are kept
//   - NeverRegress: equal or lower sub-ms in the same millisecond is bumped
//   - The counter caps at 2^20 - 1 and never wraps
//   - A clock that stepped back is accepted as-is
//   - A throwing sampler leaves the state untouched
//   - Concurrent advance() calls never hand out the same stamp twice
// =============================================================================

#include "chronoid/concurrent/monotonic_state.hpp"
#include "chronoid/layout/bit_layout.hpp"

#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using chronoid::MonotonicState;
using chronoid::Reconcile;
using chronoid::SubMsStamp;
using chronoid::layout::kSubMsMax;

// Default policy, as used by the "as-of" channel.
class MonotonicStateTest : public ::testing::Test {
 protected:
  MonotonicState state;
};

// Policy used by the live-clock "now" channel.
class NeverRegressStateTest : public ::testing::Test {
 protected:
  MonotonicState state{Reconcile::NeverRegress};
};

TEST_F(MonotonicStateTest, StartsAtZero) {
  SubMsStamp s = state.snapshot();
  EXPECT_EQ(s.ms, 0u);
  EXPECT_EQ(s.sub_ms, 0u);
  EXPECT_EQ(state.policy(), Reconcile::OnExactMatch);
}

TEST_F(MonotonicStateTest, FreshStampPassesThrough) {
  auto adv = state.advance(SubMsStamp{1000, 42});
  EXPECT_EQ(adv.stamp.ms, 1000u);
  EXPECT_EQ(adv.stamp.sub_ms, 42u);
  EXPECT_FALSE(adv.saturated_now);
  EXPECT_TRUE(state.snapshot() == (SubMsStamp{1000, 42}));
}

// -----------------------------------------------------------------------------
// Same ms, same sub-ms: the counter bumps. A repeat of the raw value after a
// bump no longer matches the stored stamp, so it is kept as computed.
// -----------------------------------------------------------------------------
TEST_F(MonotonicStateTest, ExactRepeatIncrementsCounter) {
  state.advance(SubMsStamp{1000, 42});
  EXPECT_EQ(state.advance(SubMsStamp{1000, 42}).stamp.sub_ms, 43u);
  EXPECT_EQ(state.advance(SubMsStamp{1000, 43}).stamp.sub_ms, 44u);
  EXPECT_EQ(state.advance(SubMsStamp{1000, 42}).stamp.sub_ms, 42u);
  EXPECT_EQ(state.snapshot().sub_ms, 42u);
}

// Stamps arriving out of order inside one millisecond are never rewritten.
TEST_F(MonotonicStateTest, EarlierStampInSameMillisecondIsKept) {
  state.advance(SubMsStamp{1000, 900});
  auto adv = state.advance(SubMsStamp{1000, 100});
  EXPECT_EQ(adv.stamp.sub_ms, 100u);
  EXPECT_FALSE(adv.saturated_now);
  EXPECT_TRUE(state.snapshot() == (SubMsStamp{1000, 100}));
}

TEST_F(NeverRegressStateTest, IdenticalStampKeepsIncrementing) {
  state.advance(SubMsStamp{1000, 42});
  EXPECT_EQ(state.advance(SubMsStamp{1000, 42}).stamp.sub_ms, 43u);
  EXPECT_EQ(state.advance(SubMsStamp{1000, 42}).stamp.sub_ms, 44u);
  EXPECT_EQ(state.snapshot().sub_ms, 44u);
}

// -----------------------------------------------------------------------------
// After bumps, the clock's raw sub-ms lags the stored one. It must not
// produce a smaller value.
// -----------------------------------------------------------------------------
TEST_F(NeverRegressStateTest, LaggingSubMsIsBumpedPastLastStamp) {
  state.advance(SubMsStamp{1000, 10});
  state.advance(SubMsStamp{1000, 10});  // -> 11
  EXPECT_EQ(state.advance(SubMsStamp{1000, 9}).stamp.sub_ms, 12u);
  // Clock catches up past the counter: raw value wins again.
  EXPECT_EQ(state.advance(SubMsStamp{1000, 500}).stamp.sub_ms, 500u);
}

TEST_F(MonotonicStateTest, NewMillisecondResetsToClockValue) {
  state.advance(SubMsStamp{1000, 900});
  state.advance(SubMsStamp{1000, 900});
  auto adv = state.advance(SubMsStamp{1001, 3});
  EXPECT_EQ(adv.stamp.ms, 1001u);
  EXPECT_EQ(adv.stamp.sub_ms, 3u);
}

// -----------------------------------------------------------------------------
// Saturation: the counter stops at kSubMsMax. saturated_now fires exactly
// once, on the call that reaches the cap.
// -----------------------------------------------------------------------------
TEST_F(MonotonicStateTest, CounterCapsWithoutWrapping) {
  state.advance(SubMsStamp{7, kSubMsMax - 1});

  auto reach = state.advance(SubMsStamp{7, kSubMsMax - 1});
  EXPECT_EQ(reach.stamp.sub_ms, kSubMsMax);
  EXPECT_TRUE(reach.saturated_now);

  auto pinned = state.advance(SubMsStamp{7, kSubMsMax});
  EXPECT_EQ(pinned.stamp.sub_ms, kSubMsMax);
  EXPECT_FALSE(pinned.saturated_now);
}

TEST_F(NeverRegressStateTest, CounterCapsWithoutWrapping) {
  state.advance(SubMsStamp{7, kSubMsMax - 1});

  auto reach = state.advance(SubMsStamp{7, kSubMsMax - 1});
  EXPECT_EQ(reach.stamp.sub_ms, kSubMsMax);
  EXPECT_TRUE(reach.saturated_now);

  for (int i = 0; i < 5; ++i) {
    auto pinned = state.advance(SubMsStamp{7, 0});
    EXPECT_EQ(pinned.stamp.ms, 7u);
    EXPECT_EQ(pinned.stamp.sub_ms, kSubMsMax);
    EXPECT_FALSE(pinned.saturated_now);
  }
}

// A clock that jumps backward is not "corrected"; the state follows it.
TEST_F(MonotonicStateTest, BackwardClockIsAcceptedAsIs) {
  state.advance(SubMsStamp{2000, 5});
  auto adv = state.advance(SubMsStamp{1500, 1});
  EXPECT_EQ(adv.stamp.ms, 1500u);
  EXPECT_EQ(adv.stamp.sub_ms, 1u);
  EXPECT_EQ(state.snapshot().ms, 1500u);
}

// -----------------------------------------------------------------------------
// A sampler that throws must leave the state exactly as it was.
// -----------------------------------------------------------------------------
TEST_F(MonotonicStateTest, ThrowingSamplerLeavesStateUntouched) {
  state.advance(SubMsStamp{1000, 1});

  EXPECT_THROW(state.advance_with([]() -> SubMsStamp {
    throw std::runtime_error("clock failure");
  }),
               std::runtime_error);

  EXPECT_TRUE(state.snapshot() == (SubMsStamp{1000, 1}));
}

TEST_F(MonotonicStateTest, SamplerRunsUnderTheLock) {
  int calls = 0;
  auto adv = state.advance_with([&calls] {
    ++calls;
    return SubMsStamp{55, 66};
  });
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(adv.stamp.ms, 55u);
  EXPECT_EQ(adv.stamp.sub_ms, 66u);
}

// -----------------------------------------------------------------------------
// Concurrency: 8 threads hammer one millisecond. Every returned sub-ms must
// be distinct (well below the cap, so none saturate).
// -----------------------------------------------------------------------------
TEST_F(NeverRegressStateTest, ConcurrentAdvanceHandsOutDistinctStamps) {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 2000;

  std::vector<std::vector<std::uint32_t>> seen(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([this, t, &seen] {
      for (int i = 0; i < kPerThread; ++i) {
        seen[t].push_back(state.advance(SubMsStamp{99, 0}).stamp.sub_ms);
      }
    });
  }
  for (auto& th : threads) th.join();

  std::set<std::uint32_t> all;
  for (const auto& v : seen) {
    for (std::size_t i = 1; i < v.size(); ++i) {
      EXPECT_LT(v[i - 1], v[i]) << "per-thread order regressed";
    }
    all.insert(v.begin(), v.end());
  }
  EXPECT_EQ(all.size(), static_cast<std::size_t>(kThreads * kPerThread));
}
