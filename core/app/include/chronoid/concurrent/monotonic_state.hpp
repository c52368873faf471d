#pragma once

#include <cstdint>
#include <mutex>

namespace chronoid {

// -----------------------------------------------------------------------------
// SubMsStamp — a millisecond timestamp plus its 20-bit sub-millisecond field
// -----------------------------------------------------------------------------
struct SubMsStamp {
  std::uint64_t ms{0};
  std::uint32_t sub_ms{0};
};

inline bool operator==(const SubMsStamp& a, const SubMsStamp& b) {
  return a.ms == b.ms && a.sub_ms == b.sub_ms;
}

// How a channel treats a stamp in the same millisecond as the last one.
enum class Reconcile {
  // Bump only an exact repeat of the stored stamp; anything else is kept
  // as computed. Caller-supplied timestamps survive unchanged.
  OnExactMatch,
  // Bump any stamp that would not sort after the stored one. Consecutive
  // results from one instance never decrease within a millisecond.
  NeverRegress,
};

// -----------------------------------------------------------------------------
// MonotonicState — the guarded {last_ms, last_sub_ms} record
// -----------------------------------------------------------------------------
//
// @brief  Remembers the last stamp handed out on one generation channel and
//         bumps the sub-ms field when the channel's Reconcile policy says so.
//
// @details
// Reconciliation, applied under the lock:
//
//   OnExactMatch:
//     if candidate.ms == last.ms and candidate.sub_ms == last.sub_ms
//        and last.sub_ms < kSubMsMax:
//         sub_ms = last.sub_ms + 1
//     else:
//         sub_ms = candidate.sub_ms
//
//   NeverRegress:
//     if candidate.ms == last.ms and candidate.sub_ms <= last.sub_ms:
//         sub_ms = min(last.sub_ms + 1, kSubMsMax)    // never wraps
//     else:
//         sub_ms = candidate.sub_ms
//
//   last = {candidate.ms, sub_ms}
//
// A candidate in an earlier millisecond (wall clock stepped back) is taken
// as-is under both policies. The state keys off the supplied value, not a
// monotonic clock.
//
// The Uuid7Generator owns two instances: a NeverRegress one for live-clock
// ("now") calls, where a clock coarser than the call rate would otherwise
// repeat or reorder stamps, and an OnExactMatch one for caller-supplied
// ("as-of") calls, where backfills may arrive in any order and each must
// keep the timestamp it asked for. Each instance has its own mutex, so the
// two channels never contend.
//
// Thread model:
//   advance() and advance_with() are safe to call concurrently. Each call
//   is exactly one read-modify-write inside a single critical section.
//
// Ownership:
//   Value member of Uuid7Generator. Non-copyable, non-movable.
// -----------------------------------------------------------------------------
class MonotonicState {
 public:
  /// Result of one reconciliation.
  struct Advance {
    SubMsStamp stamp;
    // True on the call that first pinned this millisecond at kSubMsMax.
    bool saturated_now{false};
  };

  explicit MonotonicState(Reconcile policy = Reconcile::OnExactMatch)
      : policy_(policy) {}

  MonotonicState(const MonotonicState&) = delete;
  MonotonicState& operator=(const MonotonicState&) = delete;
  MonotonicState(MonotonicState&&) = delete;
  MonotonicState& operator=(MonotonicState&&) = delete;

  // -------------------------------------------------------------------------
  // advance_with(sample)
  // -------------------------------------------------------------------------
  // @brief  Runs `sample` under the lock, then reconciles its stamp.
  //
  // @param  sample  Callable returning the candidate SubMsStamp. It runs
  //                 inside the critical section so that the order of clock
  //                 reads equals the order of state updates. If it throws,
  //                 the state is left untouched and the exception
  //                 propagates.
  // -------------------------------------------------------------------------
  template <typename Sampler>
  Advance advance_with(Sampler&& sample) {
    std::lock_guard lock(mutex_);
    const SubMsStamp candidate = sample();
    return reconcile_locked(candidate);
  }

  /// Reconciles a stamp the caller already computed.
  Advance advance(const SubMsStamp& candidate) {
    std::lock_guard lock(mutex_);
    return reconcile_locked(candidate);
  }

  /// Copy of the last stored stamp.
  SubMsStamp snapshot() const;

  Reconcile policy() const { return policy_; }

 private:
  Advance reconcile_locked(const SubMsStamp& candidate);

  const Reconcile policy_;
  mutable std::mutex mutex_;
  SubMsStamp last_{};
};

}  // namespace chronoid
