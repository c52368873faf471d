#include "chronoid/concurrent/monotonic_state.hpp"
#include "chronoid/layout/bit_layout.hpp"

namespace chronoid {

MonotonicState::Advance MonotonicState::reconcile_locked(
    const SubMsStamp& candidate) {
  Advance out;
  out.stamp = candidate;

  if (candidate.ms != last_.ms) {
    last_ = out.stamp;
    return out;
  }

  const bool bump = policy_ == Reconcile::NeverRegress
                        ? candidate.sub_ms <= last_.sub_ms
                        : candidate.sub_ms == last_.sub_ms;
  if (bump) {
    if (last_.sub_ms < layout::kSubMsMax) {
      out.stamp.sub_ms = last_.sub_ms + 1;
      out.saturated_now = out.stamp.sub_ms == layout::kSubMsMax;
    } else {
      // Counter is pinned for the rest of this millisecond; ordering among
      // the remaining ids falls back to their random bits.
      out.stamp.sub_ms = layout::kSubMsMax;
    }
  }

  last_ = out.stamp;
  return out;
}

SubMsStamp MonotonicState::snapshot() const {
  std::lock_guard lock(mutex_);
  return last_;
}

}  // namespace chronoid
