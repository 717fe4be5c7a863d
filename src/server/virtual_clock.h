// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <atomic>
#include <cstdint>

namespace doppel {

// Supplies the current time in milliseconds to all time dependent computations: entry ID
// generation, pending entry idle times and delivery timestamps.
// By default follows the wall clock. Once frozen with SetTime() it only moves by Advance(),
// which lets tests simulate elapsed time without sleeping.
// Blocking deadlines do not use this clock, they are real timers.
class VirtualClock {
 public:
  uint64_t NowMs() const;

  // Freezes the clock at `ms`. Zero returns the clock to wall time.
  void SetTime(uint64_t ms) {
    frozen_ms_.store(ms, std::memory_order_relaxed);
  }

  // Moves a frozen clock forward. A clock that follows wall time is frozen at the current
  // wall time first.
  void Advance(uint64_t ms);

 private:
  std::atomic_uint64_t frozen_ms_{0};
};

}  // namespace doppel
