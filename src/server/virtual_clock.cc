// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "server/virtual_clock.h"

#include <absl/time/clock.h>

namespace doppel {

namespace {

uint64_t WallTimeMs() {
  return absl::GetCurrentTimeNanos() / 1000000;
}

}  // namespace

uint64_t VirtualClock::NowMs() const {
  uint64_t frozen = frozen_ms_.load(std::memory_order_relaxed);
  return frozen ? frozen : WallTimeMs();
}

void VirtualClock::Advance(uint64_t ms) {
  uint64_t cur = frozen_ms_.load(std::memory_order_relaxed);
  uint64_t next;
  do {
    next = (cur ? cur : WallTimeMs()) + ms;
  } while (!frozen_ms_.compare_exchange_weak(cur, next, std::memory_order_relaxed));
}

}  // namespace doppel
