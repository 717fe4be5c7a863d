// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/container/btree_map.h>
#include <absl/types/span.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/stream.h"
#include "core/stream_id.h"

namespace doppel {

// An entry delivered to a consumer and not acknowledged yet. The record holds no reference
// into the stream, so it outlives the deletion of the entry it was created for.
struct PendingEntry {
  std::string consumer;
  uint64_t delivery_time_ms = 0;
  uint64_t delivery_count = 0;
};

struct PendingSummary {
  size_t count = 0;
  StreamID min_id;
  StreamID max_id;

  // Consumers with at least one pending entry, sorted by name.
  std::vector<std::pair<std::string, size_t>> consumers;
};

struct PendingExtended {
  StreamID id;
  std::string consumer;
  uint64_t idle_ms = 0;
  uint64_t delivery_count = 0;
};

struct PendingFilter {
  StreamID start = StreamID::Min();
  StreamID end = StreamID::Max();
  int64_t count = 0;
  uint64_t min_idle_ms = 0;

  // Empty means any consumer.
  std::string_view consumer;
};

// Read cursor and pending entries list of a consumer group.
// The group does not own the stream, reads receive it explicitly.
class ConsumerGroup {
 public:
  explicit ConsumerGroup(const StreamID& last_delivered) : last_delivered_(last_delivered) {
  }

  const StreamID& last_delivered_id() const {
    return last_delivered_;
  }

  // Delivers up to `count` entries added after the group cursor to `consumer` and moves the
  // cursor to the last delivered entry. Unless `noack` is set, every delivered entry becomes
  // pending for the consumer. A zero count means no limit.
  StreamEntries ReadNew(const Stream& stream, std::string_view consumer, uint64_t now_ms,
                        size_t count, bool noack);

  // Returns entries pending for `consumer` with IDs greater than `after`. Neither the cursor nor
  // the pending entries change. Pending entries whose stream entry was deleted are skipped.
  StreamEntries ReadHistory(const Stream& stream, std::string_view consumer,
                            const StreamID& after, uint64_t now_ms, size_t count);

  // Removes the given IDs from the pending entries list whoever owns them.
  // Returns the number of removed entries.
  size_t Ack(absl::Span<const StreamID> ids);

  size_t PendingCount(std::string_view consumer) const;

  size_t pending_size() const {
    return pending_.size();
  }

  size_t consumer_count() const {
    return consumers_.size();
  }

  // Returns the time a consumer was last seen, or nullopt for an unknown consumer.
  std::optional<uint64_t> ConsumerSeenTime(std::string_view consumer) const;

  PendingSummary Summary() const;

  // Returns pending entries in ID order that match the filter. A non-positive count yields
  // nothing.
  std::vector<PendingExtended> Pending(uint64_t now_ms, const PendingFilter& filter) const;

 private:
  void Touch(std::string_view consumer, uint64_t now_ms);

  StreamID last_delivered_;
  absl::btree_map<StreamID, PendingEntry> pending_;

  // consumer name -> the last time it was seen
  absl::btree_map<std::string, uint64_t> consumers_;
};

}  // namespace doppel
