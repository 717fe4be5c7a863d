// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/container/btree_map.h>
#include <absl/container/flat_hash_map.h>
#include <absl/types/span.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/stream_id.h"

namespace doppel {

class ConsumerGroup;

// Field/value pairs of an entry in insertion order.
using FieldValues = std::vector<std::pair<std::string, std::string>>;

struct StreamEntry {
  StreamID id;
  FieldValues values;
};

using StreamEntries = std::vector<StreamEntry>;

// Append-only log of entries ordered by ID together with the consumer groups reading it.
// Not thread-safe, the owner serializes access.
class Stream {
 public:
  enum class AddStatus : uint8_t { OK, ID_ZERO, ID_TOO_SMALL };

  Stream();
  ~Stream();

  Stream(const Stream&) = delete;
  Stream& operator=(const Stream&) = delete;

  size_t length() const {
    return entries_.size();
  }

  // The greatest ID ever added. Trimming and deletion do not lower it so IDs are never reused.
  const StreamID& last_id() const {
    return last_id_;
  }

  // ID of the oldest entry, 0-0 for an empty stream.
  StreamID first_id() const;

  // Appends an entry. `id` may be a wildcard ("*" or "<ms>-*") which is completed from `now_ms`
  // and last_id(). An explicit ID must be greater than last_id().
  // On success the new ID is stored in `added_id`, otherwise the stream stays unchanged.
  AddStatus Add(const ParsedStreamID& id, FieldValues values, uint64_t now_ms,
                StreamID* added_id);

  // Evicts the oldest entries until at most `max_len` remain. Returns the number evicted.
  size_t Trim(size_t max_len);

  // Removes the entries with the given IDs, unknown IDs are ignored.
  // Returns the number of removed entries.
  size_t Delete(absl::Span<const StreamID> ids);

  // Returns up to `count` entries between `start` and `end` inclusive, in the direction of the
  // scan. For a reverse scan `start` is the greater bound. A zero count means no limit.
  StreamEntries Range(const StreamID& start, const StreamID& end, size_t count, bool rev) const;

  // Returns up to `count` entries with IDs greater than `id`.
  StreamEntries After(const StreamID& id, size_t count) const;

  // Returns the values of the entry with exactly this ID or null if there is none.
  const FieldValues* Find(const StreamID& id) const;

  // Returns nullptr if a group with this name already exists.
  ConsumerGroup* CreateGroup(std::string_view name, const StreamID& last_delivered);
  ConsumerGroup* FindGroup(std::string_view name);

  size_t group_count() const {
    return groups_.size();
  }

 private:
  absl::btree_map<StreamID, FieldValues> entries_;
  StreamID last_id_;

  absl::flat_hash_map<std::string, std::unique_ptr<ConsumerGroup>> groups_;
};

}  // namespace doppel
