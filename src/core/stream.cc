// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "core/stream.h"

#include <glog/logging.h>

#include <iterator>

#include "core/consumer_group.h"

namespace doppel {

using namespace std;

Stream::Stream() = default;

Stream::~Stream() = default;

StreamID Stream::first_id() const {
  return entries_.empty() ? StreamID{} : entries_.begin()->first;
}

auto Stream::Add(const ParsedStreamID& id, FieldValues values, uint64_t now_ms,
                 StreamID* added_id) -> AddStatus {
  StreamID new_id;

  if (!id.id_given) {
    // "*": the current time, or the successor of the last ID if the clock went backwards.
    if (now_ms > last_id_.ms) {
      new_id = StreamID{now_ms, 0};
    } else {
      new_id = last_id_;
      if (!new_id.Incr())
        return AddStatus::ID_TOO_SMALL;
    }
  } else if (!id.has_seq) {
    // "<ms>-*": the next free sequence within the given millisecond.
    if (id.val.ms > last_id_.ms) {
      new_id = StreamID{id.val.ms, 0};
    } else if (id.val.ms == last_id_.ms && last_id_.seq != UINT64_MAX) {
      new_id = StreamID{id.val.ms, last_id_.seq + 1};
    } else {
      return AddStatus::ID_TOO_SMALL;
    }
  } else {
    if (id.val == StreamID::Min())
      return AddStatus::ID_ZERO;
    if (id.val <= last_id_)
      return AddStatus::ID_TOO_SMALL;
    new_id = id.val;
  }

  DCHECK(new_id > last_id_);

  entries_.emplace(new_id, std::move(values));
  last_id_ = new_id;
  *added_id = new_id;

  DVLOG(2) << "Added " << new_id << ", length " << entries_.size();
  return AddStatus::OK;
}

size_t Stream::Trim(size_t max_len) {
  if (entries_.size() <= max_len)
    return 0;

  size_t to_remove = entries_.size() - max_len;
  auto end = entries_.begin();
  std::advance(end, to_remove);
  entries_.erase(entries_.begin(), end);

  return to_remove;
}

size_t Stream::Delete(absl::Span<const StreamID> ids) {
  size_t deleted = 0;
  for (const StreamID& id : ids) {
    deleted += entries_.erase(id);
  }
  return deleted;
}

StreamEntries Stream::Range(const StreamID& start, const StreamID& end, size_t count,
                            bool rev) const {
  StreamEntries res;

  auto limit_reached = [&] { return count > 0 && res.size() >= count; };

  if (!rev) {
    if (end < start)
      return res;

    for (auto it = entries_.lower_bound(start); it != entries_.end() && it->first <= end; ++it) {
      if (limit_reached())
        break;
      res.push_back(StreamEntry{it->first, it->second});
    }
    return res;
  }

  if (start < end)
    return res;

  // upper_bound returns the first entry past `start`, walk backwards from there.
  for (auto it = entries_.upper_bound(start); it != entries_.begin();) {
    --it;
    if (it->first < end || limit_reached())
      break;
    res.push_back(StreamEntry{it->first, it->second});
  }

  return res;
}

StreamEntries Stream::After(const StreamID& id, size_t count) const {
  StreamID start = id;
  if (!start.Incr())
    return {};

  return Range(start, StreamID::Max(), count, false);
}

const FieldValues* Stream::Find(const StreamID& id) const {
  auto it = entries_.find(id);
  return it == entries_.end() ? nullptr : &it->second;
}

ConsumerGroup* Stream::CreateGroup(string_view name, const StreamID& last_delivered) {
  auto [it, inserted] = groups_.try_emplace(string(name));
  if (!inserted)
    return nullptr;

  it->second = make_unique<ConsumerGroup>(last_delivered);
  return it->second.get();
}

ConsumerGroup* Stream::FindGroup(string_view name) {
  auto it = groups_.find(name);
  return it == groups_.end() ? nullptr : it->second.get();
}

}  // namespace doppel
