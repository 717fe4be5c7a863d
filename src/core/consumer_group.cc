// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "core/consumer_group.h"

#include <glog/logging.h>

namespace doppel {

using namespace std;

void ConsumerGroup::Touch(string_view consumer, uint64_t now_ms) {
  auto it = consumers_.find(consumer);
  if (it == consumers_.end()) {
    consumers_.emplace(string(consumer), now_ms);
  } else {
    it->second = now_ms;
  }
}

StreamEntries ConsumerGroup::ReadNew(const Stream& stream, string_view consumer, uint64_t now_ms,
                                     size_t count, bool noack) {
  Touch(consumer, now_ms);

  StreamEntries res = stream.After(last_delivered_, count);
  if (res.empty())
    return res;

  last_delivered_ = res.back().id;

  if (!noack) {
    for (const StreamEntry& entry : res) {
      pending_.insert_or_assign(entry.id, PendingEntry{string(consumer), now_ms, 1});
    }
  }

  DVLOG(1) << "Delivered " << res.size() << " entries to " << consumer << ", cursor "
           << last_delivered_;
  return res;
}

StreamEntries ConsumerGroup::ReadHistory(const Stream& stream, string_view consumer,
                                         const StreamID& after, uint64_t now_ms, size_t count) {
  Touch(consumer, now_ms);

  StreamEntries res;
  for (auto it = pending_.upper_bound(after); it != pending_.end(); ++it) {
    if (count > 0 && res.size() >= count)
      break;

    if (it->second.consumer != consumer)
      continue;

    const FieldValues* values = stream.Find(it->first);
    if (values == nullptr)
      continue;

    res.push_back(StreamEntry{it->first, *values});
  }

  return res;
}

size_t ConsumerGroup::Ack(absl::Span<const StreamID> ids) {
  size_t acked = 0;
  for (const StreamID& id : ids) {
    acked += pending_.erase(id);
  }
  return acked;
}

size_t ConsumerGroup::PendingCount(string_view consumer) const {
  size_t res = 0;
  for (const auto& [id, pe] : pending_) {
    if (pe.consumer == consumer)
      ++res;
  }
  return res;
}

optional<uint64_t> ConsumerGroup::ConsumerSeenTime(string_view consumer) const {
  auto it = consumers_.find(consumer);
  if (it == consumers_.end())
    return nullopt;
  return it->second;
}

PendingSummary ConsumerGroup::Summary() const {
  PendingSummary res;
  res.count = pending_.size();
  if (pending_.empty())
    return res;

  res.min_id = pending_.begin()->first;
  res.max_id = pending_.rbegin()->first;

  absl::btree_map<string_view, size_t> per_consumer;
  for (const auto& [id, pe] : pending_) {
    per_consumer[pe.consumer]++;
  }

  res.consumers.reserve(per_consumer.size());
  for (const auto& [name, cnt] : per_consumer) {
    res.consumers.emplace_back(string(name), cnt);
  }
  return res;
}

vector<PendingExtended> ConsumerGroup::Pending(uint64_t now_ms, const PendingFilter& filter) const {
  vector<PendingExtended> res;
  if (filter.count <= 0 || filter.end < filter.start)
    return res;

  for (auto it = pending_.lower_bound(filter.start);
       it != pending_.end() && it->first <= filter.end; ++it) {
    if (res.size() >= size_t(filter.count))
      break;

    const PendingEntry& pe = it->second;
    if (!filter.consumer.empty() && pe.consumer != filter.consumer)
      continue;

    uint64_t idle = now_ms > pe.delivery_time_ms ? now_ms - pe.delivery_time_ms : 0;
    if (idle < filter.min_idle_ms)
      continue;

    res.push_back(PendingExtended{it->first, pe.consumer, idle, pe.delivery_count});
  }

  return res;
}

}  // namespace doppel
