// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "server/blocking_controller.h"

#include <glog/logging.h>

#include <algorithm>
#include <deque>

#include "server/transaction.h"

namespace doppel {

using namespace std;

struct BlockingController::WatchQueue {
  deque<Transaction*> items;

  auto Find(Transaction* tx) const {
    return find(items.begin(), items.end(), tx);
  }
};

BlockingController::BlockingController() {
}

BlockingController::~BlockingController() {
  DCHECK(queue_map_.empty()) << "blocked transactions outlived their table";
}

void BlockingController::AddWatched(ArgSlice watch_keys, Transaction* trans) {
  for (string_view key : watch_keys) {
    auto [res, inserted] = queue_map_.emplace(key, nullptr);
    if (inserted) {
      res->second.reset(new WatchQueue);
    }

    // Duplicate keys case. We push only once per key.
    if (res->second->Find(trans) != res->second->items.end())
      continue;

    DVLOG(2) << "Emplace " << trans->DebugId() << " to watch " << key;
    res->second->items.push_back(trans);
  }
}

void BlockingController::RemovedWatched(ArgSlice keys, Transaction* tx) {
  for (string_view key : keys) {
    auto wq_it = queue_map_.find(key);

    // With multiple same keys we may have misses because the first iteration
    // on the same key could remove the queue.
    if (wq_it == queue_map_.end())
      continue;

    WatchQueue* wq = wq_it->second.get();
    if (auto it = wq->Find(tx); it != wq->items.end()) {
      wq->items.erase(it);
    }

    if (wq->items.empty()) {
      DVLOG(1) << "queue_map.erase " << key;
      awakened_keys_.erase(wq_it->first);
      queue_map_.erase(wq_it);
    }
  }
}

void BlockingController::Touch(string_view key) {
  auto it = queue_map_.find(key);
  if (it == queue_map_.end())
    return;  // nobody watches this key.

  if (awakened_keys_.insert(it->first).second) {
    VLOG(1) << "Touch: " << key;
  }
}

void BlockingController::NotifyPending() {
  for (const string& key : awakened_keys_) {
    auto it = queue_map_.find(key);
    DCHECK(it != queue_map_.end());

    for (Transaction* tx : it->second->items) {
      DVLOG(2) << "Notify " << tx->DebugId() << " on key " << key;
      tx->NotifySuspended();
    }
  }
  awakened_keys_.clear();
}

vector<string> BlockingController::GetWatchedKeys() const {
  vector<string> res;
  res.reserve(queue_map_.size());
  for (const auto& k_v : queue_map_) {
    res.push_back(k_v.first);
  }

  return res;
}

size_t BlockingController::NumWaiters(string_view key) const {
  auto it = queue_map_.find(key);
  return it == queue_map_.end() ? 0 : it->second->items.size();
}

}  // namespace doppel
