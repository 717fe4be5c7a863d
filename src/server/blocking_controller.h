// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "server/tx_base.h"

namespace doppel {

class Transaction;

// Used for tracking keys of blocking transactions and properly notifying them.
// First, keys are marked as watched and associated with an owner transaction. A mutating
// transaction marks them as touched, and once it concludes, the watching transactions are notified.
// Every waiter of a touched key is woken and re-evaluates its own read, there is no hand-off
// between waiters.
// One controller exists per db table and it is accessed only under the table mutex.
class BlockingController {
 public:
  BlockingController();
  ~BlockingController();

  // Associate given keys with transaction.
  void AddWatched(ArgSlice watch_keys, Transaction* me);

  // Remove transaction from watching these keys.
  void RemovedWatched(ArgSlice keys, Transaction* tx);

  // Mark given key as touched. Called by commands mutating this key.
  void Touch(std::string_view key);

  // Notify transactions of touched keys.
  void NotifyPending();

  // Used in tests and debugging functions.
  size_t NumWatched() const {
    return queue_map_.size();
  }
  std::vector<std::string> GetWatchedKeys() const;

  // Number of transactions watching the key.
  size_t NumWaiters(std::string_view key) const;

 private:
  struct WatchQueue;

  absl::flat_hash_map<std::string, std::unique_ptr<WatchQueue>> queue_map_;

  // touched keys that have at least one watcher.
  absl::flat_hash_set<std::string> awakened_keys_;
};

}  // namespace doppel
