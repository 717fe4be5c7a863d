// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/container/flat_hash_map.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/compact_object.h"
#include "server/blocking_controller.h"
#include "server/tx_base.h"

namespace doppel {

using PrimeValue = CompactObj;
using PrimeTable = absl::flat_hash_map<std::string, PrimeValue>;

// A single Db table that represents a table that can be chosen with "SELECT" command.
struct DbTable {
  // Serializes all commands running on this table. Blocked readers release it while waiting.
  std::mutex mu;

  PrimeTable prime;

  // Versions of the live keys. A mutated key takes the next value of mutation_seq, so the version
  // of a key grows even across its deletion and re-creation.
  absl::flat_hash_map<std::string, uint64_t> key_versions;
  uint64_t mutation_seq = 0;

  BlockingController blocking_controller;

  DbIndex index;

  explicit DbTable(DbIndex index) : index(index) {
  }

  void Clear();
};

using DbTableArray = std::vector<std::unique_ptr<DbTable>>;

}  // namespace doppel
