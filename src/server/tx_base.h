// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <cstdint>

#include "facade/facade_types.h"

namespace doppel {

class Transaction;
class DbSlice;

using DbIndex = uint16_t;

using facade::ArgSlice;

constexpr DbIndex kMaxDbId = 1024;  // Reasonable starting point.

struct DbContext {
  DbIndex db_index = 0;

  // Virtual clock reading taken when the current hop started.
  uint64_t time_now_ms = 0;
};

struct OpArgs {
  DbSlice* db_slice = nullptr;
  Transaction* tx = nullptr;
  DbContext db_cntx;

  OpArgs() = default;

  OpArgs(DbSlice* slice, Transaction* tx, const DbContext& cntx)
      : db_slice(slice), tx(tx), db_cntx(cntx) {
  }

  DbSlice& GetDbSlice() const {
    return *db_slice;
  }
};

}  // namespace doppel
