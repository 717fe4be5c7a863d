// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/functional/function_ref.h>

#include <chrono>
#include <condition_variable>
#include <string>

#include "facade/op_status.h"
#include "server/common.h"
#include "server/tx_base.h"

namespace doppel {

class DbSlice;
class VirtualClock;
struct DbTable;

using facade::OpResult;
using facade::OpStatus;

// Gives a command serialized access to the database it runs on.
//
// Every hop locks the mutex of the selected db table, runs the callback and, before releasing the
// lock, wakes the blocked transactions of the keys the callback touched. Global transactions
// (FLUSHALL) run the callback once per database.
//
// A blocking command retries its read with WaitOnWatch(). Between the attempts the table lock is
// released and the transaction is suspended until one of its keys is touched, its deadline passes
// or its connection cancels it.
class Transaction {
  Transaction(const Transaction&) = delete;
  void operator=(const Transaction&) = delete;

 public:
  using time_point = ::std::chrono::steady_clock::time_point;

  // Runnable that is run under the table lock during hop executions (often named callback).
  using RunnableType = absl::FunctionRef<OpStatus(Transaction* t, DbSlice* slice)>;

  // Attempts a blocking read. Returns true if the read is complete and the transaction should stop
  // waiting.
  using BlockingPredicate = absl::FunctionRef<bool(Transaction* t, DbSlice* slice)>;

  Transaction(const CommandId* cid, DbSlice* db_slice, const VirtualClock* clock, DbIndex index);
  ~Transaction();

  // Execute single hop.
  OpStatus ScheduleSingleHop(RunnableType cb);

  // Execute single hop with return value.
  template <typename F> auto ScheduleSingleHopT(F&& f) -> decltype(f(this, nullptr));

  // Runs `pred` under the table lock until it returns true. After each unsuccessful attempt
  // the transaction watches `keys` and blocks until either one of them is touched or tp is
  // reached. If tp is time_point::max() then waits indefinitely.
  // Returns OK once pred succeeded, TIMED_OUT or CANCELLED otherwise.
  OpStatus WaitOnWatch(const time_point& tp, ArgSlice keys, BlockingPredicate pred);

  // Wakes the transaction if it is suspended in WaitOnWatch().
  // Requires the table lock to be held.
  void NotifySuspended();

  // Interrupts WaitOnWatch(), now or at its next attempt. Can be called from any thread.
  void CancelBlocking();

  OpArgs GetOpArgs(DbSlice* slice) {
    return OpArgs{slice, this, db_cntx_};
  }

  const DbContext& GetDbContext() const {
    return db_cntx_;
  }

  DbIndex GetDbIndex() const {
    return db_index_;
  }

  bool IsGlobal() const;

  std::string DebugId() const;

 private:
  // Runs cb under the lock of table.
  OpStatus RunHop(DbTable* table, RunnableType cb);

  const CommandId* cid_;
  DbSlice* db_slice_;
  const VirtualClock* clock_;
  const DbIndex db_index_;
  const uint64_t txid_;

  DbContext db_cntx_;

  // Guarded by the mutex of the table the transaction blocks on.
  std::condition_variable blocking_cv_;
  bool awakened_ = false;
  bool cancelled_ = false;
};

template <typename F> auto Transaction::ScheduleSingleHopT(F&& f) -> decltype(f(this, nullptr)) {
  decltype(f(this, nullptr)) res;

  ScheduleSingleHop([&res, f = std::forward<F>(f)](Transaction* t, DbSlice* slice) {
    res = f(t, slice);
    return res.status();
  });
  return res;
}

}  // namespace doppel
