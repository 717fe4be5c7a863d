// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "server/transaction.h"

#include <absl/cleanup/cleanup.h>
#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <atomic>
#include <mutex>

#include "server/command_registry.h"
#include "server/db_slice.h"
#include "server/virtual_clock.h"

namespace doppel {

using namespace std;

namespace {

atomic_uint64_t op_seq{1};

}  // namespace

Transaction::Transaction(const CommandId* cid, DbSlice* db_slice, const VirtualClock* clock,
                         DbIndex index)
    : cid_(cid),
      db_slice_(db_slice),
      clock_(clock),
      db_index_(index),
      txid_(op_seq.fetch_add(1, memory_order_relaxed)) {
  db_cntx_.db_index = index;
  db_cntx_.time_now_ms = clock_->NowMs();
}

Transaction::~Transaction() {
  DVLOG(3) << "Transaction " << DebugId() << " destroyed";
}

bool Transaction::IsGlobal() const {
  return cid_->opt_mask() & CO::GLOBAL_TRANS;
}

string Transaction::DebugId() const {
  return absl::StrCat(cid_->name(), "@", txid_, "/", db_index_);
}

OpStatus Transaction::RunHop(DbTable* table, RunnableType cb) {
  lock_guard lk(table->mu);

  db_cntx_.db_index = table->index;
  db_cntx_.time_now_ms = clock_->NowMs();
  OpStatus status = cb(this, db_slice_);

  table->blocking_controller.NotifyPending();
  return status;
}

OpStatus Transaction::ScheduleSingleHop(RunnableType cb) {
  if (!IsGlobal()) {
    DbTable* table = db_slice_->GetDBTable(db_index_);
    DCHECK(table) << "invalid db " << db_index_;
    return RunHop(table, cb);
  }

  OpStatus result = OpStatus::OK;
  for (size_t i = 0; i < db_slice_->db_array_size(); ++i) {
    OpStatus status = RunHop(db_slice_->GetDBTable(DbIndex(i)), cb);
    if (status != OpStatus::OK)
      result = status;
  }
  db_cntx_.db_index = db_index_;

  return result;
}

OpStatus Transaction::WaitOnWatch(const time_point& tp, ArgSlice keys, BlockingPredicate pred) {
  DCHECK(!IsGlobal());
  DbTable* table = db_slice_->GetDBTable(db_index_);
  DCHECK(table) << "invalid db " << db_index_;

  unique_lock lk(table->mu);

  bool watching = false;
  absl::Cleanup unwatch = [&] {
    if (watching)
      table->blocking_controller.RemovedWatched(keys, this);
  };

  auto ready = [this] { return awakened_ || cancelled_; };
  while (true) {
    if (cancelled_) {  // Might have been cancelled ahead by a dropping connection
      DVLOG(1) << "WaitOnWatch cancelled " << DebugId();
      return OpStatus::CANCELLED;
    }

    db_cntx_.time_now_ms = clock_->NowMs();
    bool done = pred(this, db_slice_);
    table->blocking_controller.NotifyPending();
    if (done)
      return OpStatus::OK;

    if (!watching) {
      table->blocking_controller.AddWatched(keys, this);
      watching = true;
    }

    DVLOG(1) << "WaitOnWatch wait " << DebugId();
    awakened_ = false;
    if (tp == time_point::max()) {
      blocking_cv_.wait(lk, ready);
    } else if (!blocking_cv_.wait_until(lk, tp, ready)) {
      DVLOG(1) << "WaitOnWatch timed out " << DebugId();
      return OpStatus::TIMED_OUT;
    }
  }
}

void Transaction::NotifySuspended() {
  awakened_ = true;
  blocking_cv_.notify_one();
}

void Transaction::CancelBlocking() {
  DbTable* table = db_slice_->GetDBTable(db_index_);
  DCHECK(table);

  lock_guard lk(table->mu);
  cancelled_ = true;
  blocking_cv_.notify_one();
}

}  // namespace doppel
