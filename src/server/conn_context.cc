// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "server/conn_context.h"

#include <glog/logging.h>

#include "server/transaction.h"

namespace doppel {

using namespace std;

void ConnectionContext::SetTransaction(Transaction* tx) {
  lock_guard lk(mu_);
  transaction_ = tx;
  if (tx && cancelled_)
    tx->CancelBlocking();
}

void ConnectionContext::CancelBlocking() {
  lock_guard lk(mu_);
  VLOG(1) << "Cancelling blocking commands of connection " << name_;

  cancelled_ = true;
  if (transaction_)
    transaction_->CancelBlocking();
}

bool ConnectionContext::cancelled() const {
  lock_guard lk(mu_);
  return cancelled_;
}

}  // namespace doppel
