// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <mutex>
#include <string>

#include "server/common.h"
#include "server/tx_base.h"

namespace doppel {

struct ConnectionState {
  DbIndex db_index = 0;
};

// Per client state. Commands of a connection run one at a time, but CancelBlocking() may be
// called from another thread, for example when the client goes away.
class ConnectionContext {
 public:
  explicit ConnectionContext(std::string name = {}) : name_(std::move(name)) {
  }

  ConnectionState conn_state;

  DbIndex db_index() const {
    return conn_state.db_index;
  }

  const std::string& name() const {
    return name_;
  }

  // Publishes the transaction of the command being executed, nullptr once it finished.
  // A transaction published on a cancelled connection is cancelled right away.
  void SetTransaction(Transaction* tx);

  // Closes the connection for blocking: interrupts the blocked command if there is one and every
  // blocking command that follows.
  void CancelBlocking();

  bool cancelled() const;

 private:
  std::string name_;

  mutable std::mutex mu_;
  Transaction* transaction_ = nullptr;  // guarded by mu_
  bool cancelled_ = false;              // guarded by mu_
};

}  // namespace doppel
