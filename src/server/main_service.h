// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <memory>
#include <string_view>

#include "facade/facade_types.h"
#include "server/command_registry.h"
#include "server/virtual_clock.h"

namespace facade {
class RedisReplyBuilder;
}  // namespace facade

namespace doppel {

class ConnectionContext;
class DbSlice;

// Owns the databases, the clock and the command table, and routes client commands to their
// handlers. All public methods can be called concurrently from different connections.
class Service {
 public:
  Service();
  ~Service();

  // Creates the databases and registers the commands. Must be called once before dispatching.
  void Init();

  // args[0] is the command name, matched case insensitively.
  void DispatchCommand(facade::CmdArgList args, facade::RedisReplyBuilder* builder,
                       ConnectionContext* cntx);

  const CommandId* FindCmd(std::string_view cmd) const;

  DbSlice& db_slice() {
    return *db_slice_;
  }

  VirtualClock& clock() {
    return clock_;
  }

  const CommandRegistry& registry() const {
    return registry_;
  }

 private:
  void RegisterCommands();

  VirtualClock clock_;
  std::unique_ptr<DbSlice> db_slice_;
  CommandRegistry registry_;
};

}  // namespace doppel
