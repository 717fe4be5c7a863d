// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/container/flat_hash_map.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "facade/facade_types.h"

namespace facade {
class RedisReplyBuilder;
}  // namespace facade

namespace doppel {

class ConnectionContext;
class Transaction;

namespace CO {

enum CommandOpt : uint32_t {
  READONLY = 1U << 0,
  FAST = 1U << 1,
  WRITE = 1U << 2,
  DENYOOM = 1U << 4,  // use-memory in redis.
  BLOCKING = 1U << 9,
  GLOBAL_TRANS = 1U << 12,
  NO_KEY_TRANSACTIONAL = 1U << 16,
};

};  // namespace CO

struct CommandContext {
  CommandContext(Transaction* _tx, facade::RedisReplyBuilder* _rb, ConnectionContext* cntx)
      : tx(_tx), rb(_rb), conn_cntx(cntx) {
  }

  Transaction* tx;
  facade::RedisReplyBuilder* rb;
  ConnectionContext* conn_cntx;
};

class CommandId {
 public:
  using CmdArgList = facade::CmdArgList;

  // Arity counts the command name. A negative arity means at least -arity arguments.
  CommandId(const char* name, uint32_t mask, int8_t arity);

  using Handler = std::function<void(CmdArgList, const CommandContext&)>;

  std::string_view name() const {
    return name_;
  }

  int arity() const {
    return arity_;
  }

  uint32_t opt_mask() const {
    return opt_mask_;
  }

  bool IsBlocking() const {
    return opt_mask_ & CO::BLOCKING;
  }

  // Invokes the handler with the arguments that follow the command name.
  void Invoke(CmdArgList args, const CommandContext& cmd_cntx) const;

  // Returns an error if the number of arguments does not match the arity.
  std::optional<facade::ErrorReply> Validate(CmdArgList tail_args) const;

  CommandId&& SetHandler(Handler f) && {
    handler_ = std::move(f);
    return std::move(*this);
  }

 private:
  std::string name_;

  uint32_t opt_mask_;
  int8_t arity_;

  Handler handler_;
};

class CommandRegistry {
 public:
  CommandRegistry();

  CommandRegistry& operator<<(CommandId cmd);

  // Expects an upper-cased name.
  const CommandId* Find(std::string_view cmd) const {
    auto it = cmd_map_.find(cmd);
    return it == cmd_map_.end() ? nullptr : &it->second;
  }

  using TraverseCb = std::function<void(std::string_view, const CommandId&)>;

  void Traverse(TraverseCb cb) const {
    for (const auto& k_v : cmd_map_) {
      cb(k_v.first, k_v.second);
    }
  }

  size_t size() const {
    return cmd_map_.size();
  }

 private:
  // Maps upper-cased original names to upper-cased new names, an empty new name disables
  // the command.
  using RenameMap = absl::flat_hash_map<std::string, std::string>;

  static RenameMap ParseRenames(const std::vector<std::string>& mappings);

  absl::flat_hash_map<std::string, CommandId> cmd_map_;
  RenameMap renames_;
};

}  // namespace doppel
