// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/flags/declare.h>

#include "facade/facade_types.h"
#include "server/tx_base.h"

ABSL_DECLARE_FLAG(uint32_t, dbnum);

namespace doppel {

using facade::CmdArgList;
using facade::OpResult;

class CommandRegistry;
struct CommandContext;

// Commands that work on keys of any type and on the key space itself.
class GenericFamily {
 public:
  static void Register(CommandRegistry* registry);

  static OpResult<uint32_t> OpExists(const OpArgs& op_args, CmdArgList keys);
  static OpResult<uint32_t> OpDel(const OpArgs& op_args, CmdArgList keys);

 private:
  static void Del(CmdArgList args, const CommandContext& cmd_cntx);
  static void Ping(CmdArgList args, const CommandContext& cmd_cntx);
  static void Echo(CmdArgList args, const CommandContext& cmd_cntx);
  static void Exists(CmdArgList args, const CommandContext& cmd_cntx);
  static void Select(CmdArgList args, const CommandContext& cmd_cntx);
  static void Type(CmdArgList args, const CommandContext& cmd_cntx);
  static void Time(CmdArgList args, const CommandContext& cmd_cntx);
  static void DbSize(CmdArgList args, const CommandContext& cmd_cntx);
  static void FlushDb(CmdArgList args, const CommandContext& cmd_cntx);
  static void FlushAll(CmdArgList args, const CommandContext& cmd_cntx);
};

}  // namespace doppel
