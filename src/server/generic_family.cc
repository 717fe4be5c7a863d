// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "server/generic_family.h"

#include <absl/flags/flag.h>
#include <absl/strings/numbers.h>
#include <glog/logging.h>

#include "facade/error.h"
#include "facade/reply_builder.h"
#include "server/command_registry.h"
#include "server/conn_context.h"
#include "server/db_slice.h"
#include "server/transaction.h"

namespace doppel {

using namespace std;
using namespace facade;

OpResult<uint32_t> GenericFamily::OpExists(const OpArgs& op_args, CmdArgList keys) {
  DVLOG(1) << "Exists: " << keys.front();
  auto& db_slice = op_args.GetDbSlice();
  uint32_t res = 0;

  for (string_view key : keys) {
    res += db_slice.FindReadOnly(op_args.db_cntx, key) != nullptr;
  }
  return res;
}

OpResult<uint32_t> GenericFamily::OpDel(const OpArgs& op_args, CmdArgList keys) {
  DVLOG(1) << "Del: " << keys.front();
  auto& db_slice = op_args.GetDbSlice();
  uint32_t res = 0;

  for (string_view key : keys) {
    res += db_slice.Del(op_args.db_cntx, key);
  }
  return res;
}

void GenericFamily::Del(CmdArgList args, const CommandContext& cmd_cntx) {
  VLOG(1) << "Del " << ArgS(args, 0);

  auto cb = [&](Transaction* t, DbSlice* slice) { return OpDel(t->GetOpArgs(slice), args); };
  OpResult<uint32_t> result = cmd_cntx.tx->ScheduleSingleHopT(std::move(cb));

  cmd_cntx.rb->SendLong(result.value_or(0));
}

void GenericFamily::Ping(CmdArgList args, const CommandContext& cmd_cntx) {
  auto* rb = cmd_cntx.rb;
  if (args.size() > 1) {
    return rb->SendError(facade::WrongNumArgsError("ping"), kSyntaxErrType);
  }

  if (args.size() == 0) {
    return rb->SendSimpleString("PONG");
  }

  string_view msg = ArgS(args, 0);
  DVLOG(2) << "Ping " << msg;

  return rb->SendBulkString(msg);
}

void GenericFamily::Echo(CmdArgList args, const CommandContext& cmd_cntx) {
  string_view key = ArgS(args, 0);
  return cmd_cntx.rb->SendBulkString(key);
}

void GenericFamily::Exists(CmdArgList args, const CommandContext& cmd_cntx) {
  VLOG(1) << "Exists " << ArgS(args, 0);

  auto cb = [&](Transaction* t, DbSlice* slice) { return OpExists(t->GetOpArgs(slice), args); };
  OpResult<uint32_t> result = cmd_cntx.tx->ScheduleSingleHopT(std::move(cb));

  cmd_cntx.rb->SendLong(result.value_or(0));
}

void GenericFamily::Select(CmdArgList args, const CommandContext& cmd_cntx) {
  string_view key = ArgS(args, 0);
  int64_t index;
  auto* builder = cmd_cntx.rb;
  if (!absl::SimpleAtoi(key, &index)) {
    return builder->SendError(kInvalidDbIndErr);
  }
  if (index < 0 || index >= absl::GetFlag(FLAGS_dbnum)) {
    return builder->SendError(kDbIndOutOfRangeErr);
  }

  cmd_cntx.conn_cntx->conn_state.db_index = index;
  builder->SendOk();
}

void GenericFamily::Type(CmdArgList args, const CommandContext& cmd_cntx) {
  std::string_view key = ArgS(args, 0);

  auto cb = [&](Transaction* t, DbSlice* slice) -> OpResult<CompactObjType> {
    const PrimeValue* pv = slice->FindReadOnly(t->GetDbContext(), key);
    if (pv) {
      return pv->ObjType();
    } else {
      return OpStatus::KEY_NOTFOUND;
    }
  };
  OpResult<CompactObjType> result = cmd_cntx.tx->ScheduleSingleHopT(std::move(cb));
  if (!result) {
    cmd_cntx.rb->SendSimpleString("none");
  } else {
    cmd_cntx.rb->SendSimpleString(ObjTypeToString(result.value()));
  }
}

// Reports the virtual clock, so a frozen clock is observable by clients.
void GenericFamily::Time(CmdArgList args, const CommandContext& cmd_cntx) {
  uint64_t now_usec = cmd_cntx.tx->GetDbContext().time_now_ms * 1000;

  auto* rb = cmd_cntx.rb;
  rb->StartArray(2);
  rb->SendLong(now_usec / 1000000);
  rb->SendLong(now_usec % 1000000);
}

void GenericFamily::DbSize(CmdArgList args, const CommandContext& cmd_cntx) {
  auto cb = [&](Transaction* t, DbSlice* slice) -> OpResult<size_t> {
    return slice->DbSize(t->GetDbIndex());
  };
  OpResult<size_t> result = cmd_cntx.tx->ScheduleSingleHopT(std::move(cb));

  cmd_cntx.rb->SendLong(result.value_or(0));
}

void GenericFamily::FlushDb(CmdArgList args, const CommandContext& cmd_cntx) {
  auto cb = [](Transaction* t, DbSlice* slice) {
    slice->FlushDb(t->GetDbIndex());
    return OpStatus::OK;
  };
  cmd_cntx.tx->ScheduleSingleHop(std::move(cb));
  cmd_cntx.rb->SendOk();
}

void GenericFamily::FlushAll(CmdArgList args, const CommandContext& cmd_cntx) {
  // Runs once per database.
  auto cb = [](Transaction* t, DbSlice* slice) {
    slice->FlushDb(t->GetDbContext().db_index);
    return OpStatus::OK;
  };
  cmd_cntx.tx->ScheduleSingleHop(std::move(cb));
  cmd_cntx.rb->SendOk();
}

#define HFUNC(x) SetHandler(&GenericFamily::x)

void GenericFamily::Register(CommandRegistry* registry) {
  using CI = CommandId;

  *registry << CI{"DEL", CO::WRITE, -2}.HFUNC(Del)
            << CI{"PING", CO::FAST, -1}.HFUNC(Ping)
            << CI{"ECHO", CO::READONLY | CO::FAST, 2}.HFUNC(Echo)
            << CI{"EXISTS", CO::READONLY | CO::FAST, -2}.HFUNC(Exists)
            << CI{"SELECT", CO::FAST, 2}.HFUNC(Select)
            << CI{"TYPE", CO::READONLY | CO::FAST, 2}.HFUNC(Type)
            << CI{"TIME", CO::FAST | CO::NO_KEY_TRANSACTIONAL, 1}.HFUNC(Time)
            << CI{"DBSIZE", CO::READONLY | CO::FAST, 1}.HFUNC(DbSize)
            << CI{"FLUSHDB", CO::WRITE, 1}.HFUNC(FlushDb)
            << CI{"FLUSHALL", CO::WRITE | CO::GLOBAL_TRANS, -1}.HFUNC(FlushAll);
}

}  // namespace doppel
