// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "server/main_service.h"

#include <absl/flags/flag.h>
#include <absl/strings/ascii.h>
#include <glog/logging.h>

#include "facade/error.h"
#include "facade/reply_builder.h"
#include "server/conn_context.h"
#include "server/db_slice.h"
#include "server/generic_family.h"
#include "server/stream_family.h"
#include "server/transaction.h"

using namespace std;

ABSL_FLAG(uint32_t, dbnum, 16, "Number of databases");

namespace doppel {

using namespace facade;
using absl::GetFlag;

Service::Service() {
}

Service::~Service() {
}

void Service::Init() {
  uint32_t dbnum = GetFlag(FLAGS_dbnum);
  if (dbnum == 0 || dbnum > kMaxDbId) {
    LOG(ERROR) << "dbnum must be between 1 and " << kMaxDbId << ", got " << dbnum;
    exit(1);
  }

  db_slice_ = make_unique<DbSlice>(dbnum);
  RegisterCommands();

  LOG(INFO) << "Initialized " << dbnum << " databases and " << registry_.size() << " commands";
}

void Service::RegisterCommands() {
  GenericFamily::Register(&registry_);
  StreamFamily::Register(&registry_);

  if (VLOG_IS_ON(2)) {
    registry_.Traverse([](std::string_view key, const CommandId& cid) {
      LOG(INFO) << "Registered " << key << " arity " << cid.arity();
    });
  }
}

const CommandId* Service::FindCmd(std::string_view cmd) const {
  return registry_.Find(absl::AsciiStrToUpper(cmd));
}

void Service::DispatchCommand(CmdArgList args, RedisReplyBuilder* builder,
                              ConnectionContext* cntx) {
  DCHECK(!args.empty());
  DCHECK(db_slice_) << "Service is not initialized";

  const CommandId* cid = FindCmd(args[0]);
  if (cid == nullptr) {
    VLOG(1) << "Unknown command " << args[0];
    return builder->SendError(UnknownCmd(args[0], args.subspan(1)), kSyntaxErrType);
  }

  CmdArgList tail_args = args.subspan(1);
  if (auto err = cid->Validate(tail_args); err) {
    return builder->SendError(std::move(*err));
  }

  DVLOG(2) << "Got (" << cntx->name() << "): " << args;

  Transaction tx{cid, db_slice_.get(), &clock_, cntx->db_index()};

  // Only blocking commands can be interrupted by the connection.
  if (!cid->IsBlocking())
    return cid->Invoke(tail_args, CommandContext{&tx, builder, cntx});

  cntx->SetTransaction(&tx);
  cid->Invoke(tail_args, CommandContext{&tx, builder, cntx});
  cntx->SetTransaction(nullptr);
}

}  // namespace doppel
