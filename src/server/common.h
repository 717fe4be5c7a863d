// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include "facade/facade_types.h"
#include "facade/op_status.h"
#include "server/tx_base.h"

namespace doppel {

using facade::ArgS;
using facade::CmdArgList;
using facade::CmdArgVec;
using facade::OpResult;
using facade::OpStatus;

class CommandId;
class Transaction;
class ConnectionContext;

}  // namespace doppel
