// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "facade/op_status.h"

#include <glog/logging.h>

#include "facade/error.h"

namespace facade {

std::string_view StatusToMsg(OpStatus status) {
  switch (status) {
    case OpStatus::OK:
      return "OK";
    case OpStatus::KEY_EXISTS:
      return kKeyExistsErr;
    case OpStatus::KEY_NOTFOUND:
      return kKeyNotFoundErr;
    case OpStatus::SKIPPED:
      return kSkippedErr;
    case OpStatus::INVALID_VALUE:
      return kInvalidValueErr;
    case OpStatus::WRONG_TYPE:
      return kWrongTypeErr;
    case OpStatus::INVALID_INT:
      return kInvalidIntErr;
    case OpStatus::BUSY_GROUP:
      return kBusyGroupErr;
    case OpStatus::STREAM_ID_SMALL:
      return kStreamIdSmallErr;
    case OpStatus::TIMED_OUT:
      return kTimedOutErr;
    case OpStatus::CANCELLED:
      return kOperationCancelledErr;
  }

  LOG(DFATAL) << "Unsupported status " << int(status);
  return "Internal error";
}

std::string_view StatusToErrorType(OpStatus status) {
  switch (status) {
    case OpStatus::WRONG_TYPE:
      return kWrongTypeErrType;
    case OpStatus::INVALID_VALUE:
    case OpStatus::INVALID_INT:
    case OpStatus::STREAM_ID_SMALL:
      return kSyntaxErrType;
    default:
      return {};
  }
}

const char* StatusName(OpStatus status) {
  switch (status) {
    case OpStatus::OK:
      return "OK";
    case OpStatus::KEY_EXISTS:
      return "KEY_EXISTS";
    case OpStatus::KEY_NOTFOUND:
      return "KEY_NOTFOUND";
    case OpStatus::SKIPPED:
      return "SKIPPED";
    case OpStatus::INVALID_VALUE:
      return "INVALID_VALUE";
    case OpStatus::WRONG_TYPE:
      return "WRONG_TYPE";
    case OpStatus::INVALID_INT:
      return "INVALID_INT";
    case OpStatus::BUSY_GROUP:
      return "BUSY_GROUP";
    case OpStatus::STREAM_ID_SMALL:
      return "STREAM_ID_SMALL";
    case OpStatus::TIMED_OUT:
      return "TIMED_OUT";
    case OpStatus::CANCELLED:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

}  // namespace facade
