// Copyright 2023, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "facade/cmd_arg_parser.h"

#include <absl/strings/match.h>
#include <glog/logging.h>

#include "facade/error.h"

namespace facade {

CmdArgParser::~CmdArgParser() {
  DCHECK(!error_.has_value()) << "Parsing error at " << error_->index << " was not checked";
}

bool CmdArgParser::NextIsTag(std::string_view tag, size_t num_values) const {
  if (error_ || cur_i_ + num_values >= args_.size())
    return false;
  return absl::EqualsIgnoreCase(args_[cur_i_], tag);
}

bool CmdArgParser::Finalize() {
  if (HasNext()) {
    Report(UNPROCESSED, cur_i_);
    return false;
  }
  return !HasError();
}

void CmdArgParser::Report(ErrorType type, size_t idx) {
  if (error_)
    return;

  DVLOG(2) << "Argument error " << type << " at " << idx;
  error_ = ErrorInfo{type, idx};
  cur_i_ = args_.size();
}

ErrorReply CmdArgParser::ErrorInfo::MakeReply() const {
  if (type == INVALID_INT)
    return ErrorReply{kInvalidIntErr};
  return ErrorReply{kSyntaxErr, kSyntaxErrType};
}

}  // namespace facade
