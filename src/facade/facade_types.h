// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/types/span.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "facade/op_status.h"

namespace facade {

// Command arguments, excluding the command name. Views point into the connection's request
// buffer and are valid for the duration of the command.
using CmdArgList = absl::Span<const std::string_view>;
using CmdArgVec = std::vector<std::string_view>;

// A list of keys or other arguments that are not necessarily the whole command tail.
using ArgSlice = absl::Span<const std::string_view>;

inline std::string_view ArgS(ArgSlice args, size_t i) {
  return args[i];
}

// An error to send back to the client. Either carries its own message or defers it
// to the status.
struct ErrorReply {
  explicit ErrorReply(std::string_view msg, std::string_view kind = {})
      : message(msg), kind(kind) {
  }

  ErrorReply(OpStatus status) : status(status) {
  }

  std::string message;

  // Error class for accounting, e.g. "syntax_error". Empty means unclassified.
  std::string_view kind;
  std::optional<OpStatus> status;
};

}  // namespace facade

namespace std {
ostream& operator<<(ostream& os, facade::CmdArgList args);
}  // namespace std
