// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <string>
#include <string_view>

#include "facade/facade_types.h"

namespace facade {

std::string WrongNumArgsError(std::string_view cmd);
std::string UnknownCmd(std::string_view cmd, CmdArgList args);
std::string UnsupportedSubCmd(std::string_view cmd, std::string_view args);

inline constexpr char kSyntaxErr[] = "syntax error";
inline constexpr char kWrongTypeErr[] =
    "-WRONGTYPE Operation against a key holding the wrong kind of value";
inline constexpr char kKeyNotFoundErr[] = "no such key";
inline constexpr char kKeyExistsErr[] = "key already exists";
inline constexpr char kInvalidIntErr[] = "value is not an integer or out of range";
inline constexpr char kInvalidValueErr[] = "invalid value";
inline constexpr char kSkippedErr[] = "skipped";
inline constexpr char kTimedOutErr[] = "-TIMEDOUT operation timed out";
inline constexpr char kOperationCancelledErr[] = "-CANCELLED operation was cancelled";
inline constexpr char kDbIndOutOfRangeErr[] = "DB index is out of range";
inline constexpr char kInvalidDbIndErr[] = "invalid DB index";
inline constexpr char kTimeoutNegative[] = "timeout is negative";

// Stream errors.
inline constexpr char kBusyGroupErr[] = "-BUSYGROUP Consumer Group name already exists";
inline constexpr char kInvalidStreamId[] =
    "Invalid stream ID specified as stream command argument";
inline constexpr char kStreamIdSmallErr[] =
    "The ID specified in XADD is equal or smaller than the target stream top item";
inline constexpr char kStreamIdZeroErr[] = "The ID specified in XADD must be greater than 0-0";
inline constexpr char kMaxLenNegative[] = "The MAXLEN argument must be >= 0.";
inline constexpr char kXAddWrongArgs[] = "wrong number of arguments for XADD";
inline constexpr char kXGroupKeyNotFound[] =
    "The XGROUP subcommand requires the key to exist. Note that for CREATE you may want to use "
    "the MKSTREAM option to create an empty stream automatically.";
inline constexpr char kXReadUnbalanced[] =
    "Unbalanced XREAD list of streams: for each stream key an ID or '$' must be specified.";
inline constexpr char kXInfoSyntaxErr[] = "syntax error, try 'XINFO HELP'";

inline constexpr char kSyntaxErrType[] = "syntax_error";
inline constexpr char kWrongTypeErrType[] = "wrong_type";

}  // namespace facade
