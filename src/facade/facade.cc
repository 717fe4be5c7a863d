// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include <absl/strings/ascii.h>
#include <absl/strings/escaping.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "facade/error.h"

namespace facade {

using namespace std;

string WrongNumArgsError(string_view cmd) {
  return absl::StrCat("wrong number of arguments for '", absl::AsciiStrToLower(cmd), "' command");
}

string UnknownCmd(string_view cmd, CmdArgList args) {
  string res = absl::StrCat("unknown command '", cmd, "', with args beginning with: ");
  for (string_view arg : args)
    absl::StrAppend(&res, "'", arg, "' ");
  return res;
}

string UnsupportedSubCmd(string_view cmd, string_view args) {
  return absl::StrCat("'", cmd, " ", args, "' not supported");
}

}  // namespace facade

namespace std {

ostream& operator<<(ostream& os, facade::CmdArgList args) {
  auto escaped = [](string* out, string_view arg) { out->append(absl::CHexEscape(arg)); };
  return os << "[" << absl::StrJoin(args, ",", escaped) << "]";
}

}  // namespace std
