// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "server/command_registry.h"

#include <absl/flags/flag.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>
#include <glog/logging.h>

#include "facade/error.h"

using namespace std;

ABSL_FLAG(vector<string>, rename_command, {},
          "Change the name of commands, format is: <cmd1_name>=<cmd1_new_name>, "
          "<cmd2_name>=<cmd2_new_name>. An empty new name disables the command");

namespace doppel {

using namespace facade;

using absl::AsciiStrToUpper;
using absl::GetFlag;
using absl::StrSplit;

CommandId::CommandId(const char* name, uint32_t mask, int8_t arity)
    : name_(name), opt_mask_(mask), arity_(arity) {
}

void CommandId::Invoke(CmdArgList args, const CommandContext& cmd_cntx) const {
  DCHECK(handler_) << name_;
  handler_(args, cmd_cntx);
}

optional<facade::ErrorReply> CommandId::Validate(CmdArgList tail_args) const {
  if ((arity() > 0 && tail_args.size() + 1 != size_t(arity())) ||
      (arity() < 0 && tail_args.size() + 1 < size_t(-arity()))) {
    return facade::ErrorReply{facade::WrongNumArgsError(name()), kSyntaxErrType};
  }

  return nullopt;
}

CommandRegistry::CommandRegistry() : renames_(ParseRenames(GetFlag(FLAGS_rename_command))) {
}

auto CommandRegistry::ParseRenames(const vector<string>& mappings) -> RenameMap {
  RenameMap res;
  for (const string& mapping : mappings) {
    pair<string_view, string_view> kv = StrSplit(mapping, absl::MaxSplits('=', 1));
    if (mapping.find('=') == string::npos) {
      LOG(ERROR) << "Bad rename_command entry '" << mapping << "', expected <name>=<new_name>";
      exit(1);
    }

    string from = AsciiStrToUpper(kv.first);
    string to = AsciiStrToUpper(kv.second);
    if (from == to || !res.emplace(from, std::move(to)).second) {
      LOG(ERROR) << "Command " << from << " is renamed more than once or to itself";
      exit(1);
    }
  }
  return res;
}

CommandRegistry& CommandRegistry::operator<<(CommandId cmd) {
  string name(cmd.name());

  if (auto it = renames_.find(name); it != renames_.end()) {
    if (it->second.empty()) {
      VLOG(1) << "Command " << name << " is disabled";
      return *this;
    }
    name = it->second;
  }

  CHECK(cmd_map_.emplace(name, std::move(cmd)).second) << "Duplicate command " << name;
  return *this;
}

}  // namespace doppel
