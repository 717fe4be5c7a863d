// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "server/stream_family.h"

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <glog/logging.h>

#include <chrono>
#include <optional>
#include <variant>

#include "core/consumer_group.h"
#include "core/stream.h"
#include "facade/cmd_arg_parser.h"
#include "facade/error.h"
#include "facade/reply_builder.h"
#include "server/command_registry.h"
#include "server/conn_context.h"
#include "server/db_slice.h"
#include "server/transaction.h"

namespace doppel {

using namespace facade;
using namespace std;

namespace {

struct AddOpts {
  ParsedStreamID parsed_id;
  int64_t max_len = -1;
  bool no_mkstream = false;
};

struct RangeOpts {
  StreamID start;
  StreamID end;
  bool is_rev = false;
  size_t count = 0;  // 0 means no limit
};

struct CreateOpts {
  string_view gname;
  StreamID id;
  bool resolve_last_id = false;
  bool mkstream = false;
};

struct StreamIDsItem {
  string_view key;

  // For XREAD the entries after `id` are returned. For XREADGROUP it is the replay position
  // unless new_only is set.
  StreamID id;

  // XREADGROUP with ">".
  bool new_only = false;

  // XREAD with "$", replaced with the stream's last ID on the first attempt.
  bool resolve_last_id = false;
};

struct ReadOpts {
  bool read_group = false;
  string_view group_name;
  string_view consumer_name;
  bool noack = false;

  size_t count = 0;  // 0 means no limit
  bool block = false;
  int64_t timeout_ms = 0;

  vector<StreamIDsItem> stream_ids;
};

// One slot per requested stream, nullopt for the streams with nothing to report.
using ReadResult = vector<optional<StreamEntries>>;
using ReadOutcome = variant<ReadResult, ErrorReply>;

string NoGroupOrKey(string_view key, string_view cgroup, string_view suffix = "") {
  return absl::StrCat("-NOGROUP No such key '", key, "'", " or consumer group '", cgroup, "'",
                      suffix);
}

OpResult<Stream*> FindStream(const OpArgs& op_args, string_view key) {
  auto res_it = op_args.GetDbSlice().FindMutable(op_args.db_cntx, key, OBJ_STREAM);
  if (!res_it)
    return res_it.status();
  return (*res_it)->GetStream();
}

// Returns SKIPPED if the stream exists but has no such group.
OpResult<ConsumerGroup*> FindGroup(const OpArgs& op_args, string_view key, string_view gname) {
  auto res = FindStream(op_args, key);
  if (!res)
    return res.status();

  ConsumerGroup* cg = (*res)->FindGroup(gname);
  if (!cg)
    return OpStatus::SKIPPED;
  return cg;
}

OpResult<StreamID> OpAdd(const OpArgs& op_args, string_view key, const AddOpts& opts,
                         CmdArgList args) {
  DCHECK(!args.empty() && args.size() % 2 == 0);
  auto& db_slice = op_args.GetDbSlice();

  auto res_it = db_slice.FindMutable(op_args.db_cntx, key, OBJ_STREAM);
  Stream* stream = nullptr;
  unique_ptr<Stream> new_stream;

  if (res_it) {
    stream = (*res_it)->GetStream();
  } else {
    if (res_it.status() != OpStatus::KEY_NOTFOUND || opts.no_mkstream)
      return res_it.status();

    // The key is created only once the append succeeded.
    new_stream = make_unique<Stream>();
    stream = new_stream.get();
  }

  FieldValues values;
  values.reserve(args.size() / 2);
  for (size_t i = 0; i < args.size(); i += 2) {
    values.emplace_back(ArgS(args, i), ArgS(args, i + 1));
  }

  StreamID result_id;
  auto status = stream->Add(opts.parsed_id, std::move(values), op_args.db_cntx.time_now_ms,
                            &result_id);
  switch (status) {
    case Stream::AddStatus::OK:
      break;
    case Stream::AddStatus::ID_ZERO:
      return OpStatus::INVALID_VALUE;
    case Stream::AddStatus::ID_TOO_SMALL:
      return OpStatus::STREAM_ID_SMALL;
  }

  if (opts.max_len >= 0)
    stream->Trim(opts.max_len);

  if (new_stream) {
    auto add_res = db_slice.AddNew(op_args.db_cntx, key, PrimeValue{std::move(new_stream)});
    if (!add_res)
      return add_res.status();
  }

  db_slice.Touch(op_args.db_cntx, key);
  return result_id;
}

OpResult<uint32_t> OpLen(const OpArgs& op_args, string_view key) {
  auto res_it = op_args.GetDbSlice().FindReadOnly(op_args.db_cntx, key, OBJ_STREAM);
  if (!res_it)
    return res_it.status();
  return (*res_it)->GetStream()->length();
}

OpResult<StreamEntries> OpRange(const OpArgs& op_args, string_view key, const RangeOpts& opts) {
  auto res_it = op_args.GetDbSlice().FindReadOnly(op_args.db_cntx, key, OBJ_STREAM);
  if (!res_it)
    return res_it.status();

  return (*res_it)->GetStream()->Range(opts.start, opts.end, opts.count, opts.is_rev);
}

OpStatus OpCreate(const OpArgs& op_args, string_view key, const CreateOpts& opts) {
  auto& db_slice = op_args.GetDbSlice();
  auto res_it = db_slice.FindMutable(op_args.db_cntx, key, OBJ_STREAM);
  Stream* stream = nullptr;

  if (res_it) {
    stream = (*res_it)->GetStream();
  } else {
    if (res_it.status() != OpStatus::KEY_NOTFOUND || !opts.mkstream)
      return res_it.status();

    auto add_res = db_slice.AddNew(op_args.db_cntx, key, PrimeValue{make_unique<Stream>()});
    if (!add_res)
      return add_res.status();
    stream = (*add_res)->GetStream();
  }

  StreamID id = opts.resolve_last_id ? stream->last_id() : opts.id;
  if (!stream->CreateGroup(opts.gname, id))
    return OpStatus::BUSY_GROUP;

  if (opts.mkstream)
    db_slice.Touch(op_args.db_cntx, key);
  return OpStatus::OK;
}

OpResult<uint32_t> OpDel(const OpArgs& op_args, string_view key, absl::Span<const StreamID> ids) {
  auto& db_slice = op_args.GetDbSlice();
  auto res = FindStream(op_args, key);
  if (!res)
    return res.status();

  uint32_t deleted = (*res)->Delete(ids);
  if (deleted)
    db_slice.Touch(op_args.db_cntx, key);
  return deleted;
}

OpResult<uint32_t> OpAck(const OpArgs& op_args, string_view key, string_view gname,
                         absl::Span<const StreamID> ids) {
  auto res = FindGroup(op_args, key, gname);
  if (!res) {
    // Acknowledging in a missing group is a no-op.
    if (res.status() == OpStatus::SKIPPED)
      return 0u;
    return res.status();
  }

  return (*res)->Ack(ids);
}

struct PendingOpts {
  string_view group_name;
  PendingFilter filter;
  bool summary = true;
};

// monostate stands for the null reply of the extended form.
using PendingResult = variant<monostate, PendingSummary, vector<PendingExtended>>;

OpResult<PendingResult> OpPending(const OpArgs& op_args, string_view key,
                                  const PendingOpts& opts) {
  auto res = FindGroup(op_args, key, opts.group_name);
  if (!res)
    return res.status();

  const ConsumerGroup* cg = *res;
  if (opts.summary)
    return PendingResult{cg->Summary()};

  if (cg->pending_size() == 0 || opts.filter.count < 0)
    return PendingResult{monostate{}};

  return PendingResult{cg->Pending(op_args.db_cntx.time_now_ms, opts.filter)};
}

// Reads every stream for XREAD. Missing keys are skipped, `$` IDs are resolved in place.
ReadOutcome OpRead(const OpArgs& op_args, ReadOpts* opts) {
  auto& db_slice = op_args.GetDbSlice();
  ReadResult result(opts->stream_ids.size());

  for (size_t i = 0; i < opts->stream_ids.size(); ++i) {
    StreamIDsItem& item = opts->stream_ids[i];
    auto res_it = db_slice.FindReadOnly(op_args.db_cntx, item.key, OBJ_STREAM);
    if (!res_it) {
      if (res_it.status() == OpStatus::KEY_NOTFOUND) {
        item.resolve_last_id = false;
        continue;
      }
      return ErrorReply{res_it.status()};
    }

    const Stream* stream = (*res_it)->GetStream();
    if (item.resolve_last_id) {
      item.id = stream->last_id();
      item.resolve_last_id = false;
      continue;
    }

    StreamEntries entries = stream->After(item.id, opts->count);
    if (!entries.empty())
      result[i] = std::move(entries);
  }

  return result;
}

// Reads every stream for XREADGROUP. All groups are resolved before any of them is read, so an
// error leaves every group untouched.
ReadOutcome OpReadGroup(const OpArgs& op_args, const ReadOpts& opts) {
  vector<pair<const Stream*, ConsumerGroup*>> sources;
  sources.reserve(opts.stream_ids.size());

  for (const auto& item : opts.stream_ids) {
    auto res = FindStream(op_args, item.key);
    ConsumerGroup* cg = res ? (*res)->FindGroup(opts.group_name) : nullptr;
    if (!cg) {
      if (res.status() == OpStatus::WRONG_TYPE)
        return ErrorReply{OpStatus::WRONG_TYPE};
      return ErrorReply{
          NoGroupOrKey(item.key, opts.group_name, " in XREADGROUP with GROUP option")};
    }
    sources.emplace_back(*res, cg);
  }

  uint64_t now_ms = op_args.db_cntx.time_now_ms;
  ReadResult result(opts.stream_ids.size());

  for (size_t i = 0; i < opts.stream_ids.size(); ++i) {
    const auto& item = opts.stream_ids[i];
    auto [stream, cg] = sources[i];

    if (item.new_only) {
      StreamEntries entries =
          cg->ReadNew(*stream, opts.consumer_name, now_ms, opts.count, opts.noack);
      if (!entries.empty())
        result[i] = std::move(entries);
    } else {
      // History is reported even when empty.
      result[i] = cg->ReadHistory(*stream, opts.consumer_name, item.id, now_ms, opts.count);
    }
  }

  return result;
}

struct StreamReplies {
  explicit StreamReplies(RedisReplyBuilder* rb) : rb{rb} {
  }

  void SendRecord(const StreamEntry& entry) const {
    rb->StartArray(2);
    rb->SendBulkString(entry.id.ToString());
    rb->StartArray(entry.values.size() * 2);
    for (const auto& k_v : entry.values) {
      rb->SendBulkString(k_v.first);
      rb->SendBulkString(k_v.second);
    }
  }

  void SendRecords(absl::Span<const StreamEntry> records) const {
    rb->StartArray(records.size());
    for (const auto& record : records)
      SendRecord(record);
  }

  void SendStreamRecords(string_view key, absl::Span<const StreamEntry> records) const {
    rb->StartArray(2);
    rb->SendBulkString(key);
    SendRecords(records);
  }

  void SendPendingSummary(const PendingSummary& summary) const {
    rb->StartArray(4);
    rb->SendLong(summary.count);
    if (summary.count == 0) {
      rb->SendNull();
      rb->SendNull();
      rb->SendNullArray();
      return;
    }

    rb->SendBulkString(summary.min_id.ToString());
    rb->SendBulkString(summary.max_id.ToString());
    rb->StartArray(summary.consumers.size());
    for (const auto& [name, count] : summary.consumers) {
      rb->StartArray(2);
      rb->SendBulkString(name);
      rb->SendBulkString(absl::StrCat(count));
    }
  }

  void SendPendingDetail(absl::Span<const PendingExtended> rows) const {
    rb->StartArray(rows.size());
    for (const auto& row : rows) {
      rb->StartArray(4);
      rb->SendBulkString(row.id.ToString());
      rb->SendBulkString(row.consumer);
      rb->SendLong(row.idle_ms);
      rb->SendLong(row.delivery_count);
    }
  }

  RedisReplyBuilder* rb;
};

// Parses the IDs of a command that takes a list of concrete IDs. Replies with an error on failure.
optional<vector<StreamID>> ParseIDsOrReply(CmdArgList args, RedisReplyBuilder* rb) {
  vector<StreamID> ids(args.size());
  for (size_t i = 0; i < args.size(); ++i) {
    if (!ParseConcreteID(ArgS(args, i), &ids[i])) {
      rb->SendError(kInvalidStreamId, kSyntaxErrType);
      return nullopt;
    }
  }
  return ids;
}

optional<ReadOpts> ParseReadArgsOrReply(CmdArgList args, bool read_group, RedisReplyBuilder* rb) {
  string_view cmd_name = read_group ? "XREADGROUP" : "XREAD";
  ReadOpts opts;
  opts.read_group = read_group;
  size_t id_indx = 0;

  if (read_group) {
    string arg = absl::AsciiStrToUpper(ArgS(args, id_indx));
    if (arg != "GROUP") {
      rb->SendError(kSyntaxErr, kSyntaxErrType);
      return nullopt;
    }

    opts.group_name = ArgS(args, 1);
    opts.consumer_name = ArgS(args, 2);
    id_indx = 3;
  }

  CmdArgList keys_and_ids;
  bool has_streams = false;

  for (; id_indx < args.size(); ++id_indx) {
    string arg = absl::AsciiStrToUpper(ArgS(args, id_indx));
    bool remaining_args = args.size() - id_indx - 1 > 0;

    if (arg == "COUNT" || arg == "BLOCK") {
      if (!remaining_args) {
        rb->SendError(WrongNumArgsError(cmd_name), kSyntaxErrType);
        return nullopt;
      }

      int64_t val;
      string_view val_str = ArgS(args, ++id_indx);
      if (!absl::SimpleAtoi(val_str, &val)) {
        rb->SendError(kInvalidIntErr);
        return nullopt;
      }

      if (arg == "COUNT") {
        opts.count = val > 0 ? size_t(val) : 0;
      } else {
        if (val < 0) {
          rb->SendError(kTimeoutNegative);
          return nullopt;
        }
        opts.block = true;
        opts.timeout_ms = val;
      }
    } else if (read_group && arg == "NOACK") {
      opts.noack = true;
    } else if (arg == "STREAMS") {
      keys_and_ids = args.subspan(id_indx + 1);
      if (keys_and_ids.size() % 2 != 0) {
        rb->SendError(kXReadUnbalanced);
        return nullopt;
      }
      has_streams = true;
      break;
    } else {
      rb->SendError(absl::StrCat("incorrect argument ", ArgS(args, id_indx)));
      return nullopt;
    }
  }

  if (!has_streams || keys_and_ids.empty()) {
    rb->SendError(WrongNumArgsError(cmd_name), kSyntaxErrType);
    return nullopt;
  }

  size_t streams_count = keys_and_ids.size() / 2;
  for (size_t i = 0; i < streams_count; ++i) {
    StreamIDsItem item;
    item.key = ArgS(keys_and_ids, i);
    string_view idstr = ArgS(keys_and_ids, streams_count + i);

    if (read_group && idstr == ">") {
      item.new_only = true;
    } else if (!read_group && idstr == "$") {
      item.resolve_last_id = true;
    } else if (!ParseConcreteID(idstr, &item.id)) {
      rb->SendError(kInvalidStreamId, kSyntaxErrType);
      return nullopt;
    }

    // Replaying the history never blocks.
    if (read_group && !item.new_only)
      opts.block = false;

    opts.stream_ids.push_back(item);
  }

  return opts;
}

void SendReadResult(const ReadOpts& opts, const ReadResult& result, RedisReplyBuilder* rb) {
  size_t resolved = 0;
  for (const auto& entries : result)
    resolved += entries.has_value();

  if (resolved == 0)
    return rb->SendNullArray();

  StreamReplies replies{rb};
  rb->StartArray(resolved);
  for (size_t i = 0; i < result.size(); ++i) {
    if (result[i])
      replies.SendStreamRecords(opts.stream_ids[i].key, *result[i]);
  }
}

void XReadGeneric(CmdArgList args, bool read_group, const CommandContext& cmd_cntx) {
  auto* rb = cmd_cntx.rb;
  auto opts = ParseReadArgsOrReply(args, read_group, rb);
  if (!opts)
    return;

  auto* tx = cmd_cntx.tx;
  ReadOutcome outcome;

  auto attempt = [&](Transaction* t, DbSlice* slice) {
    if (read_group)
      outcome = OpReadGroup(t->GetOpArgs(slice), *opts);
    else
      outcome = OpRead(t->GetOpArgs(slice), &*opts);
  };

  if (!opts->block) {
    tx->ScheduleSingleHop([&](Transaction* t, DbSlice* slice) {
      attempt(t, slice);
      return OpStatus::OK;
    });
  } else {
    vector<string_view> keys;
    keys.reserve(opts->stream_ids.size());
    for (const auto& item : opts->stream_ids)
      keys.push_back(item.key);

    Transaction::time_point tp = Transaction::time_point::max();
    if (opts->timeout_ms > 0) {
      tp = chrono::steady_clock::now() + chrono::milliseconds(opts->timeout_ms);
    }

    auto pred = [&](Transaction* t, DbSlice* slice) {
      attempt(t, slice);
      if (holds_alternative<ErrorReply>(outcome))
        return true;

      for (const auto& entries : get<ReadResult>(outcome)) {
        if (entries)
          return true;
      }
      return false;
    };

    OpStatus status = tx->WaitOnWatch(tp, keys, std::move(pred));
    if (status == OpStatus::TIMED_OUT) {
      VLOG(1) << tx->DebugId() << " timed out";
      return rb->SendNullArray();
    }

    if (status == OpStatus::CANCELLED) {
      // The connection is gone, nobody is waiting for the reply.
      VLOG(1) << tx->DebugId() << " cancelled";
      return;
    }
  }

  if (auto* err = get_if<ErrorReply>(&outcome))
    return rb->SendError(std::move(*err));

  SendReadResult(*opts, get<ReadResult>(outcome), rb);
}

void XRangeGeneric(CmdArgList args, bool is_rev, const CommandContext& cmd_cntx) {
  auto* rb = cmd_cntx.rb;
  string_view key = ArgS(args, 0);

  if (args.size() == 4 || args.size() > 5) {
    return rb->SendError(kSyntaxErr, kSyntaxErrType);
  }

  RangeOpts range_opts;
  range_opts.is_rev = is_rev;

  if (!ParseRangeBound(ArgS(args, 1), true, is_rev, &range_opts.start) ||
      !ParseRangeBound(ArgS(args, 2), false, is_rev, &range_opts.end)) {
    return rb->SendError(kInvalidStreamId, kSyntaxErrType);
  }

  if (args.size() == 5) {
    if (!absl::EqualsIgnoreCase(ArgS(args, 3), "COUNT")) {
      return rb->SendError(kSyntaxErr, kSyntaxErrType);
    }

    int64_t count;
    if (!absl::SimpleAtoi(ArgS(args, 4), &count)) {
      return rb->SendError(kInvalidIntErr);
    }
    range_opts.count = count > 0 ? size_t(count) : 0;
  }

  auto cb = [&](Transaction* t, DbSlice* slice) {
    return OpRange(t->GetOpArgs(slice), key, range_opts);
  };

  OpResult<StreamEntries> result = cmd_cntx.tx->ScheduleSingleHopT(cb);

  StreamReplies replies{rb};
  if (result) {
    return replies.SendRecords(*result);
  }

  if (result.status() == OpStatus::KEY_NOTFOUND) {
    return rb->SendEmptyArray();
  }
  return rb->SendError(result.status());
}

}  // namespace

void StreamFamily::XAdd(CmdArgList args, const CommandContext& cmd_cntx) {
  auto* rb = cmd_cntx.rb;
  string_view key = ArgS(args, 0);
  AddOpts add_opts;
  size_t id_indx = 1;

  for (; id_indx < args.size(); ++id_indx) {
    string arg = absl::AsciiStrToUpper(ArgS(args, id_indx));
    bool remaining_args = args.size() - id_indx - 1 > 0;

    if (arg == "NOMKSTREAM") {
      add_opts.no_mkstream = true;
    } else if (arg == "MAXLEN" && remaining_args) {
      ++id_indx;
      string_view approx = ArgS(args, id_indx);
      if (approx == "~" || approx == "=") {
        if (++id_indx >= args.size()) {
          return rb->SendError(WrongNumArgsError("XADD"), kSyntaxErrType);
        }
      }

      if (!absl::SimpleAtoi(ArgS(args, id_indx), &add_opts.max_len)) {
        return rb->SendError(kInvalidIntErr);
      }
      if (add_opts.max_len < 0) {
        return rb->SendError(kMaxLenNegative, kSyntaxErrType);
      }
    } else {
      break;
    }
  }

  args.remove_prefix(id_indx);
  if (args.empty()) {
    return rb->SendError(WrongNumArgsError("XADD"), kSyntaxErrType);
  }
  if (args.size() == 1 || args.size() % 2 == 0) {
    return rb->SendError(kXAddWrongArgs, kSyntaxErrType);
  }

  if (!ParseStreamID(ArgS(args, 0), true, 0, &add_opts.parsed_id)) {
    return rb->SendError(kInvalidStreamId, kSyntaxErrType);
  }
  args.remove_prefix(1);

  auto cb = [&](Transaction* t, DbSlice* slice) {
    return OpAdd(t->GetOpArgs(slice), key, add_opts, args);
  };

  OpResult<StreamID> add_result = cmd_cntx.tx->ScheduleSingleHopT(cb);
  if (add_result) {
    return rb->SendBulkString(add_result->ToString());
  }

  if (add_result == OpStatus::KEY_NOTFOUND) {
    return rb->SendNull();
  }

  if (add_result == OpStatus::INVALID_VALUE) {
    return rb->SendError(kStreamIdZeroErr);
  }

  return rb->SendError(add_result.status());
}

void StreamFamily::XDel(CmdArgList args, const CommandContext& cmd_cntx) {
  string_view key = ArgS(args, 0);
  auto ids = ParseIDsOrReply(args.subspan(1), cmd_cntx.rb);
  if (!ids)
    return;

  auto cb = [&](Transaction* t, DbSlice* slice) { return OpDel(t->GetOpArgs(slice), key, *ids); };

  OpResult<uint32_t> result = cmd_cntx.tx->ScheduleSingleHopT(cb);
  if (result || result.status() == OpStatus::KEY_NOTFOUND) {
    return cmd_cntx.rb->SendLong(*result);
  }
  cmd_cntx.rb->SendError(result.status());
}

void StreamFamily::XGroup(CmdArgList args, const CommandContext& cmd_cntx) {
  auto* rb = cmd_cntx.rb;
  string sub_cmd = absl::AsciiStrToUpper(ArgS(args, 0));

  if ((args.size() != 4 && args.size() != 5) || sub_cmd != "CREATE") {
    return rb->SendError(UnsupportedSubCmd("XGROUP", absl::StrJoin(args, " ")));
  }

  string_view key = ArgS(args, 1);
  CreateOpts opts;
  opts.gname = ArgS(args, 2);

  string_view id = ArgS(args, 3);
  if (id == "$") {
    opts.resolve_last_id = true;
  } else if (!ParseConcreteID(id, &opts.id)) {
    return rb->SendError(kInvalidStreamId, kSyntaxErrType);
  }

  if (args.size() == 5) {
    if (!absl::EqualsIgnoreCase(ArgS(args, 4), "MKSTREAM")) {
      return rb->SendError(kSyntaxErr, kSyntaxErrType);
    }
    opts.mkstream = true;
  }

  auto cb = [&](Transaction* t, DbSlice* slice) {
    return OpCreate(t->GetOpArgs(slice), key, opts);
  };

  OpStatus result = cmd_cntx.tx->ScheduleSingleHop(std::move(cb));
  switch (result) {
    case OpStatus::OK:
      return rb->SendOk();
    case OpStatus::KEY_NOTFOUND:
      return rb->SendError(kXGroupKeyNotFound);
    default:
      return rb->SendError(result);
  }
}

void StreamFamily::XInfo(CmdArgList args, const CommandContext& cmd_cntx) {
  auto* rb = cmd_cntx.rb;
  string sub_cmd = absl::AsciiStrToUpper(ArgS(args, 0));

  if (sub_cmd == "CONSUMERS" || sub_cmd == "GROUPS" || sub_cmd == "HELP") {
    return rb->SendError(UnsupportedSubCmd("XINFO", absl::StrJoin(args, " ")));
  }

  if (sub_cmd != "STREAM") {
    return rb->SendError(kXInfoSyntaxErr, kSyntaxErrType);
  }

  if (args.size() < 2) {
    return rb->SendError(WrongNumArgsError("XINFO"), kSyntaxErrType);
  }

  string_view key = ArgS(args, 1);
  auto cb = [&](Transaction* t, DbSlice* slice) { return OpLen(t->GetOpArgs(slice), key); };

  OpResult<uint32_t> result = cmd_cntx.tx->ScheduleSingleHopT(cb);
  if (!result) {
    return rb->SendError(result.status());
  }

  rb->StartCollection(1, RedisReplyBuilder::MAP);
  rb->SendBulkString("length");
  rb->SendLong(*result);
}

void StreamFamily::XLen(CmdArgList args, const CommandContext& cmd_cntx) {
  string_view key = ArgS(args, 0);
  auto cb = [&](Transaction* t, DbSlice* slice) { return OpLen(t->GetOpArgs(slice), key); };

  OpResult<uint32_t> result = cmd_cntx.tx->ScheduleSingleHopT(cb);
  if (result || result.status() == OpStatus::KEY_NOTFOUND) {
    return cmd_cntx.rb->SendLong(*result);
  }

  return cmd_cntx.rb->SendError(result.status());
}

void StreamFamily::XPending(CmdArgList args, const CommandContext& cmd_cntx) {
  auto* rb = cmd_cntx.rb;
  string_view key = ArgS(args, 0);

  PendingOpts opts;
  opts.group_name = ArgS(args, 1);

  CmdArgParser parser{args.subspan(2)};
  bool idle_given = false;
  if (parser.Check("IDLE")) {
    int64_t min_idle = parser.Next<int64_t>();
    if (auto err = parser.Error(); err) {
      return rb->SendError(err->MakeReply());
    }
    opts.filter.min_idle_ms = min_idle > 0 ? min_idle : 0;
    idle_given = true;
  }

  if (parser.HasNext()) {
    if (!parser.HasAtLeast(3)) {
      return rb->SendError(kSyntaxErr, kSyntaxErrType);
    }

    opts.summary = false;
    string_view start = parser.Next();
    string_view end = parser.Next();
    if (!ParseRangeBound(start, true, false, &opts.filter.start) ||
        !ParseRangeBound(end, false, false, &opts.filter.end)) {
      return rb->SendError(kInvalidStreamId, kSyntaxErrType);
    }

    opts.filter.count = parser.Next<int64_t>();
    if (auto err = parser.Error(); err) {
      return rb->SendError(err->MakeReply());
    }

    opts.filter.consumer = parser.NextOrDefault();
    if (!parser.Finalize()) {
      return rb->SendError(parser.Error()->MakeReply());
    }
  } else if (idle_given) {
    // IDLE only filters the extended form.
    return rb->SendError(kSyntaxErr, kSyntaxErrType);
  }

  auto cb = [&](Transaction* t, DbSlice* slice) {
    return OpPending(t->GetOpArgs(slice), key, opts);
  };

  OpResult<PendingResult> result = cmd_cntx.tx->ScheduleSingleHopT(cb);
  if (!result) {
    if (result.status() == OpStatus::WRONG_TYPE)
      return rb->SendError(kWrongTypeErr, kWrongTypeErrType);
    return rb->SendError(NoGroupOrKey(key, opts.group_name));
  }

  StreamReplies replies{rb};
  if (auto* summary = get_if<PendingSummary>(&*result)) {
    return replies.SendPendingSummary(*summary);
  }

  if (holds_alternative<monostate>(*result)) {
    return rb->SendNullArray();
  }
  replies.SendPendingDetail(get<vector<PendingExtended>>(*result));
}

void StreamFamily::XRange(CmdArgList args, const CommandContext& cmd_cntx) {
  XRangeGeneric(args, false, cmd_cntx);
}

void StreamFamily::XRevRange(CmdArgList args, const CommandContext& cmd_cntx) {
  XRangeGeneric(args, true, cmd_cntx);
}

void StreamFamily::XRead(CmdArgList args, const CommandContext& cmd_cntx) {
  XReadGeneric(args, false, cmd_cntx);
}

void StreamFamily::XReadGroup(CmdArgList args, const CommandContext& cmd_cntx) {
  XReadGeneric(args, true, cmd_cntx);
}

void StreamFamily::XAck(CmdArgList args, const CommandContext& cmd_cntx) {
  string_view key = ArgS(args, 0);
  string_view group = ArgS(args, 1);

  auto ids = ParseIDsOrReply(args.subspan(2), cmd_cntx.rb);
  if (!ids)
    return;

  auto cb = [&](Transaction* t, DbSlice* slice) {
    return OpAck(t->GetOpArgs(slice), key, group, *ids);
  };

  OpResult<uint32_t> result = cmd_cntx.tx->ScheduleSingleHopT(cb);
  if (result || result.status() == OpStatus::KEY_NOTFOUND) {
    return cmd_cntx.rb->SendLong(*result);
  }

  cmd_cntx.rb->SendError(result.status());
}

#define HFUNC(x) SetHandler(&StreamFamily::x)

void StreamFamily::Register(CommandRegistry* registry) {
  using CI = CommandId;

  constexpr auto kReadFlags = CO::READONLY | CO::BLOCKING;
  *registry << CI{"XADD", CO::WRITE | CO::DENYOOM | CO::FAST, -5}.HFUNC(XAdd)
            << CI{"XDEL", CO::WRITE | CO::FAST, -3}.HFUNC(XDel)
            << CI{"XGROUP", CO::WRITE | CO::DENYOOM, -2}.HFUNC(XGroup)
            << CI{"XINFO", CO::READONLY, -2}.HFUNC(XInfo)
            << CI{"XLEN", CO::READONLY | CO::FAST, 2}.HFUNC(XLen)
            << CI{"XPENDING", CO::READONLY, -3}.HFUNC(XPending)
            << CI{"XRANGE", CO::READONLY, -4}.HFUNC(XRange)
            << CI{"XREVRANGE", CO::READONLY, -4}.HFUNC(XRevRange)
            << CI{"XREAD", kReadFlags, -4}.HFUNC(XRead)
            << CI{"XREADGROUP", CO::WRITE | CO::BLOCKING, -7}.HFUNC(XReadGroup)
            << CI{"XACK", CO::WRITE | CO::FAST, -4}.HFUNC(XAck);
}

}  // namespace doppel
