// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "core/stream_id.h"

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

namespace doppel {

using namespace std;

namespace {

constexpr size_t kMaxIdLen = 127;

}  // namespace

bool StreamID::Incr() {
  if (seq == UINT64_MAX) {
    if (ms == UINT64_MAX)
      return false;
    ms++;
    seq = 0;
  } else {
    seq++;
  }
  return true;
}

bool StreamID::Decr() {
  if (seq == 0) {
    if (ms == 0)
      return false;
    ms--;
    seq = UINT64_MAX;
  } else {
    seq--;
  }
  return true;
}

string StreamID::ToString() const {
  return absl::StrCat(ms, "-", seq);
}

int CompareStreamID(const StreamID& a, const StreamID& b) {
  if (a.ms != b.ms)
    return a.ms < b.ms ? -1 : 1;
  if (a.seq != b.seq)
    return a.seq < b.seq ? -1 : 1;
  return 0;
}

bool ParseStreamID(string_view strid, bool strict, uint64_t missing_seq, ParsedStreamID* dest) {
  if (strid.empty() || strid.size() > kMaxIdLen)
    return false;

  if (strid == "*") {
    dest->val = StreamID{};
    dest->id_given = false;
    dest->has_seq = false;
    return true;
  }

  dest->id_given = true;
  dest->has_seq = true;

  if (strid == "-" || strid == "+") {
    if (strict)
      return false;

    dest->val = strid == "-" ? StreamID::Min() : StreamID::Max();
    return true;
  }

  StreamID result{0, missing_seq};

  size_t dash_pos = strid.find('-');
  if (!absl::SimpleAtoi(strid.substr(0, dash_pos), &result.ms))
    return false;

  if (dash_pos != string_view::npos) {
    if (dash_pos + 1 == strid.size())
      return false;

    if (dash_pos + 2 == strid.size() && strid[dash_pos + 1] == '*') {
      result.seq = 0;
      dest->has_seq = false;
    } else if (!absl::SimpleAtoi(strid.substr(dash_pos + 1), &result.seq)) {
      return false;
    }
  }

  dest->val = result;
  return true;
}

bool ParseConcreteID(string_view str, StreamID* dest) {
  ParsedStreamID parsed;
  if (!ParseStreamID(str, true, 0, &parsed) || !parsed.id_given || !parsed.has_seq)
    return false;

  *dest = parsed.val;
  return true;
}

bool ParseRangeBound(string_view str, bool is_start, bool is_rev, StreamID* dest) {
  // The bound whose missing sequence is completed with the maximum is the upper one.
  bool is_upper = is_start == is_rev;

  ParsedStreamID parsed;
  if (!ParseStreamID(str, false, is_upper ? UINT64_MAX : 0, &parsed) || !parsed.id_given ||
      !parsed.has_seq)
    return false;

  *dest = parsed.val;
  return true;
}

ostream& operator<<(ostream& os, const StreamID& id) {
  return os << id.ms << "-" << id.seq;
}

}  // namespace doppel
