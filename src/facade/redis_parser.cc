// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//
#include "facade/redis_parser.h"

#include <absl/strings/escaping.h>
#include <absl/strings/numbers.h>
#include <glog/logging.h>

#include <cstring>

namespace facade {

using namespace std;
constexpr static long kMaxBulkLen = 256 * (1ul << 20);  // 256MB.

auto RedisParser::Parse(Buffer str, uint32_t* consumed, RespExpr::Vec* res) -> Result {
  DCHECK(!str.empty());
  *consumed = 0;
  res->clear();
  stash_.clear();

  DVLOG(2) << "Parsing: "
           << absl::CHexEscape(string_view{reinterpret_cast<const char*>(str.data()), str.size()});

  ResultConsumed resultc;
  if (server_mode_) {
    resultc = str[0] == '*' ? ParseArray(str, res) : ParseInline(str, res);
  } else {
    res->emplace_back();
    resultc = ParseExpr(str, &res->back());
  }

  if (resultc.first != OK) {
    res->clear();
    stash_.clear();
    return resultc.first;
  }

  *consumed = resultc.second;
  return OK;
}

auto RedisParser::ParseInline(Buffer str, RespVec* res) -> ResultConsumed {
  uint8_t* end = reinterpret_cast<uint8_t*>(memchr(str.data(), '\n', str.size()));
  if (end == nullptr)
    return {INPUT_PENDING, 0};

  uint32_t consumed = end - str.data() + 1;
  uint8_t* line_end = end;
  if (line_end > str.data() && line_end[-1] == '\r')
    --line_end;

  uint8_t* ptr = str.data();
  while (ptr != line_end) {
    if (*ptr == ' ' || *ptr == '\t') {
      ++ptr;
      continue;
    }

    uint8_t* token_start = ptr;
    while (ptr != line_end && *ptr != ' ' && *ptr != '\t')
      ++ptr;

    Buffer token{token_start, size_t(ptr - token_start)};
    res->push_back(RespExpr::Text(RespExpr::STRING, token));
  }

  return {OK, consumed};
}

auto RedisParser::ParseLine(Buffer str, Buffer* line) -> ResultConsumed {
  for (size_t i = 0; i + 1 < str.size(); ++i) {
    if (str[i] == '\r') {
      if (str[i + 1] != '\n')
        return {BAD_STRING, 0};
      *line = str.subspan(0, i);
      return {OK, i + 2};
    }
  }
  return {INPUT_PENDING, 0};
}

auto RedisParser::ParseLen(Buffer str, int64_t* res) -> ResultConsumed {
  Buffer line;
  ResultConsumed resultc = ParseLine(str, &line);
  if (resultc.first != OK)
    return resultc;

  if (!absl::SimpleAtoi(ToSV(line), res))
    return {BAD_INT, 0};

  return resultc;
}

// Parses "*<len>\r\n" followed by len expressions. In server mode every element must be a
// bulk string and the elements are appended to res directly.
auto RedisParser::ParseArray(Buffer str, RespVec* res) -> ResultConsumed {
  DCHECK_EQ(str[0], '*');

  int64_t len;
  ResultConsumed resultc = ParseLen(str.subspan(1), &len);
  if (resultc.first != OK)
    return {resultc.first == BAD_INT ? BAD_ARRAYLEN : resultc.first, 0};

  if (len < -1 || len > max_arr_len_)
    return {BAD_ARRAYLEN, 0};

  uint32_t consumed = resultc.second + 1;
  if (len == -1)  // Only valid as a reply, the caller marks it as NIL_ARRAY.
    return {server_mode_ ? BAD_ARRAYLEN : OK, consumed};

  res->resize(len);
  for (int64_t i = 0; i < len; ++i) {
    Buffer rest = str.subspan(consumed);
    if (rest.empty())
      return {INPUT_PENDING, 0};

    if (server_mode_ && rest[0] != '$')
      return {BAD_BULKLEN, 0};

    resultc = ParseExpr(rest, &(*res)[i]);
    if (resultc.first != OK)
      return {resultc.first, 0};

    if (server_mode_ && (*res)[i].type != RespExpr::STRING)
      return {BAD_BULKLEN, 0};
    consumed += resultc.second;
  }

  return {OK, consumed};
}

auto RedisParser::ParseExpr(Buffer str, RespExpr* res) -> ResultConsumed {
  if (str.empty())
    return {INPUT_PENDING, 0};

  char prefix = str[0];
  if (prefix == '*') {
    stash_.emplace_back(new RespVec);
    RespVec* vec = stash_.back().get();
    ResultConsumed resultc = ParseArray(str, vec);
    if (resultc.first != OK)
      return resultc;

    if (str.size() > 2 && str[1] == '-') {
      *res = RespExpr{RespExpr::NIL_ARRAY};
    } else {
      *res = RespExpr::Array(vec);
    }
    return resultc;
  }

  Buffer line;
  ResultConsumed resultc = ParseLine(str.subspan(1), &line);
  if (resultc.first != OK)
    return resultc;
  uint32_t consumed = resultc.second + 1;

  switch (prefix) {
    case '+':
    case '-':
      *res = RespExpr::Text(prefix == '+' ? RespExpr::STRING : RespExpr::ERROR, line);
      return {OK, consumed};
    case ':': {
      int64_t ival;
      if (!absl::SimpleAtoi(ToSV(line), &ival))
        return {BAD_INT, 0};
      *res = RespExpr::Int(ival);
      return {OK, consumed};
    }
    case '$': {
      int64_t len;
      if (!absl::SimpleAtoi(ToSV(line), &len) || len < -1 || len > kMaxBulkLen)
        return {BAD_BULKLEN, 0};

      if (len == -1) {
        *res = RespExpr{RespExpr::NIL};
        return {OK, consumed};
      }

      if (str.size() < consumed + len + 2)
        return {INPUT_PENDING, 0};

      if (str[consumed + len] != '\r' || str[consumed + len + 1] != '\n')
        return {BAD_STRING, 0};

      *res = RespExpr::Text(RespExpr::STRING, str.subspan(consumed, len));
      return {OK, consumed + uint32_t(len) + 2};
    }
    default:
      VLOG(1) << "Unexpected prefix " << int(prefix);
      return {BAD_STRING, 0};
  }
}

}  // namespace facade
