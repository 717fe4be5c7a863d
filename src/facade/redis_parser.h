// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//
#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "facade/resp_expr.h"

namespace facade {

/**
 * @brief Zero-copy RESP2 parser.
 *
 * Server mode accepts client requests: multi-bulk arrays of bulk strings and inline commands.
 * Client mode accepts any reply and is used by tests to decode what the server sent.
 *
 * The parser is message oriented: a message is either parsed completely or not at all.
 */
class RedisParser {
 public:
  enum Result : uint8_t { OK, INPUT_PENDING, BAD_ARRAYLEN, BAD_BULKLEN, BAD_STRING, BAD_INT };
  using Buffer = RespExpr::Buffer;

  explicit RedisParser(uint32_t max_arr_len = UINT32_MAX, bool server_mode = true)
      : server_mode_(server_mode), max_arr_len_(max_arr_len) {
  }

  /**
   * @brief Parses a single message from the beginning of str into res.
   *
   * "consumed" stores the number of bytes the message occupied in str. In server mode res holds
   * the command arguments, in client mode it holds exactly one expression.
   * res references str and the parser's internal storage, so both must outlive it.
   * If str does not contain a complete message yet, INPUT_PENDING is returned, nothing is
   * consumed and the caller should retry once more data has been appended.
   */
  Result Parse(Buffer str, uint32_t* consumed, RespVec* res);

  void SetClientMode() {
    server_mode_ = false;
  }

  size_t stash_size() const {
    return stash_.size();
  }

 private:
  using ResultConsumed = std::pair<Result, uint32_t>;

  ResultConsumed ParseInline(Buffer str, RespVec* res);
  ResultConsumed ParseExpr(Buffer str, RespExpr* res);
  ResultConsumed ParseArray(Buffer str, RespVec* res);

  // Consumes a line terminated by CRLF and returns it without the terminator.
  ResultConsumed ParseLine(Buffer str, Buffer* line);
  ResultConsumed ParseLen(Buffer str, int64_t* res);

  bool server_mode_ = true;
  uint32_t max_arr_len_;

  // Owns nested arrays referenced by the parsed expressions.
  std::vector<std::unique_ptr<RespVec>> stash_;
};

}  // namespace facade
