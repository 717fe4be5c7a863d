// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//
#pragma once

#include <string>
#include <string_view>

#include "facade/facade_types.h"
#include "facade/op_status.h"

namespace facade {

// Base class for all reply builders. Offers a simple high level interface for sending basic
// response types. Replies are appended to a caller-owned output string.
class SinkReplyBuilder {
 public:
  explicit SinkReplyBuilder(std::string* sink) : sink_(sink) {
  }

  virtual ~SinkReplyBuilder() = default;

  size_t RepliesRecorded() const {
    return replies_recorded_;
  }

 public:  // High level interface
  virtual void SendLong(long val) = 0;
  virtual void SendSimpleString(std::string_view str) = 0;

  void SendOk() {
    SendSimpleString("OK");
  }

  virtual void SendError(std::string_view str, std::string_view type = {}) = 0;
  void SendError(OpStatus status);
  void SendError(ErrorReply error);

  std::string ConsumeLastError() {
    return std::exchange(last_error_, {});
  }

 protected:
  template <typename... Ts> void WritePieces(Ts&&... pieces);

  size_t replies_recorded_ = 0;
  std::string last_error_;

 private:
  std::string* sink_;
};

// Redis reply builder interface for sending RESP2 data.
class RedisReplyBuilder : public SinkReplyBuilder {
 public:
  enum CollectionType { ARRAY, MAP };

  explicit RedisReplyBuilder(std::string* sink) : SinkReplyBuilder(sink) {
  }

  ~RedisReplyBuilder() override = default;

  void SendNull();
  void SendSimpleString(std::string_view str) override;
  void SendBulkString(std::string_view str);
  void SendLong(long val) override;

  void SendNullArray();
  void StartCollection(unsigned len, CollectionType ct);

  using SinkReplyBuilder::SendError;
  void SendError(std::string_view str, std::string_view type = {}) override;
  void SendProtocolError(std::string_view str);

  void SendBulkStrArr(absl::Span<const std::string> strs);
  void StartArray(unsigned len);
  void SendEmptyArray();
};

}  // namespace facade
