// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//
#include "facade/reply_builder.h"

#include <absl/base/macros.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <cstring>

#include "facade/error.h"

using namespace std;

namespace facade {

namespace {

constexpr char kCRLF[] = "\r\n";
constexpr char kSimplePref[] = "+";
constexpr char kLengthPrefix[] = "$";
constexpr char kLongPref[] = ":";
constexpr char kNullString[] = "$-1\r\n";

template <typename T> size_t piece_size(const T& v) {
  if constexpr (is_array_v<T>)
    return ABSL_ARRAYSIZE(v) - 1;  // expect null terminated
  else if constexpr (is_integral_v<T>)
    return absl::numbers_internal::kFastToBufferSize;
  else  // string_view
    return v.size();
}

template <size_t S> char* write_piece(const char (&arr)[S], char* dest) {
  return (char*)memcpy(dest, arr, S - 1) + (S - 1);
}

template <typename T> enable_if_t<is_integral_v<T>, char*> write_piece(T num, char* dest) {
  static_assert(!is_same_v<T, char>, "Use arrays for single chars");
  return absl::numbers_internal::FastIntToBuffer(num, dest);
}

char* write_piece(string_view str, char* dest) {
  return (char*)memcpy(dest, str.data(), str.size()) + str.size();
}

}  // namespace

void SinkReplyBuilder::SendError(ErrorReply error) {
  if (error.status)
    return SendError(*error.status);
  SendError(error.message, error.kind);
}

void SinkReplyBuilder::SendError(OpStatus status) {
  if (status == OpStatus::OK)
    return SendOk();
  SendError(StatusToMsg(status), StatusToErrorType(status));
}

// Reserves the upper bound of all pieces, writes them and shrinks the sink back to the
// actual written size.
template <typename... Ts> void SinkReplyBuilder::WritePieces(Ts&&... pieces) {
  DCHECK(sink_ != nullptr);
  size_t required = (piece_size(pieces) + ...);
  size_t start = sink_->size();
  sink_->resize(start + required);

  char* dest = sink_->data() + start;
  char* ptr = dest;
  ([&]() { ptr = write_piece(pieces, ptr); }(), ...);

  sink_->resize(start + (ptr - dest));
}

void RedisReplyBuilder::SendNull() {
  WritePieces(kNullString);
  replies_recorded_++;
}

void RedisReplyBuilder::SendSimpleString(std::string_view str) {
  WritePieces(kSimplePref, str, kCRLF);
  replies_recorded_++;
}

void RedisReplyBuilder::SendBulkString(std::string_view str) {
  DVLOG(2) << "SendBulk " << str.size();
  WritePieces(kLengthPrefix, uint32_t(str.size()), kCRLF, str, kCRLF);
  replies_recorded_++;
}

void RedisReplyBuilder::SendLong(long val) {
  WritePieces(kLongPref, val, kCRLF);
  replies_recorded_++;
}

void RedisReplyBuilder::SendNullArray() {
  WritePieces("*-1", kCRLF);
  replies_recorded_++;
}

void RedisReplyBuilder::StartCollection(unsigned len, CollectionType ct) {
  // RESP2 supports only arrays, maps are sent as flat key/value arrays.
  if (ct == MAP)
    len *= 2;
  WritePieces("*", len, kCRLF);
}

void RedisReplyBuilder::SendError(std::string_view str, std::string_view type) {
  VLOG(1) << "Error: " << str;
  last_error_ = str;

  if (str.empty() || str[0] != '-')
    WritePieces("-ERR ", str, kCRLF);
  else
    WritePieces(str, kCRLF);
  replies_recorded_++;
}

void RedisReplyBuilder::SendProtocolError(std::string_view str) {
  SendError(absl::StrCat("-ERR Protocol error: ", str), "protocol_error");
}

void RedisReplyBuilder::SendBulkStrArr(absl::Span<const std::string> strs) {
  StartArray(strs.size());
  for (std::string_view str : strs)
    SendBulkString(str);
}

void RedisReplyBuilder::StartArray(unsigned len) {
  StartCollection(len, CollectionType::ARRAY);
}

void RedisReplyBuilder::SendEmptyArray() {
  StartArray(0);
  replies_recorded_++;
}

}  // namespace facade
