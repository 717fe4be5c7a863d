// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>
#include <utility>

namespace facade {

// Outcome of an operation on the data layer. Handlers translate it to a reply.
enum class OpStatus : uint16_t {
  OK,
  KEY_EXISTS,
  KEY_NOTFOUND,
  SKIPPED,  // the key exists but the addressed sub-object (e.g. a consumer group) does not.
  INVALID_VALUE,
  WRONG_TYPE,
  INVALID_INT,
  BUSY_GROUP,
  STREAM_ID_SMALL,  // a new stream ID is not greater than the stream's last ID.
  TIMED_OUT,
  CANCELLED,  // a blocked command was interrupted by its connection.
};

// Either a value or the status explaining why there is none. The value is default constructed
// when the status is not OK.
template <typename V> class OpResult {
 public:
  OpResult(OpStatus st = OpStatus::OK) : st_(st) {
  }

  OpResult(V&& v) : v_(std::move(v)) {
  }

  OpResult(const V& v) : v_(v) {
  }

  OpStatus status() const {
    return st_;
  }

  bool ok() const {
    return st_ == OpStatus::OK;
  }

  explicit operator bool() const {
    return ok();
  }

  bool operator==(OpStatus st) const {
    return st_ == st;
  }

  const V& value() const {
    return v_;
  }

  V value_or(V v) const {
    return ok() ? v_ : v;
  }

  V* operator->() {
    return &v_;
  }

  const V* operator->() const {
    return &v_;
  }

  V& operator*() & {
    return v_;
  }

  const V& operator*() const& {
    return v_;
  }

  V&& operator*() && {
    return std::move(v_);
  }

 private:
  OpStatus st_ = OpStatus::OK;
  V v_{};
};

// Error message of the status, as sent to clients.
std::string_view StatusToMsg(OpStatus status);

// Error kind of the status for error accounting, empty if it has none.
std::string_view StatusToErrorType(OpStatus status);

const char* StatusName(OpStatus status);

}  // namespace facade

namespace std {

template <typename T> std::ostream& operator<<(std::ostream& os, const facade::OpResult<T>& res) {
  os << res.status();
  return os;
}

inline std::ostream& operator<<(std::ostream& os, const facade::OpStatus op) {
  os << facade::StatusName(op);
  return os;
}

}  // namespace std
