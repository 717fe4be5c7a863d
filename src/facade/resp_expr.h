// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/types/span.h>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "facade/facade_types.h"

namespace facade {

// A parsed RESP2 value. Strings reference the parsed buffer and arrays are owned by the parser,
// so an expression lives only as long as both of them.
class RespExpr {
 public:
  using Buffer = absl::Span<uint8_t>;

  // STRING covers both simple and bulk strings.
  enum Type : uint8_t { STRING, ARRAY, INT64, NIL, NIL_ARRAY, ERROR };

  using Vec = std::vector<RespExpr>;
  Type type;

  std::variant<int64_t, Buffer, Vec*> u;

  RespExpr(Type t = NIL) : type(t), u(Buffer{}) {
  }

  // Text of type STRING or ERROR.
  static RespExpr Text(Type t, Buffer buf) {
    RespExpr res(t);
    res.u = buf;
    return res;
  }

  static RespExpr Int(int64_t val) {
    RespExpr res(INT64);
    res.u = val;
    return res;
  }

  static RespExpr Array(Vec* vec) {
    RespExpr res(ARRAY);
    res.u = vec;
    return res;
  }

  static Buffer buffer(std::string* s) {
    return Buffer{reinterpret_cast<uint8_t*>(s->data()), s->size()};
  }

  bool IsNull() const {
    return type == NIL || type == NIL_ARRAY;
  }

  Buffer GetBuf() const {
    return std::get<Buffer>(u);
  }

  std::string_view GetView() const {
    Buffer buffer = GetBuf();
    return {reinterpret_cast<const char*>(buffer.data()), buffer.size()};
  }

  std::string GetString() const {
    return std::string(GetView());
  }

  const Vec& GetVec() const {
    return *std::get<Vec*>(u);
  }

  std::optional<int64_t> GetInt() const {
    if (const int64_t* val = std::get_if<int64_t>(&u))
      return *val;
    return std::nullopt;
  }

  static const char* TypeName(Type t);

  // Fills dest with views of the expressions, which must all be strings as in a client request.
  // Returns false if one of them is not.
  static bool VecToArgList(const Vec& src, CmdArgVec* dest);
};

using RespVec = RespExpr::Vec;
using RespSpan = absl::Span<const RespExpr>;

inline std::string_view ToSV(RespExpr::Buffer buf) {
  return std::string_view{reinterpret_cast<char*>(buf.data()), buf.size()};
}

}  // namespace facade

namespace std {

ostream& operator<<(ostream& os, const facade::RespExpr& e);
ostream& operator<<(ostream& os, facade::RespSpan rspan);

}  // namespace std
