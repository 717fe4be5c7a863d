// Copyright 2023, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "facade/resp_expr.h"

#include <glog/logging.h>

namespace facade {

const char* RespExpr::TypeName(Type t) {
  switch (t) {
    case STRING:
      return "string";
    case ARRAY:
      return "array";
    case INT64:
      return "int";
    case NIL:
      return "nil";
    case NIL_ARRAY:
      return "nil-array";
    case ERROR:
      return "error";
  }
  return "unknown";
}

bool RespExpr::VecToArgList(const Vec& src, CmdArgVec* dest) {
  dest->clear();
  dest->reserve(src.size());
  for (const RespExpr& expr : src) {
    if (expr.type != RespExpr::STRING) {
      VLOG(1) << "Unexpected argument of type " << TypeName(expr.type);
      return false;
    }
    dest->push_back(expr.GetView());
  }
  return true;
}

}  // namespace facade

namespace std {

ostream& operator<<(ostream& os, const facade::RespExpr& e) {
  using facade::RespExpr;

  switch (e.type) {
    case RespExpr::STRING:
      return os << "'" << e.GetView() << "'";
    case RespExpr::ERROR:
      return os << "e(" << e.GetView() << ")";
    case RespExpr::INT64:
      return os << "i" << *e.GetInt();
    case RespExpr::ARRAY:
      return os << facade::RespSpan{e.GetVec()};
    case RespExpr::NIL:
      return os << "nil";
    case RespExpr::NIL_ARRAY:
      return os << "[]";
  }
  return os;
}

ostream& operator<<(ostream& os, facade::RespSpan span) {
  os << "[";
  for (size_t i = 0; i < span.size(); ++i) {
    if (i > 0)
      os << ",";
    os << span[i];
  }
  return os << "]";
}

}  // namespace std
