// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "core/compact_object.h"

#include <glog/logging.h>

#include <utility>

namespace doppel {

using namespace std;

string_view CompactObj::GetString() const {
  DCHECK_EQ(ObjType(), OBJ_STRING);
  return get<string>(u_);
}

Stream* CompactObj::GetStream() const {
  DCHECK_EQ(ObjType(), OBJ_STREAM);
  return get<unique_ptr<Stream>>(u_).get();
}

constexpr pair<CompactObjType, string_view> kObjTypeToString[] = {{OBJ_STRING, "string"sv},
                                                                  {OBJ_STREAM, "stream"sv}};

string_view ObjTypeToString(CompactObjType type) {
  for (auto& p : kObjTypeToString) {
    if (type == p.first) {
      return p.second;
    }
  }

  LOG(DFATAL) << "Unsupported type " << type;
  return "Invalid type"sv;
}

}  // namespace doppel
