// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include "core/stream.h"

namespace doppel {

using CompactObjType = unsigned;

constexpr CompactObjType OBJ_STRING = 0;
constexpr CompactObjType OBJ_STREAM = 6;

// Value stored under a key. Holds either a plain string or an owned stream.
class CompactObj {
 public:
  CompactObj() = default;

  explicit CompactObj(std::string_view str) : u_(std::string(str)) {
  }

  explicit CompactObj(std::unique_ptr<Stream> stream) : u_(std::move(stream)) {
  }

  CompactObj(CompactObj&&) = default;
  CompactObj& operator=(CompactObj&&) = default;

  CompactObjType ObjType() const {
    return std::holds_alternative<std::string>(u_) ? OBJ_STRING : OBJ_STREAM;
  }

  // Requires ObjType() == OBJ_STRING.
  std::string_view GetString() const;

  // Requires ObjType() == OBJ_STREAM.
  Stream* GetStream() const;

 private:
  std::variant<std::string, std::unique_ptr<Stream>> u_;
};

std::string_view ObjTypeToString(CompactObjType type);

}  // namespace doppel
