// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <string_view>

#include "facade/op_status.h"
#include "server/common.h"
#include "server/table.h"

namespace doppel {

// Typed key space of all logical databases.
// DbSlice does not lock anything: every call that receives a Context requires the caller to hold
// the mutex of the table selected by Context::db_index. Transaction takes care of that.
class DbSlice {
  DbSlice(const DbSlice&) = delete;
  void operator=(const DbSlice&) = delete;

 public:
  using Context = DbContext;

  explicit DbSlice(uint32_t db_count);
  ~DbSlice();

  bool IsDbValid(DbIndex id) const {
    return id < db_arr_.size();
  }

  size_t db_array_size() const {
    return db_arr_.size();
  }

  DbTable* GetDBTable(DbIndex id) {
    return IsDbValid(id) ? db_arr_[id].get() : nullptr;
  }

  // Returns nullptr if the key does not exist.
  const PrimeValue* FindReadOnly(const Context& cntx, std::string_view key) const;

  // Returns KEY_NOTFOUND if the key does not exist or WRONG_TYPE if it holds a value of another
  // type.
  OpResult<const PrimeValue*> FindReadOnly(const Context& cntx, std::string_view key,
                                           unsigned req_obj_type) const;

  // Same as FindReadOnly but allows the value to be mutated. Callers that mutate the value
  // must call Touch() afterwards.
  OpResult<PrimeValue*> FindMutable(const Context& cntx, std::string_view key,
                                    unsigned req_obj_type);

  // Adds a new entry. Returns KEY_EXISTS if the key is already present.
  OpResult<PrimeValue*> AddNew(const Context& cntx, std::string_view key, PrimeValue obj);

  // Returns true if the key existed and was deleted.
  bool Del(const Context& cntx, std::string_view key);

  // Removes all keys of the database.
  void FlushDb(DbIndex db_ind);

  // Marks the key as mutated: bumps its version and wakes the transactions blocked on it.
  void Touch(const Context& cntx, std::string_view key);

  // Version of the last mutation of a live key, zero for a missing or untouched key. A re-created
  // key gets a greater version than it had before the deletion.
  uint64_t GetKeyVersion(const Context& cntx, std::string_view key) const;

  size_t DbSize(DbIndex db_ind) const;

 private:
  DbTable& GetTable(const Context& cntx) const;

  DbTableArray db_arr_;
};

}  // namespace doppel
