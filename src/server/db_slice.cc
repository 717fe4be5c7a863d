// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "server/db_slice.h"

#include <glog/logging.h>

namespace doppel {

using namespace std;
using namespace facade;

DbSlice::DbSlice(uint32_t db_count) {
  CHECK_GT(db_count, 0u);
  db_arr_.resize(db_count);
  for (uint32_t i = 0; i < db_count; ++i) {
    db_arr_[i] = make_unique<DbTable>(DbIndex(i));
  }
}

DbSlice::~DbSlice() {
}

DbTable& DbSlice::GetTable(const Context& cntx) const {
  DCHECK(IsDbValid(cntx.db_index)) << cntx.db_index;
  return *db_arr_[cntx.db_index];
}

const PrimeValue* DbSlice::FindReadOnly(const Context& cntx, string_view key) const {
  const DbTable& db = GetTable(cntx);
  auto it = db.prime.find(key);
  return it == db.prime.end() ? nullptr : &it->second;
}

OpResult<const PrimeValue*> DbSlice::FindReadOnly(const Context& cntx, string_view key,
                                                  unsigned req_obj_type) const {
  const PrimeValue* pv = FindReadOnly(cntx, key);
  if (pv == nullptr)
    return OpStatus::KEY_NOTFOUND;

  if (pv->ObjType() != req_obj_type)
    return OpStatus::WRONG_TYPE;

  return pv;
}

OpResult<PrimeValue*> DbSlice::FindMutable(const Context& cntx, string_view key,
                                           unsigned req_obj_type) {
  DbTable& db = GetTable(cntx);
  auto it = db.prime.find(key);
  if (it == db.prime.end())
    return OpStatus::KEY_NOTFOUND;

  if (it->second.ObjType() != req_obj_type)
    return OpStatus::WRONG_TYPE;

  return &it->second;
}

OpResult<PrimeValue*> DbSlice::AddNew(const Context& cntx, string_view key, PrimeValue obj) {
  DbTable& db = GetTable(cntx);
  auto [it, inserted] = db.prime.try_emplace(string(key), std::move(obj));
  if (!inserted)
    return OpStatus::KEY_EXISTS;

  DVLOG(2) << "Added " << key << " to db " << cntx.db_index;
  return &it->second;
}

bool DbSlice::Del(const Context& cntx, string_view key) {
  DbTable& db = GetTable(cntx);
  auto it = db.prime.find(key);
  if (it == db.prime.end())
    return false;

  db.prime.erase(it);
  Touch(cntx, key);
  return true;
}

void DbSlice::FlushDb(DbIndex db_ind) {
  CHECK(IsDbValid(db_ind));
  db_arr_[db_ind]->Clear();
}

void DbSlice::Touch(const Context& cntx, string_view key) {
  DbTable& db = GetTable(cntx);
  ++db.mutation_seq;
  if (db.prime.contains(key)) {
    db.key_versions[string(key)] = db.mutation_seq;
  } else {
    db.key_versions.erase(key);
  }
  db.blocking_controller.Touch(key);
}

uint64_t DbSlice::GetKeyVersion(const Context& cntx, string_view key) const {
  const DbTable& db = GetTable(cntx);
  auto it = db.key_versions.find(key);
  return it == db.key_versions.end() ? 0 : it->second;
}

size_t DbSlice::DbSize(DbIndex db_ind) const {
  CHECK(IsDbValid(db_ind));
  return db_arr_[db_ind]->prime.size();
}

}  // namespace doppel
