// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "server/table.h"

#include <glog/logging.h>

namespace doppel {

void DbTable::Clear() {
  VLOG(1) << "Clearing db " << index << " with " << prime.size() << " keys";

  for (const auto& k_v : prime) {
    blocking_controller.Touch(k_v.first);
  }
  prime.clear();
  key_versions.clear();
  ++mutation_seq;
}

}  // namespace doppel
