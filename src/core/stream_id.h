// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace doppel {

// Identifier of a stream entry, textually "<ms>-<seq>".
// IDs are ordered by milliseconds and then by sequence number.
struct StreamID {
  uint64_t ms = 0;
  uint64_t seq = 0;

  static constexpr StreamID Min() {
    return StreamID{0, 0};
  }

  static constexpr StreamID Max() {
    return StreamID{UINT64_MAX, UINT64_MAX};
  }

  // Advances to the smallest ID that is greater than this one.
  // Returns false if this is already the maximal ID.
  bool Incr();

  // Moves to the greatest ID that is smaller than this one.
  // Returns false if this is already the minimal ID.
  bool Decr();

  std::string ToString() const;
};

// Three way comparison, returns -1, 0 or 1.
int CompareStreamID(const StreamID& a, const StreamID& b);

inline bool operator==(const StreamID& a, const StreamID& b) {
  return a.ms == b.ms && a.seq == b.seq;
}

inline bool operator!=(const StreamID& a, const StreamID& b) {
  return !(a == b);
}

inline bool operator<(const StreamID& a, const StreamID& b) {
  return CompareStreamID(a, b) < 0;
}

inline bool operator>(const StreamID& a, const StreamID& b) {
  return b < a;
}

inline bool operator<=(const StreamID& a, const StreamID& b) {
  return !(b < a);
}

inline bool operator>=(const StreamID& a, const StreamID& b) {
  return !(a < b);
}

struct ParsedStreamID {
  StreamID val;

  // Was an ID different than "*" specified?
  bool id_given = false;

  // Was an ID different than "<ms>-*" specified?
  bool has_seq = false;
};

// Parses "<ms>-<seq>" and "<ms>". A missing sequence is set to `missing_seq`.
// "*" and "<ms>-*" are accepted with id_given/has_seq unset, only XADD may use them.
// Unless `strict` is set, "-" and "+" are accepted as the minimal and maximal IDs.
bool ParseStreamID(std::string_view str, bool strict, uint64_t missing_seq, ParsedStreamID* dest);

// Parses a concrete ID: wildcards and the "-"/"+" tokens are rejected.
bool ParseConcreteID(std::string_view str, StreamID* dest);

// Resolves an endpoint of a range query. A bare "<ms>" is completed with the maximal sequence
// when it is the upper end of the scan and with 0 when it is the lower end. For a reverse scan
// the start argument is the upper end.
bool ParseRangeBound(std::string_view str, bool is_start, bool is_rev, StreamID* dest);

std::ostream& operator<<(std::ostream& os, const StreamID& id);

}  // namespace doppel
