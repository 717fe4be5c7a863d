// Copyright 2023, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/strings/numbers.h>

#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

#include "facade/facade_types.h"

namespace facade {

// Cursor over the option tail of a command, e.g. "[IDLE ms] start end count [consumer]".
// The first failure is latched and moves the cursor to the end, so callers may chain calls
// and inspect Error() once. An error must be consumed with Error() before destruction.
class CmdArgParser {
 public:
  enum ErrorType { OUT_OF_BOUNDS, INVALID_INT, UNPROCESSED };

  struct ErrorInfo {
    ErrorType type;
    size_t index;

    // INVALID_INT maps to the integer error, everything else to a syntax error.
    ErrorReply MakeReply() const;
  };

  explicit CmdArgParser(CmdArgList args) : args_{args} {
  }

  ~CmdArgParser();

  // Returns the next value without consuming it, empty at the end.
  std::string_view Peek() const {
    return cur_i_ < args_.size() ? args_[cur_i_] : std::string_view{};
  }

  // Consumes the next value, converted to T.
  template <class T = std::string_view> T Next() {
    if (cur_i_ >= args_.size()) {
      Report(OUT_OF_BOUNDS, cur_i_);
      return T{};
    }
    return Convert<T>(cur_i_++);
  }

  template <class T = std::string_view> T NextOrDefault(T default_value = {}) {
    return HasNext() ? Next<T>() : default_value;
  }

  // If the next value equals `tag` ignoring case and is followed by enough values for `args`,
  // consumes the tag and its values. Otherwise consumes nothing and returns false.
  template <class... Args> bool Check(std::string_view tag, Args*... args) {
    if (!NextIsTag(tag, sizeof...(Args)))
      return false;

    ++cur_i_;
    ((*args = Convert<Args>(cur_i_++)), ...);
    return true;
  }

  // Fails with UNPROCESSED if values are left.
  bool Finalize();

  CmdArgList Tail() const {
    return args_.subspan(cur_i_);
  }

  // True if values are left and no error occurred.
  bool HasNext() const {
    return cur_i_ < args_.size() && !error_;
  }

  bool HasAtLeast(size_t n) const {
    return cur_i_ + n <= args_.size() && !error_;
  }

  bool HasError() const {
    return error_.has_value();
  }

  // Returns and clears the latched error.
  std::optional<ErrorInfo> Error() {
    return std::exchange(error_, {});
  }

 private:
  bool NextIsTag(std::string_view tag, size_t num_values) const;

  template <class T> T Convert(size_t idx) {
    static_assert(std::is_integral_v<T> || std::is_constructible_v<T, std::string_view>,
                  "incorrect type");
    std::string_view arg = args_[idx];
    if constexpr (std::is_integral_v<T>) {
      T out;
      if (absl::SimpleAtoi(arg, &out))
        return out;
      Report(INVALID_INT, idx);
      return T{};
    } else {
      return T(arg);
    }
  }

  void Report(ErrorType type, size_t idx);

  size_t cur_i_ = 0;
  CmdArgList args_;

  std::optional<ErrorInfo> error_;
};

}  // namespace facade
