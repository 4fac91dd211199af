// Copyright 2024 The Hyperslab Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef HYPERSLAB_INTERNAL_LOG_VERBOSE_FLAG_H_
#define HYPERSLAB_INTERNAL_LOG_VERBOSE_FLAG_H_

/// \file
/// Named, runtime-configurable switches for diagnostic logging.
///
/// Flags are configured from the `HYPERSLAB_VERBOSE_LOGGING` environment
/// variable and the `--hyperslab_verbose_logging` command line flag.  Both
/// accept a comma-separated list of `name` or `name=level` entries; the name
/// `all` sets the level of every flag not otherwise listed.
///
/// Usage:
///
///     ABSL_CONST_INIT internal_log::VerboseFlag select_logging(
///         "hyperslab_select");
///
///     ABSL_LOG_IF(INFO, select_logging) << "Selecting " << ...;

#include <atomic>
#include <limits>
#include <string_view>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"

namespace hyperslab {
namespace internal_log {

/// Replaces (if `overwrite` is `true`) or merges the configured levels with
/// those parsed from `input`, and updates every registered flag.
void UpdateVerboseLogging(std::string_view input, bool overwrite);

class VerboseFlag {
 public:
  constexpr static int kValueUninitialized = std::numeric_limits<int>::max();

  /// `name` must have static storage duration.  A `VerboseFlag` must never be
  /// destroyed.
  explicit constexpr VerboseFlag(const char* name)
      : value_(kValueUninitialized), name_(name), next_(nullptr) {}

  VerboseFlag(const VerboseFlag&) = delete;
  VerboseFlag& operator=(const VerboseFlag&) = delete;

  /// Returns whether logging is enabled at `level`, which must be `>= 0`.
  ABSL_ATTRIBUTE_ALWAYS_INLINE
  bool Level(int level) {
    int v = value_.load(std::memory_order_relaxed);
    if (ABSL_PREDICT_TRUE(level > v)) {
      return false;
    }
    return SlowPath(this, v, level);
  }

  /// Returns whether logging is enabled at level 0.
  ABSL_ATTRIBUTE_ALWAYS_INLINE
  operator bool() { return Level(0); }

 private:
  static bool SlowPath(VerboseFlag* flag, int old_v, int level);
  static int Register(VerboseFlag* flag);

  std::atomic<int> value_;
  const char* const name_;
  VerboseFlag* next_;  // Guarded by the registry mutex.

  friend void UpdateVerboseLogging(std::string_view, bool);
};

}  // namespace internal_log
}  // namespace hyperslab

#endif  // HYPERSLAB_INTERNAL_LOG_VERBOSE_FLAG_H_
