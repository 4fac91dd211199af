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

#ifndef HYPERSLAB_UTIL_SPAN_H_
#define HYPERSLAB_UTIL_SPAN_H_

/// \file
/// Non-owning views of contiguous sequences.

#include <cstdint>

#include "absl/types/span.h"
#include "hyperslab/index.h"

namespace hyperslab {

/// Unowned view of a contiguous array of `T`.
template <typename T>
using span = absl::Span<T>;

/// Returns the product of `extents`, or `1` if `extents` is empty.
inline Index ProductOfExtents(span<const Index> extents) {
  Index result = 1;
  for (Index x : extents) result *= x;
  return result;
}

}  // namespace hyperslab

#endif  // HYPERSLAB_UTIL_SPAN_H_
