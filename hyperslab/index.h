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

#ifndef HYPERSLAB_INDEX_H_
#define HYPERSLAB_INDEX_H_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hyperslab {

/// Type for representing a coordinate in, or an extent of, a
/// multi-dimensional dataspace.
using Index = std::int64_t;

/// Type for representing a dimension index or rank.
using DimensionIndex = std::ptrdiff_t;

/// Ordered tuple of non-negative extents.  Its length is the rank.
using Shape = std::vector<Index>;

}  // namespace hyperslab

#endif  // HYPERSLAB_INDEX_H_
