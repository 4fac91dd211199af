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

#ifndef HYPERSLAB_TRANSLATE_H_
#define HYPERSLAB_TRANSLATE_H_

/// \file
/// Conversion of per-axis index expressions to hyperslab parameters.

#include <iosfwd>
#include <vector>

#include "hyperslab/index.h"
#include "hyperslab/index_expression.h"
#include "hyperslab/strided_block.h"
#include "hyperslab/util/result.h"
#include "hyperslab/util/span.h"

namespace hyperslab {

/// Hyperslab parameters for a single axis.
///
/// Selects `count` blocks of `block` elements, spaced `stride` apart and
/// starting at `start`.  `scalar` is `true` if the axis was indexed by an
/// integer and is therefore dropped from the array shape.
///
/// Invariants for a non-empty result on an axis of length ``L``:
/// ``start >= 0``, ``stride >= 1``, ``1 <= block <= stride`` (for strided
/// blocks) and ``start + block + (count - 1) * stride - 1 < L``.
struct AxisHyperslab {
  Index start = 0;
  Index count = 0;
  Index stride = 1;
  Index block = 1;
  bool scalar = false;

  friend bool operator==(const AxisHyperslab& a, const AxisHyperslab& b) {
    return a.start == b.start && a.count == b.count && a.stride == b.stride &&
           a.block == b.block && a.scalar == b.scalar;
  }
  friend bool operator!=(const AxisHyperslab& a, const AxisHyperslab& b) {
    return !(a == b);
  }
  friend std::ostream& operator<<(std::ostream& os, const AxisHyperslab& x);
};

/// Hyperslab parameters for every axis of an extent.
struct HyperslabDescriptor {
  std::vector<Index> start;
  std::vector<Index> count;
  std::vector<Index> stride;
  std::vector<Index> block;
  std::vector<bool> scalar;

  DimensionIndex rank() const { return start.size(); }

  /// Returns ``count[i] * block[i]`` for each axis.
  Shape mshape() const;

  /// Returns `mshape()` with the scalar axes removed.
  Shape array_shape() const;

  /// Appends the parameters of one axis.
  void push_back(const AxisHyperslab& axis);

  friend bool operator==(const HyperslabDescriptor& a,
                         const HyperslabDescriptor& b) {
    return a.start == b.start && a.count == b.count && a.stride == b.stride &&
           a.block == b.block && a.scalar == b.scalar;
  }
  friend bool operator!=(const HyperslabDescriptor& a,
                         const HyperslabDescriptor& b) {
    return !(a == b);
  }
  friend std::ostream& operator<<(std::ostream& os,
                                  const HyperslabDescriptor& x);
};

/// Translates an integer index.
///
/// A negative `index` counts from the end of the axis.
///
/// \returns ``{index, 1, 1, 1, scalar=true}``, with `index` normalized.
/// \error `absl::StatusCode::kOutOfRange` (`IndexOutOfRange`) if `index` is
///     outside ``[-length, length)``.
Result<AxisHyperslab> TranslateInt(Index index, Index length);

/// Translates a slice.
///
/// The bounds are clamped to ``[0, length]`` following the usual slice rules.
/// An empty range yields ``{0, 0, 1, 1}``.
///
/// \error `absl::StatusCode::kInvalidArgument` (`InvalidSliceStep`) if the
///     step is less than `1`.
Result<AxisHyperslab> TranslateSlice(const Slice& slice, Index length);

/// Translates a strided block, computing the number of blocks if it is not
/// specified.
///
/// \error `absl::StatusCode::kInvalidArgument` (`InvalidMultiBlockParameters`)
///     if no full block fits, or if the specified blocks extend past the end
///     of the axis.
Result<AxisHyperslab> TranslateStridedBlock(const StridedBlock& block,
                                            Index length);

/// Translates `args`, after ellipsis expansion, to a hyperslab over `shape`.
///
/// Each argument must be an integer, slice, strided block or ellipsis.
///
/// \error `absl::StatusCode::kInvalidArgument` (`InvalidIndexType`) if an
///     argument is of any other kind.
/// \error Any error returned by `ExpandEllipsis` or the per-axis
///     translations, annotated with the axis.
Result<HyperslabDescriptor> TranslateSimple(span<const Index> shape,
                                            span<const IndexExpression> args);

}  // namespace hyperslab

#endif  // HYPERSLAB_TRANSLATE_H_
