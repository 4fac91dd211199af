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

#ifndef HYPERSLAB_INDEX_EXPRESSION_H_
#define HYPERSLAB_INDEX_EXPRESSION_H_

/// \file
/// The closed set of per-axis index arguments accepted by `Select`.
///
/// Arguments are classified once, when an `IndexExpression` is constructed;
/// the selection code dispatches on the variant alternative and never inspects
/// the argument in any other way.

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "hyperslab/dataspace.h"
#include "hyperslab/index.h"
#include "hyperslab/strided_block.h"
#include "hyperslab/util/result.h"
#include "hyperslab/util/span.h"

namespace hyperslab {

/// Half-open range with optional bounds, interpreted like a Python slice:
/// negative bounds count from the end of the axis and out-of-range bounds are
/// clamped.  A missing `step` means `1`.
struct Slice {
  std::optional<Index> start;
  std::optional<Index> stop;
  std::optional<Index> step;

  friend bool operator==(const Slice& a, const Slice& b) {
    return a.start == b.start && a.stop == b.stop && a.step == b.step;
  }
  friend bool operator!=(const Slice& a, const Slice& b) { return !(a == b); }
  friend std::ostream& operator<<(std::ostream& os, const Slice& x);
};

/// Stands for as many full-range slices as needed to fill the rank.
struct Ellipsis {
  friend bool operator==(Ellipsis, Ellipsis) { return true; }
  friend bool operator!=(Ellipsis, Ellipsis) { return false; }
  friend std::ostream& operator<<(std::ostream& os, Ellipsis);
};

/// Strictly increasing list of positions along one axis.
struct IndexList {
  std::vector<Index> values;

  friend bool operator==(const IndexList& a, const IndexList& b) {
    return a.values == b.values;
  }
  friend bool operator!=(const IndexList& a, const IndexList& b) {
    return !(a == b);
  }
  friend std::ostream& operator<<(std::ostream& os, const IndexList& x);
};

/// Row-major boolean array.  A 1-D mask selects positions along one axis; a
/// mask with the shape of the whole extent selects individual points.
class BooleanMask {
 public:
  BooleanMask() = default;

  /// Constructs a 1-D mask.
  explicit BooleanMask(std::vector<bool> values);

  /// Returns a mask of the specified shape.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` (`LengthMismatch`) if
  ///     `values.size()` is not the product of `shape`.
  static Result<BooleanMask> Make(Shape shape, std::vector<bool> values);

  const Shape& shape() const { return shape_; }
  DimensionIndex rank() const { return shape_.size(); }
  const std::vector<bool>& values() const { return values_; }

  /// Returns the positions of the `true` elements of a 1-D mask.
  std::vector<Index> Nonzero() const;

  /// Returns the coordinates of the `true` elements in row-major order,
  /// flattened with `rank()` values per point.
  std::vector<Index> NonzeroCoordinates() const;

  friend bool operator==(const BooleanMask& a, const BooleanMask& b) {
    return a.shape_ == b.shape_ && a.values_ == b.values_;
  }
  friend bool operator!=(const BooleanMask& a, const BooleanMask& b) {
    return !(a == b);
  }
  friend std::ostream& operator<<(std::ostream& os, const BooleanMask& x);

 private:
  Shape shape_;
  std::vector<bool> values_;
};

/// A region that has already been selected, adopted as-is.
struct ExistingSelection {
  std::shared_ptr<const Dataspace> region;

  friend bool operator==(const ExistingSelection& a,
                         const ExistingSelection& b) {
    return a.region == b.region;
  }
  friend bool operator!=(const ExistingSelection& a,
                         const ExistingSelection& b) {
    return !(a == b);
  }
};

/// One index argument.  Integers use the `Index` alternative.
using IndexExpression =
    std::variant<Index, Slice, StridedBlock, Ellipsis, IndexList, BooleanMask,
                 ExistingSelection, RegionReference>;

/// Discriminator for `IndexExpression`, in alternative order.
enum class IndexExpressionKind {
  kInteger,
  kSlice,
  kStridedBlock,
  kEllipsis,
  kIndexList,
  kBooleanMask,
  kExistingSelection,
  kRegionReference,
};

inline IndexExpressionKind GetIndexExpressionKind(const IndexExpression& x) {
  return static_cast<IndexExpressionKind>(x.index());
}

std::ostream& operator<<(std::ostream& os, IndexExpressionKind kind);
std::ostream& operator<<(std::ostream& os, const IndexExpression& x);

/// Returns `true` if `x` is an integer, slice, strided block or ellipsis,
/// which are the arguments a regular hyperslab can be built from.
bool IsSimpleIndexExpression(const IndexExpression& x);

}  // namespace hyperslab

#endif  // HYPERSLAB_INDEX_EXPRESSION_H_
