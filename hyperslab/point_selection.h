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

#ifndef HYPERSLAB_POINT_SELECTION_H_
#define HYPERSLAB_POINT_SELECTION_H_

#include <memory>

#include "absl/status/status.h"
#include "hyperslab/broadcast.h"
#include "hyperslab/dataspace.h"
#include "hyperslab/index.h"
#include "hyperslab/index_expression.h"
#include "hyperslab/internal/selection_state.h"
#include "hyperslab/util/result.h"
#include "hyperslab/util/span.h"

namespace hyperslab {

/// Ordered list of individual points.
///
/// Points are specified either by a boolean mask of the same shape as the
/// extent, or as flattened coordinate lists: ``{x0, y0, x1, y1, ...}`` for a
/// rank-2 extent.  The selected region is always treated as 1-D, with
/// `mshape() == {nselect()}`.
class PointSelection {
 public:
  PointSelection() = default;

  /// Returns a selection that takes ownership of `dataspace`, leaving its
  /// current selection in place.
  static Result<PointSelection> Make(std::unique_ptr<Dataspace> dataspace);

  const Shape& shape() const { return state_.shape(); }
  Index nselect() const { return state_.nselect(); }
  const Dataspace& dataspace() const { return state_.dataspace(); }
  Shape mshape() const { return {nselect()}; }
  Shape array_shape() const { return mshape(); }

  /// Selects the points where a mask of the same shape as the extent is
  /// `true`, in row-major order.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` (`InvalidIndexType`) if
  ///     `args` is not a single boolean mask.
  /// \error `absl::StatusCode::kInvalidArgument` (`ShapeMismatch`) if the
  ///     shape of the mask differs from `shape()`.
  absl::Status Apply(span<const IndexExpression> args);

  /// Replaces the selection with `coordinates`.
  absl::Status Set(span<const Index> coordinates);

  /// Adds `coordinates` after the points already selected.
  ///
  /// If the committed selection is not a point selection, it is replaced
  /// instead.
  absl::Status Append(span<const Index> coordinates);

  /// Adds `coordinates` before the points already selected.
  ///
  /// If the committed selection is not a point selection, it is replaced
  /// instead.
  absl::Status Prepend(span<const Index> coordinates);

  /// Returns `source_shape` if it has `nselect()` elements.
  Result<Shape> ExpandShape(span<const Index> source_shape) const;

  /// Returns a sequence yielding the selection once if `source_shape` has
  /// `nselect()` elements.
  Result<BroadcastSequence> Broadcast(span<const Index> source_shape) const;

 private:
  absl::Status SelectPoints(span<const Index> coordinates, PointsOp op);

  internal_selection::SelectionState state_;
};

}  // namespace hyperslab

#endif  // HYPERSLAB_POINT_SELECTION_H_
