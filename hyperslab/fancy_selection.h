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

#ifndef HYPERSLAB_FANCY_SELECTION_H_
#define HYPERSLAB_FANCY_SELECTION_H_

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

/// Union of hyperslabs built from one sequence axis.
///
/// Exactly one axis is indexed by a sequence: an `IndexList` or a 1-D
/// `BooleanMask` (standing for the positions where it is `true`).  The other
/// axes are indexed by integers, slices or strided blocks.  The selection is
/// the union of one hyperslab per sequence value.
///
/// For example, ``({1, 3, 5}, :)`` on a ``(10, 10)`` extent selects rows 1, 3
/// and 5, with `array_shape() == {3, 10}`.
///
/// Broadcasting is not supported: a source array must have exactly
/// `array_shape()`.
class FancySelection {
 public:
  FancySelection() = default;

  /// Returns a selection that takes ownership of `dataspace` and selects its
  /// whole extent.
  static Result<FancySelection> Make(std::unique_ptr<Dataspace> dataspace);

  const Shape& shape() const { return state_.shape(); }
  Index nselect() const { return state_.nselect(); }
  const Dataspace& dataspace() const { return state_.dataspace(); }

  /// Returns the selected shape.  The sequence axis has the length of the
  /// sequence and integer-indexed axes have length 1.
  const Shape& mshape() const { return mshape_; }

  /// Returns `mshape()` without the integer-indexed axes.  The sequence axis
  /// is always retained.
  const Shape& array_shape() const { return array_shape_; }

  /// Replaces the selection with the union described by `args`.
  ///
  /// An empty sequence selects nothing, with the sequence axis of length 0.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` (`InvalidIndexType`) if an
  ///     argument cannot be used for this selection, or a boolean mask is not
  ///     1-D.
  /// \error `absl::StatusCode::kInvalidArgument`
  ///     (`UnsupportedFancyCombination`) unless exactly one axis is indexed by
  ///     a sequence.
  /// \error `absl::StatusCode::kInvalidArgument` (`NonMonotonicIndexSequence`)
  ///     if the sequence is not strictly increasing.
  absl::Status Apply(span<const IndexExpression> args);

  /// Returns `source_shape` if it equals `array_shape()`.
  Result<Shape> ExpandShape(span<const Index> source_shape) const;

  /// Returns a sequence yielding the selection once if `source_shape` equals
  /// `array_shape()`.
  Result<BroadcastSequence> Broadcast(span<const Index> source_shape) const;

 private:
  internal_selection::SelectionState state_;
  Shape mshape_;
  Shape array_shape_;
};

}  // namespace hyperslab

#endif  // HYPERSLAB_FANCY_SELECTION_H_
