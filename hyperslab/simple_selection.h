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

#ifndef HYPERSLAB_SIMPLE_SELECTION_H_
#define HYPERSLAB_SIMPLE_SELECTION_H_

#include <memory>

#include "absl/status/status.h"
#include "hyperslab/broadcast.h"
#include "hyperslab/dataspace.h"
#include "hyperslab/index.h"
#include "hyperslab/index_expression.h"
#include "hyperslab/internal/selection_state.h"
#include "hyperslab/translate.h"
#include "hyperslab/util/result.h"
#include "hyperslab/util/span.h"

namespace hyperslab {

/// Single regular hyperslab built from integers, slices and strided blocks.
///
/// This is the only kind of selection that supports broadcasting a smaller
/// source array across the selected region.
///
/// Initially the whole extent is selected.  Each call to `Apply` replaces the
/// committed selection; after a failed `Apply` the selection must not be used.
class SimpleSelection {
 public:
  SimpleSelection() = default;

  /// Returns a selection that takes ownership of `dataspace` and selects its
  /// whole extent.
  static Result<SimpleSelection> Make(std::unique_ptr<Dataspace> dataspace);

  const Shape& shape() const { return state_.shape(); }
  Index nselect() const { return state_.nselect(); }
  const Dataspace& dataspace() const { return state_.dataspace(); }

  /// Returns the hyperslab parameters of the committed selection.  Empty for
  /// a rank-0 extent.
  const HyperslabDescriptor& descriptor() const { return descriptor_; }

  /// Returns ``count[i] * block[i]`` for each axis.
  Shape mshape() const { return descriptor_.mshape(); }

  /// Returns `mshape()` without the axes indexed by an integer.
  Shape array_shape() const { return descriptor_.array_shape(); }

  /// Replaces the selection with the hyperslab described by `args`.
  ///
  /// For a rank-0 extent, `args` must be empty or consist of a single
  /// ellipsis, and the single element is selected.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` (`InvalidIndexType`) if a
  ///     rank-0 extent is indexed by anything else.
  /// \error Any error returned by `TranslateSimple`.
  absl::Status Apply(span<const IndexExpression> args);

  /// Returns the chunk shape for broadcasting `source_shape`, as computed by
  /// `ExpandShapeForBroadcast`.
  Result<Shape> ExpandShape(span<const Index> source_shape) const;

  /// Returns the chunks covering the selection for a source array of shape
  /// `source_shape`.  The returned sequence borrows this selection.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` (`BroadcastIncompatible`) if
  ///     `source_shape` cannot be broadcast to `array_shape()`.
  Result<BroadcastSequence> Broadcast(span<const Index> source_shape) const;

 private:
  internal_selection::SelectionState state_;
  HyperslabDescriptor descriptor_;
};

}  // namespace hyperslab

#endif  // HYPERSLAB_SIMPLE_SELECTION_H_
