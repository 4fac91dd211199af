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

#ifndef HYPERSLAB_PASS_THROUGH_SELECTION_H_
#define HYPERSLAB_PASS_THROUGH_SELECTION_H_

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

/// Selection adopted as-is from an existing dataspace or a resolved region
/// reference.  The selected region is treated as 1-D.
class PassThroughSelection {
 public:
  PassThroughSelection() = default;

  /// Adopts `dataspace` and its committed selection.
  static Result<PassThroughSelection> Make(
      std::unique_ptr<Dataspace> dataspace);

  const Shape& shape() const { return state_.shape(); }
  Index nselect() const { return state_.nselect(); }
  const Dataspace& dataspace() const { return state_.dataspace(); }
  Shape mshape() const { return {nselect()}; }
  Shape array_shape() const { return mshape(); }

  /// Always fails: an adopted selection cannot be indexed further.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` (`InvalidIndexType`)
  absl::Status Apply(span<const IndexExpression> args);

  Result<Shape> ExpandShape(span<const Index> source_shape) const;
  Result<BroadcastSequence> Broadcast(span<const Index> source_shape) const;

 private:
  internal_selection::SelectionState state_;
};

}  // namespace hyperslab

#endif  // HYPERSLAB_PASS_THROUGH_SELECTION_H_
