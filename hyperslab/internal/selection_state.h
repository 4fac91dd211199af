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

#ifndef HYPERSLAB_INTERNAL_SELECTION_STATE_H_
#define HYPERSLAB_INTERNAL_SELECTION_STATE_H_

#include <memory>

#include "absl/status/status.h"
#include "hyperslab/broadcast.h"
#include "hyperslab/dataspace.h"
#include "hyperslab/index.h"
#include "hyperslab/util/result.h"
#include "hyperslab/util/span.h"

namespace hyperslab {
namespace internal_selection {

/// Dataspace owned by a selection, together with its extent and the cached
/// number of selected elements.
class SelectionState {
 public:
  SelectionState() = default;

  /// Takes ownership of `dataspace`, which must be non-null.
  static Result<SelectionState> Make(std::unique_ptr<Dataspace> dataspace);

  const Shape& shape() const { return shape_; }
  Index nselect() const { return nselect_; }
  Dataspace& dataspace() { return *dataspace_; }
  const Dataspace& dataspace() const { return *dataspace_; }

  /// Re-reads the number of selected elements after the selection changed.
  absl::Status UpdateNumSelected();

  /// Returns `source_shape` if it has exactly `nselect()` elements.
  ///
  /// Used by selections that do not support broadcasting.
  Result<Shape> ExpandShapeExact(span<const Index> source_shape,
                                 const char* selection_description) const;

  /// Returns a sequence that yields the committed selection once, provided
  /// `source_shape` has exactly `nselect()` elements.
  Result<BroadcastSequence> BroadcastExact(
      span<const Index> source_shape, const char* selection_description) const;

 private:
  std::unique_ptr<Dataspace> dataspace_;
  Shape shape_;
  Index nselect_ = 0;
};

}  // namespace internal_selection
}  // namespace hyperslab

#endif  // HYPERSLAB_INTERNAL_SELECTION_STATE_H_
