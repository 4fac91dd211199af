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

#include "hyperslab/internal/selection_state.h"

#include <memory>
#include <utility>

#include "hyperslab/error.h"
#include "hyperslab/util/status.h"
#include "hyperslab/util/str_cat.h"

namespace hyperslab {
namespace internal_selection {

Result<SelectionState> SelectionState::Make(
    std::unique_ptr<Dataspace> dataspace) {
  SelectionState state;
  state.shape_ = dataspace->shape();
  state.dataspace_ = std::move(dataspace);
  HYPERSLAB_RETURN_IF_ERROR(state.UpdateNumSelected());
  return state;
}

absl::Status SelectionState::UpdateNumSelected() {
  HYPERSLAB_ASSIGN_OR_RETURN(nselect_, dataspace_->GetSelectNpoints());
  return absl::OkStatus();
}

Result<Shape> SelectionState::ExpandShapeExact(
    span<const Index> source_shape, const char* selection_description) const {
  if (ProductOfExtents(source_shape) != nselect_) {
    return SelectionError(
        SelectionErrorKind::kBroadcastIncompatible,
        StrCat("Broadcasting is not supported for ", selection_description,
               ": source shape ", source_shape, " does not have ", nselect_,
               " elements"));
  }
  return Shape(source_shape.begin(), source_shape.end());
}

Result<BroadcastSequence> SelectionState::BroadcastExact(
    span<const Index> source_shape, const char* selection_description) const {
  HYPERSLAB_RETURN_IF_ERROR(
      ExpandShapeExact(source_shape, selection_description).status());
  return BroadcastSequence::Single(dataspace_.get());
}

}  // namespace internal_selection
}  // namespace hyperslab
