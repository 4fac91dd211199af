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

#include "hyperslab/simple_selection.h"

#include <memory>
#include <utility>
#include <variant>

#include "hyperslab/error.h"
#include "hyperslab/util/status.h"
#include "hyperslab/util/str_cat.h"

namespace hyperslab {

Result<SimpleSelection> SimpleSelection::Make(
    std::unique_ptr<Dataspace> dataspace) {
  SimpleSelection selection;
  HYPERSLAB_ASSIGN_OR_RETURN(
      selection.state_,
      internal_selection::SelectionState::Make(std::move(dataspace)));
  for (Index extent : selection.shape()) {
    AxisHyperslab axis;
    axis.count = extent;
    selection.descriptor_.push_back(axis);
  }
  return selection;
}

absl::Status SimpleSelection::Apply(span<const IndexExpression> args) {
  auto& dataspace = state_.dataspace();
  if (shape().empty()) {
    if (args.size() > 1 ||
        (args.size() == 1 && !std::holds_alternative<Ellipsis>(args[0]))) {
      return SelectionError(
          SelectionErrorKind::kInvalidIndexType,
          "Invalid index for scalar dataset (only ..., () allowed)");
    }
    HYPERSLAB_RETURN_IF_ERROR(dataspace.SelectAll());
    return state_.UpdateNumSelected();
  }
  HYPERSLAB_ASSIGN_OR_RETURN(descriptor_, TranslateSimple(shape(), args));
  HYPERSLAB_RETURN_IF_ERROR(
      dataspace.SelectHyperslab(HyperslabOp::kSet, descriptor_.start,
                                descriptor_.count, descriptor_.stride,
                                descriptor_.block));
  return state_.UpdateNumSelected();
}

Result<Shape> SimpleSelection::ExpandShape(
    span<const Index> source_shape) const {
  return ExpandShapeForBroadcast(descriptor_, source_shape);
}

Result<BroadcastSequence> SimpleSelection::Broadcast(
    span<const Index> source_shape) const {
  if (shape().empty()) {
    if (ProductOfExtents(source_shape) != 1) {
      return SelectionError(
          SelectionErrorKind::kBroadcastIncompatible,
          StrCat("Can't broadcast ", source_shape, " to scalar"));
    }
    return BroadcastSequence::Single(&dataspace());
  }
  return BroadcastHyperslab(&dataspace(), descriptor_, source_shape);
}

}  // namespace hyperslab
