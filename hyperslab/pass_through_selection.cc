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

#include "hyperslab/pass_through_selection.h"

#include <memory>
#include <utility>

#include "hyperslab/error.h"
#include "hyperslab/util/status.h"

namespace hyperslab {
namespace {
constexpr char kDescription[] = "adopted selections";
}  // namespace

Result<PassThroughSelection> PassThroughSelection::Make(
    std::unique_ptr<Dataspace> dataspace) {
  PassThroughSelection selection;
  HYPERSLAB_ASSIGN_OR_RETURN(
      selection.state_,
      internal_selection::SelectionState::Make(std::move(dataspace)));
  return selection;
}

absl::Status PassThroughSelection::Apply(span<const IndexExpression> args) {
  return SelectionError(SelectionErrorKind::kInvalidIndexType,
                        "This selection does not support indexing");
}

Result<Shape> PassThroughSelection::ExpandShape(
    span<const Index> source_shape) const {
  return state_.ExpandShapeExact(source_shape, kDescription);
}

Result<BroadcastSequence> PassThroughSelection::Broadcast(
    span<const Index> source_shape) const {
  return state_.BroadcastExact(source_shape, kDescription);
}

}  // namespace hyperslab
