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

#include "hyperslab/point_selection.h"

#include <memory>
#include <utility>
#include <variant>
#include <vector>

#include "hyperslab/error.h"
#include "hyperslab/util/status.h"
#include "hyperslab/util/str_cat.h"

namespace hyperslab {
namespace {

constexpr char kDescription[] = "point-wise selections";

absl::Status ValidateCoordinates(span<const Index> shape,
                                 span<const Index> coordinates) {
  const size_t rank = shape.size();
  if (rank == 0 ? !coordinates.empty() : coordinates.size() % rank != 0) {
    return SelectionError(
        SelectionErrorKind::kLengthMismatch,
        StrCat("Number of coordinates (", coordinates.size(),
               ") is not a multiple of the rank (", rank, ")"));
  }
  for (size_t i = 0; i < coordinates.size(); ++i) {
    const Index extent = shape[i % rank];
    const Index x = coordinates[i];
    if (x < 0 || x >= extent) {
      return SelectionError(
          SelectionErrorKind::kIndexOutOfRange,
          StrCat("Coordinate ", x, " of point ", i / rank,
                 " out of range (0-", extent - 1, ")"));
    }
  }
  return absl::OkStatus();
}

}  // namespace

Result<PointSelection> PointSelection::Make(
    std::unique_ptr<Dataspace> dataspace) {
  PointSelection selection;
  HYPERSLAB_ASSIGN_OR_RETURN(
      selection.state_,
      internal_selection::SelectionState::Make(std::move(dataspace)));
  return selection;
}

absl::Status PointSelection::Apply(span<const IndexExpression> args) {
  const BooleanMask* mask =
      args.size() == 1 ? std::get_if<BooleanMask>(&args[0]) : nullptr;
  if (!mask) {
    return SelectionError(
        SelectionErrorKind::kInvalidIndexType,
        "Point selection can only be indexed by a single boolean mask");
  }
  if (mask->shape() != shape()) {
    return SelectionError(
        SelectionErrorKind::kShapeMismatch,
        StrCat("Boolean indexing array of shape ", mask->shape(),
               " is incompatible with extent ", shape()));
  }
  return Set(mask->NonzeroCoordinates());
}

absl::Status PointSelection::Set(span<const Index> coordinates) {
  return SelectPoints(coordinates, PointsOp::kSet);
}

absl::Status PointSelection::Append(span<const Index> coordinates) {
  return SelectPoints(coordinates, PointsOp::kAppend);
}

absl::Status PointSelection::Prepend(span<const Index> coordinates) {
  return SelectPoints(coordinates, PointsOp::kPrepend);
}

absl::Status PointSelection::SelectPoints(span<const Index> coordinates,
                                          PointsOp op) {
  HYPERSLAB_RETURN_IF_ERROR(ValidateCoordinates(shape(), coordinates));
  auto& dataspace = state_.dataspace();
  if (dataspace.select_type() != SelectType::kPoints) {
    op = PointsOp::kSet;
  }
  if (coordinates.empty()) {
    HYPERSLAB_RETURN_IF_ERROR(dataspace.SelectNone());
  } else {
    HYPERSLAB_RETURN_IF_ERROR(dataspace.SelectElements(op, coordinates));
  }
  return state_.UpdateNumSelected();
}

Result<Shape> PointSelection::ExpandShape(
    span<const Index> source_shape) const {
  return state_.ExpandShapeExact(source_shape, kDescription);
}

Result<BroadcastSequence> PointSelection::Broadcast(
    span<const Index> source_shape) const {
  return state_.BroadcastExact(source_shape, kDescription);
}

}  // namespace hyperslab
