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

#include "hyperslab/fancy_selection.h"

#include <memory>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/log/absl_log.h"
#include "hyperslab/error.h"
#include "hyperslab/index_parser.h"
#include "hyperslab/internal/log/verbose_flag.h"
#include "hyperslab/translate.h"
#include "hyperslab/util/status.h"
#include "hyperslab/util/str_cat.h"

namespace hyperslab {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag select_logging("hyperslab_select");

using Sequence = std::optional<std::vector<Index>>;

/// Returns the sequence denoted by `arg`, or `std::nullopt` if `arg` indexes
/// a single axis position or range.
Result<Sequence> GetSequence(
    const IndexExpression& arg) {
  switch (GetIndexExpressionKind(arg)) {
    case IndexExpressionKind::kInteger:
    case IndexExpressionKind::kSlice:
    case IndexExpressionKind::kStridedBlock:
      return Sequence();
    case IndexExpressionKind::kIndexList:
      return Sequence(std::get<IndexList>(arg).values);
    case IndexExpressionKind::kBooleanMask: {
      const auto& mask = std::get<BooleanMask>(arg);
      if (mask.rank() != 1) {
        return SelectionError(SelectionErrorKind::kInvalidIndexType,
                              "Boolean indexing arrays must be 1-D");
      }
      return Sequence(mask.Nonzero());
    }
    default:
      return SelectionError(
          SelectionErrorKind::kInvalidIndexType,
          StrCat("Illegal index \"", arg,
                 "\" (must be a slice, number, index list or boolean mask)"));
  }
}

absl::Status ValidateStrictlyIncreasing(span<const Index> values) {
  for (size_t i = 1; i < values.size(); ++i) {
    if (values[i - 1] >= values[i]) {
      return SelectionError(
          SelectionErrorKind::kNonMonotonicIndexSequence,
          StrCat("Indexing elements must be in increasing order: ", values));
    }
  }
  return absl::OkStatus();
}

}  // namespace

Result<FancySelection> FancySelection::Make(
    std::unique_ptr<Dataspace> dataspace) {
  FancySelection selection;
  HYPERSLAB_ASSIGN_OR_RETURN(
      selection.state_,
      internal_selection::SelectionState::Make(std::move(dataspace)));
  selection.mshape_ = selection.array_shape_ = selection.shape();
  return selection;
}

absl::Status FancySelection::Apply(span<const IndexExpression> args) {
  const DimensionIndex rank = shape().size();
  HYPERSLAB_ASSIGN_OR_RETURN(auto expanded, ExpandEllipsis(args, rank));

  DimensionIndex sequence_axis = -1;
  std::vector<Index> sequence;
  for (DimensionIndex axis = 0; axis < rank; ++axis) {
    HYPERSLAB_ASSIGN_OR_RETURN(
        auto values, GetSequence(expanded[axis]),
        MaybeAnnotateStatus(_, StrCat("Indexing axis ", axis)));
    if (!values) continue;
    HYPERSLAB_RETURN_IF_ERROR(ValidateStrictlyIncreasing(*values));
    if (sequence_axis != -1) {
      return SelectionError(
          SelectionErrorKind::kUnsupportedFancyCombination,
          "Only one indexing vector or array is currently allowed for "
          "advanced selection");
    }
    sequence_axis = axis;
    sequence = std::move(*values);
  }
  if (sequence_axis == -1) {
    return SelectionError(SelectionErrorKind::kUnsupportedFancyCombination,
                          "Advanced selection inappropriate");
  }

  ABSL_LOG_IF(INFO, select_logging)
      << "Union selection over axis " << sequence_axis << " of "
      << sequence.size() << " hyperslabs on extent " << StrCat(shape());

  auto& dataspace = state_.dataspace();
  HYPERSLAB_RETURN_IF_ERROR(dataspace.SelectNone());
  std::vector<IndexExpression> entry = expanded;
  HyperslabDescriptor descriptor;
  auto add_hyperslab = [&]() -> absl::Status {
    HYPERSLAB_ASSIGN_OR_RETURN(descriptor, TranslateSimple(shape(), entry));
    return dataspace.SelectHyperslab(HyperslabOp::kOr, descriptor.start,
                                     descriptor.count, descriptor.stride,
                                     descriptor.block);
  };
  if (sequence.empty()) {
    // An empty range on the sequence axis yields a correctly shaped empty
    // selection.
    entry[sequence_axis] = Slice{0, 0, std::nullopt};
    HYPERSLAB_RETURN_IF_ERROR(add_hyperslab());
  }
  for (Index value : sequence) {
    entry[sequence_axis] = value;
    HYPERSLAB_RETURN_IF_ERROR(add_hyperslab());
  }

  mshape_.resize(rank);
  array_shape_.clear();
  for (DimensionIndex axis = 0; axis < rank; ++axis) {
    if (axis == sequence_axis) {
      mshape_[axis] = sequence.size();
    } else if (descriptor.scalar[axis]) {
      mshape_[axis] = 1;
      continue;
    } else {
      mshape_[axis] = descriptor.count[axis] * descriptor.block[axis];
    }
    array_shape_.push_back(mshape_[axis]);
  }
  return state_.UpdateNumSelected();
}

Result<Shape> FancySelection::ExpandShape(
    span<const Index> source_shape) const {
  if (span<const Index>(array_shape_) != source_shape) {
    return SelectionError(
        SelectionErrorKind::kBroadcastIncompatible,
        StrCat("Broadcasting is not supported for complex selections: ",
               "source shape ", source_shape, " differs from ",
               array_shape_));
  }
  return Shape(source_shape.begin(), source_shape.end());
}

Result<BroadcastSequence> FancySelection::Broadcast(
    span<const Index> source_shape) const {
  HYPERSLAB_RETURN_IF_ERROR(ExpandShape(source_shape).status());
  return BroadcastSequence::Single(&dataspace());
}

}  // namespace hyperslab
