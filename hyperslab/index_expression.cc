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

#include "hyperslab/index_expression.h"

#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "hyperslab/error.h"
#include "hyperslab/util/str_cat.h"

namespace hyperslab {
namespace {

void PrintOptionalBound(std::ostream& os, const std::optional<Index>& x) {
  if (x) os << *x;
}

}  // namespace

std::ostream& operator<<(std::ostream& os, const Slice& x) {
  PrintOptionalBound(os, x.start);
  os << ":";
  PrintOptionalBound(os, x.stop);
  if (x.step) os << ":" << *x.step;
  return os;
}

std::ostream& operator<<(std::ostream& os, Ellipsis) { return os << "..."; }

std::ostream& operator<<(std::ostream& os, const IndexList& x) {
  return os << StrCat(x.values);
}

BooleanMask::BooleanMask(std::vector<bool> values)
    : shape_{static_cast<Index>(values.size())}, values_(std::move(values)) {}

Result<BooleanMask> BooleanMask::Make(Shape shape, std::vector<bool> values) {
  const Index num_elements = ProductOfExtents(shape);
  if (num_elements != static_cast<Index>(values.size())) {
    return SelectionError(
        SelectionErrorKind::kLengthMismatch,
        StrCat("Boolean mask of shape ", shape, " requires ", num_elements,
               " values, but received ", values.size()));
  }
  BooleanMask mask;
  mask.shape_ = std::move(shape);
  mask.values_ = std::move(values);
  return mask;
}

std::vector<Index> BooleanMask::Nonzero() const {
  std::vector<Index> result;
  for (size_t i = 0; i < values_.size(); ++i) {
    if (values_[i]) result.push_back(static_cast<Index>(i));
  }
  return result;
}

std::vector<Index> BooleanMask::NonzeroCoordinates() const {
  const DimensionIndex rank = shape_.size();
  std::vector<Index> result;
  std::vector<Index> position(rank, 0);
  for (size_t i = 0; i < values_.size(); ++i) {
    if (values_[i]) {
      result.insert(result.end(), position.begin(), position.end());
    }
    // Increment the row-major position, last dimension fastest.
    for (DimensionIndex dim = rank - 1; dim >= 0; --dim) {
      if (++position[dim] < shape_[dim]) break;
      position[dim] = 0;
    }
  }
  return result;
}

std::ostream& operator<<(std::ostream& os, const BooleanMask& x) {
  return os << "BooleanMask(shape=" << StrCat(x.shape())
            << ", values=" << StrCat(x.values()) << ")";
}

std::ostream& operator<<(std::ostream& os, IndexExpressionKind kind) {
  switch (kind) {
    case IndexExpressionKind::kInteger:
      return os << "integer";
    case IndexExpressionKind::kSlice:
      return os << "slice";
    case IndexExpressionKind::kStridedBlock:
      return os << "strided block";
    case IndexExpressionKind::kEllipsis:
      return os << "ellipsis";
    case IndexExpressionKind::kIndexList:
      return os << "index list";
    case IndexExpressionKind::kBooleanMask:
      return os << "boolean mask";
    case IndexExpressionKind::kExistingSelection:
      return os << "existing selection";
    case IndexExpressionKind::kRegionReference:
      return os << "region reference";
  }
  return os;
}

std::ostream& operator<<(std::ostream& os, const IndexExpression& x) {
  std::visit(
      [&os](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, ExistingSelection>) {
          os << "<existing selection>";
        } else if constexpr (std::is_same_v<T, RegionReference>) {
          os << "<region reference>";
        } else {
          os << value;
        }
      },
      x);
  return os;
}

bool IsSimpleIndexExpression(const IndexExpression& x) {
  switch (GetIndexExpressionKind(x)) {
    case IndexExpressionKind::kInteger:
    case IndexExpressionKind::kSlice:
    case IndexExpressionKind::kStridedBlock:
    case IndexExpressionKind::kEllipsis:
      return true;
    default:
      return false;
  }
}

}  // namespace hyperslab
