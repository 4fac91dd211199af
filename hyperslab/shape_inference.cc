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

#include "hyperslab/shape_inference.h"

#include <optional>
#include <vector>

#include "hyperslab/error.h"
#include "hyperslab/util/status.h"
#include "hyperslab/util/str_cat.h"

namespace hyperslab {
namespace {

using OptionalShape = std::optional<Shape>;

absl::Status UnsupportedError(const char* what, const Dataspace& dataspace) {
  return SelectionError(
      SelectionErrorKind::kUnsupportedSelectionMode,
      StrCat("Unrecognized ", what, ": extent class ", dataspace.extent_class(),
             ", selection type ", dataspace.select_type()));
}

// Returns the number of positions selected along `axis`, given that
// `num_selected` elements lie within the bounding box `bounds`.
//
// All elements beyond the first position along the axis are removed from a
// copy of the selection.  For a regular hyperslab the remaining count is the
// product of the counts along the other axes.
Result<Index> GetAxisCount(const Dataspace& dataspace,
                           const SelectionBounds& bounds, DimensionIndex axis,
                           Index num_selected) {
  const DimensionIndex rank = bounds.start.size();
  std::vector<Index> start = bounds.start;
  std::vector<Index> count(rank);
  for (DimensionIndex i = 0; i < rank; ++i) {
    count[i] = bounds.end[i] - bounds.start[i] + 1;
  }
  if (count[axis] == 1) return 1;
  start[axis] += 1;
  count[axis] -= 1;
  const std::vector<Index> ones(rank, 1);
  HYPERSLAB_ASSIGN_OR_RETURN(auto masked, dataspace.Copy());
  HYPERSLAB_RETURN_IF_ERROR(
      masked->SelectHyperslab(HyperslabOp::kNotB, start, count, ones, ones));
  HYPERSLAB_ASSIGN_OR_RETURN(const Index leftover, masked->GetSelectNpoints());
  return num_selected / leftover;
}

}  // namespace

Result<std::optional<Shape>> GuessShape(const Dataspace& dataspace) {
  const SelectType select_type = dataspace.select_type();
  switch (dataspace.extent_class()) {
    case ExtentClass::kNull:
      return OptionalShape();
    case ExtentClass::kScalar:
      if (select_type == SelectType::kNone) return OptionalShape();
      if (select_type == SelectType::kAll) return OptionalShape(Shape());
      break;
    case ExtentClass::kSimple:
      break;
    default:
      return UnsupportedError("dataspace class", dataspace);
  }

  HYPERSLAB_ASSIGN_OR_RETURN(const Index num_selected,
                             dataspace.GetSelectNpoints());
  const Shape extent = dataspace.shape();
  const DimensionIndex rank = extent.size();
  switch (select_type) {
    case SelectType::kNone:
      return OptionalShape(Shape(rank, 0));
    case SelectType::kAll:
      return OptionalShape(extent);
    case SelectType::kPoints:
      return OptionalShape(Shape{num_selected});
    case SelectType::kHyperslabs:
      break;
    default:
      return UnsupportedError("selection method", dataspace);
  }

  if (num_selected == 0) return OptionalShape(Shape(rank, 0));

  HYPERSLAB_ASSIGN_OR_RETURN(auto bounds, dataspace.GetSelectBounds());
  Shape shape(rank);
  for (DimensionIndex axis = 0; axis < rank; ++axis) {
    HYPERSLAB_ASSIGN_OR_RETURN(
        shape[axis], GetAxisCount(dataspace, bounds, axis, num_selected));
  }
  if (ProductOfExtents(shape) != num_selected) {
    // Union of several hyperslabs.
    return OptionalShape(Shape{num_selected});
  }
  return OptionalShape(shape);
}

}  // namespace hyperslab
