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

#include "hyperslab/translate.h"

#include <ostream>
#include <variant>
#include <vector>

#include "hyperslab/error.h"
#include "hyperslab/index_parser.h"
#include "hyperslab/internal/integer_overflow.h"
#include "hyperslab/util/division.h"
#include "hyperslab/util/status.h"
#include "hyperslab/util/str_cat.h"

namespace hyperslab {
namespace {

/// Clamps a slice bound to ``[0, length]``, counting negative values from the
/// end of the axis.
Index ClampSliceBound(Index bound, Index length) {
  if (bound < 0) {
    bound += length;
    return bound < 0 ? 0 : bound;
  }
  return bound > length ? length : bound;
}

Result<AxisHyperslab> TranslateAxis(const IndexExpression& arg, Index length) {
  if (auto* index = std::get_if<Index>(&arg)) {
    return TranslateInt(*index, length);
  }
  if (auto* slice = std::get_if<Slice>(&arg)) {
    return TranslateSlice(*slice, length);
  }
  if (auto* block = std::get_if<StridedBlock>(&arg)) {
    return TranslateStridedBlock(*block, length);
  }
  return SelectionError(
      SelectionErrorKind::kInvalidIndexType,
      StrCat("Illegal index \"", arg, "\" (must be a slice or number)"));
}

}  // namespace

std::ostream& operator<<(std::ostream& os, const AxisHyperslab& x) {
  os << "{start=" << x.start << ", count=" << x.count
     << ", stride=" << x.stride << ", block=" << x.block;
  if (x.scalar) os << ", scalar";
  return os << "}";
}

Shape HyperslabDescriptor::mshape() const {
  Shape result(rank());
  for (DimensionIndex i = 0; i < rank(); ++i) {
    result[i] = count[i] * block[i];
  }
  return result;
}

Shape HyperslabDescriptor::array_shape() const {
  Shape result;
  for (DimensionIndex i = 0; i < rank(); ++i) {
    if (!scalar[i]) result.push_back(count[i] * block[i]);
  }
  return result;
}

void HyperslabDescriptor::push_back(const AxisHyperslab& axis) {
  start.push_back(axis.start);
  count.push_back(axis.count);
  stride.push_back(axis.stride);
  block.push_back(axis.block);
  scalar.push_back(axis.scalar);
}

std::ostream& operator<<(std::ostream& os, const HyperslabDescriptor& x) {
  return os << "{start=" << StrCat(x.start) << ", count=" << StrCat(x.count)
            << ", stride=" << StrCat(x.stride)
            << ", block=" << StrCat(x.block)
            << ", scalar=" << StrCat(x.scalar) << "}";
}

Result<AxisHyperslab> TranslateInt(Index index, Index length) {
  const Index normalized = index < 0 ? index + length : index;
  if (normalized < 0 || normalized >= length) {
    return SelectionError(SelectionErrorKind::kIndexOutOfRange,
                          StrCat("Index (", index, ") out of range (0-",
                                 length - 1, ")"));
  }
  AxisHyperslab result;
  result.start = normalized;
  result.count = 1;
  result.scalar = true;
  return result;
}

Result<AxisHyperslab> TranslateSlice(const Slice& slice, Index length) {
  const Index step = slice.step.value_or(1);
  if (step < 1) {
    return SelectionError(SelectionErrorKind::kInvalidSliceStep,
                          StrCat("Step must be >= 1 (got ", step, ")"));
  }
  const Index start =
      slice.start ? ClampSliceBound(*slice.start, length) : Index(0);
  const Index stop =
      slice.stop ? ClampSliceBound(*slice.stop, length) : length;
  AxisHyperslab result;
  if (stop <= start) {
    // Empty selection.
    return result;
  }
  result.start = start;
  result.count = 1 + (stop - start - 1) / step;
  result.stride = step;
  return result;
}

Result<AxisHyperslab> TranslateStridedBlock(const StridedBlock& block,
                                            Index length) {
  Index count;
  if (block.count()) {
    count = *block.count();
  } else {
    // Select as many full blocks as possible without exceeding the extent.
    Index remaining;
    if (internal::SubOverflow(length, block.start(), &remaining) ||
        internal::SubOverflow(remaining, block.block(), &remaining)) {
      remaining = -1;
    }
    count = FloorOfRatio<Index>(remaining, block.stride()) + 1;
    if (count < 1) {
      return SelectionError(
          SelectionErrorKind::kInvalidMultiBlockParameters,
          StrCat("No full blocks can be selected using ", block.ToString(),
                 " on dimension of length ", length));
    }
  }
  Index end_index;
  if (internal::MulOverflow(count - 1, block.stride(), &end_index) ||
      internal::AddOverflow(end_index, block.start(), &end_index) ||
      internal::AddOverflow(end_index, block.block() - 1, &end_index)) {
    return SelectionError(
        SelectionErrorKind::kInvalidMultiBlockParameters,
        StrCat("Integer overflow computing range of ", block.ToString(count),
               " on dimension of length ", length));
  }
  if (end_index >= length) {
    return SelectionError(
        SelectionErrorKind::kInvalidMultiBlockParameters,
        StrCat(block.ToString(count), " range (", block.start(), " - ",
               end_index, ") extends beyond maximum index (", length - 1,
               ")"));
  }
  AxisHyperslab result;
  result.start = block.start();
  result.count = count;
  result.stride = block.stride();
  result.block = block.block();
  return result;
}

Result<HyperslabDescriptor> TranslateSimple(span<const Index> shape,
                                            span<const IndexExpression> args) {
  HYPERSLAB_ASSIGN_OR_RETURN(auto expanded, ExpandEllipsis(args, shape.size()));
  HyperslabDescriptor result;
  for (DimensionIndex axis = 0; axis < static_cast<DimensionIndex>(shape.size());
       ++axis) {
    HYPERSLAB_ASSIGN_OR_RETURN(
        auto axis_hyperslab, TranslateAxis(expanded[axis], shape[axis]),
        MaybeAnnotateStatus(_, StrCat("Indexing axis ", axis)));
    result.push_back(axis_hyperslab);
  }
  return result;
}

}  // namespace hyperslab
