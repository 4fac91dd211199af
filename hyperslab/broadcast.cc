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

#include "hyperslab/broadcast.h"

#include <memory>
#include <utility>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/log/absl_log.h"
#include "hyperslab/error.h"
#include "hyperslab/internal/log/verbose_flag.h"
#include "hyperslab/util/status.h"
#include "hyperslab/util/str_cat.h"

namespace hyperslab {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag broadcast_logging(
    "hyperslab_broadcast");

absl::Status BroadcastIncompatibleError(const HyperslabDescriptor& descriptor,
                                        span<const Index> source_shape) {
  return SelectionError(SelectionErrorKind::kBroadcastIncompatible,
                        StrCat("Can't broadcast ", source_shape, " -> ",
                               descriptor.array_shape()));
}

}  // namespace

Result<Shape> ExpandShapeForBroadcast(const HyperslabDescriptor& descriptor,
                                      span<const Index> source_shape) {
  const DimensionIndex rank = descriptor.rank();
  const Shape mshape = descriptor.mshape();
  Shape chunk_shape(rank, 1);
  size_t remaining = source_shape.size();
  for (DimensionIndex axis = rank - 1; axis >= 0; --axis) {
    if (remaining == 0 || descriptor.scalar[axis]) continue;
    const Index extent = source_shape[--remaining];
    if (extent != 1 && extent != mshape[axis] &&
        extent != descriptor.block[axis]) {
      return BroadcastIncompatibleError(descriptor, source_shape);
    }
    chunk_shape[axis] = extent;
  }
  for (size_t i = 0; i < remaining; ++i) {
    if (source_shape[i] > 1) {
      return BroadcastIncompatibleError(descriptor, source_shape);
    }
  }
  return chunk_shape;
}

BroadcastSequence BroadcastSequence::Single(const Dataspace* dataspace) {
  BroadcastSequence sequence;
  sequence.single_ = dataspace;
  sequence.size_ = 1;
  return sequence;
}

Result<BroadcastSequence> BroadcastSequence::Chunked(
    const Dataspace* dataspace, const HyperslabDescriptor& descriptor,
    span<const Index> chunk_shape) {
  const DimensionIndex rank = descriptor.rank();
  const Shape mshape = descriptor.mshape();
  BroadcastSequence sequence;
  sequence.axes_.resize(rank);
  Index num_chunks = 1;
  for (DimensionIndex axis = 0; axis < rank; ++axis) {
    auto& a = sequence.axes_[axis];
    a.start = descriptor.start[axis];
    a.stride = descriptor.stride[axis];
    a.block = descriptor.block[axis];
    a.chunk_extent = chunk_shape[axis];
    a.num_chunks = a.chunk_extent == 0 ? 0 : mshape[axis] / a.chunk_extent;
    num_chunks *= a.num_chunks;
  }
  if (num_chunks == 1) return Single(dataspace);
  sequence.size_ = num_chunks;
  if (num_chunks == 0) return sequence;

  // Axes that are not repeated keep their own hyperslab parameters.  Repeated
  // axes select a single contiguous run of `chunk_extent` elements.
  std::vector<Index> origin(rank, 0), count(rank), stride(rank), block(rank);
  for (DimensionIndex axis = 0; axis < rank; ++axis) {
    const auto& a = sequence.axes_[axis];
    if (a.num_chunks == 1) {
      count[axis] = descriptor.count[axis];
      stride[axis] = a.stride;
      block[axis] = a.block;
    } else {
      count[axis] = 1;
      stride[axis] = 1;
      block[axis] = a.chunk_extent;
    }
  }
  HYPERSLAB_ASSIGN_OR_RETURN(sequence.chunk_, dataspace->Copy());
  HYPERSLAB_RETURN_IF_ERROR(sequence.chunk_->SelectHyperslab(
      HyperslabOp::kSet, origin, count, stride, block));
  return sequence;
}

Index BroadcastSequence::ChunkOrigin(const AxisChunking& axis,
                                     Index chunk_index) const {
  if (axis.num_chunks == 1) return axis.start;
  // Position of the first element of the chunk within the selected elements
  // of the axis, mapped back through the block structure.
  const Index element = chunk_index * axis.chunk_extent;
  return axis.start + (element / axis.block) * axis.stride +
         element % axis.block;
}

Result<const Dataspace*> BroadcastSequence::Next() {
  if (position_ >= size_) return static_cast<const Dataspace*>(nullptr);
  Index linear_index = position_++;
  if (!chunk_) return single_;

  const DimensionIndex rank = axes_.size();
  std::vector<Index> offset(rank);
  for (DimensionIndex axis = rank - 1; axis >= 0; --axis) {
    const auto& a = axes_[axis];
    offset[axis] = ChunkOrigin(a, linear_index % a.num_chunks);
    linear_index /= a.num_chunks;
  }
  ABSL_LOG_IF(INFO, broadcast_logging.Level(1))
      << "Broadcast chunk " << (position_ - 1) << " at offset "
      << StrCat(offset);
  HYPERSLAB_RETURN_IF_ERROR(chunk_->OffsetSimple(offset));
  return static_cast<const Dataspace*>(chunk_.get());
}

Result<BroadcastSequence> BroadcastHyperslab(
    const Dataspace* dataspace, const HyperslabDescriptor& descriptor,
    span<const Index> source_shape) {
  HYPERSLAB_ASSIGN_OR_RETURN(
      auto chunk_shape, ExpandShapeForBroadcast(descriptor, source_shape));
  ABSL_LOG_IF(INFO, broadcast_logging)
      << "Broadcasting " << StrCat(source_shape) << " to "
      << StrCat(descriptor.mshape()) << " in chunks of "
      << StrCat(chunk_shape);
  return BroadcastSequence::Chunked(dataspace, descriptor, chunk_shape);
}

}  // namespace hyperslab
