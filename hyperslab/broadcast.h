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

#ifndef HYPERSLAB_BROADCAST_H_
#define HYPERSLAB_BROADCAST_H_

/// \file
/// Mapping of a source array onto a regular hyperslab selection by
/// repetition.
///
/// A source array whose shape is "smaller" than the selection is written (or
/// read) chunk by chunk: the selection is split into a grid of chunks, each
/// with the shape of the source array, and the source array is transferred
/// once per chunk.

#include <memory>
#include <vector>

#include "hyperslab/dataspace.h"
#include "hyperslab/index.h"
#include "hyperslab/translate.h"
#include "hyperslab/util/result.h"
#include "hyperslab/util/span.h"

namespace hyperslab {

/// Matches the dimensions of `source_shape` to the axes of `descriptor`.
///
/// Axes are matched from last to first.  A scalar axis consumes no source
/// dimension.  Any other axis consumes the last remaining source dimension,
/// which must equal `1`, the selected length of the axis, or the block size
/// of the axis; once the source dimensions are exhausted, `1` is used.
/// Unconsumed leading source dimensions must equal `1`.
///
/// For example, with a selection on ``(10, 5, 4, 2)`` indexed by
/// ``[..., 0]``, the source shape ``(5, 4)`` expands to ``(1, 5, 4, 1)``.
///
/// \returns The chunk shape, of rank `descriptor.rank()`.
/// \error `absl::StatusCode::kInvalidArgument` (`BroadcastIncompatible`) if
///     `source_shape` cannot be matched.
Result<Shape> ExpandShapeForBroadcast(const HyperslabDescriptor& descriptor,
                                      span<const Index> source_shape);

/// Single-pass sequence of dataspaces covering a selection chunk by chunk.
///
/// Each dataspace returned by `Next` is borrowed: it remains valid only until
/// the next call to `Next` or the destruction of the sequence, and must not
/// be modified.  All chunks of a sequence share one dataspace, which is
/// repositioned by each call to `Next`; abandoning the sequence early leaves
/// its position unspecified.
class BroadcastSequence {
 public:
  BroadcastSequence() = default;
  BroadcastSequence(BroadcastSequence&&) = default;
  BroadcastSequence& operator=(BroadcastSequence&&) = default;

  /// Returns a sequence that yields `dataspace` once.  `dataspace` must
  /// outlive the sequence.
  static BroadcastSequence Single(const Dataspace* dataspace);

  /// Returns a sequence covering the hyperslab `descriptor`, committed to
  /// `dataspace`, with chunks of shape `chunk_shape` (as computed by
  /// `ExpandShapeForBroadcast`).
  ///
  /// If the selection consists of a single chunk, `dataspace` itself is
  /// yielded, otherwise a copy is made.
  static Result<BroadcastSequence> Chunked(
      const Dataspace* dataspace, const HyperslabDescriptor& descriptor,
      span<const Index> chunk_shape);

  /// Returns the total number of chunks in the sequence.
  Index size() const { return size_; }

  /// Returns the next chunk, or `nullptr` after the last chunk.
  ///
  /// \error Any error returned by `Dataspace::OffsetSimple`.
  Result<const Dataspace*> Next();

 private:
  struct AxisChunking {
    Index start;
    Index stride;
    Index block;
    Index chunk_extent;
    Index num_chunks;
  };

  Index ChunkOrigin(const AxisChunking& axis, Index chunk_index) const;

  const Dataspace* single_ = nullptr;
  std::unique_ptr<Dataspace> chunk_;
  std::vector<AxisChunking> axes_;
  Index size_ = 0;
  Index position_ = 0;
};

/// Computes the chunk shape for `source_shape` and returns the sequence of
/// chunks covering `descriptor`, which is committed to `dataspace`.
///
/// \error `absl::StatusCode::kInvalidArgument` (`BroadcastIncompatible`) if
///     `source_shape` cannot be broadcast to the selection.
Result<BroadcastSequence> BroadcastHyperslab(
    const Dataspace* dataspace, const HyperslabDescriptor& descriptor,
    span<const Index> source_shape);

}  // namespace hyperslab

#endif  // HYPERSLAB_BROADCAST_H_
