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

#ifndef HYPERSLAB_STRIDED_BLOCK_H_
#define HYPERSLAB_STRIDED_BLOCK_H_

/// \file
/// Defines `StridedBlock`, an extension of a slice that selects regularly
/// spaced blocks of elements along one axis.

#include <iosfwd>
#include <optional>
#include <string>

#include "hyperslab/index.h"
#include "hyperslab/util/result.h"

namespace hyperslab {

/// Selects `count` blocks of `block` consecutive elements, the first starting
/// at `start` and each subsequent block starting `stride` elements after the
/// previous one.
///
/// If `count` is unspecified, as many full blocks as fit within the axis are
/// selected.  The default-constructed value (`start=0`, `stride=1`,
/// `block=1`, unspecified `count`) selects the full axis.
///
/// A `StridedBlock` is a pure value: the parameters are validated on
/// construction by `Make`, but fitting them to a particular axis length
/// happens in `TranslateStridedBlock`.
///
/// \ingroup indexing
class StridedBlock {
 public:
  /// Constructs a strided block that selects the full axis.
  StridedBlock() = default;

  /// Returns a validated strided block.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` (`InvalidMultiBlockParameters`)
  ///     if `start < 0`, `stride < 1`, `count < 1`, `block < 1`, or
  ///     `block > stride`.
  static Result<StridedBlock> Make(Index start = 0, Index stride = 1,
                                   std::optional<Index> count = std::nullopt,
                                   Index block = 1);

  Index start() const { return start_; }
  Index stride() const { return stride_; }
  const std::optional<Index>& count() const { return count_; }
  Index block() const { return block_; }

  /// Returns the canonical representation
  /// ``StridedBlock(start=S, stride=T, count=C, block=B)``.  An unspecified
  /// count is printed as ``count=auto``.
  std::string ToString() const;

  /// Same as `ToString`, but prints `count` in place of the stored count.
  std::string ToString(std::optional<Index> count) const;

  friend bool operator==(const StridedBlock& a, const StridedBlock& b) {
    return a.start_ == b.start_ && a.stride_ == b.stride_ &&
           a.count_ == b.count_ && a.block_ == b.block_;
  }
  friend bool operator!=(const StridedBlock& a, const StridedBlock& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& os, const StridedBlock& x);

 private:
  Index start_ = 0;
  Index stride_ = 1;
  std::optional<Index> count_;
  Index block_ = 1;
};

}  // namespace hyperslab

#endif  // HYPERSLAB_STRIDED_BLOCK_H_
