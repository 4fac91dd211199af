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

#include "hyperslab/strided_block.h"

#include <optional>
#include <ostream>
#include <string>

#include "hyperslab/error.h"
#include "hyperslab/util/str_cat.h"

namespace hyperslab {

Result<StridedBlock> StridedBlock::Make(Index start, Index stride,
                                        std::optional<Index> count,
                                        Index block) {
  StridedBlock result;
  result.start_ = start;
  result.stride_ = stride;
  result.count_ = count;
  result.block_ = block;
  if (start < 0) {
    return SelectionError(
        SelectionErrorKind::kInvalidMultiBlockParameters,
        StrCat("Start can't be negative: ", result.ToString()));
  }
  if (stride < 1 || (count && *count < 1) || block < 1) {
    return SelectionError(
        SelectionErrorKind::kInvalidMultiBlockParameters,
        StrCat("Stride, count and block can't be 0 or negative: ",
               result.ToString()));
  }
  if (block > stride) {
    return SelectionError(
        SelectionErrorKind::kInvalidMultiBlockParameters,
        StrCat("Blocks will overlap if block > stride: ", result.ToString()));
  }
  return result;
}

std::string StridedBlock::ToString() const { return ToString(count_); }

std::string StridedBlock::ToString(std::optional<Index> count) const {
  return StrCat("StridedBlock(start=", start_, ", stride=", stride_,
                ", count=", count ? StrCat(*count) : std::string("auto"),
                ", block=", block_, ")");
}

std::ostream& operator<<(std::ostream& os, const StridedBlock& x) {
  return os << x.ToString();
}

}  // namespace hyperslab
