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

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "hyperslab/error.h"
#include "hyperslab/util/status_testutil.h"
#include "hyperslab/util/str_cat.h"

namespace {

using ::hyperslab::MatchesSelectionError;
using ::hyperslab::MatchesStatus;
using ::hyperslab::SelectionErrorKind;
using ::hyperslab::StrCat;
using ::hyperslab::StridedBlock;

TEST(StridedBlockTest, Default) {
  StridedBlock block;
  EXPECT_EQ(0, block.start());
  EXPECT_EQ(1, block.stride());
  EXPECT_EQ(std::nullopt, block.count());
  EXPECT_EQ(1, block.block());
  EXPECT_EQ("StridedBlock(start=0, stride=1, count=auto, block=1)",
            block.ToString());
}

TEST(StridedBlockTest, Make) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto block, StridedBlock::Make(2, 3, 2, 2));
  EXPECT_EQ(2, block.start());
  EXPECT_EQ(3, block.stride());
  EXPECT_EQ(2, block.count());
  EXPECT_EQ(2, block.block());
  EXPECT_EQ("StridedBlock(start=2, stride=3, count=2, block=2)",
            StrCat(block));
  EXPECT_EQ("StridedBlock(start=2, stride=3, count=7, block=2)",
            block.ToString(7));
}

TEST(StridedBlockTest, Equality) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto a, StridedBlock::Make(1, 2));
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto b, StridedBlock::Make(1, 2));
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto c, StridedBlock::Make(1, 2, 3));
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
  EXPECT_EQ(StridedBlock(), StridedBlock::Make().value());
}

TEST(StridedBlockTest, NegativeStart) {
  EXPECT_THAT(StridedBlock::Make(-1),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Start can't be negative: StridedBlock\\(start=-1, "
                            "stride=1, count=auto, block=1\\)"));
}

TEST(StridedBlockTest, NonPositiveParameters) {
  EXPECT_THAT(StridedBlock::Make(0, 0),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Stride, count and block can't be 0 or negative: "
                            ".*"));
  EXPECT_THAT(StridedBlock::Make(0, 1, 0),
              MatchesSelectionError(
                  SelectionErrorKind::kInvalidMultiBlockParameters));
  EXPECT_THAT(StridedBlock::Make(0, 1, std::nullopt, -2),
              MatchesSelectionError(
                  SelectionErrorKind::kInvalidMultiBlockParameters));
}

TEST(StridedBlockTest, OverlappingBlocks) {
  EXPECT_THAT(StridedBlock::Make(0, 2, 3, 3),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Blocks will overlap if block > stride: "
                            "StridedBlock\\(start=0, stride=2, count=3, "
                            "block=3\\)"));
  HYPERSLAB_EXPECT_OK(StridedBlock::Make(0, 3, 3, 3));
}

}  // namespace
