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

#include "hyperslab/pass_through_selection.h"

#include <memory>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "hyperslab/dataspace.h"
#include "hyperslab/dataspace_testutil.h"
#include "hyperslab/error.h"
#include "hyperslab/index_expression.h"
#include "hyperslab/util/status_testutil.h"

namespace {

using ::hyperslab::HyperslabOp;
using ::hyperslab::InMemoryDataspace;
using ::hyperslab::IndexExpression;
using ::hyperslab::IsOkAndHolds;
using ::hyperslab::MatchesSelectionError;
using ::hyperslab::MatchesStatus;
using ::hyperslab::PassThroughSelection;
using ::hyperslab::SelectionErrorKind;
using ::hyperslab::Slice;
using ::testing::ElementsAre;

TEST(PassThroughSelectionTest, AdoptsSelection) {
  auto dataspace = InMemoryDataspace::Make({6, 6});
  HYPERSLAB_ASSERT_OK(dataspace->SelectHyperslab(HyperslabOp::kSet, {1, 1},
                                                 {2, 3}, {2, 1}, {1, 1}));
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto selection,
                                 PassThroughSelection::Make(std::move(dataspace)));
  EXPECT_THAT(selection.shape(), ElementsAre(6, 6));
  EXPECT_EQ(6, selection.nselect());
  EXPECT_THAT(selection.mshape(), ElementsAre(6));
  EXPECT_THAT(selection.array_shape(), ElementsAre(6));
}

TEST(PassThroughSelectionTest, ApplyFails) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto selection, PassThroughSelection::Make(InMemoryDataspace::Make({3})));
  std::vector<IndexExpression> args{Slice{}};
  EXPECT_THAT(selection.Apply(args),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "This selection does not support indexing"));
  EXPECT_THAT(selection.Apply({}),
              MatchesSelectionError(SelectionErrorKind::kInvalidIndexType));
}

TEST(PassThroughSelectionTest, Broadcast) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto selection,
      PassThroughSelection::Make(InMemoryDataspace::Make({2, 3})));
  EXPECT_THAT(selection.ExpandShape({6}), IsOkAndHolds(ElementsAre(6)));
  EXPECT_THAT(selection.ExpandShape({2, 3}), IsOkAndHolds(ElementsAre(2, 3)));
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto sequence, selection.Broadcast({6}));
  EXPECT_THAT(sequence.Next(), IsOkAndHolds(&selection.dataspace()));
  EXPECT_THAT(selection.Broadcast({3}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Broadcasting is not supported for adopted "
                            "selections: .*"));
}

}  // namespace
