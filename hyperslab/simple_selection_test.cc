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

#include "hyperslab/simple_selection.h"

#include <memory>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "hyperslab/dataspace.h"
#include "hyperslab/dataspace_testutil.h"
#include "hyperslab/error.h"
#include "hyperslab/index.h"
#include "hyperslab/index_expression.h"
#include "hyperslab/strided_block.h"
#include "hyperslab/util/status_testutil.h"

namespace {

using ::hyperslab::Dataspace;
using ::hyperslab::Ellipsis;
using ::hyperslab::InMemoryDataspace;
using ::hyperslab::Index;
using ::hyperslab::IndexExpression;
using ::hyperslab::IndexList;
using ::hyperslab::IsOkAndHolds;
using ::hyperslab::MatchesSelectionError;
using ::hyperslab::MatchesStatus;
using ::hyperslab::SelectionErrorKind;
using ::hyperslab::SelectType;
using ::hyperslab::SimpleSelection;
using ::hyperslab::Slice;
using ::hyperslab::StridedBlock;
using ::testing::ElementsAre;

using Coordinates = InMemoryDataspace::Coordinates;

std::vector<Coordinates> GetCoordinates(const SimpleSelection& selection) {
  return static_cast<const InMemoryDataspace&>(selection.dataspace())
      .GetSelectedCoordinates();
}

TEST(SimpleSelectionTest, InitiallyAll) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto selection, SimpleSelection::Make(InMemoryDataspace::Make({10, 20})));
  EXPECT_THAT(selection.shape(), ElementsAre(10, 20));
  EXPECT_EQ(200, selection.nselect());
  EXPECT_THAT(selection.mshape(), ElementsAre(10, 20));
  EXPECT_THAT(selection.array_shape(), ElementsAre(10, 20));
}

TEST(SimpleSelectionTest, IntegerAndSlice) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto selection, SimpleSelection::Make(InMemoryDataspace::Make({4, 3})));
  std::vector<IndexExpression> args{Index(2), Slice{}};
  HYPERSLAB_ASSERT_OK(selection.Apply(args));
  EXPECT_EQ(3, selection.nselect());
  EXPECT_THAT(selection.mshape(), ElementsAre(1, 3));
  EXPECT_THAT(selection.array_shape(), ElementsAre(3));
  EXPECT_THAT(GetCoordinates(selection),
              ElementsAre(Coordinates{2, 0}, Coordinates{2, 1},
                          Coordinates{2, 2}));
}

TEST(SimpleSelectionTest, ApplyReplacesSelection) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto selection, SimpleSelection::Make(InMemoryDataspace::Make({10})));
  std::vector<IndexExpression> first{Slice{0, 5, std::nullopt}};
  HYPERSLAB_ASSERT_OK(selection.Apply(first));
  std::vector<IndexExpression> second{Slice{8, std::nullopt, std::nullopt}};
  HYPERSLAB_ASSERT_OK(selection.Apply(second));
  EXPECT_EQ(2, selection.nselect());
  EXPECT_THAT(GetCoordinates(selection),
              ElementsAre(Coordinates{8}, Coordinates{9}));
}

TEST(SimpleSelectionTest, SameArgumentsGiveSameSelection) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto block, StridedBlock::Make(1, 4, 2, 2));
  std::vector<IndexExpression> args{Index(-3), Slice{1, std::nullopt, 3},
                                    block};
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto first,
      SimpleSelection::Make(InMemoryDataspace::Make({10, 20, 12})));
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto second,
      SimpleSelection::Make(InMemoryDataspace::Make({10, 20, 12})));
  HYPERSLAB_ASSERT_OK(first.Apply(args));
  HYPERSLAB_ASSERT_OK(second.Apply(args));
  EXPECT_EQ(first.descriptor(), second.descriptor());
  EXPECT_EQ(first.nselect(), second.nselect());
  EXPECT_EQ(GetCoordinates(first), GetCoordinates(second));

  // Applying again to the same selection commits the same region.
  const auto coordinates = GetCoordinates(first);
  HYPERSLAB_ASSERT_OK(first.Apply(args));
  EXPECT_EQ(second.descriptor(), first.descriptor());
  EXPECT_EQ(coordinates, GetCoordinates(first));
  EXPECT_EQ(28, first.nselect());
}

TEST(SimpleSelectionTest, StridedBlock) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto selection, SimpleSelection::Make(InMemoryDataspace::Make({10})));
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto block, StridedBlock::Make(2, 3, 2, 2));
  std::vector<IndexExpression> args{block};
  HYPERSLAB_ASSERT_OK(selection.Apply(args));
  EXPECT_THAT(selection.mshape(), ElementsAre(4));
  EXPECT_THAT(GetCoordinates(selection),
              ElementsAre(Coordinates{2}, Coordinates{3}, Coordinates{5},
                          Coordinates{6}));
}

TEST(SimpleSelectionTest, EmptySlice) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto selection, SimpleSelection::Make(InMemoryDataspace::Make({10, 2})));
  std::vector<IndexExpression> args{Slice{5, 2, std::nullopt}};
  HYPERSLAB_ASSERT_OK(selection.Apply(args));
  EXPECT_EQ(0, selection.nselect());
  EXPECT_THAT(selection.mshape(), ElementsAre(0, 2));
  EXPECT_EQ(SelectType::kNone, selection.dataspace().select_type());
}

TEST(SimpleSelectionTest, Errors) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto selection, SimpleSelection::Make(InMemoryDataspace::Make({10})));
  std::vector<IndexExpression> out_of_range{Index(10)};
  EXPECT_THAT(selection.Apply(out_of_range),
              MatchesSelectionError(SelectionErrorKind::kIndexOutOfRange));
  std::vector<IndexExpression> list{IndexList{{1}}};
  EXPECT_THAT(selection.Apply(list),
              MatchesSelectionError(SelectionErrorKind::kInvalidIndexType));
  std::vector<IndexExpression> ellipses{Ellipsis{}, Ellipsis{}};
  EXPECT_THAT(selection.Apply(ellipses),
              MatchesSelectionError(SelectionErrorKind::kTooManyEllipses));
}

TEST(SimpleSelectionTest, Scalar) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto selection, SimpleSelection::Make(InMemoryDataspace::Make({})));
  EXPECT_EQ(1, selection.nselect());
  HYPERSLAB_EXPECT_OK(selection.Apply({}));
  std::vector<IndexExpression> ellipsis{Ellipsis{}};
  HYPERSLAB_EXPECT_OK(selection.Apply(ellipsis));
  EXPECT_EQ(1, selection.nselect());
  EXPECT_THAT(selection.mshape(), ElementsAre());
  EXPECT_THAT(selection.array_shape(), ElementsAre());

  std::vector<IndexExpression> index{Index(0)};
  EXPECT_THAT(selection.Apply(index),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Invalid index for scalar dataset \\(only \\.\\.\\., "
                            "\\(\\) allowed\\)"));
}

TEST(SimpleSelectionTest, ScalarBroadcast) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto selection, SimpleSelection::Make(InMemoryDataspace::Make({})));
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto sequence, selection.Broadcast({}));
  EXPECT_EQ(1, sequence.size());
  EXPECT_THAT(sequence.Next(), IsOkAndHolds(&selection.dataspace()));
  HYPERSLAB_EXPECT_OK(selection.Broadcast({1, 1}));
  EXPECT_THAT(selection.Broadcast({2}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Can't broadcast \\{2\\} to scalar"));
}

TEST(SimpleSelectionTest, Broadcast) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto selection, SimpleSelection::Make(InMemoryDataspace::Make({10, 5})));
  EXPECT_THAT(selection.ExpandShape({5}), IsOkAndHolds(ElementsAre(1, 5)));
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto sequence, selection.Broadcast({5}));
  EXPECT_EQ(10, sequence.size());
  Index num_chunks = 0;
  while (true) {
    HYPERSLAB_ASSERT_OK_AND_ASSIGN(const Dataspace* chunk, sequence.Next());
    if (!chunk) break;
    EXPECT_THAT(chunk->GetSelectNpoints(), IsOkAndHolds(5));
    ++num_chunks;
  }
  EXPECT_EQ(10, num_chunks);
  EXPECT_THAT(selection.Broadcast({3}),
              MatchesSelectionError(SelectionErrorKind::kBroadcastIncompatible));
}

TEST(SimpleSelectionTest, ExpandShapeDropsIntegerAxes) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto selection,
      SimpleSelection::Make(InMemoryDataspace::Make({10, 5, 4, 2})));
  std::vector<IndexExpression> args{Ellipsis{}, Index(0)};
  HYPERSLAB_ASSERT_OK(selection.Apply(args));
  EXPECT_THAT(selection.array_shape(), ElementsAre(10, 5, 4));
  EXPECT_THAT(selection.ExpandShape({5, 4}),
              IsOkAndHolds(ElementsAre(1, 5, 4, 1)));
}

}  // namespace
