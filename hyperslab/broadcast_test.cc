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
#include "hyperslab/translate.h"
#include "hyperslab/util/result.h"
#include "hyperslab/util/status.h"
#include "hyperslab/util/status_testutil.h"

namespace {

using ::hyperslab::BroadcastHyperslab;
using ::hyperslab::BroadcastSequence;
using ::hyperslab::Dataspace;
using ::hyperslab::Ellipsis;
using ::hyperslab::ExpandShapeForBroadcast;
using ::hyperslab::HyperslabDescriptor;
using ::hyperslab::HyperslabOp;
using ::hyperslab::InMemoryDataspace;
using ::hyperslab::Index;
using ::hyperslab::IndexExpression;
using ::hyperslab::IsOkAndHolds;
using ::hyperslab::MatchesSelectionError;
using ::hyperslab::MatchesStatus;
using ::hyperslab::Result;
using ::hyperslab::SelectionErrorKind;
using ::hyperslab::Shape;
using ::hyperslab::Slice;
using ::hyperslab::StridedBlock;
using ::hyperslab::TranslateSimple;
using ::testing::ElementsAre;

using Coordinates = InMemoryDataspace::Coordinates;

HyperslabDescriptor Translate(const Shape& shape,
                              std::vector<IndexExpression> args) {
  auto descriptor = TranslateSimple(shape, args);
  HYPERSLAB_CHECK_OK(descriptor);
  return *descriptor;
}

// Returns a dataspace of `shape` with `descriptor` committed.
std::unique_ptr<InMemoryDataspace> MakeDataspace(
    const Shape& shape, const HyperslabDescriptor& descriptor) {
  auto dataspace = InMemoryDataspace::Make(shape);
  HYPERSLAB_CHECK_OK(dataspace->SelectHyperslab(
      HyperslabOp::kSet, descriptor.start, descriptor.count, descriptor.stride,
      descriptor.block));
  return dataspace;
}

// Returns the selected coordinates of each chunk of `sequence`.
Result<std::vector<std::vector<Coordinates>>> CollectChunks(
    BroadcastSequence& sequence) {
  std::vector<std::vector<Coordinates>> chunks;
  while (true) {
    HYPERSLAB_ASSIGN_OR_RETURN(const Dataspace* chunk, sequence.Next());
    if (!chunk) break;
    chunks.push_back(static_cast<const InMemoryDataspace*>(chunk)
                         ->GetSelectedCoordinates());
  }
  return chunks;
}

TEST(ExpandShapeForBroadcastTest, TrailingDimensions) {
  auto descriptor = Translate({10, 5}, {});
  EXPECT_THAT(ExpandShapeForBroadcast(descriptor, {5}),
              IsOkAndHolds(ElementsAre(1, 5)));
  EXPECT_THAT(ExpandShapeForBroadcast(descriptor, {10, 5}),
              IsOkAndHolds(ElementsAre(10, 5)));
  EXPECT_THAT(ExpandShapeForBroadcast(descriptor, {1}),
              IsOkAndHolds(ElementsAre(1, 1)));
  EXPECT_THAT(ExpandShapeForBroadcast(descriptor, {}),
              IsOkAndHolds(ElementsAre(1, 1)));
  EXPECT_THAT(ExpandShapeForBroadcast(descriptor, {1, 1, 10, 5}),
              IsOkAndHolds(ElementsAre(10, 5)));
}

TEST(ExpandShapeForBroadcastTest, SkipsScalarAxes) {
  auto descriptor = Translate({10, 5, 4, 2}, {Ellipsis{}, Index(0)});
  EXPECT_THAT(ExpandShapeForBroadcast(descriptor, {5, 4}),
              IsOkAndHolds(ElementsAre(1, 5, 4, 1)));
}

TEST(ExpandShapeForBroadcastTest, BlockSize) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto block, StridedBlock::Make(0, 4, 2, 2));
  auto descriptor = Translate({10}, {block});
  EXPECT_THAT(ExpandShapeForBroadcast(descriptor, {2}),
              IsOkAndHolds(ElementsAre(2)));
  EXPECT_THAT(ExpandShapeForBroadcast(descriptor, {4}),
              IsOkAndHolds(ElementsAre(4)));
}

TEST(ExpandShapeForBroadcastTest, Incompatible) {
  auto descriptor = Translate({10, 5}, {});
  EXPECT_THAT(ExpandShapeForBroadcast(descriptor, {3}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Can't broadcast \\{3\\} -> \\{10, 5\\}"));
  EXPECT_THAT(ExpandShapeForBroadcast(descriptor, {2, 10, 5}),
              MatchesSelectionError(SelectionErrorKind::kBroadcastIncompatible));
}

TEST(BroadcastHyperslabTest, Rows) {
  const Shape shape{10, 5};
  auto descriptor = Translate(shape, {});
  auto dataspace = MakeDataspace(shape, descriptor);
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto sequence, BroadcastHyperslab(dataspace.get(), descriptor, {5}));
  EXPECT_EQ(10, sequence.size());
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto chunks, CollectChunks(sequence));
  ASSERT_EQ(10, chunks.size());
  for (Index i = 0; i < 10; ++i) {
    EXPECT_THAT(chunks[i],
                ElementsAre(Coordinates{i, 0}, Coordinates{i, 1},
                            Coordinates{i, 2}, Coordinates{i, 3},
                            Coordinates{i, 4}));
  }
  // The selection itself is unchanged.
  EXPECT_EQ(50, dataspace->GetSelectedCoordinates().size());
}

TEST(BroadcastHyperslabTest, SingleChunk) {
  const Shape shape{4, 3};
  auto descriptor = Translate(shape, {Slice{1, 3, std::nullopt}});
  auto dataspace = MakeDataspace(shape, descriptor);
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto sequence, BroadcastHyperslab(dataspace.get(), descriptor, {2, 3}));
  EXPECT_EQ(1, sequence.size());
  EXPECT_THAT(sequence.Next(),
              IsOkAndHolds(static_cast<const Dataspace*>(dataspace.get())));
  EXPECT_THAT(sequence.Next(),
              IsOkAndHolds(static_cast<const Dataspace*>(nullptr)));
}

TEST(BroadcastHyperslabTest, Strided) {
  const Shape shape{10};
  auto descriptor =
      Translate(shape, {Slice{std::nullopt, std::nullopt, 2}});
  auto dataspace = MakeDataspace(shape, descriptor);
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto sequence, BroadcastHyperslab(dataspace.get(), descriptor, {1}));
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto chunks, CollectChunks(sequence));
  EXPECT_THAT(chunks, ElementsAre(ElementsAre(Coordinates{0}),
                                  ElementsAre(Coordinates{2}),
                                  ElementsAre(Coordinates{4}),
                                  ElementsAre(Coordinates{6}),
                                  ElementsAre(Coordinates{8})));
}

TEST(BroadcastHyperslabTest, StridedFullAxisChunk) {
  // The strided axis is covered by each chunk, so its stride is retained.
  const Shape shape{3, 6};
  auto descriptor =
      Translate(shape, {Slice{}, Slice{1, std::nullopt, 2}});
  auto dataspace = MakeDataspace(shape, descriptor);
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto sequence, BroadcastHyperslab(dataspace.get(), descriptor, {3}));
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto chunks, CollectChunks(sequence));
  ASSERT_EQ(3, chunks.size());
  EXPECT_THAT(chunks[0],
              ElementsAre(Coordinates{0, 1}, Coordinates{0, 3},
                          Coordinates{0, 5}));
  EXPECT_THAT(chunks[2],
              ElementsAre(Coordinates{2, 1}, Coordinates{2, 3},
                          Coordinates{2, 5}));
}

TEST(BroadcastHyperslabTest, Blocks) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto block, StridedBlock::Make(1, 4, 2, 2));
  const Shape shape{10};
  auto descriptor = Translate(shape, {block});
  auto dataspace = MakeDataspace(shape, descriptor);
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto sequence, BroadcastHyperslab(dataspace.get(), descriptor, {2}));
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto chunks, CollectChunks(sequence));
  EXPECT_THAT(chunks,
              ElementsAre(ElementsAre(Coordinates{1}, Coordinates{2}),
                          ElementsAre(Coordinates{5}, Coordinates{6})));
}

TEST(BroadcastHyperslabTest, ScalarAxis) {
  const Shape shape{3, 4, 2};
  auto descriptor = Translate(shape, {Ellipsis{}, Index(1)});
  auto dataspace = MakeDataspace(shape, descriptor);
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto sequence, BroadcastHyperslab(dataspace.get(), descriptor, {4}));
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto chunks, CollectChunks(sequence));
  ASSERT_EQ(3, chunks.size());
  EXPECT_THAT(chunks[1],
              ElementsAre(Coordinates{1, 0, 1}, Coordinates{1, 1, 1},
                          Coordinates{1, 2, 1}, Coordinates{1, 3, 1}));
}

TEST(BroadcastHyperslabTest, EmptySelection) {
  const Shape shape{10};
  auto descriptor = Translate(shape, {Slice{3, 3, std::nullopt}});
  auto dataspace = MakeDataspace(shape, descriptor);
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto sequence, BroadcastHyperslab(dataspace.get(), descriptor, {1}));
  EXPECT_EQ(0, sequence.size());
  EXPECT_THAT(sequence.Next(),
              IsOkAndHolds(static_cast<const Dataspace*>(nullptr)));
}

TEST(BroadcastHyperslabTest, Incompatible) {
  const Shape shape{10, 5};
  auto descriptor = Translate(shape, {});
  auto dataspace = MakeDataspace(shape, descriptor);
  EXPECT_THAT(BroadcastHyperslab(dataspace.get(), descriptor, {4}),
              MatchesSelectionError(SelectionErrorKind::kBroadcastIncompatible));
}

}  // namespace
