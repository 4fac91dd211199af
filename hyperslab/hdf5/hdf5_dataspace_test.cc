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

#include "hyperslab/hdf5/hdf5_dataspace.h"

#include <hdf5.h>

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "hyperslab/dataspace.h"
#include "hyperslab/error.h"
#include "hyperslab/index.h"
#include "hyperslab/index_expression.h"
#include "hyperslab/select.h"
#include "hyperslab/selection.h"
#include "hyperslab/shape_inference.h"
#include "hyperslab/util/status_testutil.h"
#include "hyperslab/util/str_cat.h"

namespace {

using ::hyperslab::BooleanMask;
using ::hyperslab::Dataspace;
using ::hyperslab::ExtentClass;
using ::hyperslab::GetDataspace;
using ::hyperslab::GetNumSelected;
using ::hyperslab::GetSelectionKind;
using ::hyperslab::GuessShape;
using ::hyperslab::Hdf5DatasetHandle;
using ::hyperslab::Hdf5Dataspace;
using ::hyperslab::HyperslabOp;
using ::hyperslab::Index;
using ::hyperslab::IndexExpression;
using ::hyperslab::IndexList;
using ::hyperslab::IsOkAndHolds;
using ::hyperslab::MatchesStatus;
using ::hyperslab::PointsOp;
using ::hyperslab::RegionReference;
using ::hyperslab::Select;
using ::hyperslab::SelectionKind;
using ::hyperslab::SelectType;
using ::hyperslab::Shape;
using ::hyperslab::Slice;
using ::hyperslab::StrCat;
using ::testing::ElementsAre;
using ::testing::Optional;

class Hdf5DataspaceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
    path_ = ::testing::TempDir() + "/hyperslab_hdf5_dataspace_test.h5";
    file_ = H5Fcreate(path_.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    ASSERT_GE(file_, 0);
  }

  void TearDown() override {
    if (dataset_ >= 0) H5Dclose(dataset_);
    if (file_ >= 0) H5Fclose(file_);
    std::remove(path_.c_str());
  }

  // Creates the integer dataset "data" of the specified shape.
  void CreateDataset(const std::vector<hsize_t>& dims) {
    hid_t space = H5Screate_simple(dims.size(), dims.data(), nullptr);
    ASSERT_GE(space, 0);
    dataset_ = H5Dcreate2(file_, "data", H5T_NATIVE_INT, space, H5P_DEFAULT,
                          H5P_DEFAULT, H5P_DEFAULT);
    H5Sclose(space);
    ASSERT_GE(dataset_, 0);
  }

  std::string path_;
  hid_t file_ = H5I_INVALID_HID;
  hid_t dataset_ = H5I_INVALID_HID;
};

TEST_F(Hdf5DataspaceTest, Create) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto dataspace, Hdf5Dataspace::Create({10, 5}));
  EXPECT_EQ(ExtentClass::kSimple, dataspace->extent_class());
  EXPECT_THAT(dataspace->shape(), ElementsAre(10, 5));
  EXPECT_EQ(SelectType::kAll, dataspace->select_type());
  EXPECT_THAT(dataspace->GetSelectNpoints(), IsOkAndHolds(50));
}

TEST_F(Hdf5DataspaceTest, Scalar) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto dataspace, Hdf5Dataspace::Create({}));
  EXPECT_EQ(ExtentClass::kScalar, dataspace->extent_class());
  EXPECT_THAT(dataspace->shape(), ElementsAre());
  EXPECT_THAT(dataspace->GetSelectNpoints(), IsOkAndHolds(1));
  EXPECT_THAT(GuessShape(*dataspace), IsOkAndHolds(Optional(ElementsAre())));
}

TEST_F(Hdf5DataspaceTest, HyperslabAndBounds) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto dataspace, Hdf5Dataspace::Create({8, 8}));
  HYPERSLAB_ASSERT_OK(dataspace->SelectHyperslab(HyperslabOp::kSet, {1, 2},
                                                 {3, 2}, {2, 3}, {1, 2}));
  EXPECT_EQ(SelectType::kHyperslabs, dataspace->select_type());
  EXPECT_THAT(dataspace->GetSelectNpoints(), IsOkAndHolds(12));
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto bounds, dataspace->GetSelectBounds());
  EXPECT_EQ("[{1, 2}, {5, 6}]", StrCat(bounds));
  EXPECT_THAT(GuessShape(*dataspace),
              IsOkAndHolds(Optional(ElementsAre(3, 4))));

  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto copy, dataspace->Copy());
  HYPERSLAB_ASSERT_OK(copy->OffsetSimple({2, 1}));
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(bounds, copy->GetSelectBounds());
  EXPECT_EQ("[{3, 3}, {7, 7}]", StrCat(bounds));
  EXPECT_THAT(copy->SelectValid(), IsOkAndHolds(true));
  HYPERSLAB_ASSERT_OK(copy->OffsetSimple({3, 0}));
  EXPECT_THAT(copy->SelectValid(), IsOkAndHolds(false));
}

TEST_F(Hdf5DataspaceTest, Points) {
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto dataspace, Hdf5Dataspace::Create({4, 4}));
  HYPERSLAB_ASSERT_OK(dataspace->SelectElements(PointsOp::kSet, {0, 1, 2, 3}));
  HYPERSLAB_ASSERT_OK(dataspace->SelectElements(PointsOp::kAppend, {3, 3}));
  EXPECT_EQ(SelectType::kPoints, dataspace->select_type());
  EXPECT_THAT(dataspace->GetSelectNpoints(), IsOkAndHolds(3));
  EXPECT_THAT(dataspace->SelectElements(PointsOp::kSet, {1}),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
}

TEST_F(Hdf5DataspaceTest, SelectSimple) {
  Hdf5DatasetHandle handle;
  const Shape shape{10, 20};
  std::vector<IndexExpression> args{Index(2), Slice{}};
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto selection, Select(shape, args, handle));
  EXPECT_EQ(SelectionKind::kSimple, GetSelectionKind(selection));
  EXPECT_EQ(20, GetNumSelected(selection));
  EXPECT_THAT(GuessShape(GetDataspace(selection)),
              IsOkAndHolds(Optional(ElementsAre(1, 20))));
}

TEST_F(Hdf5DataspaceTest, SelectFancy) {
  Hdf5DatasetHandle handle;
  const Shape shape{10, 10};
  std::vector<IndexExpression> args{IndexList{{1, 3, 5}}, Slice{}};
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto selection, Select(shape, args, handle));
  EXPECT_EQ(SelectionKind::kFancy, GetSelectionKind(selection));
  EXPECT_EQ(30, GetNumSelected(selection));
  EXPECT_THAT(GuessShape(GetDataspace(selection)),
              IsOkAndHolds(Optional(ElementsAre(3, 10))));

  std::vector<IndexExpression> empty{IndexList{}, Slice{}};
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto empty_selection,
                                 Select(shape, empty, handle));
  EXPECT_EQ(0, GetNumSelected(empty_selection));
}

TEST_F(Hdf5DataspaceTest, SelectPoints) {
  Hdf5DatasetHandle handle;
  const Shape shape{2, 3};
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(
      auto mask,
      BooleanMask::Make({2, 3}, {true, false, false, false, true, true}));
  std::vector<IndexExpression> args{mask};
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto selection, Select(shape, args, handle));
  EXPECT_EQ(SelectionKind::kPoint, GetSelectionKind(selection));
  EXPECT_EQ(3, GetNumSelected(selection));
  EXPECT_THAT(GuessShape(GetDataspace(selection)),
              IsOkAndHolds(Optional(ElementsAre(3))));
}

TEST_F(Hdf5DataspaceTest, Broadcast) {
  Hdf5DatasetHandle handle;
  const Shape shape{10, 5};
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto selection, Select(shape, {}, handle));
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto sequence,
                                 hyperslab::Broadcast(selection, {5}));
  ASSERT_EQ(10, sequence.size());
  for (Index i = 0; i < 10; ++i) {
    HYPERSLAB_ASSERT_OK_AND_ASSIGN(const Dataspace* chunk, sequence.Next());
    ASSERT_NE(nullptr, chunk);
    EXPECT_THAT(chunk->GetSelectNpoints(), IsOkAndHolds(5));
    HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto bounds, chunk->GetSelectBounds());
    EXPECT_EQ(StrCat("[{", i, ", 0}, {", i, ", 4}]"), StrCat(bounds));
  }
  EXPECT_THAT(sequence.Next(),
              IsOkAndHolds(static_cast<const Dataspace*>(nullptr)));
}

TEST_F(Hdf5DataspaceTest, RegionReference) {
  ASSERT_NO_FATAL_FAILURE(CreateDataset({8}));
  Hdf5Dataspace region(H5Dget_space(dataset_));
  HYPERSLAB_ASSERT_OK(
      region.SelectHyperslab(HyperslabOp::kSet, {1}, {3}, {2}, {1}));
  RegionReference reference;
  reference.data.resize(H5R_DSET_REG_REF_BUF_SIZE);
  ASSERT_GE(H5Rcreate(reference.data.data(), file_, "data",
                      H5R_DATASET_REGION, region.id()),
            0);

  Hdf5DatasetHandle handle(dataset_);
  std::vector<IndexExpression> args{reference};
  HYPERSLAB_ASSERT_OK_AND_ASSIGN(auto selection, Select({8}, args, handle));
  EXPECT_EQ(SelectionKind::kPassThrough, GetSelectionKind(selection));
  EXPECT_EQ(3, GetNumSelected(selection));

  EXPECT_THAT(handle.ResolveRegion(RegionReference{{1, 2}}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Region reference must have .* bytes, but has 2"));
  EXPECT_THAT(Hdf5DatasetHandle().ResolveRegion(reference),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Cannot resolve a region reference without a "
                            "dataset"));
}

}  // namespace
