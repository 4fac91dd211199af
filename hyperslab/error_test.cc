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

#include "hyperslab/error.h"

#include <optional>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "hyperslab/util/status.h"
#include "hyperslab/util/status_testutil.h"
#include "hyperslab/util/str_cat.h"

namespace {

using ::hyperslab::GetSelectionErrorKind;
using ::hyperslab::MatchesSelectionError;
using ::hyperslab::MatchesStatus;
using ::hyperslab::MaybeAnnotateStatus;
using ::hyperslab::SelectionError;
using ::hyperslab::SelectionErrorCode;
using ::hyperslab::SelectionErrorKind;
using ::hyperslab::StrCat;

TEST(SelectionErrorTest, Codes) {
  EXPECT_EQ(absl::StatusCode::kOutOfRange,
            SelectionErrorCode(SelectionErrorKind::kIndexOutOfRange));
  EXPECT_EQ(absl::StatusCode::kUnimplemented,
            SelectionErrorCode(SelectionErrorKind::kUnsupportedSelectionMode));
  EXPECT_EQ(absl::StatusCode::kInvalidArgument,
            SelectionErrorCode(SelectionErrorKind::kTooManyEllipses));
  EXPECT_EQ(absl::StatusCode::kInvalidArgument,
            SelectionErrorCode(SelectionErrorKind::kBroadcastIncompatible));
}

TEST(SelectionErrorTest, KindRoundTrip) {
  for (auto kind : {SelectionErrorKind::kShapeMismatch,
                    SelectionErrorKind::kInvalidIndexType,
                    SelectionErrorKind::kIndexOutOfRange,
                    SelectionErrorKind::kInvalidSliceStep,
                    SelectionErrorKind::kInvalidMultiBlockParameters,
                    SelectionErrorKind::kTooManyEllipses,
                    SelectionErrorKind::kTooManyIndices,
                    SelectionErrorKind::kUnsupportedFancyCombination,
                    SelectionErrorKind::kNonMonotonicIndexSequence,
                    SelectionErrorKind::kLengthMismatch,
                    SelectionErrorKind::kBroadcastIncompatible,
                    SelectionErrorKind::kUnsupportedSelectionMode}) {
    SCOPED_TRACE(StrCat(kind));
    auto status = SelectionError(kind, "message");
    EXPECT_EQ(SelectionErrorCode(kind), status.code());
    EXPECT_EQ("message", status.message());
    EXPECT_EQ(kind, GetSelectionErrorKind(status));
  }
}

TEST(SelectionErrorTest, Names) {
  EXPECT_EQ("TooManyEllipses", StrCat(SelectionErrorKind::kTooManyEllipses));
  EXPECT_EQ("NonMonotonicIndexSequence",
            StrCat(SelectionErrorKind::kNonMonotonicIndexSequence));
}

TEST(SelectionErrorTest, KindSurvivesAnnotation) {
  auto status = MaybeAnnotateStatus(
      SelectionError(SelectionErrorKind::kInvalidSliceStep, "Step"),
      "Indexing axis 1");
  EXPECT_THAT(status, MatchesStatus(absl::StatusCode::kInvalidArgument,
                                    "Indexing axis 1: Step"));
  EXPECT_THAT(status,
              MatchesSelectionError(SelectionErrorKind::kInvalidSliceStep));
}

TEST(SelectionErrorTest, NoKind) {
  EXPECT_EQ(std::nullopt, GetSelectionErrorKind(absl::OkStatus()));
  EXPECT_EQ(std::nullopt,
            GetSelectionErrorKind(absl::InvalidArgumentError("other")));
}

}  // namespace
