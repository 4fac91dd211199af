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
#include <ostream>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/cord.h"

namespace hyperslab {
namespace {

constexpr SelectionErrorKind kAllKinds[] = {
    SelectionErrorKind::kShapeMismatch,
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
    SelectionErrorKind::kUnsupportedSelectionMode,
};

}  // namespace

std::string_view SelectionErrorKindName(SelectionErrorKind kind) {
  switch (kind) {
    case SelectionErrorKind::kShapeMismatch:
      return "ShapeMismatch";
    case SelectionErrorKind::kInvalidIndexType:
      return "InvalidIndexType";
    case SelectionErrorKind::kIndexOutOfRange:
      return "IndexOutOfRange";
    case SelectionErrorKind::kInvalidSliceStep:
      return "InvalidSliceStep";
    case SelectionErrorKind::kInvalidMultiBlockParameters:
      return "InvalidMultiBlockParameters";
    case SelectionErrorKind::kTooManyEllipses:
      return "TooManyEllipses";
    case SelectionErrorKind::kTooManyIndices:
      return "TooManyIndices";
    case SelectionErrorKind::kUnsupportedFancyCombination:
      return "UnsupportedFancyCombination";
    case SelectionErrorKind::kNonMonotonicIndexSequence:
      return "NonMonotonicIndexSequence";
    case SelectionErrorKind::kLengthMismatch:
      return "LengthMismatch";
    case SelectionErrorKind::kBroadcastIncompatible:
      return "BroadcastIncompatible";
    case SelectionErrorKind::kUnsupportedSelectionMode:
      return "UnsupportedSelectionMode";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, SelectionErrorKind kind) {
  return os << SelectionErrorKindName(kind);
}

absl::StatusCode SelectionErrorCode(SelectionErrorKind kind) {
  switch (kind) {
    case SelectionErrorKind::kIndexOutOfRange:
      return absl::StatusCode::kOutOfRange;
    case SelectionErrorKind::kUnsupportedSelectionMode:
      return absl::StatusCode::kUnimplemented;
    default:
      return absl::StatusCode::kInvalidArgument;
  }
}

absl::Status SelectionError(SelectionErrorKind kind, std::string_view message) {
  absl::Status status(SelectionErrorCode(kind), message);
  status.SetPayload(kSelectionErrorPayloadKey,
                    absl::Cord(SelectionErrorKindName(kind)));
  return status;
}

std::optional<SelectionErrorKind> GetSelectionErrorKind(
    const absl::Status& status) {
  if (status.ok()) return std::nullopt;
  auto payload = status.GetPayload(kSelectionErrorPayloadKey);
  if (!payload) return std::nullopt;
  const std::string name(*payload);
  for (SelectionErrorKind kind : kAllKinds) {
    if (SelectionErrorKindName(kind) == name) return kind;
  }
  return std::nullopt;
}

}  // namespace hyperslab
