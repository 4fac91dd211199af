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

#ifndef HYPERSLAB_ERROR_H_
#define HYPERSLAB_ERROR_H_

/// \file
/// Error kinds reported by the selection layer.
///
/// Every error is an `absl::Status` with a canonical status code.  The kind is
/// additionally attached as a payload so that callers can distinguish, for
/// example, a bad slice step from a bad strided block even though both are
/// `absl::StatusCode::kInvalidArgument`.

#include <iosfwd>
#include <optional>
#include <string_view>

#include "absl/status/status.h"

namespace hyperslab {

enum class SelectionErrorKind {
  /// Adopted region's shape differs from the target shape.
  kShapeMismatch,
  /// Argument is not one of the supported index expression kinds.
  kInvalidIndexType,
  /// Integer index outside `[-length, length)`.
  kIndexOutOfRange,
  /// Slice step `< 1`.
  kInvalidSliceStep,
  /// Strided block parameters are invalid or do not fit the axis.
  kInvalidMultiBlockParameters,
  /// More than one ellipsis.
  kTooManyEllipses,
  /// More explicit entries than the rank.
  kTooManyIndices,
  /// Zero, or more than one, sequence axis in a union selection.
  kUnsupportedFancyCombination,
  /// Sequence values are not strictly increasing.
  kNonMonotonicIndexSequence,
  /// Sequences that must agree in length do not.
  kLengthMismatch,
  /// Source shape cannot be broadcast to the selection.
  kBroadcastIncompatible,
  /// Descriptor reports an extent class or selection type that is not
  /// recognized.
  kUnsupportedSelectionMode,
};

/// Payload key under which the error kind name is recorded.
constexpr char kSelectionErrorPayloadKey[] = "hyperslab/selection_error";

/// Returns the name of `kind`, e.g. `"TooManyEllipses"`.
std::string_view SelectionErrorKindName(SelectionErrorKind kind);

std::ostream& operator<<(std::ostream& os, SelectionErrorKind kind);

/// Returns the canonical status code used for `kind`.
absl::StatusCode SelectionErrorCode(SelectionErrorKind kind);

/// Returns an error status of kind `kind` with the specified message.
absl::Status SelectionError(SelectionErrorKind kind, std::string_view message);

/// Returns the error kind recorded in `status`, or `std::nullopt` if `status`
/// is ok or did not originate from this library.
std::optional<SelectionErrorKind> GetSelectionErrorKind(
    const absl::Status& status);

}  // namespace hyperslab

#endif  // HYPERSLAB_ERROR_H_
