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

#ifndef HYPERSLAB_INDEX_PARSER_H_
#define HYPERSLAB_INDEX_PARSER_H_

#include <vector>

#include "hyperslab/index.h"
#include "hyperslab/index_expression.h"
#include "hyperslab/util/result.h"
#include "hyperslab/util/span.h"

namespace hyperslab {

/// Normalizes `args` to exactly `rank` entries by expanding the ellipsis.
///
/// If `args` contains no ellipsis and its length differs from `rank`, an
/// ellipsis is implicitly appended.  The ellipsis is then replaced by as many
/// full-range slices as are needed to bring the total to `rank`; it expands to
/// nothing if the other arguments already fill the rank.
///
/// \param args The index arguments, in axis order.
/// \param rank The rank of the indexed extent.
/// \returns The expanded arguments, of length `rank`.
/// \error `absl::StatusCode::kInvalidArgument` (`TooManyEllipses`) if `args`
///     contains more than one ellipsis.
/// \error `absl::StatusCode::kInvalidArgument` (`TooManyIndices`) if `args`
///     contains more than `rank` entries other than the ellipsis.
Result<std::vector<IndexExpression>> ExpandEllipsis(
    span<const IndexExpression> args, DimensionIndex rank);

}  // namespace hyperslab

#endif  // HYPERSLAB_INDEX_PARSER_H_
