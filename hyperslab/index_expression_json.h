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

#ifndef HYPERSLAB_INDEX_EXPRESSION_JSON_H_
#define HYPERSLAB_INDEX_EXPRESSION_JSON_H_

/// \file
/// JSON representation of index arguments.
///
/// Each index expression is represented as follows:
///
/// - Integer: a JSON integer, e.g. ``-1``.
/// - Ellipsis: the string ``"..."``.
/// - Slice: a string ``"start:stop"`` or ``"start:stop:step"`` with each part
///   optional (``":"`` selects the whole axis), or an object with optional
///   members ``"start"``, ``"stop"`` and ``"step"`` (each an integer or
///   ``null``).
/// - Strided block: an object with members ``"start"``, ``"stride"``,
///   ``"count"`` and ``"block"``, at least one of the last three present.
/// - Index list: an array of integers, e.g. ``[1, 3, 5]``.
/// - 1-D boolean mask: an array of booleans, e.g. ``[true, false]``.
/// - N-D boolean mask: an object ``{"mask": [[true, false], [false, true]]}``.
///
/// A sequence of index arguments is a JSON array of index expressions.  Any
/// other JSON value is treated as a single argument.

#include <vector>

#include <nlohmann/json.hpp>
#include "hyperslab/index.h"
#include "hyperslab/index_expression.h"
#include "hyperslab/util/result.h"

namespace hyperslab {

/// Parses a single index expression.
///
/// \error `absl::StatusCode::kInvalidArgument` (`InvalidIndexType`) if `j` is
///     not a valid representation.
/// \error `absl::StatusCode::kInvalidArgument` (`InvalidMultiBlockParameters`)
///     if a strided block has invalid parameters.
Result<IndexExpression> ParseIndexExpressionJson(const ::nlohmann::json& j);

/// Parses a sequence of index arguments.
Result<std::vector<IndexExpression>> ParseIndexArgumentsJson(
    const ::nlohmann::json& j);

/// Parses a shape, represented as an array of non-negative integers.
///
/// \error `absl::StatusCode::kInvalidArgument` if `j` is not a valid shape.
Result<Shape> ParseShapeJson(const ::nlohmann::json& j);

/// Returns the JSON representation of `x`.
///
/// \error `absl::StatusCode::kInvalidArgument` (`InvalidIndexType`) if `x` is
///     an existing selection or a region reference.
Result<::nlohmann::json> IndexExpressionToJson(const IndexExpression& x);

}  // namespace hyperslab

#endif  // HYPERSLAB_INDEX_EXPRESSION_JSON_H_
