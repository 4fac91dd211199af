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

#ifndef HYPERSLAB_SELECT_H_
#define HYPERSLAB_SELECT_H_

#include "hyperslab/dataspace.h"
#include "hyperslab/index.h"
#include "hyperslab/index_expression.h"
#include "hyperslab/selection.h"
#include "hyperslab/util/result.h"
#include "hyperslab/util/span.h"

namespace hyperslab {

/// Computes the selection denoted by `args` over an extent of `shape`.
///
/// The kind of selection is determined from the arguments:
///
/// - A single `ExistingSelection` is adopted (as a copy), and a single
///   `RegionReference` is resolved by `handle`; both yield a
///   `PassThroughSelection`.
/// - A single `BooleanMask` of the same shape as the extent yields a
///   `PointSelection`.
/// - Otherwise, if any argument is not an integer, slice, strided block or
///   ellipsis, the result is a `FancySelection`.
/// - Otherwise, the result is a `SimpleSelection`.
///
/// New selections obtain their dataspace from `handle.CreateDataspace`.
///
/// \param shape The extent of the dataset being indexed.
/// \param args The index arguments, in axis order.
/// \param handle Supplies dataspaces and resolves region references.
/// \error `absl::StatusCode::kInvalidArgument` (`ShapeMismatch`) if an adopted
///     selection or a referenced region is defined over a different extent.
/// \error Any error returned by `Apply` for the chosen kind of selection.
Result<Selection> Select(span<const Index> shape,
                         span<const IndexExpression> args,
                         const DatasetHandle& handle);

}  // namespace hyperslab

#endif  // HYPERSLAB_SELECT_H_
