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

#ifndef HYPERSLAB_SHAPE_INFERENCE_H_
#define HYPERSLAB_SHAPE_INFERENCE_H_

#include <optional>

#include "hyperslab/dataspace.h"
#include "hyperslab/index.h"
#include "hyperslab/util/result.h"

namespace hyperslab {

/// Deduces the shape of the selection committed to `dataspace` by querying
/// it.
///
/// - A null extent, and a scalar extent with nothing selected, have no shape
///   (`std::nullopt`).  A scalar extent with everything selected has shape
///   ``{}``.
/// - If nothing is selected, the shape is all zeros, of the rank of the
///   extent.  If everything is selected, the shape is the extent.
/// - Point selections have shape ``{N}``, where ``N`` is the number of
///   selected points.
/// - For hyperslab selections, the number of elements selected along each
///   axis is computed separately.  If the product of these counts is not
///   ``N``, the selection is not a single regular hyperslab and the shape
///   ``{N}`` is returned.
///
/// \error `absl::StatusCode::kUnimplemented` (`UnsupportedSelectionMode`) if
///     the extent class or selection type is not recognized.
Result<std::optional<Shape>> GuessShape(const Dataspace& dataspace);

}  // namespace hyperslab

#endif  // HYPERSLAB_SHAPE_INFERENCE_H_
