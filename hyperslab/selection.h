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

#ifndef HYPERSLAB_SELECTION_H_
#define HYPERSLAB_SELECTION_H_

/// \file
/// Closed set of selection kinds.
///
/// Every kind provides `shape()`, `nselect()`, `mshape()`, `array_shape()`,
/// `dataspace()`, `Apply(args)`, `ExpandShape(source_shape)` and
/// `Broadcast(source_shape)`; the free functions below dispatch to them.

#include <iosfwd>
#include <variant>

#include "absl/status/status.h"
#include "hyperslab/broadcast.h"
#include "hyperslab/dataspace.h"
#include "hyperslab/fancy_selection.h"
#include "hyperslab/index.h"
#include "hyperslab/index_expression.h"
#include "hyperslab/pass_through_selection.h"
#include "hyperslab/point_selection.h"
#include "hyperslab/simple_selection.h"
#include "hyperslab/util/result.h"
#include "hyperslab/util/span.h"

namespace hyperslab {

using Selection = std::variant<SimpleSelection, FancySelection, PointSelection,
                               PassThroughSelection>;

/// Identifies the alternative held by a `Selection`, in declaration order.
enum class SelectionKind {
  kSimple,
  kFancy,
  kPoint,
  kPassThrough,
};

std::ostream& operator<<(std::ostream& os, SelectionKind kind);

inline SelectionKind GetSelectionKind(const Selection& selection) {
  return static_cast<SelectionKind>(selection.index());
}

/// Returns the extent over which `selection` is defined.
const Shape& GetShape(const Selection& selection);

/// Returns the number of selected elements.
Index GetNumSelected(const Selection& selection);

/// Returns the shape of the selected region, including integer-indexed axes.
Shape GetMShape(const Selection& selection);

/// Returns the shape a companion array must have or broadcast to.
Shape GetArrayShape(const Selection& selection);

/// Returns the dataspace holding the committed selection.
const Dataspace& GetDataspace(const Selection& selection);

/// Replaces the committed selection of `selection` with `args`.
absl::Status Apply(Selection& selection, span<const IndexExpression> args);

/// Returns the shape `source_shape` is matched to, axis by axis, when
/// transferring to or from `selection`.
Result<Shape> ExpandShape(const Selection& selection,
                          span<const Index> source_shape);

/// Returns the sequence of dataspaces to transfer a source array of shape
/// `source_shape` to or from.  The sequence borrows `selection`.
Result<BroadcastSequence> Broadcast(const Selection& selection,
                                    span<const Index> source_shape);

}  // namespace hyperslab

#endif  // HYPERSLAB_SELECTION_H_
