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

#include "hyperslab/selection.h"

#include <ostream>
#include <variant>

namespace hyperslab {

std::ostream& operator<<(std::ostream& os, SelectionKind kind) {
  switch (kind) {
    case SelectionKind::kSimple:
      return os << "simple";
    case SelectionKind::kFancy:
      return os << "fancy";
    case SelectionKind::kPoint:
      return os << "point";
    case SelectionKind::kPassThrough:
      return os << "pass-through";
  }
  return os;
}

const Shape& GetShape(const Selection& selection) {
  return std::visit([](const auto& s) -> const Shape& { return s.shape(); },
                    selection);
}

Index GetNumSelected(const Selection& selection) {
  return std::visit([](const auto& s) { return s.nselect(); }, selection);
}

Shape GetMShape(const Selection& selection) {
  return std::visit([](const auto& s) { return Shape(s.mshape()); },
                    selection);
}

Shape GetArrayShape(const Selection& selection) {
  return std::visit([](const auto& s) { return Shape(s.array_shape()); },
                    selection);
}

const Dataspace& GetDataspace(const Selection& selection) {
  return std::visit(
      [](const auto& s) -> const Dataspace& { return s.dataspace(); },
      selection);
}

absl::Status Apply(Selection& selection, span<const IndexExpression> args) {
  return std::visit([&](auto& s) { return s.Apply(args); }, selection);
}

Result<Shape> ExpandShape(const Selection& selection,
                          span<const Index> source_shape) {
  return std::visit([&](const auto& s) { return s.ExpandShape(source_shape); },
                    selection);
}

Result<BroadcastSequence> Broadcast(const Selection& selection,
                                    span<const Index> source_shape) {
  return std::visit([&](const auto& s) { return s.Broadcast(source_shape); },
                    selection);
}

}  // namespace hyperslab
