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

#include "hyperslab/index_parser.h"

#include <algorithm>
#include <variant>
#include <vector>

#include "hyperslab/error.h"
#include "hyperslab/util/str_cat.h"

namespace hyperslab {

Result<std::vector<IndexExpression>> ExpandEllipsis(
    span<const IndexExpression> args, DimensionIndex rank) {
  const DimensionIndex num_ellipses =
      std::count_if(args.begin(), args.end(), [](const IndexExpression& arg) {
        return std::holds_alternative<Ellipsis>(arg);
      });
  if (num_ellipses > 1) {
    return SelectionError(SelectionErrorKind::kTooManyEllipses,
                          "Only one ellipsis may be used");
  }
  const DimensionIndex num_explicit = args.size() - num_ellipses;
  if (num_explicit > rank) {
    return SelectionError(
        SelectionErrorKind::kTooManyIndices,
        StrCat("Argument sequence too long: ", num_explicit,
               " indices specified for extent of rank ", rank));
  }
  const DimensionIndex num_fill = rank - num_explicit;

  std::vector<IndexExpression> expanded;
  expanded.reserve(rank);
  bool filled = false;
  for (const auto& arg : args) {
    if (std::holds_alternative<Ellipsis>(arg)) {
      expanded.insert(expanded.end(), static_cast<size_t>(num_fill), Slice{});
      filled = true;
    } else {
      expanded.push_back(arg);
    }
  }
  // An implicit trailing ellipsis.
  if (!filled) {
    expanded.insert(expanded.end(), static_cast<size_t>(num_fill), Slice{});
  }
  return expanded;
}

}  // namespace hyperslab
