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

#include "hyperslab/select.h"

#include <algorithm>
#include <memory>
#include <utility>
#include <variant>

#include "absl/base/attributes.h"
#include "absl/log/absl_log.h"
#include "hyperslab/error.h"
#include "hyperslab/internal/log/verbose_flag.h"
#include "hyperslab/util/status.h"
#include "hyperslab/util/str_cat.h"

namespace hyperslab {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag select_logging("hyperslab_select");

absl::Status ValidateAdoptedShape(span<const Index> shape,
                                  const Dataspace& dataspace,
                                  const char* what) {
  const Shape adopted_shape = dataspace.shape();
  if (span<const Index>(adopted_shape) != shape) {
    return SelectionError(SelectionErrorKind::kShapeMismatch,
                          StrCat(what, " shape ", adopted_shape,
                                 " does not match dataset shape ", shape));
  }
  return absl::OkStatus();
}

Result<Selection> AdoptDataspace(span<const Index> shape,
                                 std::unique_ptr<Dataspace> dataspace,
                                 const char* what) {
  HYPERSLAB_RETURN_IF_ERROR(ValidateAdoptedShape(shape, *dataspace, what));
  HYPERSLAB_ASSIGN_OR_RETURN(auto selection,
                             PassThroughSelection::Make(std::move(dataspace)));
  return Selection(std::move(selection));
}

template <typename SelectionType>
Result<Selection> ApplyNew(span<const Index> shape,
                           span<const IndexExpression> args,
                           const DatasetHandle& handle) {
  HYPERSLAB_ASSIGN_OR_RETURN(auto dataspace, handle.CreateDataspace(shape));
  HYPERSLAB_ASSIGN_OR_RETURN(auto selection,
                             SelectionType::Make(std::move(dataspace)));
  HYPERSLAB_RETURN_IF_ERROR(selection.Apply(args));
  return Selection(std::move(selection));
}

}  // namespace

Result<Selection> Select(span<const Index> shape,
                         span<const IndexExpression> args,
                         const DatasetHandle& handle) {
  ABSL_LOG_IF(INFO, select_logging)
      << "Select " << StrCat(args) << " on extent " << StrCat(shape);
  if (args.size() == 1) {
    const auto& arg = args[0];
    if (auto* existing = std::get_if<ExistingSelection>(&arg)) {
      if (!existing->region) {
        return SelectionError(SelectionErrorKind::kInvalidIndexType,
                              "Existing selection has no dataspace");
      }
      HYPERSLAB_ASSIGN_OR_RETURN(auto copy, existing->region->Copy());
      return AdoptDataspace(shape, std::move(copy), "Selection");
    }
    if (auto* reference = std::get_if<RegionReference>(&arg)) {
      HYPERSLAB_ASSIGN_OR_RETURN(auto region, handle.ResolveRegion(*reference));
      return AdoptDataspace(shape, std::move(region), "Reference");
    }
    if (auto* mask = std::get_if<BooleanMask>(&arg)) {
      if (span<const Index>(mask->shape()) == shape) {
        return ApplyNew<PointSelection>(shape, args, handle);
      }
    }
  }
  if (!std::all_of(args.begin(), args.end(), IsSimpleIndexExpression)) {
    return ApplyNew<FancySelection>(shape, args, handle);
  }
  return ApplyNew<SimpleSelection>(shape, args, handle);
}

}  // namespace hyperslab
