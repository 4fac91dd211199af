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

/// \file
/// Prints the selection computed for an index expression.
///
/// Example:
///
///     hyperslab_select --shape='[10, 5]' --index='[[1, 3], ":"]'
///     hyperslab_select --shape='[10, 5]' --index='":"' --source_shape='[5]'

#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include <nlohmann/json.hpp>
#include "hyperslab/dataspace.h"
#include "hyperslab/hdf5/hdf5_dataspace.h"
#include "hyperslab/index_expression.h"
#include "hyperslab/index_expression_json.h"
#include "hyperslab/select.h"
#include "hyperslab/selection.h"
#include "hyperslab/shape_inference.h"
#include "hyperslab/util/json_absl_flag.h"
#include "hyperslab/util/result.h"
#include "hyperslab/util/status.h"
#include "hyperslab/util/str_cat.h"

ABSL_FLAG(hyperslab::JsonAbslFlag, shape, {},
          "Shape of the dataset, as a JSON array of non-negative integers.");

ABSL_FLAG(hyperslab::JsonAbslFlag, index, {},
          "Index arguments as JSON.  An array is a sequence of arguments; "
          "any other value is a single argument.  Defaults to no arguments.");

ABSL_FLAG(hyperslab::JsonAbslFlag, source_shape, {},
          "Optional shape of a source array to broadcast to the selection.");

namespace hyperslab {
namespace {

absl::Status PrintBounds(std::ostream& out, const char* label,
                         const Dataspace& dataspace) {
  HYPERSLAB_ASSIGN_OR_RETURN(const Index nselect,
                             dataspace.GetSelectNpoints());
  out << label;
  if (nselect == 0) {
    out << "none\n";
    return absl::OkStatus();
  }
  HYPERSLAB_ASSIGN_OR_RETURN(auto bounds, dataspace.GetSelectBounds());
  out << bounds << "\n";
  return absl::OkStatus();
}

absl::Status Run(std::ostream& out) {
  const auto shape_json = absl::GetFlag(FLAGS_shape).value;
  if (shape_json.is_discarded()) {
    return absl::InvalidArgumentError("--shape must be specified");
  }
  HYPERSLAB_ASSIGN_OR_RETURN(auto shape, ParseShapeJson(shape_json),
                             MaybeAnnotateStatus(_, "Invalid --shape"));

  std::vector<IndexExpression> args;
  if (const auto index_json = absl::GetFlag(FLAGS_index).value;
      !index_json.is_discarded()) {
    HYPERSLAB_ASSIGN_OR_RETURN(args, ParseIndexArgumentsJson(index_json),
                               MaybeAnnotateStatus(_, "Invalid --index"));
  }

  Hdf5DatasetHandle handle;
  HYPERSLAB_ASSIGN_OR_RETURN(auto selection, Select(shape, args, handle));
  const Dataspace& dataspace = GetDataspace(selection);

  out << "kind: " << GetSelectionKind(selection) << "\n";
  out << "mshape: " << StrCat(GetMShape(selection)) << "\n";
  out << "array_shape: " << StrCat(GetArrayShape(selection)) << "\n";
  out << "nselect: " << GetNumSelected(selection) << "\n";
  HYPERSLAB_RETURN_IF_ERROR(PrintBounds(out, "bounds: ", dataspace));
  HYPERSLAB_ASSIGN_OR_RETURN(auto guessed_shape, GuessShape(dataspace));
  out << "guessed_shape: "
      << (guessed_shape ? StrCat(*guessed_shape) : std::string("none"))
      << "\n";

  const auto source_json = absl::GetFlag(FLAGS_source_shape).value;
  if (source_json.is_discarded()) return absl::OkStatus();
  HYPERSLAB_ASSIGN_OR_RETURN(
      auto source_shape, ParseShapeJson(source_json),
      MaybeAnnotateStatus(_, "Invalid --source_shape"));
  HYPERSLAB_ASSIGN_OR_RETURN(auto chunk_shape,
                             ExpandShape(selection, source_shape));
  HYPERSLAB_ASSIGN_OR_RETURN(auto chunks, Broadcast(selection, source_shape));
  out << "chunk_shape: " << StrCat(chunk_shape) << "\n";
  out << "chunks: " << chunks.size() << "\n";
  for (Index i = 0;; ++i) {
    HYPERSLAB_ASSIGN_OR_RETURN(const Dataspace* chunk, chunks.Next());
    if (!chunk) break;
    HYPERSLAB_RETURN_IF_ERROR(
        PrintBounds(out, StrCat("  chunk ", i, ": ").c_str(), *chunk));
  }
  return absl::OkStatus();
}

}  // namespace
}  // namespace hyperslab

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(
      "Prints the selection computed for an index expression over a shape.");
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  if (auto status = hyperslab::Run(std::cout); !status.ok()) {
    std::cerr << status << std::endl;
    return 1;
  }
  return 0;
}
