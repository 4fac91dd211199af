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

#include "hyperslab/index_expression_json.h"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include <nlohmann/json.hpp>
#include "hyperslab/error.h"
#include "hyperslab/strided_block.h"
#include "hyperslab/util/status.h"
#include "hyperslab/util/str_cat.h"

namespace hyperslab {
namespace {

using ::nlohmann::json;

absl::Status ExpectedError(const json& j, std::string_view type_name) {
  return SelectionError(
      SelectionErrorKind::kInvalidIndexType,
      StrCat("Expected ", type_name, ", but received: ", j.dump()));
}

std::optional<Index> JsonToIndex(const json& j) {
  if (j.is_number_unsigned()) {
    const auto value = j.get<uint64_t>();
    if (value > static_cast<uint64_t>(std::numeric_limits<Index>::max())) {
      return std::nullopt;
    }
    return static_cast<Index>(value);
  }
  if (j.is_number_integer()) return j.get<int64_t>();
  return std::nullopt;
}

Result<std::optional<Index>> GetOptionalIndexMember(const json& object,
                                                    const char* name) {
  auto it = object.find(name);
  if (it == object.end() || it->is_null()) return std::optional<Index>();
  if (auto value = JsonToIndex(*it)) return std::optional<Index>(*value);
  return ExpectedError(*it, StrCat("integer or null for \"", name, "\""));
}

Result<std::optional<Index>> ParseSliceBound(std::string_view part) {
  part = absl::StripAsciiWhitespace(part);
  if (part.empty()) return std::optional<Index>();
  Index value;
  if (!absl::SimpleAtoi(part, &value)) {
    return SelectionError(SelectionErrorKind::kInvalidIndexType,
                          StrCat("Invalid slice bound: \"", part, "\""));
  }
  return std::optional<Index>(value);
}

Result<IndexExpression> ParseString(const json& j) {
  const auto& s = j.get_ref<const std::string&>();
  if (s == "...") return IndexExpression(Ellipsis{});
  std::vector<std::string_view> parts = absl::StrSplit(s, ':');
  if (parts.size() != 2 && parts.size() != 3) {
    return ExpectedError(j, "\"...\" or slice \"start:stop[:step]\"");
  }
  Slice slice;
  HYPERSLAB_ASSIGN_OR_RETURN(slice.start, ParseSliceBound(parts[0]));
  HYPERSLAB_ASSIGN_OR_RETURN(slice.stop, ParseSliceBound(parts[1]));
  if (parts.size() == 3) {
    HYPERSLAB_ASSIGN_OR_RETURN(slice.step, ParseSliceBound(parts[2]));
  }
  return IndexExpression(slice);
}

// Appends the elements of the nested boolean array `j` at nesting level
// `depth` to `values`, recording the extent of each level in `shape`.
absl::Status ParseMaskLevel(const json& j, size_t depth, Shape& shape,
                            std::vector<bool>& values) {
  if (!j.is_array()) {
    if (!j.is_boolean() || depth != shape.size()) {
      return ExpectedError(j, "boolean mask of consistent shape");
    }
    values.push_back(j.get<bool>());
    return absl::OkStatus();
  }
  const Index size = j.size();
  if (depth == shape.size() && values.empty()) {
    shape.push_back(size);
  } else if (depth >= shape.size() || shape[depth] != size) {
    return ExpectedError(j, "boolean mask of consistent shape");
  }
  for (const auto& element : j) {
    HYPERSLAB_RETURN_IF_ERROR(ParseMaskLevel(element, depth + 1, shape, values));
  }
  return absl::OkStatus();
}

Result<IndexExpression> ParseObject(const json& j) {
  if (auto it = j.find("mask"); it != j.end()) {
    if (j.size() != 1) return ExpectedError(j, "object with only \"mask\"");
    Shape shape;
    std::vector<bool> values;
    HYPERSLAB_RETURN_IF_ERROR(ParseMaskLevel(*it, 0, shape, values));
    HYPERSLAB_ASSIGN_OR_RETURN(
        auto mask, BooleanMask::Make(std::move(shape), std::move(values)));
    return IndexExpression(std::move(mask));
  }

  const bool is_strided_block =
      j.contains("stride") || j.contains("count") || j.contains("block");
  for (const auto& item : j.items()) {
    const auto& key = item.key();
    const bool allowed =
        key == "start" ||
        (is_strided_block ? (key == "stride" || key == "count" ||
                             key == "block")
                          : (key == "stop" || key == "step"));
    if (!allowed) {
      return ExpectedError(
          j, is_strided_block
                 ? "strided block with members start, stride, count, block"
                 : "slice with members start, stop, step");
    }
  }

  if (!is_strided_block) {
    Slice slice;
    HYPERSLAB_ASSIGN_OR_RETURN(slice.start, GetOptionalIndexMember(j, "start"));
    HYPERSLAB_ASSIGN_OR_RETURN(slice.stop, GetOptionalIndexMember(j, "stop"));
    HYPERSLAB_ASSIGN_OR_RETURN(slice.step, GetOptionalIndexMember(j, "step"));
    return IndexExpression(slice);
  }

  HYPERSLAB_ASSIGN_OR_RETURN(auto start, GetOptionalIndexMember(j, "start"));
  HYPERSLAB_ASSIGN_OR_RETURN(auto stride, GetOptionalIndexMember(j, "stride"));
  HYPERSLAB_ASSIGN_OR_RETURN(auto count, GetOptionalIndexMember(j, "count"));
  HYPERSLAB_ASSIGN_OR_RETURN(auto block, GetOptionalIndexMember(j, "block"));
  HYPERSLAB_ASSIGN_OR_RETURN(
      auto strided_block,
      StridedBlock::Make(start.value_or(0), stride.value_or(1), count,
                         block.value_or(1)));
  return IndexExpression(strided_block);
}

Result<IndexExpression> ParseArray(const json& j) {
  if (!j.empty() && j.front().is_boolean()) {
    std::vector<bool> values;
    for (const auto& element : j) {
      if (!element.is_boolean()) return ExpectedError(j, "array of booleans");
      values.push_back(element.get<bool>());
    }
    return IndexExpression(BooleanMask(std::move(values)));
  }
  IndexList list;
  for (const auto& element : j) {
    auto value = JsonToIndex(element);
    if (!value) return ExpectedError(j, "array of integers");
    list.values.push_back(*value);
  }
  return IndexExpression(std::move(list));
}

// Returns the nested array representation of `values`, starting at `offset`
// and covering dimensions `[dim, shape.size())`.
json MaskToJson(const Shape& shape, const std::vector<bool>& values,
                size_t dim, size_t& offset) {
  if (dim == shape.size()) return static_cast<bool>(values[offset++]);
  json result = json::array();
  for (Index i = 0; i < shape[dim]; ++i) {
    result.push_back(MaskToJson(shape, values, dim + 1, offset));
  }
  return result;
}

void SetOptionalMember(json& object, const char* name,
                       const std::optional<Index>& value) {
  if (value) object[name] = *value;
}

}  // namespace

Result<IndexExpression> ParseIndexExpressionJson(const json& j) {
  if (auto index = JsonToIndex(j)) return IndexExpression(*index);
  switch (j.type()) {
    case json::value_t::string:
      return ParseString(j);
    case json::value_t::object:
      return ParseObject(j);
    case json::value_t::array:
      return ParseArray(j);
    default:
      return ExpectedError(j, "index expression");
  }
}

Result<std::vector<IndexExpression>> ParseIndexArgumentsJson(const json& j) {
  std::vector<IndexExpression> args;
  if (!j.is_array()) {
    HYPERSLAB_ASSIGN_OR_RETURN(auto arg, ParseIndexExpressionJson(j));
    args.push_back(std::move(arg));
    return args;
  }
  for (size_t i = 0; i < j.size(); ++i) {
    HYPERSLAB_ASSIGN_OR_RETURN(
        auto arg, ParseIndexExpressionJson(j[i]),
        MaybeAnnotateStatus(_, StrCat("Error parsing index argument ", i)));
    args.push_back(std::move(arg));
  }
  return args;
}

Result<Shape> ParseShapeJson(const json& j) {
  if (!j.is_array()) {
    return absl::InvalidArgumentError(
        StrCat("Expected array of non-negative integers, but received: ",
               j.dump()));
  }
  Shape shape;
  for (const auto& element : j) {
    auto extent = JsonToIndex(element);
    if (!extent || *extent < 0) {
      return absl::InvalidArgumentError(
          StrCat("Expected array of non-negative integers, but received: ",
                 j.dump()));
    }
    shape.push_back(*extent);
  }
  return shape;
}

Result<json> IndexExpressionToJson(const IndexExpression& x) {
  switch (GetIndexExpressionKind(x)) {
    case IndexExpressionKind::kInteger:
      return json(std::get<Index>(x));
    case IndexExpressionKind::kSlice: {
      const auto& slice = std::get<Slice>(x);
      if (!slice.start && !slice.stop && !slice.step) return json(":");
      json result = json::object();
      SetOptionalMember(result, "start", slice.start);
      SetOptionalMember(result, "stop", slice.stop);
      SetOptionalMember(result, "step", slice.step);
      return result;
    }
    case IndexExpressionKind::kStridedBlock: {
      const auto& block = std::get<StridedBlock>(x);
      json result = {{"start", block.start()},
                     {"stride", block.stride()},
                     {"block", block.block()}};
      SetOptionalMember(result, "count", block.count());
      return result;
    }
    case IndexExpressionKind::kEllipsis:
      return json("...");
    case IndexExpressionKind::kIndexList:
      return json(std::get<IndexList>(x).values);
    case IndexExpressionKind::kBooleanMask: {
      const auto& mask = std::get<BooleanMask>(x);
      size_t offset = 0;
      json nested = MaskToJson(mask.shape(), mask.values(), 0, offset);
      if (mask.rank() == 1) return nested;
      return json{{"mask", std::move(nested)}};
    }
    default:
      return SelectionError(
          SelectionErrorKind::kInvalidIndexType,
          StrCat("Index expression of kind ", GetIndexExpressionKind(x),
                 " has no JSON representation"));
  }
}

}  // namespace hyperslab
