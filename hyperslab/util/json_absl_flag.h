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

#ifndef HYPERSLAB_UTIL_JSON_ABSL_FLAG_H_
#define HYPERSLAB_UTIL_JSON_ABSL_FLAG_H_

#include <string>
#include <string_view>
#include <utility>

#include "absl/flags/marshalling.h"
#include <nlohmann/json.hpp>

namespace hyperslab {

/// JSON value usable as an `ABSL_FLAG` type.
///
/// An empty flag value is represented by a discarded JSON value.
struct JsonAbslFlag {
  ::nlohmann::json value = ::nlohmann::json::value_t::discarded;

  JsonAbslFlag() = default;
  JsonAbslFlag(::nlohmann::json value) : value(std::move(value)) {}  // NOLINT

  friend std::string AbslUnparseFlag(const JsonAbslFlag& json_flag) {
    if (json_flag.value.is_discarded()) return {};
    return absl::UnparseFlag(json_flag.value.dump());
  }

  friend bool AbslParseFlag(std::string_view in, JsonAbslFlag* out,
                            std::string* error) {
    if (in.empty()) {
      out->value = ::nlohmann::json::value_t::discarded;
      return true;
    }
    out->value = ::nlohmann::json::parse(in, nullptr, false);
    if (out->value.is_discarded()) {
      *error = "Failed to parse JSON";
      return false;
    }
    return true;
  }
};

}  // namespace hyperslab

#endif  // HYPERSLAB_UTIL_JSON_ABSL_FLAG_H_
