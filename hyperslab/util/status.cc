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

#include "hyperslab/util/status.h"

#include <array>
#include <cstdio>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_join.h"

namespace hyperslab {
namespace internal {

absl::Status MaybeAnnotateStatusImpl(absl::Status source,
                                     std::string_view prefix_message,
                                     std::optional<absl::StatusCode> new_code) {
  if (source.ok()) return source;
  if (!new_code) new_code = source.code();

  size_t index = 0;
  std::array<std::string_view, 2> to_join = {};
  if (!prefix_message.empty()) {
    to_join[index++] = prefix_message;
  }
  if (!source.message().empty()) {
    to_join[index++] = source.message();
  }

  std::string message;
  if (index > 1) {
    message = absl::StrJoin(to_join.begin(), to_join.begin() + index, ": ");
  } else if (index == 1) {
    message = std::string(to_join[0]);
  }
  absl::Status dest(*new_code, message);

  // Preserve the payloads.
  source.ForEachPayload([&](std::string_view name, const absl::Cord& value) {
    dest.SetPayload(name, value);
  });
  return dest;
}

[[noreturn]] void FatalStatus(const char* message, const absl::Status& status,
                              const char* file, int line) {
  std::fprintf(stderr, "%s:%d: %s: %s\n", file, line, message,
               status.ToString().c_str());
  std::terminate();
}

}  // namespace internal
}  // namespace hyperslab
