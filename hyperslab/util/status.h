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

#ifndef HYPERSLAB_UTIL_STATUS_H_
#define HYPERSLAB_UTIL_STATUS_H_

#include <optional>
#include <string_view>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"

namespace hyperslab {
namespace internal {

absl::Status MaybeAnnotateStatusImpl(absl::Status source,
                                     std::string_view prefix_message,
                                     std::optional<absl::StatusCode> new_code);

[[noreturn]] void FatalStatus(const char* message, const absl::Status& status,
                              const char* file, int line);

}  // namespace internal

/// If status is not `absl::StatusCode::kOk`, then annotate the status message.
/// The status code and any payloads are preserved.
///
/// \ingroup error handling
inline absl::Status MaybeAnnotateStatus(absl::Status source,
                                        std::string_view message) {
  return internal::MaybeAnnotateStatusImpl(std::move(source), message,
                                           std::nullopt);
}

/// Overload for the case of a bare absl::Status argument.
///
/// \returns `status`
inline const absl::Status& GetStatus(const absl::Status& status) {
  return status;
}
inline absl::Status GetStatus(absl::Status&& status) {
  return std::move(status);
}

}  // namespace hyperslab

/// Causes the containing function to return the specified `absl::Status` value
/// if it is an error status.
///
/// Example::
///
///     absl::Status GetSomeStatus();
///
///     absl::Status Bar() {
///       HYPERSLAB_RETURN_IF_ERROR(GetSomeStatus());
///       // More code
///       return absl::OkStatus();
///     }
///
/// An optional second argument specifies the return expression in the case of
/// an error.  A variable ``_`` is bound to the value of the first expression
/// is in scope within this expression.  For example::
///
///     HYPERSLAB_RETURN_IF_ERROR(GetSomeStatus(),
///                               MaybeAnnotateStatus(_, "In Bar"));
///
/// .. warning::
///
///    The `absl::Status` expression must not contain any commas outside
///    parentheses (such as in a template argument list); if necessary, to
///    ensure this, it may be wrapped in additional parentheses as needed.
#define HYPERSLAB_RETURN_IF_ERROR(...) \
  HYPERSLAB_PP_EXPAND(HYPERSLAB_INTERNAL_RETURN_IF_ERROR_IMPL(__VA_ARGS__, _))

#define HYPERSLAB_INTERNAL_RETURN_IF_ERROR_IMPL(expr, error_expr, ...) \
  for (absl::Status _ = ::hyperslab::GetStatus(expr);                  \
       ABSL_PREDICT_FALSE(!_.ok());)                                   \
  return error_expr /**/

/// Logs an error and terminates the program if the specified `absl::Status` is
/// an error status.
#define HYPERSLAB_CHECK_OK(...)                                               \
  do {                                                                        \
    [](const ::absl::Status& hyperslab_check_ok_condition) {                  \
      if (ABSL_PREDICT_FALSE(!hyperslab_check_ok_condition.ok())) {           \
        ::hyperslab::internal::FatalStatus("Status not ok: " #__VA_ARGS__,    \
                                           hyperslab_check_ok_condition,      \
                                           __FILE__, __LINE__);               \
      }                                                                       \
    }(::hyperslab::GetStatus((__VA_ARGS__)));                                 \
  } while (false)

#define HYPERSLAB_PP_EXPAND(...) __VA_ARGS__
#define HYPERSLAB_PP_CAT_IMPL(a, b) a##b
#define HYPERSLAB_PP_CAT(a, b) HYPERSLAB_PP_CAT_IMPL(a, b)

#endif  // HYPERSLAB_UTIL_STATUS_H_
