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

#ifndef HYPERSLAB_UTIL_STATUS_TESTUTIL_H_
#define HYPERSLAB_UTIL_STATUS_TESTUTIL_H_

/// \file
/// Implements GMock matchers for absl::Status and Result.
/// For example, to test an Ok result, perhaps with a value, use:
///
///   EXPECT_THAT(DoSomething(), ::hyperslab::IsOk());
///   EXPECT_THAT(DoSomething(), ::hyperslab::IsOkAndHolds(7));
///
/// To test an error expectation, use:
///
///   EXPECT_THAT(DoSomething(),
///               ::hyperslab::MatchesStatus(absl::StatusCode::kOutOfRange,
///                                          "Index .* out of range.*"));
///   EXPECT_THAT(DoSomething(),
///               ::hyperslab::MatchesSelectionError(
///                   SelectionErrorKind::kTooManyEllipses));

#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

#include <gmock/gmock.h>
#include "absl/status/status.h"
#include "hyperslab/error.h"
#include "hyperslab/util/result.h"
#include "hyperslab/util/status.h"

namespace hyperslab {
namespace internal_status {

// Monomorphic implementation of matcher IsOkAndHolds(m).
// StatusType is a const reference to Result<T>.
template <typename StatusType>
class IsOkAndHoldsMatcherImpl : public ::testing::MatcherInterface<StatusType> {
 public:
  typedef
      typename std::remove_reference<StatusType>::type::value_type value_type;

  template <typename InnerMatcher>
  explicit IsOkAndHoldsMatcherImpl(InnerMatcher&& inner_matcher)
      : inner_matcher_(::testing::SafeMatcherCast<const value_type&>(
            std::forward<InnerMatcher>(inner_matcher))) {}

  void DescribeTo(std::ostream* os) const override {
    *os << "is OK and has a value that ";
    inner_matcher_.DescribeTo(os);
  }
  void DescribeNegationTo(std::ostream* os) const override {
    *os << "isn't OK or has a value that ";
    inner_matcher_.DescribeNegationTo(os);
  }
  bool MatchAndExplain(
      StatusType actual_value,
      ::testing::MatchResultListener* result_listener) const override {
    auto status = ::hyperslab::GetStatus(actual_value);  // avoid ADL.
    if (!status.ok()) {
      *result_listener << "whose status is " << status;
      return false;
    }
    ::testing::StringMatchResultListener inner_listener;
    if (!inner_matcher_.MatchAndExplain(actual_value.value(),
                                        &inner_listener)) {
      *result_listener << "whose value "
                       << ::testing::PrintToString(actual_value.value())
                       << " doesn't match";
      if (!inner_listener.str().empty()) {
        *result_listener << ", " << inner_listener.str();
      }
      return false;
    }
    return true;
  }

 private:
  const ::testing::Matcher<const value_type&> inner_matcher_;
};

// Implements IsOkAndHolds(m) as a polymorphic matcher.
template <typename InnerMatcher>
class IsOkAndHoldsMatcher {
 public:
  explicit IsOkAndHoldsMatcher(InnerMatcher inner_matcher)
      : inner_matcher_(std::move(inner_matcher)) {}

  template <typename StatusType>
  operator ::testing::Matcher<StatusType>() const {  // NOLINT
    return ::testing::Matcher<StatusType>(
        new IsOkAndHoldsMatcherImpl<const StatusType&>(inner_matcher_));
  }

 private:
  const InnerMatcher inner_matcher_;
};

// Monomorphic implementation of matcher IsOk() for a given type T.
template <typename StatusType>
class MonoIsOkMatcherImpl : public ::testing::MatcherInterface<StatusType> {
 public:
  void DescribeTo(std::ostream* os) const override { *os << "is OK"; }
  void DescribeNegationTo(std::ostream* os) const override {
    *os << "is not OK";
  }
  bool MatchAndExplain(
      StatusType actual_value,
      ::testing::MatchResultListener* result_listener) const override {
    auto status = ::hyperslab::GetStatus(actual_value);  // avoid ADL.
    if (!status.ok()) *result_listener << "whose status is " << status;
    return status.ok();
  }
};

// Implements IsOk() as a polymorphic matcher.
class IsOkMatcher {
 public:
  template <typename StatusType>
  operator ::testing::Matcher<StatusType>() const {  // NOLINT
    return ::testing::Matcher<StatusType>(
        new MonoIsOkMatcherImpl<const StatusType&>());
  }
};

// Monomorphic implementation of matcher StatusIs().
template <typename StatusType>
class StatusIsMatcherImpl : public ::testing::MatcherInterface<StatusType> {
 public:
  explicit StatusIsMatcherImpl(
      testing::Matcher<absl::StatusCode> code_matcher,
      testing::Matcher<const std::string&> message_matcher)
      : code_matcher_(std::move(code_matcher)),
        message_matcher_(std::move(message_matcher)) {}

  void DescribeTo(std::ostream* os) const override {
    *os << "has a status code that ";
    code_matcher_.DescribeTo(os);
    *os << ", and has an error message that ";
    message_matcher_.DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream* os) const override {
    *os << "has a status code that ";
    code_matcher_.DescribeNegationTo(os);
    *os << ", or has an error message that ";
    message_matcher_.DescribeNegationTo(os);
  }

  bool MatchAndExplain(
      StatusType actual_value,
      ::testing::MatchResultListener* result_listener) const override {
    auto status = ::hyperslab::GetStatus(actual_value);  // avoid ADL.

    testing::StringMatchResultListener inner_listener;
    if (!code_matcher_.MatchAndExplain(status.code(), &inner_listener)) {
      *result_listener << "whose status code "
                       << absl::StatusCodeToString(status.code())
                       << " doesn't match";
      const std::string inner_explanation = inner_listener.str();
      if (!inner_explanation.empty()) {
        *result_listener << ", " << inner_explanation;
      }
      return false;
    }

    if (!message_matcher_.Matches(std::string(status.message()))) {
      *result_listener << "whose error message \"" << status.message()
                       << "\" is wrong";
      return false;
    }

    return true;
  }

 private:
  const testing::Matcher<absl::StatusCode> code_matcher_;
  const testing::Matcher<const std::string&> message_matcher_;
};

// Implements StatusIs() as a polymorphic matcher.
class StatusIsMatcher {
 public:
  StatusIsMatcher(testing::Matcher<absl::StatusCode> code_matcher,
                  testing::Matcher<const std::string&> message_matcher)
      : code_matcher_(std::move(code_matcher)),
        message_matcher_(std::move(message_matcher)) {}

  template <typename StatusType>
  operator ::testing::Matcher<StatusType>() const {  // NOLINT
    return ::testing::Matcher<StatusType>(
        new StatusIsMatcherImpl<const StatusType&>(code_matcher_,
                                                   message_matcher_));
  }

 private:
  const testing::Matcher<absl::StatusCode> code_matcher_;
  const testing::Matcher<const std::string&> message_matcher_;
};

// Monomorphic implementation of matcher MatchesSelectionError().
template <typename StatusType>
class SelectionErrorMatcherImpl
    : public ::testing::MatcherInterface<StatusType> {
 public:
  explicit SelectionErrorMatcherImpl(SelectionErrorKind kind) : kind_(kind) {}

  void DescribeTo(std::ostream* os) const override {
    *os << "is a " << kind_ << " error";
  }
  void DescribeNegationTo(std::ostream* os) const override {
    *os << "is not a " << kind_ << " error";
  }
  bool MatchAndExplain(
      StatusType actual_value,
      ::testing::MatchResultListener* result_listener) const override {
    auto status = ::hyperslab::GetStatus(actual_value);  // avoid ADL.
    auto kind = GetSelectionErrorKind(status);
    if (!kind) {
      *result_listener << "whose status " << status
                       << " carries no selection error kind";
      return false;
    }
    if (*kind != kind_) {
      *result_listener << "whose error kind is " << *kind << " (" << status
                       << ")";
      return false;
    }
    return true;
  }

 private:
  SelectionErrorKind kind_;
};

class SelectionErrorMatcher {
 public:
  explicit SelectionErrorMatcher(SelectionErrorKind kind) : kind_(kind) {}

  template <typename StatusType>
  operator ::testing::Matcher<StatusType>() const {  // NOLINT
    return ::testing::Matcher<StatusType>(
        new SelectionErrorMatcherImpl<const StatusType&>(kind_));
  }

 private:
  SelectionErrorKind kind_;
};

}  // namespace internal_status

// Returns a gMock matcher that matches an OK Status/Result.
inline internal_status::IsOkMatcher IsOk() {
  return internal_status::IsOkMatcher();
}

// Returns a gMock matcher that matches an OK Result whose value matches the
// inner matcher.
template <typename InnerMatcher>
internal_status::IsOkAndHoldsMatcher<typename std::decay<InnerMatcher>::type>
IsOkAndHolds(InnerMatcher&& inner_matcher) {
  return internal_status::IsOkAndHoldsMatcher<
      typename std::decay<InnerMatcher>::type>(
      std::forward<InnerMatcher>(inner_matcher));
}

// Returns a matcher that matches a Status/Result whose code matches
// code_matcher, and whose error message matches message_matcher.
template <typename CodeMatcher, typename MessageMatcher>
internal_status::StatusIsMatcher StatusIs(CodeMatcher code_matcher,
                                          MessageMatcher message_matcher) {
  return internal_status::StatusIsMatcher(std::move(code_matcher),
                                          std::move(message_matcher));
}

// Returns a matcher that matches a Status/Result whose code matches
// code_matcher.
template <typename CodeMatcher>
internal_status::StatusIsMatcher StatusIs(CodeMatcher code_matcher) {
  return internal_status::StatusIsMatcher(std::move(code_matcher),
                                          ::testing::_);
}

// Returns a matcher that matches a Status/Result whose code is status_code.
inline internal_status::StatusIsMatcher MatchesStatus(
    absl::StatusCode status_code) {
  return internal_status::StatusIsMatcher(status_code, ::testing::_);
}

// Returns a matcher that matches a Status/Result whose code is status_code,
// and whose message matches the provided regex pattern.
internal_status::StatusIsMatcher MatchesStatus(
    absl::StatusCode status_code, const std::string& message_pattern);

// Returns a matcher that matches a Status/Result carrying the specified
// selection error kind.
inline internal_status::SelectionErrorMatcher MatchesSelectionError(
    SelectionErrorKind kind) {
  return internal_status::SelectionErrorMatcher(kind);
}

}  // namespace hyperslab

/// EXPECT assertion that the argument, when converted to an `absl::Status` via
/// `hyperslab::GetStatus`, has a code of `absl::StatusCode::kOk`.
#define HYPERSLAB_EXPECT_OK(expr) EXPECT_THAT(expr, ::hyperslab::IsOk())

/// Same as `HYPERSLAB_EXPECT_OK`, but returns in the case of an error.
#define HYPERSLAB_ASSERT_OK(expr) ASSERT_THAT(expr, ::hyperslab::IsOk())

/// ASSERTs that `expr` is a `hyperslab::Result` with a value, and assigns the
/// value to `decl`.
///
/// Example:
///
///     hyperslab::Result<int> GetResult();
///
///     HYPERSLAB_ASSERT_OK_AND_ASSIGN(int x, GetResult());
#define HYPERSLAB_ASSERT_OK_AND_ASSIGN(decl, expr)                      \
  HYPERSLAB_ASSIGN_OR_RETURN(decl, expr,                                \
                             ([&] { FAIL() << #expr << ": " << _; })()) \
  /**/

#endif  // HYPERSLAB_UTIL_STATUS_TESTUTIL_H_
