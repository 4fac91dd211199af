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

#ifndef HYPERSLAB_UTIL_STR_CAT_H_
#define HYPERSLAB_UTIL_STR_CAT_H_

/// \file
/// Provides generic conversion to string representation.

#include <iterator>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "absl/strings/str_cat.h"

namespace hyperslab {
namespace internal_strcat {

template <typename T, typename = void>
constexpr inline bool IsOstreamable = false;

template <typename T>
constexpr inline bool IsOstreamable<
    T, std::void_t<decltype(std::declval<std::ostream&>()
                            << std::declval<const T&>())>> = true;

template <typename... T, typename F>
constexpr bool Requires(F) {
  return std::is_invocable_v<F, T...>;
}

template <typename T>
auto ToAlphaNumOrString(const T& x);

/// Converts the argument to a string representation using `operator<<`.
template <typename T>
std::string StringifyUsingOstream(const T& x) {
  std::ostringstream ostr;
  ostr << x;
  return ostr.str();
}

/// Converts container<T> values to strings of the form `{a, b, c}`.
template <typename Iterator>
std::string StringifyContainer(Iterator begin, Iterator end) {
  // Elements are converted to the value type first so that proxy references,
  // as returned by `std::vector<bool>`, print like the values they refer to.
  using Value = typename std::iterator_traits<Iterator>::value_type;
  std::string result = "{";
  if (begin != end) {
    absl::StrAppend(&result,
                    ToAlphaNumOrString(static_cast<Value>(*begin++)));
  }
  for (; begin != end; ++begin) {
    absl::StrAppend(&result, ", ",
                    ToAlphaNumOrString(static_cast<Value>(*begin)));
  }
  absl::StrAppend(&result, "}");
  return result;
}

/// Converts arbitrary input values to a type supported by `absl::StrCat`.
template <typename T>
auto ToAlphaNumOrString(const T& x) {
  if constexpr (std::is_same_v<T, std::nullptr_t>) {
    return "null";
  } else if constexpr (std::is_same_v<T, bool>) {
    return x ? "true" : "false";
  } else if constexpr (std::is_convertible_v<T, absl::AlphaNum> &&
                       !std::is_enum_v<T>) {
    return x;
  } else if constexpr (IsOstreamable<T>) {
    return StringifyUsingOstream(x);
  } else if constexpr (Requires<const T>(
                           [](auto&& v) -> decltype(v.begin(), v.end()) {})) {
    return StringifyContainer(x.begin(), x.end());
  } else if constexpr (std::is_enum_v<T>) {
    // Non-streamable enum
    using I = typename std::underlying_type<T>::type;
    return static_cast<I>(x);
  } else {
    // Fallback to streamed output to generate an error.
    return StringifyUsingOstream(x);
  }
}

}  // namespace internal_strcat

/// Concatenates the string representation of `arg...` and returns the result.
///
/// Containers, including `span` and `std::vector`, are printed as
/// ``{a, b, c}``.
///
/// \ingroup string-utilities
template <typename... Arg>
std::string StrCat(const Arg&... arg) {
  return absl::StrCat(internal_strcat::ToAlphaNumOrString(arg)...);
}

}  // namespace hyperslab

#endif  // HYPERSLAB_UTIL_STR_CAT_H_
