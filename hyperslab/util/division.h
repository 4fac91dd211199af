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

#ifndef HYPERSLAB_UTIL_DIVISION_H_
#define HYPERSLAB_UTIL_DIVISION_H_

#include <type_traits>

namespace hyperslab {

/// Returns the floor of the ratio of two integers.
///
/// `numerator` may be any integer, `denominator` must be non-zero.  Unlike
/// the built-in `/` operator, which rounds toward zero, the result is rounded
/// toward negative infinity.
template <typename IntegralType>
constexpr IntegralType FloorOfRatio(IntegralType numerator,
                                    IntegralType denominator) {
  static_assert(std::is_integral<IntegralType>::value,
                "IntegralType must be an integral type.");
  const IntegralType rounded_toward_zero = numerator / denominator;
  const IntegralType intermediate_product = rounded_toward_zero * denominator;
  const bool needs_adjustment =
      (rounded_toward_zero <= 0) &&
      ((denominator > 0 && numerator < intermediate_product) ||
       (denominator < 0 && numerator > intermediate_product));
  return rounded_toward_zero - static_cast<IntegralType>(needs_adjustment);
}

}  // namespace hyperslab

#endif  // HYPERSLAB_UTIL_DIVISION_H_
