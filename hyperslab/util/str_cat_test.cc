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

#include "hyperslab/util/str_cat.h"

#include <complex>
#include <ostream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include "hyperslab/index.h"
#include "hyperslab/util/span.h"

namespace {

using ::hyperslab::internal_strcat::StringifyUsingOstream;

enum class OstreamableEnum { value = 0 };
enum class PlainEnum { value = 0 };

std::ostream& operator<<(std::ostream& os, OstreamableEnum e) {
  return os << "enum";
}

TEST(ToStringUsingOstreamTest, Basic) {
  EXPECT_EQ("hello", StringifyUsingOstream("hello"));
  EXPECT_EQ("1", StringifyUsingOstream(1));
  EXPECT_EQ("(1,2)", StringifyUsingOstream(std::complex<float>(1, 2)));
}

TEST(StrCat, Basic) {
  EXPECT_EQ("a(1,2)3", hyperslab::StrCat("a", std::complex<float>(1, 2), 3));
}

TEST(StrCat, Enum) {
  EXPECT_EQ("enum", hyperslab::StrCat(OstreamableEnum::value));
  EXPECT_EQ("0", hyperslab::StrCat(PlainEnum::value));
}

TEST(StrCat, Null) { EXPECT_EQ("null", hyperslab::StrCat(nullptr)); }

TEST(StrCat, Container) {
  std::vector<hyperslab::Index> x{1, 2, 3};
  EXPECT_EQ("{1, 2, 3}", hyperslab::StrCat(x));
  EXPECT_EQ("{1, 2, 3}",
            hyperslab::StrCat(hyperslab::span<const hyperslab::Index>(x)));
  EXPECT_EQ("{}", hyperslab::StrCat(std::vector<int>()));
}

TEST(StrCat, BoolContainer) {
  EXPECT_EQ("{true, false}", hyperslab::StrCat(std::vector<bool>{true, false}));
}

}  // namespace
