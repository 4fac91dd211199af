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

#include "hyperslab/util/division.h"

#include <cstdint>

namespace {

static_assert(3 == hyperslab::FloorOfRatio(10, 3));
static_assert(-4 == hyperslab::FloorOfRatio(-10, 3));
static_assert(-1 == hyperslab::FloorOfRatio<int64_t>(-1, 4));
static_assert(0 == hyperslab::FloorOfRatio<int64_t>(0, 4));
static_assert(-3 == hyperslab::FloorOfRatio(10, -4));

}  // namespace
