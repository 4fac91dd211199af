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

#include "hyperslab/dataspace.h"

#include <ostream>

#include "hyperslab/util/str_cat.h"

namespace hyperslab {

Dataspace::~Dataspace() = default;

DatasetHandle::~DatasetHandle() = default;

std::ostream& operator<<(std::ostream& os, ExtentClass x) {
  switch (x) {
    case ExtentClass::kNull:
      return os << "null";
    case ExtentClass::kScalar:
      return os << "scalar";
    case ExtentClass::kSimple:
      return os << "simple";
    case ExtentClass::kUnrecognized:
      break;
  }
  return os << "unrecognized";
}

std::ostream& operator<<(std::ostream& os, SelectType x) {
  switch (x) {
    case SelectType::kNone:
      return os << "none";
    case SelectType::kPoints:
      return os << "points";
    case SelectType::kHyperslabs:
      return os << "hyperslabs";
    case SelectType::kAll:
      return os << "all";
    case SelectType::kUnrecognized:
      break;
  }
  return os << "unrecognized";
}

std::ostream& operator<<(std::ostream& os, const SelectionBounds& x) {
  return os << "[" << StrCat(x.start) << ", " << StrCat(x.end) << "]";
}

}  // namespace hyperslab
