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

#include "hyperslab/dataspace_testutil.h"

#include <algorithm>
#include <map>
#include <memory>
#include <set>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "hyperslab/util/status.h"
#include "hyperslab/util/str_cat.h"

namespace hyperslab {
namespace {

using Coordinates = InMemoryDataspace::Coordinates;

// Invokes `func` with every element of the Cartesian product of
// `positions`, in row-major order.
template <typename Func>
void ForEachCombination(const std::vector<std::vector<Index>>& positions,
                        Func func) {
  const DimensionIndex rank = positions.size();
  for (const auto& p : positions) {
    if (p.empty()) return;
  }
  std::vector<size_t> index(rank, 0);
  Coordinates coordinates(rank);
  while (true) {
    for (DimensionIndex i = 0; i < rank; ++i) {
      coordinates[i] = positions[i][index[i]];
    }
    func(coordinates);
    DimensionIndex dim = rank - 1;
    for (; dim >= 0; --dim) {
      if (++index[dim] < positions[dim].size()) break;
      index[dim] = 0;
    }
    if (dim < 0) return;
  }
}

absl::Status ValidateRank(span<const Index> values, size_t rank,
                          const char* name) {
  if (values.size() != rank) {
    return absl::InvalidArgumentError(StrCat(
        name, " has ", values.size(), " elements, but rank is ", rank));
  }
  return absl::OkStatus();
}

}  // namespace

InMemoryDataspace::InMemoryDataspace(ExtentClass extent_class, Shape shape)
    : extent_class_(extent_class),
      shape_(std::move(shape)),
      select_type_(extent_class == ExtentClass::kNull ? SelectType::kNone
                                                      : SelectType::kAll),
      offset_(shape_.size(), 0) {}

std::unique_ptr<InMemoryDataspace> InMemoryDataspace::Make(
    span<const Index> shape) {
  return std::unique_ptr<InMemoryDataspace>(new InMemoryDataspace(
      shape.empty() ? ExtentClass::kScalar : ExtentClass::kSimple,
      Shape(shape.begin(), shape.end())));
}

std::unique_ptr<InMemoryDataspace> InMemoryDataspace::MakeNull() {
  return std::unique_ptr<InMemoryDataspace>(
      new InMemoryDataspace(ExtentClass::kNull, Shape()));
}

ExtentClass InMemoryDataspace::extent_class() const {
  return extent_class_override_.value_or(extent_class_);
}

SelectType InMemoryDataspace::select_type() const {
  return select_type_override_.value_or(select_type_);
}

std::set<Coordinates> InMemoryDataspace::AllCoordinates() const {
  std::vector<std::vector<Index>> positions(shape_.size());
  for (size_t i = 0; i < shape_.size(); ++i) {
    for (Index x = 0; x < shape_[i]; ++x) positions[i].push_back(x);
  }
  std::set<Coordinates> result;
  ForEachCombination(positions,
                     [&](const Coordinates& c) { result.insert(c); });
  return result;
}

std::vector<Coordinates> InMemoryDataspace::GetUnoffsetCoordinates() const {
  switch (select_type_) {
    case SelectType::kAll: {
      auto all = AllCoordinates();
      return std::vector<Coordinates>(all.begin(), all.end());
    }
    case SelectType::kPoints:
      return points_;
    case SelectType::kHyperslabs:
      return std::vector<Coordinates>(hyperslab_.begin(), hyperslab_.end());
    default:
      return {};
  }
}

std::vector<Coordinates> InMemoryDataspace::GetSelectedCoordinates() const {
  auto result = GetUnoffsetCoordinates();
  for (auto& c : result) {
    for (size_t i = 0; i < c.size(); ++i) c[i] += offset_[i];
  }
  return result;
}

absl::Status InMemoryDataspace::SelectAll() {
  if (extent_class_ == ExtentClass::kNull) {
    return absl::InvalidArgumentError("Null dataspace has no elements");
  }
  select_type_ = SelectType::kAll;
  hyperslab_.clear();
  points_.clear();
  return absl::OkStatus();
}

absl::Status InMemoryDataspace::SelectNone() {
  select_type_ = SelectType::kNone;
  hyperslab_.clear();
  points_.clear();
  return absl::OkStatus();
}

absl::Status InMemoryDataspace::SelectHyperslab(HyperslabOp op,
                                                span<const Index> start,
                                                span<const Index> count,
                                                span<const Index> stride,
                                                span<const Index> block) {
  if (extent_class_ != ExtentClass::kSimple) {
    return absl::InvalidArgumentError(
        "Hyperslab selection requires a simple dataspace");
  }
  const size_t rank = shape_.size();
  HYPERSLAB_RETURN_IF_ERROR(ValidateRank(start, rank, "start"));
  HYPERSLAB_RETURN_IF_ERROR(ValidateRank(count, rank, "count"));
  HYPERSLAB_RETURN_IF_ERROR(ValidateRank(stride, rank, "stride"));
  HYPERSLAB_RETURN_IF_ERROR(ValidateRank(block, rank, "block"));
  bool empty = false;
  for (size_t i = 0; i < rank; ++i) {
    if (stride[i] < 1) {
      return absl::InvalidArgumentError(
          StrCat("Stride must be positive: ", stride));
    }
    if (count[i] > 1 && block[i] > stride[i]) {
      return absl::InvalidArgumentError(
          StrCat("Hyperslab blocks overlap: block ", block, ", stride ",
                 stride));
    }
    if (count[i] == 0 || block[i] == 0) empty = true;
  }
  if (empty) {
    // A zero-sized hyperslab clears the selection when replacing it and
    // leaves it unchanged otherwise.
    if (op == HyperslabOp::kSet) return SelectNone();
    return absl::OkStatus();
  }

  std::set<Coordinates> current;
  switch (select_type_) {
    case SelectType::kAll:
      current = AllCoordinates();
      break;
    case SelectType::kHyperslabs:
      current = hyperslab_;
      break;
    case SelectType::kPoints:
      if (op != HyperslabOp::kSet) {
        return absl::FailedPreconditionError(
            "Point selections cannot be combined with hyperslabs");
      }
      break;
    default:
      break;
  }
  if (op == HyperslabOp::kSet) current.clear();

  std::vector<std::vector<Index>> positions(rank);
  for (size_t i = 0; i < rank; ++i) {
    for (Index c = 0; c < count[i]; ++c) {
      for (Index b = 0; b < block[i]; ++b) {
        positions[i].push_back(start[i] + c * stride[i] + b);
      }
    }
  }
  ForEachCombination(positions, [&](const Coordinates& c) {
    if (op == HyperslabOp::kNotB) {
      current.erase(c);
    } else {
      current.insert(c);
    }
  });

  hyperslab_ = std::move(current);
  points_.clear();
  select_type_ = SelectType::kHyperslabs;
  return absl::OkStatus();
}

absl::Status InMemoryDataspace::SelectElements(PointsOp op,
                                               span<const Index> coordinates) {
  if (extent_class_ == ExtentClass::kNull) {
    return absl::InvalidArgumentError("Null dataspace has no elements");
  }
  const size_t rank = shape_.size();
  if (coordinates.empty() || rank == 0 || coordinates.size() % rank != 0) {
    return absl::InvalidArgumentError(
        StrCat("Invalid point coordinates ", coordinates, " for rank ", rank));
  }
  std::vector<Coordinates> points;
  for (size_t i = 0; i < coordinates.size(); i += rank) {
    points.emplace_back(coordinates.begin() + i,
                        coordinates.begin() + i + rank);
  }
  if (op == PointsOp::kSet || select_type_ != SelectType::kPoints) {
    points_ = std::move(points);
  } else if (op == PointsOp::kAppend) {
    points_.insert(points_.end(), points.begin(), points.end());
  } else {
    points_.insert(points_.begin(), points.begin(), points.end());
  }
  hyperslab_.clear();
  select_type_ = SelectType::kPoints;
  return absl::OkStatus();
}

Result<Index> InMemoryDataspace::GetSelectNpoints() const {
  if (select_type_ == SelectType::kAll) return ProductOfExtents(shape_);
  return static_cast<Index>(GetUnoffsetCoordinates().size());
}

Result<SelectionBounds> InMemoryDataspace::GetSelectBounds() const {
  const auto coordinates = GetSelectedCoordinates();
  if (coordinates.empty()) {
    return absl::FailedPreconditionError("No elements selected");
  }
  SelectionBounds bounds;
  bounds.start = bounds.end = coordinates.front();
  for (const auto& c : coordinates) {
    for (size_t i = 0; i < c.size(); ++i) {
      bounds.start[i] = std::min(bounds.start[i], c[i]);
      bounds.end[i] = std::max(bounds.end[i], c[i]);
    }
  }
  return bounds;
}

Result<std::unique_ptr<Dataspace>> InMemoryDataspace::Copy() const {
  return std::unique_ptr<Dataspace>(new InMemoryDataspace(*this));
}

absl::Status InMemoryDataspace::OffsetSimple(span<const Index> offset) {
  HYPERSLAB_RETURN_IF_ERROR(ValidateRank(offset, shape_.size(), "offset"));
  offset_.assign(offset.begin(), offset.end());
  return absl::OkStatus();
}

Result<bool> InMemoryDataspace::SelectValid() const {
  for (const auto& c : GetSelectedCoordinates()) {
    for (size_t i = 0; i < c.size(); ++i) {
      if (c[i] < 0 || c[i] >= shape_[i]) return false;
    }
  }
  return true;
}

Result<RegionReference> InMemoryDatasetHandle::AddRegion(
    const Dataspace& region) {
  HYPERSLAB_ASSIGN_OR_RETURN(auto copy, region.Copy());
  RegionReference reference;
  for (size_t id = regions_.size(), i = 0; i < sizeof(size_t); ++i) {
    reference.data.push_back(static_cast<unsigned char>(id >> (8 * i)));
  }
  regions_.emplace(reference.data, std::move(copy));
  return reference;
}

Result<std::unique_ptr<Dataspace>> InMemoryDatasetHandle::CreateDataspace(
    span<const Index> shape) const {
  return std::unique_ptr<Dataspace>(InMemoryDataspace::Make(shape));
}

Result<std::unique_ptr<Dataspace>> InMemoryDatasetHandle::ResolveRegion(
    const RegionReference& reference) const {
  auto it = regions_.find(reference.data);
  if (it == regions_.end()) {
    return absl::InvalidArgumentError("Invalid region reference");
  }
  return it->second->Copy();
}

}  // namespace hyperslab
