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

#ifndef HYPERSLAB_DATASPACE_TESTUTIL_H_
#define HYPERSLAB_DATASPACE_TESTUTIL_H_

/// \file
/// In-memory selection engine for tests.
///
/// `InMemoryDataspace` tracks the selected coordinates explicitly and follows
/// the conventions of the HDF5 dataspace API for the operations declared by
/// `Dataspace`.

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "absl/status/status.h"
#include "hyperslab/dataspace.h"
#include "hyperslab/index.h"
#include "hyperslab/util/result.h"
#include "hyperslab/util/span.h"

namespace hyperslab {

class InMemoryDataspace : public Dataspace {
 public:
  using Coordinates = std::vector<Index>;

  /// Returns a dataspace of the specified extent with everything selected.
  /// An empty `shape` yields a scalar dataspace.
  static std::unique_ptr<InMemoryDataspace> Make(span<const Index> shape);

  /// Returns a dataspace with a null extent.
  static std::unique_ptr<InMemoryDataspace> MakeNull();

  /// Makes `extent_class()` report `extent_class` regardless of the actual
  /// extent.
  void OverrideExtentClass(ExtentClass extent_class) {
    extent_class_override_ = extent_class;
  }

  /// Makes `select_type()` report `select_type` regardless of the actual
  /// selection.
  void OverrideSelectType(SelectType select_type) {
    select_type_override_ = select_type;
  }

  /// Returns the selected coordinates, with the offset applied.  Points are
  /// returned in selection order, all other selections in row-major order.
  std::vector<Coordinates> GetSelectedCoordinates() const;

  const Coordinates& offset() const { return offset_; }

  ExtentClass extent_class() const override;
  Shape shape() const override { return shape_; }
  SelectType select_type() const override;
  absl::Status SelectAll() override;
  absl::Status SelectNone() override;
  absl::Status SelectHyperslab(HyperslabOp op, span<const Index> start,
                               span<const Index> count,
                               span<const Index> stride,
                               span<const Index> block) override;
  absl::Status SelectElements(PointsOp op,
                              span<const Index> coordinates) override;
  Result<Index> GetSelectNpoints() const override;
  Result<SelectionBounds> GetSelectBounds() const override;
  Result<std::unique_ptr<Dataspace>> Copy() const override;
  absl::Status OffsetSimple(span<const Index> offset) override;
  Result<bool> SelectValid() const override;

 private:
  InMemoryDataspace(ExtentClass extent_class, Shape shape);

  // Returns the unoffset coordinates of every element of the extent.
  std::set<Coordinates> AllCoordinates() const;

  std::vector<Coordinates> GetUnoffsetCoordinates() const;

  ExtentClass extent_class_;
  Shape shape_;
  SelectType select_type_;
  std::set<Coordinates> hyperslab_;
  std::vector<Coordinates> points_;
  Coordinates offset_;
  std::optional<ExtentClass> extent_class_override_;
  std::optional<SelectType> select_type_override_;
};

/// Dataset handle that creates `InMemoryDataspace` objects and resolves
/// references to regions registered with `AddRegion`.
class InMemoryDatasetHandle : public DatasetHandle {
 public:
  /// Stores a copy of `region` and returns a reference to it.
  Result<RegionReference> AddRegion(const Dataspace& region);

  Result<std::unique_ptr<Dataspace>> CreateDataspace(
      span<const Index> shape) const override;
  Result<std::unique_ptr<Dataspace>> ResolveRegion(
      const RegionReference& reference) const override;

 private:
  std::map<std::vector<unsigned char>, std::unique_ptr<Dataspace>> regions_;
};

}  // namespace hyperslab

#endif  // HYPERSLAB_DATASPACE_TESTUTIL_H_
