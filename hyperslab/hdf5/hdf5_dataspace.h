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

#ifndef HYPERSLAB_HDF5_HDF5_DATASPACE_H_
#define HYPERSLAB_HDF5_HDF5_DATASPACE_H_

/// \file
/// `Dataspace` and `DatasetHandle` implemented with the HDF5 C library.

#include <hdf5.h>

#include <memory>

#include "absl/status/status.h"
#include "hyperslab/dataspace.h"
#include "hyperslab/index.h"
#include "hyperslab/util/result.h"
#include "hyperslab/util/span.h"

namespace hyperslab {

/// Owns an HDF5 dataspace identifier.
class Hdf5Dataspace : public Dataspace {
 public:
  /// Takes ownership of the dataspace identifier `id`.
  explicit Hdf5Dataspace(hid_t id) : id_(id) {}
  ~Hdf5Dataspace() override;

  Hdf5Dataspace(const Hdf5Dataspace&) = delete;
  Hdf5Dataspace& operator=(const Hdf5Dataspace&) = delete;

  /// Creates a dataspace of the specified extent, with unlimited maximum
  /// dimensions and everything selected.  An empty `shape` yields a scalar
  /// dataspace.
  static Result<std::unique_ptr<Hdf5Dataspace>> Create(
      span<const Index> shape);

  /// Returns the underlying identifier, which remains owned by this object.
  hid_t id() const { return id_; }

  ExtentClass extent_class() const override;
  Shape shape() const override;
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
  hid_t id_;
};

/// Dataset handle backed by an open HDF5 dataset.
///
/// Region references are dataset region references (`H5R_DATASET_REGION`),
/// stored as their raw bytes in `RegionReference::data`.
class Hdf5DatasetHandle : public DatasetHandle {
 public:
  /// Refers to the open dataset `dataset`, which must remain open for the
  /// lifetime of the handle.  A negative identifier denotes a handle without
  /// a dataset, which cannot resolve references.
  explicit Hdf5DatasetHandle(hid_t dataset = H5I_INVALID_HID)
      : dataset_(dataset) {}

  Result<std::unique_ptr<Dataspace>> CreateDataspace(
      span<const Index> shape) const override;

  Result<std::unique_ptr<Dataspace>> ResolveRegion(
      const RegionReference& reference) const override;

 private:
  hid_t dataset_;
};

}  // namespace hyperslab

#endif  // HYPERSLAB_HDF5_HDF5_DATASPACE_H_
