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

#ifndef HYPERSLAB_DATASPACE_H_
#define HYPERSLAB_DATASPACE_H_

/// \file
/// Interface to the selection engine that holds region state.
///
/// The selection layer never stores selected coordinates itself.  It only
/// issues the primitive operations declared here against a `Dataspace`, which
/// owns the extent and the currently committed selection.  Implementations
/// are provided for HDF5 (`hyperslab/hdf5/hdf5_dataspace.h`) and, for tests,
/// an in-memory engine (`hyperslab/dataspace_testutil.h`).

#include <iosfwd>
#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "hyperslab/index.h"
#include "hyperslab/util/result.h"
#include "hyperslab/util/span.h"

namespace hyperslab {

/// Class of the extent of a dataspace.
enum class ExtentClass {
  /// No elements; selections are not supported.
  kNull,
  /// Rank-0 extent containing a single element.
  kScalar,
  /// Rank >= 1 rectangular extent.
  kSimple,
  /// Reported by an engine for a class this library does not know.
  kUnrecognized,
};

/// Flavor of the selection committed to a dataspace.
enum class SelectType {
  kNone,
  kPoints,
  kHyperslabs,
  kAll,
  /// Reported by an engine for a selection type this library does not know.
  kUnrecognized,
};

/// How a new hyperslab combines with the existing selection.
enum class HyperslabOp {
  /// Replace the existing selection.
  kSet,
  /// Union with the existing selection.
  kOr,
  /// Keep only elements of the existing selection not in the new hyperslab.
  kNotB,
};

/// How new points combine with an existing point selection.
enum class PointsOp {
  kSet,
  kAppend,
  kPrepend,
};

std::ostream& operator<<(std::ostream& os, ExtentClass x);
std::ostream& operator<<(std::ostream& os, SelectType x);

/// Inclusive bounding box of a selection.
struct SelectionBounds {
  std::vector<Index> start;
  std::vector<Index> end;

  friend bool operator==(const SelectionBounds& a, const SelectionBounds& b) {
    return a.start == b.start && a.end == b.end;
  }
  friend bool operator!=(const SelectionBounds& a, const SelectionBounds& b) {
    return !(a == b);
  }
  friend std::ostream& operator<<(std::ostream& os, const SelectionBounds& x);
};

/// Opaque handle to a region previously stored alongside a dataset.
///
/// The bytes are interpreted only by the `DatasetHandle` that resolves them.
struct RegionReference {
  std::vector<unsigned char> data;

  friend bool operator==(const RegionReference& a, const RegionReference& b) {
    return a.data == b.data;
  }
  friend bool operator!=(const RegionReference& a, const RegionReference& b) {
    return !(a == b);
  }
};

/// Extent plus committed selection, as maintained by the selection engine.
///
/// All coordinate arguments are in the rank of `shape()`.  Methods that
/// modify the selection replace or combine the committed selection as
/// described by their `op` argument; the extent never changes.
class Dataspace {
 public:
  virtual ~Dataspace();

  virtual ExtentClass extent_class() const = 0;

  /// Returns the extent.  Empty for scalar and null dataspaces.
  virtual Shape shape() const = 0;

  virtual SelectType select_type() const = 0;

  virtual absl::Status SelectAll() = 0;
  virtual absl::Status SelectNone() = 0;

  /// Selects the regular hyperslab described by `start`, `count`, `stride`
  /// and `block`, each of length `shape().size()`.
  virtual absl::Status SelectHyperslab(HyperslabOp op, span<const Index> start,
                                       span<const Index> count,
                                       span<const Index> stride,
                                       span<const Index> block) = 0;

  /// Selects individual points.  `coordinates` holds the points in order,
  /// each point contributing `shape().size()` consecutive values.
  virtual absl::Status SelectElements(PointsOp op,
                                      span<const Index> coordinates) = 0;

  /// Returns the number of selected elements.
  virtual Result<Index> GetSelectNpoints() const = 0;

  /// Returns the bounding box of the selection, including any offset set by
  /// `OffsetSimple`.
  virtual Result<SelectionBounds> GetSelectBounds() const = 0;

  /// Returns an independent copy of the extent and its selection.
  virtual Result<std::unique_ptr<Dataspace>> Copy() const = 0;

  /// Sets the offset applied to the selection.  The offset is not cumulative:
  /// each call replaces the previous offset.
  virtual absl::Status OffsetSimple(span<const Index> offset) = 0;

  /// Returns `true` if the selection, with its offset applied, lies within the
  /// extent.
  virtual Result<bool> SelectValid() const = 0;
};

/// Storage-side collaborator used by `Select`.
///
/// Supplies fresh dataspaces for new selections and resolves region
/// references.
class DatasetHandle {
 public:
  virtual ~DatasetHandle();

  /// Returns a new dataspace with the specified extent and everything
  /// selected.  A rank-0 `shape` yields a scalar dataspace.
  virtual Result<std::unique_ptr<Dataspace>> CreateDataspace(
      span<const Index> shape) const = 0;

  /// Returns the dataspace, with its stored selection, referred to by
  /// `reference`.
  virtual Result<std::unique_ptr<Dataspace>> ResolveRegion(
      const RegionReference& reference) const = 0;
};

}  // namespace hyperslab

#endif  // HYPERSLAB_DATASPACE_H_
