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

#include "hyperslab/hdf5/hdf5_dataspace.h"

#include <hdf5.h>

#include <memory>
#include <utility>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "hyperslab/internal/log/verbose_flag.h"
#include "hyperslab/util/status.h"
#include "hyperslab/util/str_cat.h"

namespace hyperslab {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag hdf5_logging("hyperslab_hdf5");

absl::Status Hdf5Error(const char* function) {
  return absl::InternalError(StrCat(function, " failed"));
}

absl::Status CheckHerr(herr_t result, const char* function) {
  if (result < 0) return Hdf5Error(function);
  return absl::OkStatus();
}

std::vector<hsize_t> ToHsize(span<const Index> values) {
  return std::vector<hsize_t>(values.begin(), values.end());
}

H5S_seloper_t ToHdf5(HyperslabOp op) {
  switch (op) {
    case HyperslabOp::kOr:
      return H5S_SELECT_OR;
    case HyperslabOp::kNotB:
      return H5S_SELECT_NOTB;
    default:
      return H5S_SELECT_SET;
  }
}

H5S_seloper_t ToHdf5(PointsOp op) {
  switch (op) {
    case PointsOp::kAppend:
      return H5S_SELECT_APPEND;
    case PointsOp::kPrepend:
      return H5S_SELECT_PREPEND;
    default:
      return H5S_SELECT_SET;
  }
}

Result<std::unique_ptr<Dataspace>> Adopt(hid_t id, const char* function) {
  if (id < 0) return Hdf5Error(function);
  return std::unique_ptr<Dataspace>(std::make_unique<Hdf5Dataspace>(id));
}

}  // namespace

Hdf5Dataspace::~Hdf5Dataspace() {
  if (id_ >= 0) H5Sclose(id_);
}

Result<std::unique_ptr<Hdf5Dataspace>> Hdf5Dataspace::Create(
    span<const Index> shape) {
  hid_t id;
  if (shape.empty()) {
    id = H5Screate(H5S_SCALAR);
  } else {
    const auto dims = ToHsize(shape);
    const std::vector<hsize_t> maxdims(shape.size(), H5S_UNLIMITED);
    id = H5Screate_simple(static_cast<int>(dims.size()), dims.data(),
                          maxdims.data());
  }
  if (id < 0) {
    return absl::InvalidArgumentError(
        StrCat("Failed to create dataspace of shape ", shape));
  }
  ABSL_LOG_IF(INFO, hdf5_logging)
      << "Created dataspace " << id << " of shape " << StrCat(shape);
  return std::make_unique<Hdf5Dataspace>(id);
}

ExtentClass Hdf5Dataspace::extent_class() const {
  switch (H5Sget_simple_extent_type(id_)) {
    case H5S_NULL:
      return ExtentClass::kNull;
    case H5S_SCALAR:
      return ExtentClass::kScalar;
    case H5S_SIMPLE:
      return ExtentClass::kSimple;
    default:
      return ExtentClass::kUnrecognized;
  }
}

Shape Hdf5Dataspace::shape() const {
  const int rank = H5Sget_simple_extent_ndims(id_);
  if (rank <= 0) return {};
  std::vector<hsize_t> dims(rank);
  if (H5Sget_simple_extent_dims(id_, dims.data(), nullptr) < 0) return {};
  return Shape(dims.begin(), dims.end());
}

SelectType Hdf5Dataspace::select_type() const {
  switch (H5Sget_select_type(id_)) {
    case H5S_SEL_NONE:
      return SelectType::kNone;
    case H5S_SEL_POINTS:
      return SelectType::kPoints;
    case H5S_SEL_HYPERSLABS:
      return SelectType::kHyperslabs;
    case H5S_SEL_ALL:
      return SelectType::kAll;
    default:
      return SelectType::kUnrecognized;
  }
}

absl::Status Hdf5Dataspace::SelectAll() {
  return CheckHerr(H5Sselect_all(id_), "H5Sselect_all");
}

absl::Status Hdf5Dataspace::SelectNone() {
  return CheckHerr(H5Sselect_none(id_), "H5Sselect_none");
}

absl::Status Hdf5Dataspace::SelectHyperslab(HyperslabOp op,
                                            span<const Index> start,
                                            span<const Index> count,
                                            span<const Index> stride,
                                            span<const Index> block) {
  ABSL_LOG_IF(INFO, hdf5_logging.Level(1))
      << "H5Sselect_hyperslab(" << id_ << ", start=" << StrCat(start)
      << ", count=" << StrCat(count) << ", stride=" << StrCat(stride)
      << ", block=" << StrCat(block) << ")";
  const auto h_start = ToHsize(start);
  const auto h_count = ToHsize(count);
  const auto h_stride = ToHsize(stride);
  const auto h_block = ToHsize(block);
  return CheckHerr(
      H5Sselect_hyperslab(id_, ToHdf5(op), h_start.data(), h_stride.data(),
                          h_count.data(), h_block.data()),
      "H5Sselect_hyperslab");
}

absl::Status Hdf5Dataspace::SelectElements(PointsOp op,
                                           span<const Index> coordinates) {
  const int rank = H5Sget_simple_extent_ndims(id_);
  if (rank <= 0 || coordinates.size() % rank != 0) {
    return absl::InvalidArgumentError(StrCat(
        "Invalid point coordinates ", coordinates, " for rank ", rank));
  }
  const auto h_coordinates = ToHsize(coordinates);
  return CheckHerr(H5Sselect_elements(id_, ToHdf5(op),
                                      coordinates.size() / rank,
                                      h_coordinates.data()),
                   "H5Sselect_elements");
}

Result<Index> Hdf5Dataspace::GetSelectNpoints() const {
  const hssize_t n = H5Sget_select_npoints(id_);
  if (n < 0) return Hdf5Error("H5Sget_select_npoints");
  return static_cast<Index>(n);
}

Result<SelectionBounds> Hdf5Dataspace::GetSelectBounds() const {
  const int rank = H5Sget_simple_extent_ndims(id_);
  if (rank < 0) return Hdf5Error("H5Sget_simple_extent_ndims");
  SelectionBounds bounds;
  if (rank == 0) return bounds;
  std::vector<hsize_t> start(rank), end(rank);
  HYPERSLAB_RETURN_IF_ERROR(
      CheckHerr(H5Sget_select_bounds(id_, start.data(), end.data()),
                "H5Sget_select_bounds"));
  bounds.start.assign(start.begin(), start.end());
  bounds.end.assign(end.begin(), end.end());
  return bounds;
}

Result<std::unique_ptr<Dataspace>> Hdf5Dataspace::Copy() const {
  return Adopt(H5Scopy(id_), "H5Scopy");
}

absl::Status Hdf5Dataspace::OffsetSimple(span<const Index> offset) {
  const std::vector<hssize_t> h_offset(offset.begin(), offset.end());
  return CheckHerr(H5Soffset_simple(id_, h_offset.data()),
                   "H5Soffset_simple");
}

Result<bool> Hdf5Dataspace::SelectValid() const {
  const htri_t valid = H5Sselect_valid(id_);
  if (valid < 0) return Hdf5Error("H5Sselect_valid");
  return valid > 0;
}

Result<std::unique_ptr<Dataspace>> Hdf5DatasetHandle::CreateDataspace(
    span<const Index> shape) const {
  HYPERSLAB_ASSIGN_OR_RETURN(auto dataspace, Hdf5Dataspace::Create(shape));
  return std::unique_ptr<Dataspace>(std::move(dataspace));
}

Result<std::unique_ptr<Dataspace>> Hdf5DatasetHandle::ResolveRegion(
    const RegionReference& reference) const {
  if (dataset_ < 0) {
    return absl::InvalidArgumentError(
        "Cannot resolve a region reference without a dataset");
  }
  if (reference.data.size() != H5R_DSET_REG_REF_BUF_SIZE) {
    return absl::InvalidArgumentError(
        StrCat("Region reference must have ", H5R_DSET_REG_REF_BUF_SIZE,
               " bytes, but has ", reference.data.size()));
  }
  return Adopt(
      H5Rget_region(dataset_, H5R_DATASET_REGION, reference.data.data()),
      "H5Rget_region");
}

}  // namespace hyperslab
