// Copyright 2024 The NgShard Authors
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


#ifndef NGSHARD_DRIVER_NEUROGLANCER_PRECOMPUTED_METADATA_H_
#define NGSHARD_DRIVER_NEUROGLANCER_PRECOMPUTED_METADATA_H_

/// \file
/// Metadata handling for the Neuroglancer precomputed format.
///
/// The metadata of a multiscale volume is stored as JSON in the `info` file at
/// the root of the dataset.

#include <stdint.h>

#include <array>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include "absl/status/status.h"
#include "ngshard/driver/neuroglancer_precomputed/data_type.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/uint64_sharded.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace internal_neuroglancer_precomputed {

constexpr inline const char kAtSignTypeId[] = "@type";
constexpr inline const char kChunkSizesId[] = "chunk_sizes";
constexpr inline const char kCompressedSegmentationBlockSizeId[] =
    "compressed_segmentation_block_size";
constexpr inline const char kDataTypeId[] = "data_type";
constexpr inline const char kEncodingId[] = "encoding";
constexpr inline const char kKeyId[] = "key";
constexpr inline const char kMetadataKey[] = "info";
constexpr inline const char kNumChannelsId[] = "num_channels";
constexpr inline const char kResolutionId[] = "resolution";
constexpr inline const char kScalesId[] = "scales";
constexpr inline const char kShardingId[] = "sharding";
constexpr inline const char kSizeId[] = "size";
constexpr inline const char kTypeId[] = "type";
constexpr inline const char kVoxelOffsetId[] = "voxel_offset";

constexpr inline const char kMultiscaleVolumeTypeId[] =
    "neuroglancer_multiscale_volume";

using ShardSpec = ::ngshard::neuroglancer_uint64_sharded::ShardSpec;

/// Parsed representation of a single entry in the "scales" array of a
/// multiscale volume.
struct ScaleMetadata {
  enum class Encoding {
    raw,
    jpeg,
    compressed_segmentation,
    /// Raw chunk data compressed with gzip.
    gzip,
  };

  /// Equal to `"key"` member of JSON metadata.
  std::string key;
  /// Volume extent in xyz order.
  std::array<int64_t, 3> size{};
  std::array<int64_t, 3> voxel_offset{};
  std::vector<std::array<int64_t, 3>> chunk_sizes;
  Encoding encoding = Encoding::raw;
  /// Only meaningful for `Encoding::compressed_segmentation`.
  std::array<int64_t, 3> compressed_segmentation_block_size{};
  std::array<double, 3> resolution{};
  std::optional<ShardSpec> sharding;

  /// Additional members excluding those listed above.  These are preserved
  /// when re-writing the metadata.
  ::nlohmann::json::object_t extra_attributes;
};

std::string_view to_string(ScaleMetadata::Encoding e);
std::ostream& operator<<(std::ostream& os, ScaleMetadata::Encoding e);

/// Parses an encoding name.
///
/// \error `absl::StatusCode::kInvalidArgument` if `name` is unknown.
Result<ScaleMetadata::Encoding> ParseEncoding(std::string_view name);

/// Parsed representation of the multiscale volume `info` metadata file.
struct MultiscaleMetadata {
  std::string type;
  DataType data_type = DataType::uint8;
  int64_t num_channels = 1;
  std::vector<ScaleMetadata> scales;

  /// Extra JSON members (excluding the parsed members above).  These are
  /// preserved when re-writing the metadata.
  ::nlohmann::json::object_t extra_attributes;
};

/// Parses and validates one element of the `"scales"` array.
///
/// \error `absl::StatusCode::kInvalidArgument` if `j` is not valid.
Result<ScaleMetadata> ParseScaleMetadata(const ::nlohmann::json& j);

/// Parses and validates the `info` metadata.
///
/// \error `absl::StatusCode::kInvalidArgument` if `j` is not valid.
Result<MultiscaleMetadata> ParseMultiscaleMetadata(const ::nlohmann::json& j);

::nlohmann::json ToJson(const ScaleMetadata& metadata);
::nlohmann::json ToJson(const MultiscaleMetadata& metadata);

/// Validates that chunks of `dtype` with `num_channels` channels can be
/// stored with `encoding`.
absl::Status ValidateEncodingDataType(ScaleMetadata::Encoding encoding,
                                      DataType dtype, int64_t num_channels);

/// Returns the scale with the specified key, or `nullptr` if there is none.
const ScaleMetadata* FindScale(const MultiscaleMetadata& metadata,
                               std::string_view key);

/// Returns `true` if every scale of `metadata` is stored in the sharded
/// format.  A volume without scales is not sharded.
bool IsSharded(const MultiscaleMetadata& metadata);

}  // namespace internal_neuroglancer_precomputed
}  // namespace ngshard

#endif  // NGSHARD_DRIVER_NEUROGLANCER_PRECOMPUTED_METADATA_H_
