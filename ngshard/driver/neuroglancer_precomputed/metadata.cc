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


#include "ngshard/driver/neuroglancer_precomputed/metadata.h"

#include <stddef.h>
#include <stdint.h>

#include <array>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "ngshard/driver/neuroglancer_precomputed/data_type.h"
#include "ngshard/internal/json/value_as.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/compressed_morton_code.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/uint64_sharded.h"
#include "ngshard/util/quote_string.h"
#include "ngshard/util/result.h"
#include "ngshard/util/status.h"

namespace ngshard {
namespace internal_neuroglancer_precomputed {
namespace {

using ::ngshard::internal_json::JsonExtractMember;
using ::ngshard::internal_json::JsonRequireInteger;
using ::ngshard::internal_json::JsonRequireIntegerTriple;
using ::ngshard::internal_json::JsonRequireNumberTriple;
using ::ngshard::internal_json::JsonRequireString;
using ::ngshard::internal_json::MaybeAnnotateMemberError;
using ::ngshard::neuroglancer_uint64_sharded::ShardVolumeSpec;

constexpr int64_t kMaxSize = std::numeric_limits<int64_t>::max() / 2;

/// Removes member `name` from `obj` and parses it with `parse`.
template <typename Parse>
auto ParseMember(::nlohmann::json::object_t& obj, std::string_view name,
                 Parse parse)
    -> decltype(parse(std::declval<const ::nlohmann::json&>())) {
  auto member = JsonExtractMember(obj, name);
  if (!member) {
    return MaybeAnnotateMemberError(
        absl::InvalidArgumentError("Member is missing"), name);
  }
  auto result = parse(*member);
  if (!result.ok()) {
    return MaybeAnnotateMemberError(result.status(), name);
  }
  return result;
}

Result<::nlohmann::json::object_t> RequireObject(const ::nlohmann::json& j) {
  if (!j.is_object()) return internal_json::ExpectedError(j, "object");
  return j.get<::nlohmann::json::object_t>();
}

Result<std::vector<std::array<int64_t, 3>>> ParseChunkSizes(
    const ::nlohmann::json& j) {
  if (!j.is_array()) return internal_json::ExpectedError(j, "array");
  std::vector<std::array<int64_t, 3>> chunk_sizes;
  for (size_t i = 0; i < j.size(); ++i) {
    NGSHARD_ASSIGN_OR_RETURN(
        auto chunk_size, JsonRequireIntegerTriple(j[i], 1, kMaxSize),
        MaybeAnnotateStatus(_, absl::StrCat("Error parsing value at position ",
                                            i)));
    chunk_sizes.push_back(chunk_size);
  }
  if (chunk_sizes.empty()) {
    return absl::InvalidArgumentError(
        "At least one chunk size must be specified");
  }
  return chunk_sizes;
}

absl::Status ValidateShardedChunkSize(const ScaleMetadata& scale) {
  if (scale.chunk_sizes.size() != 1) {
    return absl::InvalidArgumentError(
        "Sharded format does not support more than one chunk size");
  }
  auto volume_spec = ShardVolumeSpec::Create(scale.chunk_sizes[0], scale.size);
  if (!volume_spec.ok()) {
    return MaybeAnnotateStatus(
        volume_spec.status(),
        absl::StrCat("\"size\" of ", ::nlohmann::json(scale.size).dump(),
                     " with \"chunk_sizes\" of ",
                     ::nlohmann::json(scale.chunk_sizes[0]).dump(),
                     " is not compatible with sharded format"));
  }
  return absl::OkStatus();
}

}  // namespace

std::string_view to_string(ScaleMetadata::Encoding e) {
  switch (e) {
    case ScaleMetadata::Encoding::raw:
      return "raw";
    case ScaleMetadata::Encoding::jpeg:
      return "jpeg";
    case ScaleMetadata::Encoding::compressed_segmentation:
      return "compressed_segmentation";
    case ScaleMetadata::Encoding::gzip:
      return "gzip";
  }
  return "raw";
}

std::ostream& operator<<(std::ostream& os, ScaleMetadata::Encoding e) {
  return os << to_string(e);
}

Result<ScaleMetadata::Encoding> ParseEncoding(std::string_view name) {
  for (auto e : {ScaleMetadata::Encoding::raw, ScaleMetadata::Encoding::jpeg,
                 ScaleMetadata::Encoding::compressed_segmentation,
                 ScaleMetadata::Encoding::gzip}) {
    if (to_string(e) == name) return e;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Invalid encoding ", QuoteString(name)));
}

absl::Status ValidateEncodingDataType(ScaleMetadata::Encoding encoding,
                                      DataType dtype, int64_t num_channels) {
  switch (encoding) {
    case ScaleMetadata::Encoding::raw:
    case ScaleMetadata::Encoding::gzip:
      break;
    case ScaleMetadata::Encoding::compressed_segmentation:
      if (dtype != DataType::uint32 && dtype != DataType::uint64) {
        return absl::InvalidArgumentError(absl::StrCat(
            "compressed_segmentation encoding only supported for "
            "uint32 and uint64, not for ",
            to_string(dtype)));
      }
      break;
    case ScaleMetadata::Encoding::jpeg:
      if (dtype != DataType::uint8) {
        return absl::InvalidArgumentError(absl::StrCat(
            "\"jpeg\" encoding only supported for uint8, not for ",
            to_string(dtype)));
      }
      if (num_channels != 1 && num_channels != 3) {
        return absl::InvalidArgumentError(absl::StrCat(
            "\"jpeg\" encoding only supports 1 or 3 channels, not ",
            num_channels));
      }
      break;
  }
  return absl::OkStatus();
}

Result<ScaleMetadata> ParseScaleMetadata(const ::nlohmann::json& j) {
  NGSHARD_ASSIGN_OR_RETURN(auto obj, RequireObject(j));
  ScaleMetadata scale;
  NGSHARD_ASSIGN_OR_RETURN(scale.key,
                           ParseMember(obj, kKeyId, [](const auto& x) {
                             return JsonRequireString(x);
                           }));
  NGSHARD_ASSIGN_OR_RETURN(scale.size,
                           ParseMember(obj, kSizeId, [](const auto& x) {
                             return JsonRequireIntegerTriple(x, 1, kMaxSize);
                           }));
  if (obj.count(kVoxelOffsetId)) {
    NGSHARD_ASSIGN_OR_RETURN(
        scale.voxel_offset, ParseMember(obj, kVoxelOffsetId, [](const auto& x) {
          return JsonRequireIntegerTriple(x, -kMaxSize, kMaxSize);
        }));
  }
  NGSHARD_ASSIGN_OR_RETURN(scale.chunk_sizes,
                           ParseMember(obj, kChunkSizesId, ParseChunkSizes));
  NGSHARD_ASSIGN_OR_RETURN(
      scale.encoding,
      ParseMember(obj, kEncodingId,
                  [](const auto& x) -> Result<ScaleMetadata::Encoding> {
                    NGSHARD_ASSIGN_OR_RETURN(auto name, JsonRequireString(x));
                    return ParseEncoding(name);
                  }));
  if (scale.encoding == ScaleMetadata::Encoding::compressed_segmentation) {
    NGSHARD_ASSIGN_OR_RETURN(
        scale.compressed_segmentation_block_size,
        ParseMember(obj, kCompressedSegmentationBlockSizeId,
                    [](const auto& x) {
                      return JsonRequireIntegerTriple(x, 1, kMaxSize);
                    }));
  } else if (obj.count(kCompressedSegmentationBlockSizeId)) {
    return MaybeAnnotateMemberError(
        absl::InvalidArgumentError(
            "Only valid for \"compressed_segmentation\" encoding"),
        kCompressedSegmentationBlockSizeId);
  }
  NGSHARD_ASSIGN_OR_RETURN(scale.resolution,
                           ParseMember(obj, kResolutionId, [](const auto& x) {
                             return JsonRequireNumberTriple(x);
                           }));
  if (auto sharding = JsonExtractMember(obj, kShardingId);
      sharding && !sharding->is_null()) {
    NGSHARD_ASSIGN_OR_RETURN(
        scale.sharding, ShardSpec::FromJson(*sharding),
        MaybeAnnotateMemberError(_, kShardingId));
    NGSHARD_RETURN_IF_ERROR(ValidateShardedChunkSize(scale));
  }
  scale.extra_attributes = std::move(obj);
  return scale;
}

Result<MultiscaleMetadata> ParseMultiscaleMetadata(const ::nlohmann::json& j) {
  NGSHARD_ASSIGN_OR_RETURN(auto obj, RequireObject(j));
  MultiscaleMetadata metadata;
  if (auto type_id = JsonExtractMember(obj, kAtSignTypeId)) {
    if (*type_id != kMultiscaleVolumeTypeId) {
      return MaybeAnnotateMemberError(
          absl::InvalidArgumentError(
              absl::StrCat("Expected ", QuoteString(kMultiscaleVolumeTypeId),
                           ", but received: ", type_id->dump())),
          kAtSignTypeId);
    }
  }
  NGSHARD_ASSIGN_OR_RETURN(metadata.type,
                           ParseMember(obj, kTypeId, [](const auto& x) {
                             return JsonRequireString(x);
                           }));
  NGSHARD_ASSIGN_OR_RETURN(
      metadata.data_type,
      ParseMember(obj, kDataTypeId, [](const auto& x) -> Result<DataType> {
        NGSHARD_ASSIGN_OR_RETURN(auto name, JsonRequireString(x));
        return ParseDataType(name);
      }));
  NGSHARD_ASSIGN_OR_RETURN(metadata.num_channels,
                           ParseMember(obj, kNumChannelsId, [](const auto& x) {
                             return JsonRequireInteger(x, 1, kMaxSize);
                           }));
  NGSHARD_ASSIGN_OR_RETURN(
      metadata.scales,
      ParseMember(obj, kScalesId,
                  [](const auto& x) -> Result<std::vector<ScaleMetadata>> {
                    if (!x.is_array()) {
                      return internal_json::ExpectedError(x, "array");
                    }
                    std::vector<ScaleMetadata> scales;
                    for (size_t i = 0; i < x.size(); ++i) {
                      NGSHARD_ASSIGN_OR_RETURN(
                          auto scale, ParseScaleMetadata(x[i]),
                          MaybeAnnotateStatus(
                              _, absl::StrCat(
                                     "Error parsing value at position ", i)));
                      scales.push_back(std::move(scale));
                    }
                    return scales;
                  }));
  metadata.extra_attributes = std::move(obj);
  absl::flat_hash_set<std::string> keys;
  for (const auto& scale : metadata.scales) {
    if (!keys.insert(scale.key).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicate scale key ", QuoteString(scale.key)));
    }
    NGSHARD_RETURN_IF_ERROR(ValidateEncodingDataType(
        scale.encoding, metadata.data_type, metadata.num_channels));
  }
  return metadata;
}

::nlohmann::json ToJson(const ScaleMetadata& metadata) {
  ::nlohmann::json j = metadata.extra_attributes;
  j[kKeyId] = metadata.key;
  j[kSizeId] = metadata.size;
  j[kVoxelOffsetId] = metadata.voxel_offset;
  j[kChunkSizesId] = metadata.chunk_sizes;
  j[kEncodingId] = std::string(to_string(metadata.encoding));
  if (metadata.encoding == ScaleMetadata::Encoding::compressed_segmentation) {
    j[kCompressedSegmentationBlockSizeId] =
        metadata.compressed_segmentation_block_size;
  }
  j[kResolutionId] = metadata.resolution;
  if (metadata.sharding) j[kShardingId] = metadata.sharding->ToJson();
  return j;
}

::nlohmann::json ToJson(const MultiscaleMetadata& metadata) {
  ::nlohmann::json j = metadata.extra_attributes;
  j[kAtSignTypeId] = kMultiscaleVolumeTypeId;
  j[kTypeId] = metadata.type;
  j[kDataTypeId] = std::string(to_string(metadata.data_type));
  j[kNumChannelsId] = metadata.num_channels;
  ::nlohmann::json::array_t scales;
  for (const auto& scale : metadata.scales) scales.push_back(ToJson(scale));
  j[kScalesId] = std::move(scales);
  return j;
}

const ScaleMetadata* FindScale(const MultiscaleMetadata& metadata,
                               std::string_view key) {
  for (const auto& scale : metadata.scales) {
    if (scale.key == key) return &scale;
  }
  return nullptr;
}

bool IsSharded(const MultiscaleMetadata& metadata) {
  if (metadata.scales.empty()) return false;
  for (const auto& scale : metadata.scales) {
    if (!scale.sharding) return false;
  }
  return true;
}

}  // namespace internal_neuroglancer_precomputed
}  // namespace ngshard
