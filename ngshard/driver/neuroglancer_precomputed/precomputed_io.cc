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


#include "ngshard/driver/neuroglancer_precomputed/precomputed_io.h"

#include <stdint.h>

#include <algorithm>
#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "ngshard/driver/neuroglancer_precomputed/chunk_encoding.h"
#include "ngshard/driver/neuroglancer_precomputed/metadata.h"
#include "ngshard/internal/log/verbose_flag.h"
#include "ngshard/kvstore/accessor.h"
#include "ngshard/kvstore/chunk_coords.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/compressed_morton_code.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/sharded_scale.h"
#include "ngshard/util/quote_string.h"
#include "ngshard/util/result.h"
#include "ngshard/util/status.h"

namespace ngshard {
namespace internal_neuroglancer_precomputed {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag precomputed_logging("precomputed");

constexpr char kInfoMimeType[] = "application/json";

bool IsChunkOf(const ChunkCoords& coords, const std::array<int64_t, 3>& size,
               const std::array<int64_t, 3>& chunk_size) {
  for (int i = 0; i < 3; ++i) {
    const int64_t min = coords[2 * i];
    const int64_t max = coords[2 * i + 1];
    if (min % chunk_size[i] != 0) return false;
    if (max != std::min(min + chunk_size[i], size[i])) return false;
  }
  return true;
}

std::array<int64_t, 3> GetChunkExtent(const ChunkCoords& coords) {
  return {coords[1] - coords[0], coords[3] - coords[2],
          coords[5] - coords[4]};
}

}  // namespace

PrecomputedIO::PrecomputedIO(MultiscaleMetadata info,
                             std::shared_ptr<Accessor> accessor,
                             Options options)
    : info_(std::move(info)),
      accessor_(std::move(accessor)),
      options_(options) {
  for (const auto& scale : info_.scales) {
    scales_[scale.key].metadata = &scale;
  }
}

Result<std::unique_ptr<PrecomputedIO>> PrecomputedIO::Open(
    std::shared_ptr<Accessor> accessor, Options options) {
  NGSHARD_ASSIGN_OR_RETURN(auto value, accessor->FetchFile(kMetadataKey));
  auto j = ::nlohmann::json::parse(std::string(value), nullptr,
                                   /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid JSON in ", QuoteString(kMetadataKey)));
  }
  NGSHARD_ASSIGN_OR_RETURN(
      auto info, ParseMultiscaleMetadata(j),
      MaybeAnnotateStatus(
          _, absl::StrCat("Error parsing ", QuoteString(kMetadataKey))));
  ABSL_LOG_IF(INFO, precomputed_logging)
      << "Opened volume with " << info.scales.size() << " scales";
  return std::unique_ptr<PrecomputedIO>(
      new PrecomputedIO(std::move(info), std::move(accessor), options));
}

Result<std::unique_ptr<PrecomputedIO>> PrecomputedIO::Create(
    const MultiscaleMetadata& info, std::shared_ptr<Accessor> accessor,
    bool overwrite, Options options) {
  auto j = ToJson(info);
  // Metadata assembled in memory gets the same validation as a parsed file.
  NGSHARD_ASSIGN_OR_RETURN(auto validated, ParseMultiscaleMetadata(j));
  StoreOptions store_options;
  store_options.mime_type = kInfoMimeType;
  store_options.overwrite = overwrite;
  NGSHARD_RETURN_IF_ERROR(
      accessor->StoreFile(kMetadataKey, absl::Cord(j.dump()), store_options));
  return std::unique_ptr<PrecomputedIO>(
      new PrecomputedIO(std::move(validated), std::move(accessor), options));
}

absl::Status PrecomputedIO::ValidateChunkCoords(
    std::string_view scale_key, const ChunkCoords& coords) const {
  const ScaleMetadata* scale = FindScale(info_, scale_key);
  if (!scale) {
    return absl::NotFoundError(
        absl::StrCat("No scale with key ", QuoteString(scale_key)));
  }
  if (scale->voxel_offset != std::array<int64_t, 3>{}) {
    return absl::UnimplementedError(absl::StrCat(
        "Scale ", QuoteString(scale_key),
        " has a non-zero voxel_offset, which is not supported"));
  }
  for (int i = 0; i < 3; ++i) {
    const int64_t min = coords[2 * i];
    const int64_t max = coords[2 * i + 1];
    if (min < 0 || min >= max || max > scale->size[i]) {
      return absl::OutOfRangeError(absl::StrCat(
          "Chunk ", FormatChunkCoords(coords), " is outside scale ",
          QuoteString(scale_key)));
    }
  }
  for (const auto& chunk_size : scale->chunk_sizes) {
    if (IsChunkOf(coords, scale->size, chunk_size)) return absl::OkStatus();
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Chunk ", FormatChunkCoords(coords),
                   " is not aligned with a chunk size of scale ",
                   QuoteString(scale_key)));
}

Result<PrecomputedIO::ScaleState*> PrecomputedIO::GetScaleState(
    std::string_view scale_key) {
  auto it = scales_.find(scale_key);
  if (it == scales_.end()) {
    return absl::NotFoundError(
        absl::StrCat("No scale with key ", QuoteString(scale_key)));
  }
  ScaleState& state = it->second;
  const ScaleMetadata& scale = *state.metadata;
  if (!state.encoder) {
    NGSHARD_ASSIGN_OR_RETURN(auto encoder, ChunkEncoder::Create(info_, scale));
    state.encoder = std::move(encoder);
  }
  if (scale.sharding && !state.sharded) {
    NGSHARD_ASSIGN_OR_RETURN(
        auto volume_spec,
        neuroglancer_uint64_sharded::ShardVolumeSpec::Create(
            scale.chunk_sizes[0], scale.size));
    state.sharded = std::make_unique<neuroglancer_uint64_sharded::ShardedScale>(
        *scale.sharding, volume_spec, accessor_, scale.key,
        options_.minishard_storage);
    ABSL_LOG_IF(INFO, precomputed_logging)
        << "Opened sharded scale " << QuoteString(scale.key);
  }
  return &state;
}

Result<ChunkArray> PrecomputedIO::ReadChunk(std::string_view scale_key,
                                            const ChunkCoords& coords) {
  NGSHARD_RETURN_IF_ERROR(ValidateChunkCoords(scale_key, coords));
  NGSHARD_ASSIGN_OR_RETURN(auto* state, GetScaleState(scale_key));
  absl::Cord encoded;
  if (state->sharded) {
    NGSHARD_ASSIGN_OR_RETURN(encoded, state->sharded->FetchChunk(coords));
  } else {
    NGSHARD_ASSIGN_OR_RETURN(encoded,
                             accessor_->FetchChunk(scale_key, coords));
  }
  NGSHARD_ASSIGN_OR_RETURN(
      auto chunk, state->encoder->Decode(encoded, GetChunkExtent(coords)),
      MaybeAnnotateStatus(_, absl::StrCat("Error decoding chunk ", scale_key,
                                          "/", FormatChunkCoords(coords))));
  return chunk;
}

absl::Status PrecomputedIO::WriteChunk(std::string_view scale_key,
                                       const ChunkCoords& coords,
                                       const ChunkArray& chunk) {
  NGSHARD_RETURN_IF_ERROR(ValidateChunkCoords(scale_key, coords));
  NGSHARD_ASSIGN_OR_RETURN(auto* state, GetScaleState(scale_key));
  const auto extent = GetChunkExtent(coords);
  if (chunk.shape[1] != extent[2] || chunk.shape[2] != extent[1] ||
      chunk.shape[3] != extent[0]) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Chunk of shape [", chunk.shape[1], ", ", chunk.shape[2], ", ",
        chunk.shape[3], "] (zyx) does not match bounds ",
        FormatChunkCoords(coords)));
  }
  NGSHARD_ASSIGN_OR_RETURN(auto encoded, state->encoder->Encode(chunk));
  if (state->sharded) {
    return state->sharded->StoreChunk(coords, encoded);
  }
  StoreOptions store_options;
  store_options.mime_type = std::string(state->encoder->mime_type());
  store_options.overwrite = true;
  return accessor_->StoreChunk(scale_key, coords, std::move(encoded),
                               store_options);
}

absl::Status PrecomputedIO::Close(internal::ThreadPool* pool) {
  absl::Status status;
  for (auto& [key, state] : scales_) {
    if (!state.sharded) continue;
    status.Update(state.sharded->Close(pool));
  }
  return status;
}

}  // namespace internal_neuroglancer_precomputed
}  // namespace ngshard
