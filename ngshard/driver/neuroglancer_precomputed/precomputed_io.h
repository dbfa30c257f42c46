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


#ifndef NGSHARD_DRIVER_NEUROGLANCER_PRECOMPUTED_PRECOMPUTED_IO_H_
#define NGSHARD_DRIVER_NEUROGLANCER_PRECOMPUTED_PRECOMPUTED_IO_H_

#include <stdint.h>

#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "absl/container/btree_map.h"
#include "absl/status/status.h"
#include "ngshard/driver/neuroglancer_precomputed/chunk_encoding.h"
#include "ngshard/driver/neuroglancer_precomputed/metadata.h"
#include "ngshard/internal/thread/thread_pool.h"
#include "ngshard/kvstore/accessor.h"
#include "ngshard/kvstore/chunk_coords.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/minishard.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/sharded_scale.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace internal_neuroglancer_precomputed {

/// Reads and writes the chunks of a precomputed volume through an
/// `Accessor`.
///
/// Chunks of sharded scales are buffered in memory (or in temporary files)
/// until `Close`.  Chunks of unsharded scales are written immediately.
///
/// Not thread-safe.
class PrecomputedIO {
 public:
  struct Options {
    /// Where sharded scales buffer chunk data before `Close`.
    neuroglancer_uint64_sharded::MiniShardStorage minishard_storage =
        neuroglancer_uint64_sharded::MiniShardStorage::kInMemory;
  };

  /// Opens an existing volume by reading its `info` file.
  ///
  /// \error `absl::StatusCode::kNotFound` if there is no `info` file.
  /// \error `absl::StatusCode::kInvalidArgument` if it is not valid.
  static Result<std::unique_ptr<PrecomputedIO>> Open(
      std::shared_ptr<Accessor> accessor, Options options = {});

  /// Creates a volume by writing `info`.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if `info` is not valid.
  /// \error `absl::StatusCode::kAlreadyExists` if an `info` file exists and
  ///     `overwrite` is `false`.
  static Result<std::unique_ptr<PrecomputedIO>> Create(
      const MultiscaleMetadata& info, std::shared_ptr<Accessor> accessor,
      bool overwrite = false, Options options = {});

  PrecomputedIO(const PrecomputedIO&) = delete;
  PrecomputedIO& operator=(const PrecomputedIO&) = delete;

  /// Checks that `coords` are the bounds of a chunk of scale `scale_key`.
  ///
  /// \error `absl::StatusCode::kNotFound` if there is no such scale.
  /// \error `absl::StatusCode::kUnimplemented` if the scale has a non-zero
  ///     voxel offset.
  /// \error `absl::StatusCode::kOutOfRange` if `coords` lie outside the
  ///     volume.
  /// \error `absl::StatusCode::kInvalidArgument` if `coords` are not aligned
  ///     with a chunk size of the scale.
  absl::Status ValidateChunkCoords(std::string_view scale_key,
                                   const ChunkCoords& coords) const;

  /// Reads and decodes a chunk.
  ///
  /// \error `absl::StatusCode::kNotFound` if the chunk was never written.
  Result<ChunkArray> ReadChunk(std::string_view scale_key,
                               const ChunkCoords& coords);

  /// Encodes and writes a chunk, which must have the shape `coords`
  /// describe.
  absl::Status WriteChunk(std::string_view scale_key,
                          const ChunkCoords& coords, const ChunkArray& chunk);

  /// Writes out the shards of every sharded scale.  Shards are closed in
  /// parallel on `pool` if specified.
  absl::Status Close(internal::ThreadPool* pool = nullptr);

  const MultiscaleMetadata& info() const { return info_; }
  const std::shared_ptr<Accessor>& accessor() const { return accessor_; }

 private:
  struct ScaleState {
    const ScaleMetadata* metadata = nullptr;
    std::optional<ChunkEncoder> encoder;
    std::unique_ptr<neuroglancer_uint64_sharded::ShardedScale> sharded;
  };

  PrecomputedIO(MultiscaleMetadata info, std::shared_ptr<Accessor> accessor,
                Options options);

  Result<ScaleState*> GetScaleState(std::string_view scale_key);

  MultiscaleMetadata info_;
  std::shared_ptr<Accessor> accessor_;
  Options options_;
  absl::btree_map<std::string, ScaleState, std::less<>> scales_;
};

}  // namespace internal_neuroglancer_precomputed
}  // namespace ngshard

#endif  // NGSHARD_DRIVER_NEUROGLANCER_PRECOMPUTED_PRECOMPUTED_IO_H_
