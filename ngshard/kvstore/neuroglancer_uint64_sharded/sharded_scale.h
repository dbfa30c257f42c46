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


#ifndef NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_SHARDED_SCALE_H_
#define NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_SHARDED_SCALE_H_

#include <stdint.h>

#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "ngshard/internal/thread/thread_pool.h"
#include "ngshard/kvstore/accessor.h"
#include "ngshard/kvstore/chunk_coords.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/compressed_morton_code.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/minishard.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/shard.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/uint64_sharded.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace neuroglancer_uint64_sharded {

/// Sharded storage of the chunks of one scale, stored below the directory
/// `key` of an accessor.
///
/// Shards are write-once: a shard is created by the first `StoreChunk` that
/// maps to it and written out by `Close`.  A shard that already exists is
/// read-only, and a shard that is still open for writing cannot be read.
///
/// Not thread-safe.
class ShardedScale {
 public:
  ShardedScale(const ShardSpec& spec, const ShardVolumeSpec& volume_spec,
               std::shared_ptr<Accessor> accessor, std::string key,
               MiniShardStorage storage = MiniShardStorage::kInMemory);

  ShardedScale(const ShardedScale&) = delete;
  ShardedScale& operator=(const ShardedScale&) = delete;

  /// Stores the encoded chunk `data` with voxel bounds `coords`.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` or
  ///     `absl::StatusCode::kOutOfRange` if `coords` is not a chunk of the
  ///     grid.
  /// \error `absl::StatusCode::kInvalidArgument` if `data` is empty.
  /// \error `absl::StatusCode::kFailedPrecondition` if the shard of the chunk
  ///     already exists.
  absl::Status StoreChunk(const ChunkCoords& coords, const absl::Cord& data);

  /// Returns the encoded chunk with voxel bounds `coords`.
  ///
  /// \error `absl::StatusCode::kNotFound` if the chunk was never stored.
  /// \error `absl::StatusCode::kFailedPrecondition` if its shard is still
  ///     open for writing.
  Result<absl::Cord> FetchChunk(const ChunkCoords& coords);

  /// Writes out every open shard.  Shards are closed concurrently on `pool`
  /// if specified, otherwise sequentially in shard key order.  All shards are
  /// attempted; the error of the lowest failing shard key is returned and
  /// failed shards remain open.
  absl::Status Close(internal::ThreadPool* pool = nullptr);

  /// Returns the `"sharding"` member of the scale metadata.
  ::nlohmann::json ToJson() const { return spec_.ToJson(); }

  const ShardSpec& spec() const { return spec_; }
  const ShardVolumeSpec& volume_spec() const { return volume_spec_; }
  const std::string& key() const { return key_; }

  /// Number of shards open for writing.
  size_t num_open_shards() const { return writers_.size(); }

 private:
  Result<ShardWriter*> GetWriter(uint64_t shard_key);
  ShardReader* GetReader(uint64_t shard_key);

  ShardSpec spec_;
  ShardVolumeSpec volume_spec_;
  std::shared_ptr<Accessor> accessor_;
  std::string key_;
  MiniShardStorage storage_;
  absl::btree_map<uint64_t, std::unique_ptr<ShardWriter>> writers_;
  absl::flat_hash_map<uint64_t, std::unique_ptr<ShardReader>> readers_;
};

}  // namespace neuroglancer_uint64_sharded
}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_SHARDED_SCALE_H_
