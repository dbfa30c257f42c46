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

#ifndef NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_SHARD_H_
#define NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_SHARD_H_

/// \file
/// Writing and reading of a single shard.
///
/// A shard is stored either as a single `<key>.shard` file, or in the legacy
/// layout as `<key>.index`, holding the shard index table, and `<key>.data`,
/// holding everything after it.  Shards are always written in the single
/// file layout:
///
///     [shard index table]
///     [data of each non-empty minishard, in minishard order]
///     [index of each non-empty minishard, in minishard order]

#include <stdint.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "ngshard/kvstore/accessor.h"
#include "ngshard/kvstore/byte_range.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/minishard.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/minishard_index.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/uint64_sharded.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace neuroglancer_uint64_sharded {

/// Returns the path of the file `GetShardFileName(spec, shard_key, suffix)`
/// within `directory`.
std::string GetShardPath(std::string_view directory, const ShardSpec& spec,
                         uint64_t shard_key, std::string_view suffix);

/// Accumulates the chunks of one shard and writes the shard file on `Close`.
class ShardWriter {
 public:
  ShardWriter(const ShardSpec& spec, uint64_t shard_key,
              std::shared_ptr<Accessor> accessor, std::string directory,
              MiniShardStorage storage = MiniShardStorage::kInMemory);

  ShardWriter(const ShardWriter&) = delete;
  ShardWriter& operator=(const ShardWriter&) = delete;

  /// Stores the unencoded chunk `data` with chunk id `cmc`.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if `cmc` belongs to another
  ///     shard.
  /// \error `absl::StatusCode::kFailedPrecondition` after `Close`.
  absl::Status StoreChunk(uint64_t cmc, const absl::Cord& data);

  /// Writes the shard file and releases all buffered data.  Subsequent calls
  /// return `absl::OkStatus()` without effect.
  absl::Status Close();

  uint64_t shard_key() const { return shard_key_; }
  bool closed() const { return closed_; }

  /// Path of the shard file relative to the accessor root.
  const std::string& path() const { return path_; }

 private:
  ShardSpec spec_;
  uint64_t shard_key_;
  std::shared_ptr<Accessor> accessor_;
  std::string path_;
  MiniShardStorage storage_;
  bool closed_ = false;
  absl::btree_map<uint64_t, MiniShard> minishards_;
};

/// Strategy for reading byte ranges of a stored shard, where offsets are
/// those of the single file layout.
class ShardLayout {
 public:
  virtual ~ShardLayout();

  virtual Result<absl::Cord> ReadBytes(ByteRange range) = 0;

  /// Describes the layout for messages, e.g. `"0a.shard"`.
  virtual std::string Describe() const = 0;
};

/// Layout of a single `<key>.shard` file.
class ModernShardLayout : public ShardLayout {
 public:
  ModernShardLayout(std::shared_ptr<Accessor> accessor, std::string path);

  Result<absl::Cord> ReadBytes(ByteRange range) override;
  std::string Describe() const override;

 private:
  std::shared_ptr<Accessor> accessor_;
  std::string path_;
};

/// Layout split into `<key>.index` and `<key>.data` files.  Offsets below
/// `index_size` refer to the index file, and the remaining offsets to the data
/// file, shifted by `index_size`.
class LegacyShardLayout : public ShardLayout {
 public:
  LegacyShardLayout(std::shared_ptr<Accessor> accessor, std::string index_path,
                    std::string data_path, int64_t index_size);

  Result<absl::Cord> ReadBytes(ByteRange range) override;
  std::string Describe() const override;

 private:
  std::shared_ptr<Accessor> accessor_;
  std::string index_path_;
  std::string data_path_;
  int64_t index_size_;
};

/// Returns the layout of shard `shard_key` in `directory`, or `nullptr` if
/// the shard does not exist.  The single file layout takes precedence; the
/// legacy layout requires both of its files.
Result<std::unique_ptr<ShardLayout>> DetectShardLayout(
    std::shared_ptr<Accessor> accessor, std::string_view directory,
    const ShardSpec& spec, uint64_t shard_key);

/// Reads chunks from a stored shard.
///
/// The layout, the shard index and all minishard indices are loaded on first
/// use.
class ShardReader {
 public:
  ShardReader(const ShardSpec& spec, uint64_t shard_key,
              std::shared_ptr<Accessor> accessor, std::string directory);

  ShardReader(const ShardReader&) = delete;
  ShardReader& operator=(const ShardReader&) = delete;

  /// Returns `true` if the shard exists in either layout.
  Result<bool> Exists();

  /// Returns the decoded data of chunk `cmc`.
  ///
  /// \error `absl::StatusCode::kNotFound` if the shard does not exist or does
  ///     not contain the chunk.
  /// \error `absl::StatusCode::kDataLoss` if the shard is corrupt.
  Result<absl::Cord> FetchChunk(uint64_t cmc);

  /// Returns the decoded minishard indices, keyed by minishard, with byte
  /// ranges relative to the start of the shard.
  Result<const absl::flat_hash_map<uint64_t, std::vector<MinishardIndexEntry>>*>
  GetMinishardIndices();

  uint64_t shard_key() const { return shard_key_; }

 private:
  absl::Status EnsureLoaded();
  std::string Describe() const;

  ShardSpec spec_;
  uint64_t shard_key_;
  std::shared_ptr<Accessor> accessor_;
  std::string directory_;
  bool loaded_ = false;
  /// `nullptr` if the shard does not exist.
  std::unique_ptr<ShardLayout> layout_;
  absl::flat_hash_map<uint64_t, std::vector<MinishardIndexEntry>>
      minishard_indices_;
};

}  // namespace neuroglancer_uint64_sharded
}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_SHARD_H_
