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

#ifndef NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_MINISHARD_H_
#define NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_MINISHARD_H_

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <optional>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/types/span.h"
#include "ngshard/kvstore/accessor.h"
#include "ngshard/kvstore/byte_range.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/minishard_index.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/uint64_sharded.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace neuroglancer_uint64_sharded {

/// Where a `MiniShard` accumulates chunk data until the shard is written.
enum class MiniShardStorage {
  kInMemory,
  /// Spill to an unlinked temporary file, reclaimed when the `MiniShard` is
  /// destroyed.
  kTemporaryFile,
};

/// Append-only byte region.
class SpillBuffer {
 public:
  static Result<std::unique_ptr<SpillBuffer>> Create(MiniShardStorage storage);

  virtual ~SpillBuffer();
  virtual absl::Status Append(const absl::Cord& data) = 0;
  virtual Result<absl::Cord> Read(ByteRange range) const = 0;
  /// Discards all data.
  virtual absl::Status Clear() = 0;
  virtual int64_t size() const = 0;
};

/// Write side of a single minishard.
///
/// Chunks of one minishard have chunk ids (compressed Morton codes) that
/// share the low `minishard_bits + shard_bits` bits, so consecutive chunks are
/// `1 << (minishard_bits + shard_bits)` apart.  Chunks may be stored in any
/// order; a chunk that is not the next expected one is held back until the
/// gap before it is filled, so that chunk data is always laid out in
/// increasing chunk id order.
class MiniShard {
 public:
  static Result<MiniShard> Create(
      const ShardSpec& spec,
      MiniShardStorage storage = MiniShardStorage::kInMemory);

  MiniShard(MiniShard&&) = default;
  MiniShard& operator=(MiniShard&&) = default;

  /// Stores the unencoded chunk `data` with chunk id `cmc`.  The shard's
  /// `data_encoding` is applied before the chunk is buffered.
  ///
  /// \error `absl::StatusCode::kInternal` if `cmc` precedes a chunk already
  ///     laid out, or was stored before.
  /// \error `absl::StatusCode::kInvalidArgument` if `cmc` belongs to a
  ///     different minishard, or if `data` is empty.
  /// \error `absl::StatusCode::kFailedPrecondition` after `Close`.
  absl::Status StoreChunk(uint64_t cmc, const absl::Cord& data);

  /// Lays out all held-back chunks, inserting zero-length entries for the
  /// chunk ids missing before them.
  absl::Status Close();

  /// Returns `true` if no chunk has been stored.
  bool empty() const { return entries_.empty() && pending_.empty(); }

  bool closed() const { return closed_; }

  /// Number of chunks held back waiting for a predecessor.
  size_t num_buffered() const { return pending_.size(); }

  /// Chunk id expected next, or `std::nullopt` if no chunk was stored yet or
  /// the chunk id space of the minishard is exhausted.
  std::optional<uint64_t> next_cmc() const;

  /// Index entries laid out so far, with byte ranges relative to the start
  /// of the minishard data.
  absl::Span<const MinishardIndexEntry> entries() const { return entries_; }

  /// Size of the laid out chunk data.
  int64_t data_size() const { return data_->size(); }

  /// Appends the laid out chunk data to `writer`.
  absl::Status WriteData(FileWriter& writer) const;

  /// Returns the encoded minishard index, with byte ranges shifted by
  /// `data_offset`, the offset of the minishard data from the end of the shard
  /// index.
  absl::Cord EncodeIndex(int64_t data_offset) const;

 private:
  MiniShard(const ShardSpec& spec, std::unique_ptr<SpillBuffer> data,
            std::unique_ptr<SpillBuffer> pending_data);

  uint64_t NextCmc() const;
  absl::Status Append(uint64_t cmc, const absl::Cord& data);
  absl::Status Drain();

  ShardSpec spec_;
  /// Number of low bits shared by all chunk ids of the minishard.
  int stride_bits_;
  /// Value of the shared low bits, set by the first `StoreChunk`.
  std::optional<uint64_t> masked_bits_;
  uint64_t appended_ = 0;
  /// Set once `appended_ << stride_bits_` no longer fits in 64 bits.
  bool exhausted_ = false;
  bool closed_ = false;
  std::vector<MinishardIndexEntry> entries_;
  std::unique_ptr<SpillBuffer> data_;
  /// Held-back chunks, keyed by chunk id, as ranges of `pending_data_`.
  absl::btree_map<uint64_t, ByteRange> pending_;
  std::unique_ptr<SpillBuffer> pending_data_;
};

}  // namespace neuroglancer_uint64_sharded
}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_MINISHARD_H_
