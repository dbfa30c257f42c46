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

#ifndef NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_MINISHARD_INDEX_H_
#define NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_MINISHARD_INDEX_H_

/// \file
/// Encoding and decoding of the shard index table and of minishard indices.
///
/// The shard index is a table of `2**minishard_bits` entries, each a pair of
/// little-endian `uint64` values `(start, end)` giving the byte range of the
/// minishard index relative to the end of the table.
///
/// A minishard index with `n` entries is an array of `3 * n` little-endian
/// `uint64` values, stored column-major:
///
///     [chunk_id deltas..., offset deltas..., lengths...]
///
/// where the first chunk id delta is relative to 0, the first offset delta is
/// relative to the end of the shard index table, and each later offset delta
/// is relative to the end of the previous chunk.

#include <stdint.h>

#include <optional>
#include <ostream>
#include <vector>

#include "absl/strings/cord.h"
#include "absl/types/span.h"
#include "ngshard/kvstore/byte_range.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/uint64_sharded.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace neuroglancer_uint64_sharded {

/// Byte range of a minishard index, relative to the end of the shard index.
using ShardIndexEntry = ByteRange;

/// Single entry of a decoded minishard index.
struct MinishardIndexEntry {
  uint64_t chunk_id;
  /// Byte range of the chunk data relative to the end of the shard index.
  ByteRange byte_range;

  friend bool operator==(const MinishardIndexEntry& a,
                         const MinishardIndexEntry& b) {
    return a.chunk_id == b.chunk_id && a.byte_range == b.byte_range;
  }
  friend bool operator!=(const MinishardIndexEntry& a,
                         const MinishardIndexEntry& b) {
    return !(a == b);
  }
  friend std::ostream& operator<<(std::ostream& os,
                                  const MinishardIndexEntry& e);
};

/// Encodes a minishard index (before applying `minishard_index_encoding`).
///
/// \pre `minishard_index` is sorted by `chunk_id` and its byte ranges are
///     non-decreasing and non-overlapping.
absl::Cord EncodeMinishardIndex(
    absl::Span<const MinishardIndexEntry> minishard_index);

/// Decodes a minishard index, first reversing `encoding`.
///
/// \error `absl::StatusCode::kDataLoss` if the index is not valid.
Result<std::vector<MinishardIndexEntry>> DecodeMinishardIndex(
    const absl::Cord& input, ShardSpec::DataEncoding encoding);

/// Encodes a shard index table.
absl::Cord EncodeShardIndex(absl::Span<const ShardIndexEntry> shard_index);

/// Decodes a shard index table of `spec.ShardIndexSize()` bytes.
///
/// \error `absl::StatusCode::kDataLoss` if `input` has the wrong size or
///     specifies an invalid byte range.
Result<std::vector<ShardIndexEntry>> DecodeShardIndex(const absl::Cord& input,
                                                      const ShardSpec& spec);

/// Converts a byte range relative to the end of the shard index into an
/// absolute shard file byte range.
///
/// \error `absl::StatusCode::kDataLoss` on overflow.
Result<ByteRange> GetAbsoluteShardByteRange(ByteRange relative_range,
                                            const ShardSpec& spec);

/// Returns the byte range of `chunk_id` within a decoded minishard index, or
/// `std::nullopt` if it is not present.
std::optional<ByteRange> FindChunkInMinishard(
    absl::Span<const MinishardIndexEntry> minishard_index, uint64_t chunk_id);

}  // namespace neuroglancer_uint64_sharded
}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_MINISHARD_INDEX_H_
