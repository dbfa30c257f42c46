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


#include "ngshard/kvstore/neuroglancer_uint64_sharded/minishard_index.h"

#include <stddef.h>
#include <stdint.h>

#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/base/internal/endian.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "ngshard/kvstore/byte_range.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/uint64_sharded.h"
#include "ngshard/util/result.h"
#include "ngshard/util/status.h"

namespace ngshard {
namespace neuroglancer_uint64_sharded {
namespace {

constexpr uint64_t kMaxOffset =
    static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

}  // namespace

std::ostream& operator<<(std::ostream& os, const MinishardIndexEntry& e) {
  return os << "{chunk_id=" << e.chunk_id << ", byte_range=" << e.byte_range
            << "}";
}

absl::Cord EncodeMinishardIndex(
    absl::Span<const MinishardIndexEntry> minishard_index) {
  const size_t n = minishard_index.size();
  std::string out(n * 24, '\0');
  uint64_t prev_chunk_id = 0;
  int64_t prev_offset = 0;
  for (size_t i = 0; i < n; ++i) {
    const auto& e = minishard_index[i];
    absl::little_endian::Store64(&out[i * 8], e.chunk_id - prev_chunk_id);
    absl::little_endian::Store64(
        &out[n * 8 + i * 8],
        static_cast<uint64_t>(e.byte_range.inclusive_min - prev_offset));
    absl::little_endian::Store64(
        &out[n * 16 + i * 8],
        static_cast<uint64_t>(e.byte_range.exclusive_max -
                              e.byte_range.inclusive_min));
    prev_chunk_id = e.chunk_id;
    prev_offset = e.byte_range.exclusive_max;
  }
  return absl::Cord(std::move(out));
}

Result<std::vector<MinishardIndexEntry>> DecodeMinishardIndex(
    const absl::Cord& input, ShardSpec::DataEncoding encoding) {
  NGSHARD_ASSIGN_OR_RETURN(
      absl::Cord decoded_input, DecodeData(input, encoding),
      MaybeAnnotateStatus(_, "Error decoding minishard index"));
  if ((decoded_input.size() % 24) != 0) {
    return absl::DataLossError(
        absl::StrCat("Invalid minishard index length: ", decoded_input.size()));
  }
  const size_t n = decoded_input.size() / 24;
  std::vector<MinishardIndexEntry> result(n);
  const std::string flat(decoded_input);
  uint64_t chunk_id = 0;
  uint64_t byte_offset = 0;
  for (size_t i = 0; i < n; ++i) {
    auto& entry = result[i];
    const uint64_t chunk_id_delta =
        absl::little_endian::Load64(flat.data() + i * 8);
    if (i != 0 && chunk_id_delta == 0) {
      return absl::DataLossError(absl::StrCat(
          "Chunk ", chunk_id, " occurs more than once in the minishard index"));
    }
    if (chunk_id_delta > std::numeric_limits<uint64_t>::max() - chunk_id) {
      return absl::DataLossError(
          absl::StrCat("Chunk id overflow in minishard index entry ", i));
    }
    chunk_id += chunk_id_delta;
    entry.chunk_id = chunk_id;
    const uint64_t offset_delta =
        absl::little_endian::Load64(flat.data() + n * 8 + i * 8);
    const uint64_t length =
        absl::little_endian::Load64(flat.data() + n * 16 + i * 8);
    if (offset_delta > kMaxOffset - byte_offset ||
        length > kMaxOffset - (byte_offset + offset_delta)) {
      return absl::DataLossError(absl::StrCat(
          "Invalid byte range in minishard index for chunk ", chunk_id,
          ": offset overflow"));
    }
    byte_offset += offset_delta;
    entry.byte_range.inclusive_min = static_cast<int64_t>(byte_offset);
    byte_offset += length;
    entry.byte_range.exclusive_max = static_cast<int64_t>(byte_offset);
  }
  return result;
}

absl::Cord EncodeShardIndex(absl::Span<const ShardIndexEntry> shard_index) {
  std::string out(shard_index.size() * 16, '\0');
  for (size_t i = 0; i < shard_index.size(); ++i) {
    const auto& e = shard_index[i];
    absl::little_endian::Store64(&out[i * 16],
                                 static_cast<uint64_t>(e.inclusive_min));
    absl::little_endian::Store64(&out[i * 16 + 8],
                                 static_cast<uint64_t>(e.exclusive_max));
  }
  return absl::Cord(std::move(out));
}

Result<std::vector<ShardIndexEntry>> DecodeShardIndex(const absl::Cord& input,
                                                      const ShardSpec& spec) {
  const int64_t expected_size = spec.ShardIndexSize();
  if (static_cast<int64_t>(input.size()) != expected_size) {
    return absl::DataLossError(
        absl::StrCat("Expected shard index of ", expected_size,
                     " bytes, but received: ", input.size(), " bytes"));
  }
  const std::string flat(input);
  std::vector<ShardIndexEntry> result(static_cast<size_t>(expected_size / 16));
  for (size_t i = 0; i < result.size(); ++i) {
    const uint64_t start = absl::little_endian::Load64(flat.data() + i * 16);
    const uint64_t end = absl::little_endian::Load64(flat.data() + i * 16 + 8);
    if (start > kMaxOffset || end > kMaxOffset || end < start) {
      return absl::DataLossError(
          absl::StrCat("Shard index specified invalid byte range for "
                       "minishard ",
                       i, ": [", start, ", ", end, ")"));
    }
    result[i] = ByteRange{static_cast<int64_t>(start),
                          static_cast<int64_t>(end)};
  }
  return result;
}

Result<ByteRange> GetAbsoluteShardByteRange(ByteRange relative_range,
                                            const ShardSpec& spec) {
  const int64_t offset = spec.ShardIndexSize();
  if (!relative_range.SatisfiesInvariants() ||
      relative_range.exclusive_max >
          std::numeric_limits<int64_t>::max() - offset) {
    return absl::DataLossError(absl::StrCat(
        "Byte range [", relative_range.inclusive_min, ", ",
        relative_range.exclusive_max,
        ") relative to the end of the shard index is not valid"));
  }
  return ByteRange{relative_range.inclusive_min + offset,
                   relative_range.exclusive_max + offset};
}

std::optional<ByteRange> FindChunkInMinishard(
    absl::Span<const MinishardIndexEntry> minishard_index, uint64_t chunk_id) {
  auto it = absl::c_lower_bound(
      minishard_index, chunk_id,
      [](const MinishardIndexEntry& e, uint64_t chunk_id) {
        return e.chunk_id < chunk_id;
      });
  if (it == minishard_index.end() || it->chunk_id != chunk_id) {
    return std::nullopt;
  }
  return it->byte_range;
}

}  // namespace neuroglancer_uint64_sharded
}  // namespace ngshard
