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

#ifndef NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_UINT64_SHARDED_H_
#define NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_UINT64_SHARDED_H_

/// \file
/// Common definitions for the `neuroglancer_uint64_sharded_v1` format.
///
/// Chunks are addressed by a 64-bit chunk id, which for volumetric chunks is
/// the compressed Morton code of the chunk grid position.  The low
/// `minishard_bits` bits of the (hashed) id select the minishard, and the
/// next `shard_bits` bits select the shard file.

#include <stdint.h>

#include <iosfwd>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include <nlohmann/json.hpp>
#include "ngshard/util/result.h"

namespace ngshard {
namespace neuroglancer_uint64_sharded {

/// Largest supported `minishard_bits`: the shard index table of
/// `16 << minishard_bits` bytes must be addressable with `int64_t` offsets.
constexpr int kMaxMinishardBits = 58;

/// Specifies a sharded layout, as stored in the `"sharding"` member of a
/// scale in the `info` manifest.
struct ShardSpec {
  enum class HashFunction {
    identity,
  };

  enum class DataEncoding {
    raw,
    gzip,
  };

  HashFunction hash_function = HashFunction::identity;
  int preshift_bits = 0;
  int minishard_bits = 0;
  int shard_bits = 0;
  DataEncoding data_encoding = DataEncoding::raw;
  DataEncoding minishard_index_encoding = DataEncoding::raw;

  /// Returns a validated spec.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if a bit width is negative,
  ///     `minishard_bits > kMaxMinishardBits`,
  ///     `minishard_bits + shard_bits > 64`, `preshift_bits != 0`, or a hash
  ///     or encoding name is not supported.
  static Result<ShardSpec> Create(int minishard_bits, int shard_bits,
                                  std::string_view hash = "identity",
                                  std::string_view minishard_index_encoding =
                                      "raw",
                                  std::string_view data_encoding = "raw",
                                  int preshift_bits = 0);

  /// Parses a `"sharding"` JSON object.  `data_encoding` and
  /// `minishard_index_encoding` default to `"raw"`; all other members are
  /// required.
  static Result<ShardSpec> FromJson(const ::nlohmann::json& j);

  /// Returns the `"sharding"` JSON object, including `"@type"`.
  ::nlohmann::json ToJson() const;

  absl::Status Validate() const;

  /// Mask of the low `minishard_bits` bits.
  uint64_t minishard_mask() const;

  /// Mask of the `shard_bits` bits above the minishard bits.
  uint64_t shard_mask() const;

  /// Returns the shard number of `chunk_id`.
  uint64_t GetShardKey(uint64_t chunk_id) const;

  /// Returns the minishard number of `chunk_id`.
  uint64_t GetMinishardKey(uint64_t chunk_id) const;

  /// Returns the combined shard and minishard bits of `chunk_id`.
  uint64_t GetShardAndMinishardBits(uint64_t chunk_id) const;

  /// Returns the size in bytes of the shard index table,
  /// `16 << minishard_bits`.  Requires a valid spec.
  int64_t ShardIndexSize() const;

  friend bool operator==(const ShardSpec& a, const ShardSpec& b);
  friend bool operator!=(const ShardSpec& a, const ShardSpec& b) {
    return !(a == b);
  }
  friend std::ostream& operator<<(std::ostream& os, const ShardSpec& x);
};

std::string_view DataEncodingToString(ShardSpec::DataEncoding encoding);
Result<ShardSpec::DataEncoding> ParseDataEncoding(std::string_view name);

/// Applies `encoding` to `input`.
absl::Cord EncodeData(const absl::Cord& input,
                      ShardSpec::DataEncoding encoding);

/// Reverses `EncodeData`.
///
/// \error `absl::StatusCode::kDataLoss` if `input` is not valid gzip data.
Result<absl::Cord> DecodeData(const absl::Cord& input,
                              ShardSpec::DataEncoding encoding);

/// Returns the file name of shard `shard_key`: the key as lower-case hex,
/// zero-padded to `ceil(shard_bits / 4)` digits, followed by `suffix`.
std::string GetShardFileName(const ShardSpec& spec, uint64_t shard_key,
                             std::string_view suffix = ".shard");

}  // namespace neuroglancer_uint64_sharded
}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_UINT64_SHARDED_H_
