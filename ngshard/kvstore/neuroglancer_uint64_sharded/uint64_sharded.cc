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


#include "ngshard/kvstore/neuroglancer_uint64_sharded/uint64_sharded.h"

#include <stdint.h>

#include <ostream>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_format.h"
#include <nlohmann/json.hpp>
#include "ngshard/internal/compression/zlib.h"
#include "ngshard/internal/json/value_as.h"
#include "ngshard/util/division.h"
#include "ngshard/util/quote_string.h"
#include "ngshard/util/result.h"
#include "ngshard/util/status.h"

namespace ngshard {
namespace neuroglancer_uint64_sharded {
namespace {

constexpr const char kShardingType[] = "neuroglancer_uint64_sharded_v1";

constexpr uint64_t GetLowBitMask(int num_bits) {
  return num_bits >= 64 ? ~uint64_t(0) : (uint64_t(1) << num_bits) - 1;
}

constexpr uint64_t ShiftRightUpTo64(uint64_t x, int amount) {
  return amount >= 64 ? 0 : (x >> amount);
}

Result<ShardSpec::HashFunction> ParseHashFunction(std::string_view name) {
  if (name == "identity") return ShardSpec::HashFunction::identity;
  return absl::InvalidArgumentError(
      absl::StrFormat("Unsupported hash function: %s", QuoteString(name)));
}

Result<int> GetBitsMember(const ::nlohmann::json& j, const char* member) {
  auto it = j.find(member);
  if (it == j.end()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Missing sharding member %s", QuoteString(member)));
  }
  NGSHARD_ASSIGN_OR_RETURN(
      int64_t value, internal_json::JsonRequireInteger(*it, 0, 64),
      internal_json::MaybeAnnotateMemberError(_, member));
  return static_cast<int>(value);
}

Result<std::string> GetStringMember(const ::nlohmann::json& j,
                                    const char* member,
                                    const char* default_value) {
  auto it = j.find(member);
  if (it == j.end()) {
    if (default_value) return std::string(default_value);
    return absl::InvalidArgumentError(
        absl::StrFormat("Missing sharding member %s", QuoteString(member)));
  }
  if (!it->is_string()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Expected string for sharding member %s, but "
                        "received: %s",
                        QuoteString(member), it->dump()));
  }
  return it->get<std::string>();
}

}  // namespace

std::string_view DataEncodingToString(ShardSpec::DataEncoding encoding) {
  switch (encoding) {
    case ShardSpec::DataEncoding::raw:
      return "raw";
    case ShardSpec::DataEncoding::gzip:
      return "gzip";
  }
  return "raw";
}

Result<ShardSpec::DataEncoding> ParseDataEncoding(std::string_view name) {
  if (name == "raw") return ShardSpec::DataEncoding::raw;
  if (name == "gzip") return ShardSpec::DataEncoding::gzip;
  return absl::InvalidArgumentError(
      absl::StrFormat("Unsupported data encoding: %s", QuoteString(name)));
}

Result<ShardSpec> ShardSpec::Create(int minishard_bits, int shard_bits,
                                    std::string_view hash,
                                    std::string_view minishard_index_encoding,
                                    std::string_view data_encoding,
                                    int preshift_bits) {
  ShardSpec spec;
  NGSHARD_ASSIGN_OR_RETURN(spec.hash_function, ParseHashFunction(hash));
  NGSHARD_ASSIGN_OR_RETURN(spec.minishard_index_encoding,
                           ParseDataEncoding(minishard_index_encoding));
  NGSHARD_ASSIGN_OR_RETURN(spec.data_encoding,
                           ParseDataEncoding(data_encoding));
  spec.preshift_bits = preshift_bits;
  spec.minishard_bits = minishard_bits;
  spec.shard_bits = shard_bits;
  NGSHARD_RETURN_IF_ERROR(spec.Validate());
  return spec;
}

absl::Status ShardSpec::Validate() const {
  if (minishard_bits < 0 || minishard_bits > kMaxMinishardBits) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "minishard_bits must be in the range [0, %d], but received: %d",
        kMaxMinishardBits, minishard_bits));
  }
  if (shard_bits < 0 || shard_bits > 64) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "shard_bits must be in the range [0, 64], but received: %d",
        shard_bits));
  }
  if (minishard_bits + shard_bits > 64) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "minishard_bits + shard_bits must not exceed 64, but received: %d + %d",
        minishard_bits, shard_bits));
  }
  if (preshift_bits != 0) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Only preshift_bits=0 is supported, but received: %d", preshift_bits));
  }
  return absl::OkStatus();
}

Result<ShardSpec> ShardSpec::FromJson(const ::nlohmann::json& j) {
  if (!j.is_object()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Expected sharding object, but received: %s", j.dump()));
  }
  NGSHARD_ASSIGN_OR_RETURN(auto type, GetStringMember(j, "@type", nullptr));
  if (type != kShardingType) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Expected \"@type\" of %s, but received: %s",
                        QuoteString(kShardingType), QuoteString(type)));
  }
  NGSHARD_ASSIGN_OR_RETURN(auto hash, GetStringMember(j, "hash", nullptr));
  NGSHARD_ASSIGN_OR_RETURN(int preshift_bits,
                           GetBitsMember(j, "preshift_bits"));
  NGSHARD_ASSIGN_OR_RETURN(int minishard_bits,
                           GetBitsMember(j, "minishard_bits"));
  NGSHARD_ASSIGN_OR_RETURN(int shard_bits, GetBitsMember(j, "shard_bits"));
  NGSHARD_ASSIGN_OR_RETURN(
      auto minishard_index_encoding,
      GetStringMember(j, "minishard_index_encoding", "raw"));
  NGSHARD_ASSIGN_OR_RETURN(auto data_encoding,
                           GetStringMember(j, "data_encoding", "raw"));
  return Create(minishard_bits, shard_bits, hash, minishard_index_encoding,
                data_encoding, preshift_bits);
}

::nlohmann::json ShardSpec::ToJson() const {
  return ::nlohmann::json{
      {"@type", kShardingType},
      {"hash", "identity"},
      {"preshift_bits", preshift_bits},
      {"minishard_bits", minishard_bits},
      {"shard_bits", shard_bits},
      {"minishard_index_encoding",
       std::string(DataEncodingToString(minishard_index_encoding))},
      {"data_encoding", std::string(DataEncodingToString(data_encoding))},
  };
}

uint64_t ShardSpec::minishard_mask() const {
  return GetLowBitMask(minishard_bits);
}

uint64_t ShardSpec::shard_mask() const {
  return GetLowBitMask(minishard_bits + shard_bits) & ~minishard_mask();
}

uint64_t ShardSpec::GetShardKey(uint64_t chunk_id) const {
  return ShiftRightUpTo64(chunk_id & shard_mask(), minishard_bits);
}

uint64_t ShardSpec::GetMinishardKey(uint64_t chunk_id) const {
  return chunk_id & minishard_mask();
}

uint64_t ShardSpec::GetShardAndMinishardBits(uint64_t chunk_id) const {
  return chunk_id & GetLowBitMask(minishard_bits + shard_bits);
}

int64_t ShardSpec::ShardIndexSize() const {
  return static_cast<int64_t>(16) << minishard_bits;
}

bool operator==(const ShardSpec& a, const ShardSpec& b) {
  return a.hash_function == b.hash_function &&
         a.preshift_bits == b.preshift_bits &&
         a.minishard_bits == b.minishard_bits &&
         a.shard_bits == b.shard_bits && a.data_encoding == b.data_encoding &&
         a.minishard_index_encoding == b.minishard_index_encoding;
}

std::ostream& operator<<(std::ostream& os, const ShardSpec& x) {
  return os << x.ToJson().dump();
}

absl::Cord EncodeData(const absl::Cord& input,
                      ShardSpec::DataEncoding encoding) {
  if (encoding == ShardSpec::DataEncoding::raw) {
    return input;
  }
  absl::Cord compressed;
  zlib::Options options;
  options.level = 9;
  options.header = zlib::Header::kGzip;
  zlib::Encode(input, &compressed, options);
  return compressed;
}

Result<absl::Cord> DecodeData(const absl::Cord& input,
                              ShardSpec::DataEncoding encoding) {
  if (encoding == ShardSpec::DataEncoding::raw) {
    return input;
  }
  absl::Cord uncompressed;
  NGSHARD_RETURN_IF_ERROR(
      zlib::Decode(input, &uncompressed));
  return uncompressed;
}

std::string GetShardFileName(const ShardSpec& spec, uint64_t shard_key,
                             std::string_view suffix) {
  const int width = CeilOfRatio(spec.shard_bits, 4);
  return absl::StrFormat("%0*x%s", width, shard_key, suffix);
}

}  // namespace neuroglancer_uint64_sharded
}  // namespace ngshard
