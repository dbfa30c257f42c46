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


#include "ngshard/kvstore/neuroglancer_uint64_sharded/shard.h"

#include <stdint.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "ngshard/internal/log/verbose_flag.h"
#include "ngshard/kvstore/accessor.h"
#include "ngshard/kvstore/byte_range.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/minishard.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/minishard_index.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/uint64_sharded.h"
#include "ngshard/util/quote_string.h"
#include "ngshard/util/result.h"
#include "ngshard/util/status.h"

namespace ngshard {
namespace neuroglancer_uint64_sharded {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag sharded_logging("sharded");

absl::Cord MakeZeros(int64_t size) {
  constexpr int64_t kBlockSize = int64_t(1) << 16;
  const std::string block(std::min(size, kBlockSize), '\0');
  absl::Cord out;
  for (int64_t remaining = size; remaining > 0; remaining -= kBlockSize) {
    out.Append(std::string_view(block).substr(
        0, static_cast<size_t>(std::min(remaining, kBlockSize))));
  }
  return out;
}

}  // namespace

std::string GetShardPath(std::string_view directory, const ShardSpec& spec,
                         uint64_t shard_key, std::string_view suffix) {
  std::string name = GetShardFileName(spec, shard_key, suffix);
  if (directory.empty()) return name;
  return absl::StrCat(directory, "/", name);
}

ShardWriter::ShardWriter(const ShardSpec& spec, uint64_t shard_key,
                         std::shared_ptr<Accessor> accessor,
                         std::string directory, MiniShardStorage storage)
    : spec_(spec),
      shard_key_(shard_key),
      accessor_(std::move(accessor)),
      path_(GetShardPath(directory, spec, shard_key, ".shard")),
      storage_(storage) {}

absl::Status ShardWriter::StoreChunk(uint64_t cmc, const absl::Cord& data) {
  if (closed_) {
    return absl::FailedPreconditionError(absl::StrFormat(
        "Cannot store chunk %d in shard %s after it was closed", cmc,
        QuoteString(path_)));
  }
  if (spec_.GetShardKey(cmc) != shard_key_) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Chunk %d does not belong to shard %s", cmc,
                        QuoteString(path_)));
  }
  const uint64_t minishard_key = spec_.GetMinishardKey(cmc);
  auto it = minishards_.find(minishard_key);
  if (it == minishards_.end()) {
    NGSHARD_ASSIGN_OR_RETURN(auto minishard,
                             MiniShard::Create(spec_, storage_));
    it = minishards_.emplace(minishard_key, std::move(minishard)).first;
  }
  return it->second.StoreChunk(cmc, data);
}

absl::Status ShardWriter::Close() {
  if (closed_) return absl::OkStatus();
  NGSHARD_RETURN_IF_ERROR(spec_.Validate());
  const int64_t index_size = spec_.ShardIndexSize();
  const uint64_t num_minishards = uint64_t(1) << spec_.minishard_bits;

  for (auto& [minishard_key, minishard] : minishards_) {
    NGSHARD_RETURN_IF_ERROR(
        minishard.Close(),
        MaybeAnnotateStatus(_, absl::StrFormat("Error closing minishard %d of "
                                               "shard %s",
                                               minishard_key,
                                               QuoteString(path_))));
  }

  NGSHARD_ASSIGN_OR_RETURN(auto writer, accessor_->OpenWriter(path_));
  // The shard index table is written once all offsets are known.
  NGSHARD_RETURN_IF_ERROR(writer->Append(MakeZeros(index_size)));

  std::vector<int64_t> data_offsets;
  data_offsets.reserve(minishards_.size());
  int64_t data_size = 0;
  for (auto& entry : minishards_) {
    const MiniShard& minishard = entry.second;
    data_offsets.push_back(data_size);
    NGSHARD_RETURN_IF_ERROR(minishard.WriteData(*writer));
    data_size += minishard.data_size();
  }

  std::vector<ShardIndexEntry> shard_index(num_minishards, ByteRange{0, 0});
  size_t i = 0;
  for (auto& [minishard_key, minishard] : minishards_) {
    if (minishard_key >= num_minishards) {
      return absl::InternalError(absl::StrFormat(
          "Minishard %d does not fit in a shard index of %d entries",
          minishard_key, num_minishards));
    }
    const int64_t start = writer->size() - index_size;
    NGSHARD_RETURN_IF_ERROR(
        writer->Append(minishard.EncodeIndex(data_offsets[i++])));
    shard_index[minishard_key] =
        ByteRange{start, writer->size() - index_size};
  }

  NGSHARD_RETURN_IF_ERROR(writer->PWrite(0, EncodeShardIndex(shard_index)));
  const int64_t total_size = writer->size();
  NGSHARD_RETURN_IF_ERROR(
      writer->Commit(),
      MaybeAnnotateStatus(_, absl::StrCat("Error writing shard ",
                                          QuoteString(path_))));
  ABSL_LOG_IF(INFO, sharded_logging)
      << "Wrote shard " << QuoteString(path_) << ": " << minishards_.size()
      << " minishards, " << data_size << " data bytes, " << total_size
      << " bytes total";
  minishards_.clear();
  closed_ = true;
  return absl::OkStatus();
}

ShardLayout::~ShardLayout() = default;

ModernShardLayout::ModernShardLayout(std::shared_ptr<Accessor> accessor,
                                     std::string path)
    : accessor_(std::move(accessor)), path_(std::move(path)) {}

Result<absl::Cord> ModernShardLayout::ReadBytes(ByteRange range) {
  return accessor_->ReadBytes(path_, range);
}

std::string ModernShardLayout::Describe() const { return QuoteString(path_); }

LegacyShardLayout::LegacyShardLayout(std::shared_ptr<Accessor> accessor,
                                     std::string index_path,
                                     std::string data_path, int64_t index_size)
    : accessor_(std::move(accessor)),
      index_path_(std::move(index_path)),
      data_path_(std::move(data_path)),
      index_size_(index_size) {}

Result<absl::Cord> LegacyShardLayout::ReadBytes(ByteRange range) {
  absl::Cord out;
  if (range.inclusive_min < index_size_) {
    NGSHARD_ASSIGN_OR_RETURN(
        out, accessor_->ReadBytes(
                 index_path_,
                 ByteRange{range.inclusive_min,
                           std::min(range.exclusive_max, index_size_)}));
  }
  if (range.exclusive_max > index_size_) {
    NGSHARD_ASSIGN_OR_RETURN(
        auto data,
        accessor_->ReadBytes(
            data_path_,
            ByteRange{std::max(range.inclusive_min, index_size_) - index_size_,
                      range.exclusive_max - index_size_}));
    out.Append(std::move(data));
  }
  return out;
}

std::string LegacyShardLayout::Describe() const {
  return absl::StrCat(QuoteString(index_path_), " and ",
                      QuoteString(data_path_));
}

Result<std::unique_ptr<ShardLayout>> DetectShardLayout(
    std::shared_ptr<Accessor> accessor, std::string_view directory,
    const ShardSpec& spec, uint64_t shard_key) {
  std::string shard_path = GetShardPath(directory, spec, shard_key, ".shard");
  NGSHARD_ASSIGN_OR_RETURN(bool shard_exists, accessor->FileExists(shard_path));
  if (shard_exists) {
    ABSL_LOG_IF(INFO, sharded_logging)
        << "Reading shard " << QuoteString(shard_path);
    return std::unique_ptr<ShardLayout>(
        new ModernShardLayout(std::move(accessor), std::move(shard_path)));
  }
  std::string index_path = GetShardPath(directory, spec, shard_key, ".index");
  std::string data_path = GetShardPath(directory, spec, shard_key, ".data");
  NGSHARD_ASSIGN_OR_RETURN(bool index_exists, accessor->FileExists(index_path));
  if (!index_exists) return std::unique_ptr<ShardLayout>();
  NGSHARD_ASSIGN_OR_RETURN(bool data_exists, accessor->FileExists(data_path));
  if (!data_exists) return std::unique_ptr<ShardLayout>();
  ABSL_LOG_IF(INFO, sharded_logging)
      << "Reading legacy shard " << QuoteString(index_path) << " and "
      << QuoteString(data_path);
  return std::unique_ptr<ShardLayout>(new LegacyShardLayout(
      std::move(accessor), std::move(index_path), std::move(data_path),
      spec.ShardIndexSize()));
}

ShardReader::ShardReader(const ShardSpec& spec, uint64_t shard_key,
                         std::shared_ptr<Accessor> accessor,
                         std::string directory)
    : spec_(spec),
      shard_key_(shard_key),
      accessor_(std::move(accessor)),
      directory_(std::move(directory)) {}

std::string ShardReader::Describe() const {
  return layout_ ? layout_->Describe()
                 : QuoteString(GetShardPath(directory_, spec_, shard_key_,
                                            ".shard"));
}

absl::Status ShardReader::EnsureLoaded() {
  if (loaded_) return absl::OkStatus();
  NGSHARD_RETURN_IF_ERROR(spec_.Validate());
  NGSHARD_ASSIGN_OR_RETURN(
      auto layout, DetectShardLayout(accessor_, directory_, spec_, shard_key_));
  absl::flat_hash_map<uint64_t, std::vector<MinishardIndexEntry>> indices;
  if (layout) {
    const std::string description = layout->Describe();
    NGSHARD_ASSIGN_OR_RETURN(
        auto encoded_shard_index,
        layout->ReadBytes(ByteRange{0, spec_.ShardIndexSize()}),
        MaybeAnnotateStatus(
            _, absl::StrCat("Error reading shard index of ", description)));
    NGSHARD_ASSIGN_OR_RETURN(
        auto shard_index, DecodeShardIndex(encoded_shard_index, spec_),
        MaybeAnnotateStatus(
            _, absl::StrCat("Error decoding shard index of ", description)));
    for (uint64_t minishard = 0; minishard < shard_index.size(); ++minishard) {
      const ByteRange relative_range = shard_index[minishard];
      if (relative_range.empty()) continue;
      const auto annotate = [&](const absl::Status& status) {
        return MaybeAnnotateStatus(
            status, absl::StrFormat("Error reading minishard %d index of %s",
                                    minishard, description));
      };
      NGSHARD_ASSIGN_OR_RETURN(
          auto range, GetAbsoluteShardByteRange(relative_range, spec_),
          annotate(_));
      NGSHARD_ASSIGN_OR_RETURN(auto encoded, layout->ReadBytes(range),
                               annotate(_));
      NGSHARD_ASSIGN_OR_RETURN(
          auto entries,
          DecodeMinishardIndex(encoded, spec_.minishard_index_encoding),
          annotate(_));
      for (auto& entry : entries) {
        if (spec_.GetMinishardKey(entry.chunk_id) != minishard ||
            spec_.GetShardKey(entry.chunk_id) != shard_key_) {
          return absl::DataLossError(absl::StrFormat(
              "Chunk %d listed in minishard %d index of %s belongs to a "
              "different minishard",
              entry.chunk_id, minishard, description));
        }
        NGSHARD_ASSIGN_OR_RETURN(
            entry.byte_range,
            GetAbsoluteShardByteRange(entry.byte_range, spec_), annotate(_));
      }
      indices.emplace(minishard, std::move(entries));
    }
  }
  layout_ = std::move(layout);
  minishard_indices_ = std::move(indices);
  loaded_ = true;
  return absl::OkStatus();
}

Result<bool> ShardReader::Exists() {
  NGSHARD_RETURN_IF_ERROR(EnsureLoaded());
  return layout_ != nullptr;
}

Result<const absl::flat_hash_map<uint64_t, std::vector<MinishardIndexEntry>>*>
ShardReader::GetMinishardIndices() {
  NGSHARD_RETURN_IF_ERROR(EnsureLoaded());
  return &minishard_indices_;
}

Result<absl::Cord> ShardReader::FetchChunk(uint64_t cmc) {
  NGSHARD_RETURN_IF_ERROR(EnsureLoaded());
  if (!layout_) {
    return absl::NotFoundError(
        absl::StrFormat("Shard %s does not exist", Describe()));
  }
  const auto not_found = [&] {
    return absl::NotFoundError(
        absl::StrFormat("Chunk %d not found in shard %s", cmc, Describe()));
  };
  auto it = minishard_indices_.find(spec_.GetMinishardKey(cmc));
  if (it == minishard_indices_.end()) return not_found();
  auto byte_range = FindChunkInMinishard(it->second, cmc);
  // Zero-length entries only keep the minishard index contiguous.
  if (!byte_range || byte_range->empty()) return not_found();
  NGSHARD_ASSIGN_OR_RETURN(
      auto encoded, layout_->ReadBytes(*byte_range),
      MaybeAnnotateStatus(_, absl::StrFormat("Error reading chunk %d from %s",
                                             cmc, Describe())));
  NGSHARD_ASSIGN_OR_RETURN(
      auto data, DecodeData(encoded, spec_.data_encoding),
      MaybeAnnotateStatus(_, absl::StrFormat("Error decoding chunk %d from %s",
                                             cmc, Describe())));
  return data;
}

}  // namespace neuroglancer_uint64_sharded
}  // namespace ngshard
