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


#include "ngshard/kvstore/neuroglancer_uint64_sharded/sharded_scale.h"

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_format.h"
#include "absl/synchronization/blocking_counter.h"
#include "ngshard/internal/log/verbose_flag.h"
#include "ngshard/internal/thread/thread_pool.h"
#include "ngshard/kvstore/accessor.h"
#include "ngshard/kvstore/chunk_coords.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/shard.h"
#include "ngshard/util/quote_string.h"
#include "ngshard/util/result.h"
#include "ngshard/util/status.h"

namespace ngshard {
namespace neuroglancer_uint64_sharded {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag sharded_logging("sharded");

}  // namespace

ShardedScale::ShardedScale(const ShardSpec& spec,
                           const ShardVolumeSpec& volume_spec,
                           std::shared_ptr<Accessor> accessor, std::string key,
                           MiniShardStorage storage)
    : spec_(spec),
      volume_spec_(volume_spec),
      accessor_(std::move(accessor)),
      key_(std::move(key)),
      storage_(storage) {}

ShardReader* ShardedScale::GetReader(uint64_t shard_key) {
  auto& reader = readers_[shard_key];
  if (!reader) {
    reader = std::make_unique<ShardReader>(spec_, shard_key, accessor_, key_);
  }
  return reader.get();
}

Result<ShardWriter*> ShardedScale::GetWriter(uint64_t shard_key) {
  auto it = writers_.find(shard_key);
  if (it != writers_.end()) return it->second.get();
  NGSHARD_ASSIGN_OR_RETURN(bool exists, GetReader(shard_key)->Exists());
  if (exists) {
    return absl::FailedPreconditionError(absl::StrFormat(
        "Shard %s already exists and is read-only",
        QuoteString(GetShardPath(key_, spec_, shard_key, ".shard"))));
  }
  // The cached reader saw the shard as absent.
  readers_.erase(shard_key);
  ABSL_LOG_IF(INFO, sharded_logging)
      << "Opening shard " << shard_key << " of scale " << QuoteString(key_)
      << " for writing";
  auto writer = std::make_unique<ShardWriter>(spec_, shard_key, accessor_,
                                              key_, storage_);
  ShardWriter* ptr = writer.get();
  writers_.emplace(shard_key, std::move(writer));
  return ptr;
}

absl::Status ShardedScale::StoreChunk(const ChunkCoords& coords,
                                      const absl::Cord& data) {
  NGSHARD_ASSIGN_OR_RETURN(uint64_t cmc, volume_spec_.GetCmc(coords));
  if (data.empty()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Cannot store chunk %s with empty data", FormatChunkCoords(coords)));
  }
  NGSHARD_ASSIGN_OR_RETURN(ShardWriter * writer,
                           GetWriter(spec_.GetShardKey(cmc)));
  return writer->StoreChunk(cmc, data);
}

Result<absl::Cord> ShardedScale::FetchChunk(const ChunkCoords& coords) {
  NGSHARD_ASSIGN_OR_RETURN(uint64_t cmc, volume_spec_.GetCmc(coords));
  const uint64_t shard_key = spec_.GetShardKey(cmc);
  if (writers_.count(shard_key)) {
    return absl::FailedPreconditionError(absl::StrFormat(
        "Cannot read chunk %s while shard %s is open for writing",
        FormatChunkCoords(coords),
        QuoteString(GetShardPath(key_, spec_, shard_key, ".shard"))));
  }
  return GetReader(shard_key)->FetchChunk(cmc);
}

absl::Status ShardedScale::Close(internal::ThreadPool* pool) {
  if (writers_.empty()) return absl::OkStatus();
  std::vector<ShardWriter*> writers;
  writers.reserve(writers_.size());
  for (auto& entry : writers_) writers.push_back(entry.second.get());
  std::vector<absl::Status> statuses(writers.size());
  if (pool) {
    absl::BlockingCounter pending(static_cast<int>(writers.size()));
    for (size_t i = 0; i < writers.size(); ++i) {
      pool->Schedule([writer = writers[i], status = &statuses[i], &pending] {
        *status = writer->Close();
        pending.DecrementCount();
      });
    }
    pending.Wait();
  } else {
    for (size_t i = 0; i < writers.size(); ++i) {
      statuses[i] = writers[i]->Close();
    }
  }
  absl::Status result;
  size_t num_closed = 0;
  for (size_t i = 0; i < writers.size(); ++i) {
    if (!statuses[i].ok()) {
      if (result.ok()) result = statuses[i];
      continue;
    }
    const uint64_t shard_key = writers[i]->shard_key();
    readers_.erase(shard_key);
    writers_.erase(shard_key);
    ++num_closed;
  }
  ABSL_LOG_IF(INFO, sharded_logging)
      << "Closed " << num_closed << " shards of scale " << QuoteString(key_)
      << ", " << writers_.size() << " failed";
  return result;
}

}  // namespace neuroglancer_uint64_sharded
}  // namespace ngshard
