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


#include "ngshard/kvstore/neuroglancer_uint64_sharded/minishard.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <cassert>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_format.h"
#include "ngshard/internal/log/verbose_flag.h"
#include "ngshard/internal/os/file_util.h"
#include "ngshard/kvstore/accessor.h"
#include "ngshard/kvstore/byte_range.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/minishard_index.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/uint64_sharded.h"
#include "ngshard/util/result.h"
#include "ngshard/util/status.h"

namespace ngshard {
namespace neuroglancer_uint64_sharded {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag minishard_logging("minishard");

/// Block size used when copying spilled data into a shard.
constexpr int64_t kCopyBlockSize = int64_t(1) << 20;

class InMemorySpillBuffer : public SpillBuffer {
 public:
  absl::Status Append(const absl::Cord& data) override {
    data_.Append(data);
    return absl::OkStatus();
  }

  Result<absl::Cord> Read(ByteRange range) const override {
    NGSHARD_RETURN_IF_ERROR(range.Validate(size()));
    return data_.Subcord(range.inclusive_min, range.size());
  }

  absl::Status Clear() override {
    data_.Clear();
    return absl::OkStatus();
  }

  int64_t size() const override { return data_.size(); }

 private:
  absl::Cord data_;
};

class TemporaryFileSpillBuffer : public SpillBuffer {
 public:
  explicit TemporaryFileSpillBuffer(internal_os::UniqueFileDescriptor fd)
      : fd_(std::move(fd)) {}

  absl::Status Append(const absl::Cord& data) override {
    NGSHARD_RETURN_IF_ERROR(
        internal_os::PWriteAllToFile(fd_.get(), data, size_));
    size_ += data.size();
    return absl::OkStatus();
  }

  Result<absl::Cord> Read(ByteRange range) const override {
    NGSHARD_RETURN_IF_ERROR(range.Validate(size_));
    NGSHARD_ASSIGN_OR_RETURN(
        auto data,
        internal_os::ReadRangeFromFile(fd_.get(), range.inclusive_min,
                                       range.size()));
    if (static_cast<int64_t>(data.size()) != range.size()) {
      return absl::DataLossError(absl::StrFormat(
          "Temporary file truncated: expected %d bytes at offset %d, but got "
          "%d",
          range.size(), range.inclusive_min, data.size()));
    }
    return data;
  }

  absl::Status Clear() override {
    NGSHARD_RETURN_IF_ERROR(internal_os::TruncateFile(fd_.get(), 0));
    size_ = 0;
    return absl::OkStatus();
  }

  int64_t size() const override { return size_; }

 private:
  internal_os::UniqueFileDescriptor fd_;
  int64_t size_ = 0;
};

}  // namespace

SpillBuffer::~SpillBuffer() = default;

Result<std::unique_ptr<SpillBuffer>> SpillBuffer::Create(
    MiniShardStorage storage) {
  switch (storage) {
    case MiniShardStorage::kInMemory:
      return std::unique_ptr<SpillBuffer>(new InMemorySpillBuffer);
    case MiniShardStorage::kTemporaryFile: {
      NGSHARD_ASSIGN_OR_RETURN(auto fd,
                               internal_os::CreateAnonymousTemporaryFile());
      return std::unique_ptr<SpillBuffer>(
          new TemporaryFileSpillBuffer(std::move(fd)));
    }
  }
  return absl::InvalidArgumentError("Invalid minishard storage");
}

Result<MiniShard> MiniShard::Create(const ShardSpec& spec,
                                    MiniShardStorage storage) {
  NGSHARD_ASSIGN_OR_RETURN(auto data, SpillBuffer::Create(storage));
  NGSHARD_ASSIGN_OR_RETURN(auto pending_data, SpillBuffer::Create(storage));
  return MiniShard(spec, std::move(data), std::move(pending_data));
}

MiniShard::MiniShard(const ShardSpec& spec, std::unique_ptr<SpillBuffer> data,
                     std::unique_ptr<SpillBuffer> pending_data)
    : spec_(spec),
      stride_bits_(spec.minishard_bits + spec.shard_bits),
      data_(std::move(data)),
      pending_data_(std::move(pending_data)) {}

uint64_t MiniShard::NextCmc() const {
  assert(masked_bits_ && !exhausted_);
  if (stride_bits_ >= 64) return *masked_bits_;
  return (appended_ << stride_bits_) + *masked_bits_;
}

std::optional<uint64_t> MiniShard::next_cmc() const {
  if (!masked_bits_ || exhausted_) return std::nullopt;
  return NextCmc();
}

absl::Status MiniShard::StoreChunk(uint64_t cmc, const absl::Cord& data) {
  if (closed_) {
    return absl::FailedPreconditionError(
        absl::StrFormat("Cannot store chunk %d in a closed minishard", cmc));
  }
  // Zero-length entries are reserved for padding.
  if (data.empty()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Cannot store chunk %d with empty data", cmc));
  }
  const uint64_t masked_bits = spec_.GetShardAndMinishardBits(cmc);
  if (!masked_bits_) {
    masked_bits_ = masked_bits;
  } else if (*masked_bits_ != masked_bits) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Chunk %d does not belong to the minishard of chunk %d", cmc,
        *masked_bits_));
  }
  if (exhausted_ || cmc < NextCmc()) {
    return absl::InternalError(absl::StrFormat(
        "Chunk %d arrived after the minishard was laid out past it", cmc));
  }
  if (pending_.count(cmc)) {
    return absl::InternalError(
        absl::StrFormat("Chunk %d was already stored", cmc));
  }
  const absl::Cord encoded = EncodeData(data, spec_.data_encoding);
  if (cmc == NextCmc()) {
    NGSHARD_RETURN_IF_ERROR(Append(cmc, encoded));
    return Drain();
  }
  const int64_t offset = pending_data_->size();
  NGSHARD_RETURN_IF_ERROR(pending_data_->Append(encoded));
  pending_.emplace(cmc, ByteRange::FromOffsetLength(offset, encoded.size()));
  return absl::OkStatus();
}

absl::Status MiniShard::Append(uint64_t cmc, const absl::Cord& data) {
  const int64_t offset = data_->size();
  NGSHARD_RETURN_IF_ERROR(data_->Append(data));
  entries_.push_back(MinishardIndexEntry{
      cmc, ByteRange::FromOffsetLength(offset, data.size())});
  ++appended_;
  if (stride_bits_ >= 64 ||
      (stride_bits_ > 0 && (appended_ >> (64 - stride_bits_)) != 0)) {
    exhausted_ = true;
  }
  return absl::OkStatus();
}

absl::Status MiniShard::Drain() {
  while (!exhausted_ && !pending_.empty() &&
         pending_.begin()->first == NextCmc()) {
    auto it = pending_.begin();
    const uint64_t cmc = it->first;
    NGSHARD_ASSIGN_OR_RETURN(auto data, pending_data_->Read(it->second));
    pending_.erase(it);
    NGSHARD_RETURN_IF_ERROR(Append(cmc, data));
  }
  if (pending_.empty()) {
    return pending_data_->Clear();
  }
  if (exhausted_ || pending_.begin()->first < NextCmc()) {
    return absl::InternalError(absl::StrFormat(
        "Held back chunk %d precedes the next expected chunk of the minishard",
        pending_.begin()->first));
  }
  return absl::OkStatus();
}

absl::Status MiniShard::Close() {
  if (closed_) return absl::OkStatus();
  size_t num_padding = 0;
  while (!pending_.empty()) {
    if (exhausted_) {
      return absl::InternalError(absl::StrFormat(
          "Held back chunk %d lies beyond the chunk ids of the minishard",
          pending_.begin()->first));
    }
    NGSHARD_RETURN_IF_ERROR(Append(NextCmc(), absl::Cord()));
    ++num_padding;
    NGSHARD_RETURN_IF_ERROR(Drain());
  }
  ABSL_LOG_IF(INFO, minishard_logging && num_padding > 0)
      << "Minishard " << spec_.GetMinishardKey(masked_bits_.value_or(0))
      << " padded with " << num_padding << " empty entries";
  closed_ = true;
  return absl::OkStatus();
}

absl::Status MiniShard::WriteData(FileWriter& writer) const {
  const int64_t size = data_->size();
  for (int64_t offset = 0; offset < size; offset += kCopyBlockSize) {
    NGSHARD_ASSIGN_OR_RETURN(
        auto block,
        data_->Read({offset, std::min(size, offset + kCopyBlockSize)}));
    NGSHARD_RETURN_IF_ERROR(writer.Append(block));
  }
  return absl::OkStatus();
}

absl::Cord MiniShard::EncodeIndex(int64_t data_offset) const {
  std::vector<MinishardIndexEntry> index(entries_.begin(), entries_.end());
  for (auto& entry : index) {
    entry.byte_range.inclusive_min += data_offset;
    entry.byte_range.exclusive_max += data_offset;
  }
  return EncodeData(EncodeMinishardIndex(index),
                    spec_.minishard_index_encoding);
}

}  // namespace neuroglancer_uint64_sharded
}  // namespace ngshard
