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

#include <stdint.h>

#include <algorithm>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "ngshard/kvstore/accessor.h"
#include "ngshard/kvstore/byte_range.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/minishard_index.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/uint64_sharded.h"
#include "ngshard/util/status_testutil.h"

namespace {

using ::ngshard::ByteRange;
using ::ngshard::FileWriter;
using ::ngshard::IsOk;
using ::ngshard::IsOkAndHolds;
using ::ngshard::MatchesStatus;
using ::ngshard::neuroglancer_uint64_sharded::DecodeData;
using ::ngshard::neuroglancer_uint64_sharded::DecodeMinishardIndex;
using ::ngshard::neuroglancer_uint64_sharded::MiniShard;
using ::ngshard::neuroglancer_uint64_sharded::MiniShardStorage;
using ::ngshard::neuroglancer_uint64_sharded::MinishardIndexEntry;
using ::ngshard::neuroglancer_uint64_sharded::ShardSpec;
using ::ngshard::neuroglancer_uint64_sharded::SpillBuffer;
using ::testing::ElementsAre;

/// Collects appended output in memory.
class CordWriter : public FileWriter {
 public:
  absl::Status Append(const absl::Cord& data) override {
    value.Append(data);
    return absl::OkStatus();
  }
  absl::Status PWrite(int64_t offset, const absl::Cord& data) override {
    return absl::UnimplementedError("PWrite");
  }
  int64_t size() const override { return value.size(); }
  absl::Status Commit() override { return absl::OkStatus(); }

  absl::Cord value;
};

absl::Cord WriteData(const MiniShard& minishard) {
  CordWriter writer;
  NGSHARD_EXPECT_OK(minishard.WriteData(writer));
  return writer.value;
}

class MiniShardTest : public ::testing::TestWithParam<MiniShardStorage> {
 protected:
  MiniShard MakeMiniShard(const ShardSpec& spec) {
    auto minishard = MiniShard::Create(spec, GetParam());
    NGSHARD_CHECK_OK(minishard);
    return std::move(minishard).value();
  }
};

INSTANTIATE_TEST_SUITE_P(Storage, MiniShardTest,
                         ::testing::Values(MiniShardStorage::kInMemory,
                                           MiniShardStorage::kTemporaryFile));

TEST_P(MiniShardTest, InOrder) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(auto spec, ShardSpec::Create(1, 1));
  auto minishard = MakeMiniShard(spec);
  EXPECT_TRUE(minishard.empty());
  EXPECT_FALSE(minishard.next_cmc().has_value());
  // Minishard 1 of shard 0: chunk ids 1, 5, 9, ...
  NGSHARD_ASSERT_OK(minishard.StoreChunk(1, absl::Cord("a")));
  EXPECT_EQ(5u, minishard.next_cmc());
  NGSHARD_ASSERT_OK(minishard.StoreChunk(5, absl::Cord("bc")));
  NGSHARD_ASSERT_OK(minishard.StoreChunk(9, absl::Cord("def")));
  NGSHARD_ASSERT_OK(minishard.Close());
  EXPECT_THAT(minishard.entries(),
              ElementsAre(MinishardIndexEntry{1, {0, 1}},
                          MinishardIndexEntry{5, {1, 3}},
                          MinishardIndexEntry{9, {3, 6}}));
  EXPECT_EQ(6, minishard.data_size());
  EXPECT_EQ("abcdef", std::string(WriteData(minishard)));
}

TEST_P(MiniShardTest, OutOfOrderIsBuffered) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(auto spec, ShardSpec::Create(1, 1));
  auto minishard = MakeMiniShard(spec);
  NGSHARD_ASSERT_OK(minishard.StoreChunk(1, absl::Cord("a")));
  NGSHARD_ASSERT_OK(minishard.StoreChunk(9, absl::Cord("def")));
  EXPECT_EQ(1u, minishard.num_buffered());
  EXPECT_EQ(5u, minishard.next_cmc());
  NGSHARD_ASSERT_OK(minishard.StoreChunk(5, absl::Cord("bc")));
  EXPECT_EQ(0u, minishard.num_buffered());
  EXPECT_EQ(13u, minishard.next_cmc());
  EXPECT_EQ("abcdef", std::string(WriteData(minishard)));
}

TEST_P(MiniShardTest, ShuffledOrderMatchesSortedOrder) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(auto spec, ShardSpec::Create(2, 1));
  std::vector<uint64_t> cmcs;
  for (uint64_t i = 0; i < 40; ++i) cmcs.push_back(2 + (i << 3));

  auto sorted = MakeMiniShard(spec);
  for (uint64_t cmc : cmcs) {
    NGSHARD_ASSERT_OK(sorted.StoreChunk(cmc, absl::Cord(absl::StrCat(cmc))));
  }
  NGSHARD_ASSERT_OK(sorted.Close());

  // The first chunk must come first, since it fixes the minishard bits.
  std::minstd_rand gen(42);
  std::shuffle(cmcs.begin() + 1, cmcs.end(), gen);
  auto shuffled = MakeMiniShard(spec);
  for (uint64_t cmc : cmcs) {
    NGSHARD_ASSERT_OK(shuffled.StoreChunk(cmc, absl::Cord(absl::StrCat(cmc))));
  }
  NGSHARD_ASSERT_OK(shuffled.Close());

  EXPECT_EQ(WriteData(sorted), WriteData(shuffled));
  EXPECT_EQ(sorted.EncodeIndex(16), shuffled.EncodeIndex(16));
}

TEST_P(MiniShardTest, CloseInsertsPadding) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(auto spec, ShardSpec::Create(1, 0));
  auto minishard = MakeMiniShard(spec);
  NGSHARD_ASSERT_OK(minishard.StoreChunk(0, absl::Cord("a")));
  NGSHARD_ASSERT_OK(minishard.StoreChunk(6, absl::Cord("b")));
  NGSHARD_ASSERT_OK(minishard.StoreChunk(10, absl::Cord("c")));
  EXPECT_EQ(2u, minishard.num_buffered());
  NGSHARD_ASSERT_OK(minishard.Close());
  EXPECT_EQ(0u, minishard.num_buffered());
  EXPECT_THAT(minishard.entries(),
              ElementsAre(MinishardIndexEntry{0, {0, 1}},
                          MinishardIndexEntry{2, {1, 1}},
                          MinishardIndexEntry{4, {1, 1}},
                          MinishardIndexEntry{6, {1, 2}},
                          MinishardIndexEntry{8, {2, 2}},
                          MinishardIndexEntry{10, {2, 3}}));
  EXPECT_EQ("abc", std::string(WriteData(minishard)));
}

TEST_P(MiniShardTest, EarlierChunkIsAnError) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(auto spec, ShardSpec::Create(1, 1));
  auto minishard = MakeMiniShard(spec);
  NGSHARD_ASSERT_OK(minishard.StoreChunk(1, absl::Cord("a")));
  NGSHARD_ASSERT_OK(minishard.StoreChunk(5, absl::Cord("b")));
  NGSHARD_ASSERT_OK(minishard.StoreChunk(13, absl::Cord("d")));
  EXPECT_THAT(minishard.StoreChunk(1, absl::Cord("x")),
              MatchesStatus(absl::StatusCode::kInternal,
                            "Chunk 1 arrived after .*"));
  EXPECT_THAT(minishard.StoreChunk(5, absl::Cord("x")),
              MatchesStatus(absl::StatusCode::kInternal));
  // State is unchanged by the rejected chunks.
  EXPECT_EQ("ab", std::string(WriteData(minishard)));
  EXPECT_EQ(9u, minishard.next_cmc());
  EXPECT_EQ(1u, minishard.num_buffered());
  NGSHARD_ASSERT_OK(minishard.StoreChunk(9, absl::Cord("c")));
  EXPECT_EQ("abcd", std::string(WriteData(minishard)));
}

TEST_P(MiniShardTest, DuplicateBufferedChunkIsAnError) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(auto spec, ShardSpec::Create(1, 1));
  auto minishard = MakeMiniShard(spec);
  NGSHARD_ASSERT_OK(minishard.StoreChunk(1, absl::Cord("a")));
  NGSHARD_ASSERT_OK(minishard.StoreChunk(13, absl::Cord("d")));
  EXPECT_THAT(minishard.StoreChunk(13, absl::Cord("d")),
              MatchesStatus(absl::StatusCode::kInternal,
                            "Chunk 13 was already stored"));
}

TEST_P(MiniShardTest, WrongMinishardIsAnError) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(auto spec, ShardSpec::Create(1, 1));
  auto minishard = MakeMiniShard(spec);
  NGSHARD_ASSERT_OK(minishard.StoreChunk(1, absl::Cord("a")));
  EXPECT_THAT(minishard.StoreChunk(4, absl::Cord("b")),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
}

TEST_P(MiniShardTest, EmptyChunkIsRejected) {
  for (const char* data_encoding : {"raw", "gzip"}) {
    NGSHARD_ASSERT_OK_AND_ASSIGN(
        auto spec, ShardSpec::Create(1, 1, "identity", "raw", data_encoding));
    auto minishard = MakeMiniShard(spec);
    EXPECT_THAT(minishard.StoreChunk(1, absl::Cord()),
                MatchesStatus(absl::StatusCode::kInvalidArgument,
                              "Cannot store chunk 1 with empty data"))
        << data_encoding;
    EXPECT_EQ(0, minishard.data_size());
    // The rejected chunk does not advance the minishard.
    EXPECT_THAT(minishard.StoreChunk(1, absl::Cord("a")), IsOk());
  }
}

TEST_P(MiniShardTest, StoreAfterClose) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(auto spec, ShardSpec::Create(1, 1));
  auto minishard = MakeMiniShard(spec);
  NGSHARD_ASSERT_OK(minishard.StoreChunk(1, absl::Cord("a")));
  NGSHARD_ASSERT_OK(minishard.Close());
  EXPECT_TRUE(minishard.closed());
  EXPECT_THAT(minishard.StoreChunk(5, absl::Cord("b")),
              MatchesStatus(absl::StatusCode::kFailedPrecondition));
}

TEST_P(MiniShardTest, GzipDataEncoding) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(
      auto spec, ShardSpec::Create(0, 0, "identity", "gzip", "gzip"));
  auto minishard = MakeMiniShard(spec);
  NGSHARD_ASSERT_OK(minishard.StoreChunk(0, absl::Cord("hello hello hello")));
  NGSHARD_ASSERT_OK(minishard.Close());
  const auto data = WriteData(minishard);
  EXPECT_THAT(DecodeData(data, ShardSpec::DataEncoding::gzip),
              IsOkAndHolds(absl::Cord("hello hello hello")));
  EXPECT_THAT(DecodeMinishardIndex(minishard.EncodeIndex(0),
                                   ShardSpec::DataEncoding::gzip),
              IsOkAndHolds(ElementsAre(MinishardIndexEntry{
                  0, {0, static_cast<int64_t>(data.size())}})));
}

// With all 64 bits used for the shard and minishard, a minishard holds a
// single chunk.
TEST_P(MiniShardTest, FullWidthKeys) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(auto spec, ShardSpec::Create(32, 32));
  auto minishard = MakeMiniShard(spec);
  const uint64_t cmc = 0xfedcba9876543210;
  NGSHARD_ASSERT_OK(minishard.StoreChunk(cmc, absl::Cord("a")));
  EXPECT_FALSE(minishard.next_cmc().has_value());
  EXPECT_THAT(minishard.StoreChunk(cmc, absl::Cord("a")),
              MatchesStatus(absl::StatusCode::kInternal));
  NGSHARD_ASSERT_OK(minishard.Close());
}

TEST_P(MiniShardTest, EncodeIndexShiftsOffsets) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(auto spec, ShardSpec::Create(1, 1));
  auto minishard = MakeMiniShard(spec);
  NGSHARD_ASSERT_OK(minishard.StoreChunk(1, absl::Cord("a")));
  NGSHARD_ASSERT_OK(minishard.StoreChunk(5, absl::Cord("bc")));
  EXPECT_THAT(
      DecodeMinishardIndex(minishard.EncodeIndex(100),
                           ShardSpec::DataEncoding::raw),
      IsOkAndHolds(ElementsAre(MinishardIndexEntry{1, {100, 101}},
                               MinishardIndexEntry{5, {101, 103}})));
}

TEST(SpillBufferTest, TemporaryFile) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(
      auto buffer, SpillBuffer::Create(MiniShardStorage::kTemporaryFile));
  EXPECT_THAT(buffer->Append(absl::Cord("abc")), IsOk());
  EXPECT_THAT(buffer->Append(absl::Cord("def")), IsOk());
  EXPECT_EQ(6, buffer->size());
  EXPECT_THAT(buffer->Read({2, 5}), IsOkAndHolds(absl::Cord("cde")));
  EXPECT_THAT(buffer->Read({2, 7}),
              MatchesStatus(absl::StatusCode::kOutOfRange));
  EXPECT_THAT(buffer->Clear(), IsOk());
  EXPECT_EQ(0, buffer->size());
  EXPECT_THAT(buffer->Append(absl::Cord("g")), IsOk());
  EXPECT_THAT(buffer->Read({0, 1}), IsOkAndHolds(absl::Cord("g")));
}

}  // namespace
