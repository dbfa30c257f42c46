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

#include <stdint.h>

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/base/internal/endian.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "ngshard/internal/compression/zlib.h"
#include "ngshard/kvstore/byte_range.h"
#include "ngshard/kvstore/neuroglancer_uint64_sharded/uint64_sharded.h"
#include "ngshard/util/status_testutil.h"

namespace {

namespace zlib = ::ngshard::zlib;
using ::ngshard::ByteRange;
using ::ngshard::IsOkAndHolds;
using ::ngshard::MatchesStatus;
using ::ngshard::neuroglancer_uint64_sharded::DecodeMinishardIndex;
using ::ngshard::neuroglancer_uint64_sharded::DecodeShardIndex;
using ::ngshard::neuroglancer_uint64_sharded::EncodeMinishardIndex;
using ::ngshard::neuroglancer_uint64_sharded::EncodeShardIndex;
using ::ngshard::neuroglancer_uint64_sharded::FindChunkInMinishard;
using ::ngshard::neuroglancer_uint64_sharded::GetAbsoluteShardByteRange;
using ::ngshard::neuroglancer_uint64_sharded::MinishardIndexEntry;
using ::ngshard::neuroglancer_uint64_sharded::ShardIndexEntry;
using ::ngshard::neuroglancer_uint64_sharded::ShardSpec;

absl::Cord MakeUint64s(const std::vector<uint64_t>& values) {
  std::string out(values.size() * 8, '\0');
  for (size_t i = 0; i < values.size(); ++i) {
    absl::little_endian::Store64(&out[i * 8], values[i]);
  }
  return absl::Cord(std::move(out));
}

void TestEncodeMinishardRoundTrip(
    std::vector<MinishardIndexEntry> minishard_index) {
  auto out = EncodeMinishardIndex(minishard_index);
  absl::Cord compressed;
  zlib::Encode(out, &compressed, {/*.level=*/9, zlib::Header::kGzip});
  EXPECT_THAT(DecodeMinishardIndex(out, ShardSpec::DataEncoding::raw),
              IsOkAndHolds(::testing::ElementsAreArray(minishard_index)));
  EXPECT_THAT(DecodeMinishardIndex(compressed, ShardSpec::DataEncoding::gzip),
              IsOkAndHolds(::testing::ElementsAreArray(minishard_index)));
}

TEST(DecodeMinishardIndexTest, Empty) {  //
  TestEncodeMinishardRoundTrip({});
}

TEST(DecodeMinishardIndexTest, SingleEntry) {
  TestEncodeMinishardRoundTrip({{0x0123456789abcdef, {0x11, 0x23}}});
}

TEST(DecodeMinishardIndexTest, MultipleEntries) {
  TestEncodeMinishardRoundTrip({
      {1, {3, 10}},
      {7, {12, 15}},
      {8, {15, 15}},
  });
}

// Column-major layout: chunk id deltas, then offset deltas, then lengths.
TEST(EncodeMinishardIndexTest, ColumnMajorLayout) {
  std::vector<MinishardIndexEntry> minishard_index{
      {0, {0, 5}},
      {16, {5, 7}},
      {48, {7, 17}},
  };
  EXPECT_EQ(MakeUint64s({0, 16, 32, 0, 0, 0, 5, 2, 10}),
            EncodeMinishardIndex(minishard_index));
}

TEST(DecodeMinishardIndexTest, OffsetDeltaIsRelativeToPreviousEnd) {
  EXPECT_THAT(
      DecodeMinishardIndex(MakeUint64s({4, 4, 100, 3, 5, 2}),
                           ShardSpec::DataEncoding::raw),
      IsOkAndHolds(::testing::ElementsAre(MinishardIndexEntry{4, {100, 105}},
                                          MinishardIndexEntry{8, {108, 110}})));
}

TEST(DecodeMinishardIndexTest, InvalidGzip) {
  EXPECT_THAT(
      DecodeMinishardIndex(absl::Cord("abc"), ShardSpec::DataEncoding::gzip),
      MatchesStatus(absl::StatusCode::kDataLoss,
                    "Error decoding minishard index.*"));
}

TEST(DecodeMinishardIndexTest, InvalidSizeRaw) {
  EXPECT_THAT(
      DecodeMinishardIndex(absl::Cord("abc"), ShardSpec::DataEncoding::raw),
      MatchesStatus(absl::StatusCode::kDataLoss,
                    "Invalid minishard index length: 3"));
}

TEST(DecodeMinishardIndexTest, InvalidSizeGzip) {
  absl::Cord temp;
  zlib::Encode(absl::Cord("abc"), &temp, {/*.level=*/9, zlib::Header::kGzip});
  EXPECT_THAT(DecodeMinishardIndex(temp, ShardSpec::DataEncoding::gzip),
              MatchesStatus(absl::StatusCode::kDataLoss,
                            "Invalid minishard index length: 3"));
}

TEST(DecodeMinishardIndexTest, OffsetOverflow) {
  EXPECT_THAT(
      DecodeMinishardIndex(MakeUint64s({3, ~uint64_t(0), 1}),
                           ShardSpec::DataEncoding::raw),
      MatchesStatus(absl::StatusCode::kDataLoss,
                    "Invalid byte range in minishard index for chunk 3: .*"));
}

TEST(DecodeMinishardIndexTest, DuplicateChunk) {
  EXPECT_THAT(DecodeMinishardIndex(MakeUint64s({3, 0, 0, 0, 1, 1}),
                                   ShardSpec::DataEncoding::raw),
              MatchesStatus(absl::StatusCode::kDataLoss,
                            "Chunk 3 occurs more than once.*"));
}

TEST(ShardIndexTest, RoundTrip) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(auto spec, ShardSpec::Create(1, 0));
  std::vector<ShardIndexEntry> shard_index{{0, 48}, {48, 96}};
  auto encoded = EncodeShardIndex(shard_index);
  EXPECT_EQ(MakeUint64s({0, 48, 48, 96}), encoded);
  EXPECT_THAT(DecodeShardIndex(encoded, spec),
              IsOkAndHolds(::testing::ElementsAreArray(shard_index)));
}

TEST(ShardIndexTest, InvalidSize) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(auto spec, ShardSpec::Create(1, 0));
  EXPECT_THAT(DecodeShardIndex(MakeUint64s({0, 0}), spec),
              MatchesStatus(absl::StatusCode::kDataLoss,
                            "Expected shard index of 32 bytes, but "
                            "received: 16 bytes"));
}

TEST(ShardIndexTest, InvalidByteRange) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(auto spec, ShardSpec::Create(1, 0));
  EXPECT_THAT(DecodeShardIndex(MakeUint64s({0, 0, 10, 5}), spec),
              MatchesStatus(absl::StatusCode::kDataLoss,
                            "Shard index specified invalid byte range for "
                            "minishard 1: \\[10, 5\\)"));
}

TEST(GetAbsoluteShardByteRangeTest, AddsIndexSize) {
  NGSHARD_ASSERT_OK_AND_ASSIGN(auto spec, ShardSpec::Create(2, 0));
  EXPECT_THAT(GetAbsoluteShardByteRange({3, 10}, spec),
              IsOkAndHolds(ByteRange{67, 74}));
  EXPECT_THAT(GetAbsoluteShardByteRange({10, 3}, spec),
              MatchesStatus(absl::StatusCode::kDataLoss));
}

TEST(FindChunkInMinishardTest, Basic) {
  std::vector<MinishardIndexEntry> minishard_index{
      {1, {0, 5}},
      {5, {5, 9}},
      {9, {9, 9}},
  };
  EXPECT_EQ(ByteRange({5, 9}), FindChunkInMinishard(minishard_index, 5));
  EXPECT_EQ(ByteRange({9, 9}), FindChunkInMinishard(minishard_index, 9));
  EXPECT_FALSE(FindChunkInMinishard(minishard_index, 4).has_value());
  EXPECT_FALSE(FindChunkInMinishard(minishard_index, 10).has_value());
}

}  // namespace
