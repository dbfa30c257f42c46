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

#include "ngshard/internal/compression/neuroglancer_compressed_segmentation.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/base/internal/endian.h"
#include "absl/random/random.h"
#include "absl/status/status.h"
#include "ngshard/util/status_testutil.h"

namespace {

using ::ngshard::MatchesStatus;
using ::ngshard::neuroglancer_compressed_segmentation::DecodeBlock;
using ::ngshard::neuroglancer_compressed_segmentation::DecodeChannel;
using ::ngshard::neuroglancer_compressed_segmentation::DecodeChannels;
using ::ngshard::neuroglancer_compressed_segmentation::EncodeBlock;
using ::ngshard::neuroglancer_compressed_segmentation::EncodeChannel;
using ::ngshard::neuroglancer_compressed_segmentation::EncodeChannels;
using ::ngshard::neuroglancer_compressed_segmentation::EncodedValueCache;
using ::ngshard::neuroglancer_compressed_segmentation::GetEncodingBits;

std::vector<std::uint32_t> AsVec(std::string_view s) {
  EXPECT_EQ(0, s.size() % 4);
  std::vector<std::uint32_t> out(s.size() / 4);
  for (size_t i = 0; i < out.size(); ++i) {
    out[i] = absl::little_endian::Load32(s.data() + i * 4);
  }
  return out;
}

std::string FromVec(std::vector<std::uint32_t> v) {
  std::string s;
  s.resize(v.size() * 4);
  for (size_t i = 0; i < v.size(); ++i) {
    absl::little_endian::Store32(s.data() + i * 4, v[i]);
  }
  return s;
}

template <typename T>
void TestBlockRoundTrip(std::vector<T> input,
                        const std::ptrdiff_t (&input_shape)[3],
                        const std::ptrdiff_t (&block_shape)[3],
                        size_t expected_encoded_bits,
                        size_t expected_table_offset,
                        size_t expected_encoded_values_offset,
                        std::vector<uint32_t> expected_output,
                        EncodedValueCache<T> expected_cache) {
  // Use non-empty `output` to test that existing contents are preserved.
  std::string output{1, 2, 3};
  ASSERT_EQ(input_shape[0] * input_shape[1] * input_shape[2], input.size());
  constexpr std::ptrdiff_t s = sizeof(T);
  const std::ptrdiff_t input_byte_strides[3] = {
      input_shape[1] * input_shape[2] * s, input_shape[2] * s, s};
  size_t encoded_bits;
  size_t table_offset;
  size_t encoded_values_offset;
  EncodedValueCache<T> cache;
  const size_t initial_offset = output.size();
  NGSHARD_ASSERT_OK(EncodeBlock(input.data(), input_shape, input_byte_strides,
                                block_shape, initial_offset, &encoded_bits,
                                &table_offset, &encoded_values_offset, &cache,
                                &output));
  ASSERT_THAT(output.substr(0, 3), ::testing::ElementsAre(1, 2, 3));
  EXPECT_EQ(expected_encoded_bits, encoded_bits);
  EXPECT_EQ(expected_table_offset, table_offset);
  EXPECT_EQ(expected_encoded_values_offset, encoded_values_offset);
  EXPECT_EQ(expected_output, AsVec(output.substr(initial_offset)));
  EXPECT_EQ(expected_cache, cache);
  std::vector<T> decoded_output(input.size());
  EXPECT_TRUE(DecodeBlock(
      encoded_bits, output.data() + initial_offset + encoded_values_offset * 4,
      output.data() + initial_offset + table_offset * 4,
      (output.size() - (initial_offset + table_offset * 4)) / sizeof(T),
      block_shape, input_shape, input_byte_strides, decoded_output.data()));
  EXPECT_EQ(input, decoded_output);
}

template <typename T>
void TestSingleChannelRoundTrip(std::vector<T> input,
                                const std::ptrdiff_t (&input_shape)[3],
                                const std::ptrdiff_t (&block_shape)[3],
                                std::vector<uint32_t> expected_output) {
  std::string output{1, 2, 3};
  ASSERT_EQ(input_shape[0] * input_shape[1] * input_shape[2], input.size());
  constexpr std::ptrdiff_t s = sizeof(T);
  const std::ptrdiff_t input_byte_strides[3] = {
      input_shape[1] * input_shape[2] * s, input_shape[2] * s, s};
  const size_t initial_offset = output.size();
  NGSHARD_ASSERT_OK(EncodeChannel(input.data(), input_shape,
                                  input_byte_strides, block_shape, &output));
  ASSERT_THAT(output.substr(0, 3), ::testing::ElementsAre(1, 2, 3));
  EXPECT_EQ(expected_output, AsVec(output.substr(initial_offset)));
  std::vector<T> decoded_output(input.size());
  // Decode from an exactly-sized std::vector so that AddressSanitizer catches
  // one-past-the-end accesses.
  std::vector<char> output_copy(output.begin() + initial_offset, output.end());
  NGSHARD_EXPECT_OK(DecodeChannel(
      std::string_view(output_copy.data(), output_copy.size()), block_shape,
      input_shape, input_byte_strides, decoded_output.data()));
  EXPECT_EQ(input, decoded_output);
}

template <typename T>
absl::Status DecodeChannelFrom(std::string_view input,
                               const std::ptrdiff_t (&block_shape)[3],
                               const std::ptrdiff_t (&output_shape)[3]) {
  constexpr std::ptrdiff_t s = sizeof(T);
  const std::ptrdiff_t output_byte_strides[3] = {
      output_shape[1] * output_shape[2] * s, output_shape[2] * s, s};
  std::vector<T> decoded_output(output_shape[0] * output_shape[1] *
                                output_shape[2]);
  std::vector<char> input_copy(input.begin(), input.end());
  return DecodeChannel(std::string_view(input_copy.data(), input_copy.size()),
                       block_shape, output_shape, output_byte_strides,
                       decoded_output.data());
}

TEST(GetEncodingBitsTest, Tiers) {
  EXPECT_EQ(0, GetEncodingBits(1));
  EXPECT_EQ(1, GetEncodingBits(2));
  EXPECT_EQ(2, GetEncodingBits(3));
  EXPECT_EQ(2, GetEncodingBits(4));
  EXPECT_EQ(4, GetEncodingBits(5));
  EXPECT_EQ(4, GetEncodingBits(16));
  EXPECT_EQ(8, GetEncodingBits(17));
  EXPECT_EQ(8, GetEncodingBits(256));
  EXPECT_EQ(16, GetEncodingBits(257));
  EXPECT_EQ(16, GetEncodingBits(65536));
  EXPECT_EQ(32, GetEncodingBits(65537));
}

// Tests 0-bit encoding: the lookup table is written and no values follow.
TEST(EncodeBlockTest, Basic0) {
  TestBlockRoundTrip<uint64_t>(/*input=*/{3, 3, 3, 3},
                               /*input_shape=*/{1, 2, 2},
                               /*block_shape=*/{1, 2, 2},
                               /*expected_encoded_bits=*/0,
                               /*expected_table_offset=*/0,
                               /*expected_encoded_values_offset=*/2,
                               /*expected_output=*/{3, 0},
                               /*expected_cache=*/{{{3}, 0}});
}

// Tests 1-bit encoding.
TEST(EncodeBlockTest, Basic1) {
  TestBlockRoundTrip<uint64_t>(
      /*input=*/{4, 3, 4, 4},
      /*input_shape=*/{1, 2, 2},
      /*block_shape=*/{1, 2, 2},
      /*expected_encoded_bits=*/1,
      /*expected_table_offset=*/0,
      /*expected_encoded_values_offset=*/4,
      /*expected_output=*/{3, 0, 4, 0, 0b1101},
      /*expected_cache=*/{{{3, 4}, 0}});
}

// Tests padding when the values tie: the smallest label is used.
TEST(EncodeBlockTest, SizeMismatchTiePadsWithSmallest) {
  TestBlockRoundTrip<uint64_t>(
      /*input=*/{4, 3, 4, 3},
      /*input_shape=*/{1, 2, 2},
      /*block_shape=*/{1, 2, 3},
      /*expected_encoded_bits=*/1,
      /*expected_table_offset=*/0,
      /*expected_encoded_values_offset=*/4,
      /*expected_output=*/{3, 0, 4, 0, 0b001001},
      /*expected_cache=*/{{{3, 4}, 0}});
}

// Tests padding with the most frequent label of the block.
TEST(EncodeBlockTest, SizeMismatchPadsWithMostFrequent) {
  TestBlockRoundTrip<uint64_t>(
      /*input=*/{4, 4, 4, 3},
      /*input_shape=*/{1, 2, 2},
      /*block_shape=*/{1, 2, 3},
      /*expected_encoded_bits=*/1,
      /*expected_table_offset=*/0,
      /*expected_encoded_values_offset=*/4,
      /*expected_output=*/{3, 0, 4, 0, 0b101111},
      /*expected_cache=*/{{{3, 4}, 0}});
}

// Test 2-bit encoding.
TEST(EncodeBlockTest, Basic2) {
  TestBlockRoundTrip<uint64_t>(
      /*input=*/{4, 3, 5, 4},
      /*input_shape=*/{1, 2, 2},
      /*block_shape=*/{1, 2, 2},
      /*expected_encoded_bits=*/2,
      /*expected_table_offset=*/0,
      /*expected_encoded_values_offset=*/6,
      /*expected_output=*/{3, 0, 4, 0, 5, 0, 0b01100001},
      /*expected_cache=*/{{{3, 4, 5}, 0}});
}

TEST(EncodeChannelTest, Basic) {
  TestSingleChannelRoundTrip<std::uint64_t>(
      /*input=*/{4, 3, 5, 4, 1, 3, 3, 3},
      /*input_shape=*/{2, 2, 2},
      /*block_shape=*/{1, 2, 2},
      /*expected_output=*/
      {4 | (2 << 24), 10, 11 | (1 << 24), 15, 3, 0, 4, 0, 5, 0, 0b01100001, 1,
       0, 3, 0, 0b1110});
}

TEST(EncodeChannelTest, BasicCached) {
  TestSingleChannelRoundTrip<std::uint64_t>(
      /*input=*/
      {
          4, 3, 5, 4,  //
          1, 3, 3, 3,  //
          3, 1, 1, 1,  //
          5, 5, 3, 4,  //
      },
      /*input_shape=*/{4, 2, 2},
      /*block_shape=*/{1, 2, 2},
      /*expected_output=*/
      {
          8 | (2 << 24), 14,                    //
          15 | (1 << 24), 19,                   //
          15 | (1 << 24), 20,                   //
          8 | (2 << 24), 21,                    //
          3, 0, 4, 0, 5, 0, 0b01100001,         //
          1, 0, 3, 0, 0b1110,                   //
          0b0001,                               //
          0b01001010,                           //
      });
}

TEST(EncodeChannelTest, BasicCachedZeroBits) {
  TestSingleChannelRoundTrip<std::uint64_t>(
      /*input=*/
      {
          3, 3, 3, 3,  //
          3, 3, 3, 3,  //
          3, 3, 3, 3,  //
          3, 3, 3, 3,  //
      },
      /*input_shape=*/{4, 2, 2},
      /*block_shape=*/{1, 2, 2},
      /*expected_output=*/
      {
          8 | (0 << 24), 10,  //
          8 | (0 << 24), 10,  //
          8 | (0 << 24), 10,  //
          8 | (0 << 24), 10,  //
          3, 0,               //
      });
}

TEST(EncodeChannelTest, BasicCached32) {
  TestSingleChannelRoundTrip<std::uint32_t>(
      /*input=*/
      {
          4, 3, 5, 4,  //
          1, 3, 3, 3,  //
          3, 1, 1, 1,  //
          5, 5, 3, 4,  //
      },
      /*input_shape=*/{4, 2, 2},
      /*block_shape=*/{1, 2, 2},
      /*expected_output=*/
      {
          8 | (2 << 24), 11,         //
          12 | (1 << 24), 14,        //
          12 | (1 << 24), 15,        //
          8 | (2 << 24), 16,         //
          3, 4, 5, 0b01100001,       //
          1, 3, 0b1110,              //
          0b0001,                    //
          0b01001010,                //
      });
}

// A uniform 8x8x8 block uses 0 bits, a single-entry table and no values.
TEST(EncodeChannelTest, UniformBlock) {
  std::vector<uint32_t> input(8 * 8 * 8, 42);
  TestSingleChannelRoundTrip<std::uint32_t>(input,
                                            /*input_shape=*/{8, 8, 8},
                                            /*block_shape=*/{8, 8, 8},
                                            /*expected_output=*/
                                            {2 | (0 << 24), 3, 42});
}

TEST(EncodeChannelsTest, Basic1Channel1Block) {
  std::string output;
  const std::vector<uint64_t> input{4, 0, 4, 0};
  const std::ptrdiff_t input_shape[4] = {1, 1, 2, 2};
  const std::ptrdiff_t input_byte_strides[4] = {32, 32, 16, 8};
  const std::ptrdiff_t block_shape[3] = {1, 2, 2};
  NGSHARD_ASSERT_OK(EncodeChannels(input.data(), input_shape,
                                   input_byte_strides, block_shape, &output));
  EXPECT_THAT(output, ::testing::ElementsAreArray(std::vector<char>{
                          1, 0, 0, 0,              //
                          2, 0, 0, 1, 6, 0, 0, 0,  //
                          0, 0, 0, 0, 0, 0, 0, 0,  //
                          4, 0, 0, 0, 0, 0, 0, 0,  //
                          5, 0, 0, 0,              //
                      }));
  std::vector<uint64_t> decoded(4);
  NGSHARD_ASSERT_OK(DecodeChannels(output, block_shape, input_shape,
                                   input_byte_strides, decoded.data()));
  EXPECT_EQ(input, decoded);
}

const std::vector<uint32_t> kBasicChannel = {
    4 | (2 << 24), 10, 11 | (1 << 24), 15, 3, 0, 4, 0, 5, 0, 0b01100001,
    1,             0,  3,              0,  0b1110};

TEST(DecodeChannelTest, BasicChannelDecodes) {
  NGSHARD_EXPECT_OK(DecodeChannelFrom<uint64_t>(FromVec(kBasicChannel),
                                                {1, 2, 2}, {2, 2, 2}));
}

TEST(DecodeChannelTest, SizeNotMultipleOf4) {
  auto input = FromVec(kBasicChannel);
  input.resize(input.size() - 1);
  EXPECT_THAT(DecodeChannelFrom<uint64_t>(input, {1, 2, 2}, {2, 2, 2}),
              MatchesStatus(absl::StatusCode::kDataLoss,
                            ".*not a multiple of 4.*"));
}

TEST(DecodeChannelTest, Truncated) {
  auto input = FromVec(kBasicChannel);
  input.resize(input.size() - 4);
  EXPECT_THAT(DecodeChannelFrom<uint64_t>(input, {1, 2, 2}, {2, 2, 2}),
              MatchesStatus(absl::StatusCode::kDataLoss,
                            ".*insufficient room for encoded values.*"));
}

TEST(DecodeChannelTest, NonPowerOf2EncodedBits) {
  auto words = kBasicChannel;
  words[0] = 4 | (3 << 24);
  EXPECT_THAT(
      DecodeChannelFrom<uint64_t>(FromVec(words), {1, 2, 2}, {2, 2, 2}),
      MatchesStatus(absl::StatusCode::kDataLoss,
                    "Invalid number of encoding bits .*\\(3\\)"));
}

TEST(DecodeChannelTest, MoreThan32EncodedBits) {
  auto words = kBasicChannel;
  words[0] = 4 | (64 << 24);
  EXPECT_THAT(
      DecodeChannelFrom<uint64_t>(FromVec(words), {1, 2, 2}, {2, 2, 2}),
      MatchesStatus(absl::StatusCode::kDataLoss,
                    "Invalid number of encoding bits .*"));
}

TEST(DecodeChannelTest, MissingBlockHeaders) {
  EXPECT_THAT(DecodeChannelFrom<uint64_t>(
                  FromVec({4 | (2 << 24), 10, 11 | (1 << 24)}), {1, 2, 2},
                  {2, 2, 2}),
              MatchesStatus(absl::StatusCode::kDataLoss,
                            ".*too short for 2 block headers"));
}

TEST(DecodeChannelTest, InvalidEncodedValuesOffset) {
  auto words = kBasicChannel;
  words[1] = 16;
  EXPECT_THAT(
      DecodeChannelFrom<uint64_t>(FromVec(words), {1, 2, 2}, {2, 2, 2}),
      MatchesStatus(absl::StatusCode::kDataLoss,
                    ".*insufficient room for encoded values.*"));
}

TEST(DecodeChannelTest, InvalidTableOffset) {
  auto words = kBasicChannel;
  words[0] = 17 | (2 << 24);
  EXPECT_THAT(
      DecodeChannelFrom<uint64_t>(FromVec(words), {1, 2, 2}, {2, 2, 2}),
      MatchesStatus(absl::StatusCode::kDataLoss,
                    ".*lookup table offset 17 is past the end.*"));
}

TEST(DecodeChannelTest, IndexOutOfLookupTable) {
  // Point the first block at a table with only one complete entry left.
  auto words = kBasicChannel;
  words[0] = 14 | (2 << 24);
  EXPECT_THAT(
      DecodeChannelFrom<uint64_t>(FromVec(words), {1, 2, 2}, {2, 2, 2}),
      MatchesStatus(absl::StatusCode::kDataLoss,
                    ".*indexing out of the lookup table"));
}

TEST(DecodeChannelTest, ZeroBitsWithEmptyTable) {
  EXPECT_THAT(DecodeChannelFrom<uint32_t>(FromVec({2 | (0 << 24), 2}),
                                          {1, 2, 2}, {1, 2, 2}),
              MatchesStatus(absl::StatusCode::kDataLoss,
                            ".*indexing out of the lookup table"));
}

TEST(DecodeChannelsTest, InvalidChannelOffset) {
  const std::ptrdiff_t block_shape[3] = {1, 2, 2};
  const std::ptrdiff_t output_shape[4] = {1, 1, 2, 2};
  const std::ptrdiff_t output_byte_strides[4] = {16, 16, 8, 4};
  std::vector<uint32_t> decoded(4);
  EXPECT_THAT(DecodeChannels(FromVec({7, 0}), block_shape, output_shape,
                             output_byte_strides, decoded.data()),
              MatchesStatus(absl::StatusCode::kDataLoss,
                            ".*channel 0 offset 7 is past the end.*"));
  EXPECT_THAT(DecodeChannels(std::string_view(), block_shape, output_shape,
                             output_byte_strides, decoded.data()),
              MatchesStatus(absl::StatusCode::kDataLoss,
                            ".*too short for channel offsets"));
}

// Round trips chunks whose blocks need each of the seven encoding widths, for
// several block sizes, with partial blocks at the upper edges.
template <typename T>
void TestAllEncodingWidths() {
  const size_t kCardinalities[] = {1, 2, 3, 5, 17, 257, 65537};
  const size_t kExpectedBits[] = {0, 1, 2, 4, 8, 16, 32};
  for (const std::ptrdiff_t b : {8, 16, 32, 64}) {
    for (size_t tier = 0; tier < 7; ++tier) {
      const size_t n = kCardinalities[tier];
      if (n > static_cast<size_t>(b * b * b)) continue;
      SCOPED_TRACE(::testing::Message() << "block=" << b << " n=" << n);
      const std::ptrdiff_t input_shape[4] = {1, b, b, b + 3};
      const std::ptrdiff_t block_shape[3] = {b, b, b};
      constexpr std::ptrdiff_t s = sizeof(T);
      const std::ptrdiff_t input_byte_strides[4] = {
          b * b * (b + 3) * s, b * (b + 3) * s, (b + 3) * s, s};
      std::vector<T> input(b * b * (b + 3));
      for (size_t i = 0; i < input.size(); ++i) {
        // The first block of each row holds all `n` labels.
        input[i] = static_cast<T>(1000 + (i * 7919) % n);
      }
      std::string output;
      NGSHARD_ASSERT_OK(EncodeChannels(input.data(), input_shape,
                                       input_byte_strides, block_shape,
                                       &output));
      const uint32_t first_header = absl::little_endian::Load32(
          output.data() + 4);
      EXPECT_EQ(kExpectedBits[tier], first_header >> 24);
      std::vector<T> decoded(input.size());
      NGSHARD_ASSERT_OK(DecodeChannels(output, block_shape, input_shape,
                                       input_byte_strides, decoded.data()));
      EXPECT_EQ(input, decoded);
    }
  }
}

TEST(RoundTripTest, AllEncodingWidths32) { TestAllEncodingWidths<uint32_t>(); }

TEST(RoundTripTest, AllEncodingWidths64) { TestAllEncodingWidths<uint64_t>(); }

template <typename T>
void RandomRoundTrip(size_t max_block_size, size_t max_input_size,
                     size_t max_channels, size_t max_distinct_ids,
                     size_t num_iterations) {
  absl::BitGen gen;
  for (size_t iter = 0; iter < num_iterations; ++iter) {
    std::ptrdiff_t block_shape[3];
    std::ptrdiff_t input_shape[4];
    input_shape[0] = absl::Uniform<size_t>(gen, 1, max_channels + 1);
    for (int i = 0; i < 3; ++i) {
      block_shape[i] = absl::Uniform<size_t>(gen, 1, max_block_size + 1);
      input_shape[i + 1] = absl::Uniform<size_t>(gen, 1, max_input_size + 1);
    }
    std::vector<T> input(input_shape[0] * input_shape[1] * input_shape[2] *
                         input_shape[3]);
    std::vector<T> labels(max_distinct_ids);
    for (auto& label : labels) {
      label = absl::Uniform<T>(gen);
    }
    for (auto& label : input) {
      label = labels[absl::Uniform<size_t>(gen, 0, labels.size())];
    }
    constexpr std::ptrdiff_t s = sizeof(T);
    const std::ptrdiff_t input_byte_strides[4] = {
        input_shape[1] * input_shape[2] * input_shape[3] * s,
        input_shape[2] * input_shape[3] * s, input_shape[3] * s, s};
    std::string output;
    NGSHARD_ASSERT_OK(EncodeChannels(input.data(), input_shape,
                                     input_byte_strides, block_shape, &output));
    std::vector<T> decoded_output(input.size());
    NGSHARD_EXPECT_OK(DecodeChannels(output, block_shape, input_shape,
                                     input_byte_strides,
                                     decoded_output.data()));
    EXPECT_EQ(input, decoded_output);
  }
}

TEST(RoundTripTest, Random) {
  RandomRoundTrip<std::uint32_t>(/*max_block_size=*/4, /*max_input_size=*/10,
                                 /*max_channels=*/3, /*max_distinct_ids=*/16,
                                 /*num_iterations=*/100);
  RandomRoundTrip<std::uint64_t>(/*max_block_size=*/10, /*max_input_size=*/16,
                                 /*max_channels=*/3, /*max_distinct_ids=*/1000,
                                 /*num_iterations=*/100);
}

}  // namespace
