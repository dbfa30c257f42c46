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

#include "ngshard/internal/compression/zlib.h"

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "ngshard/util/status_testutil.h"

namespace {

using ::ngshard::MatchesStatus;

namespace zlib = ::ngshard::zlib;

class ZlibTest : public ::testing::TestWithParam<zlib::Header> {};

INSTANTIATE_TEST_SUITE_P(ZlibTestCases, ZlibTest,
                         ::testing::Values(zlib::Header::kZlib,
                                           zlib::Header::kGzip));

// Tests that a small input round trips, and that the result is appended to the
// output without clearing the existing contents.
TEST_P(ZlibTest, SmallRoundtrip) {
  zlib::Options options{6, GetParam()};
  const absl::Cord input("The quick brown fox jumped over the lazy dog.");
  absl::Cord encoded("abc"), decoded("def");
  zlib::Encode(input, &encoded, options);
  ASSERT_GE(encoded.size(), 3);
  EXPECT_EQ("abc", encoded.Subcord(0, 3));
  NGSHARD_ASSERT_OK(zlib::Decode(encoded.Subcord(3, encoded.size() - 3),
                                 &decoded, GetParam()));
  EXPECT_EQ("defThe quick brown fox jumped over the lazy dog.", decoded);
}

// Tests an input spanning many cord chunks and exceeding the 16KiB buffer.
TEST_P(ZlibTest, LargeFragmentedRoundtrip) {
  std::string flat(100000, '\0');
  unsigned char x = 0;
  for (auto& v : flat) {
    v = x;
    x += 7;
  }
  absl::Cord input;
  for (size_t i = 0; i < flat.size(); i += 3001) {
    input.Append(flat.substr(i, 3001));
  }
  absl::Cord encoded, decoded;
  zlib::Encode(input, &encoded, {9, GetParam()});
  NGSHARD_ASSERT_OK(zlib::Decode(encoded, &decoded, GetParam()));
  EXPECT_EQ(flat, decoded);
}

TEST_P(ZlibTest, AutoDetectsHeader) {
  const absl::Cord input("minishard index bytes");
  absl::Cord encoded, decoded;
  zlib::Encode(input, &encoded, {9, GetParam()});
  NGSHARD_ASSERT_OK(zlib::Decode(encoded, &decoded, zlib::Header::kAuto));
  EXPECT_EQ(input, decoded);
}

TEST_P(ZlibTest, EmptyInputRoundtrip) {
  absl::Cord encoded, decoded;
  zlib::Encode(absl::Cord(), &encoded, {9, GetParam()});
  EXPECT_FALSE(encoded.empty());
  NGSHARD_ASSERT_OK(zlib::Decode(encoded, &decoded, GetParam()));
  EXPECT_TRUE(decoded.empty());
}

TEST_P(ZlibTest, DecodeCorruptData) {
  const absl::Cord input("The quick brown fox jumped over the lazy dog.");
  absl::Cord encoded;
  zlib::Encode(input, &encoded, {6, GetParam()});
  std::string bytes(encoded);

  // Corrupt header.
  {
    std::string corrupt = bytes;
    corrupt[0] = 0;
    absl::Cord decoded;
    EXPECT_THAT(zlib::Decode(absl::Cord(corrupt), &decoded, GetParam()),
                MatchesStatus(absl::StatusCode::kDataLoss));
  }

  // Truncated trailer.
  {
    absl::Cord decoded;
    EXPECT_THAT(zlib::Decode(absl::Cord(bytes.substr(0, bytes.size() - 1)),
                             &decoded, GetParam()),
                MatchesStatus(absl::StatusCode::kDataLoss));
  }

  // Trailing garbage.
  {
    absl::Cord decoded;
    EXPECT_THAT(zlib::Decode(absl::Cord(bytes + "x"), &decoded, GetParam()),
                MatchesStatus(absl::StatusCode::kDataLoss));
  }
}

TEST(ZlibHeaderTest, DefaultOptionsWriteGzipMagic) {
  absl::Cord encoded;
  zlib::Encode(absl::Cord("abc"), &encoded);
  std::string bytes(encoded);
  ASSERT_GE(bytes.size(), 2);
  EXPECT_EQ('\x1f', bytes[0]);
  EXPECT_EQ('\x8b', bytes[1]);
}

TEST(ZlibHeaderTest, GzipDecoderRejectsZlibStream) {
  absl::Cord encoded, decoded;
  zlib::Encode(absl::Cord("abc"), &encoded, {9, zlib::Header::kZlib});
  EXPECT_THAT(zlib::Decode(encoded, &decoded, zlib::Header::kGzip),
              MatchesStatus(absl::StatusCode::kDataLoss));
}

}  // namespace
