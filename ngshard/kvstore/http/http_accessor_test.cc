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

#include "ngshard/kvstore/http/http_accessor.h"

#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "ngshard/kvstore/byte_range.h"
#include "ngshard/kvstore/chunk_coords.h"
#include "ngshard/kvstore/http/http_response.h"
#include "ngshard/kvstore/http/mock_http_transport.h"
#include "ngshard/util/status_testutil.h"

namespace {

using ::ngshard::ByteRange;
using ::ngshard::ChunkCoords;
using ::ngshard::HttpAccessor;
using ::ngshard::IsOkAndHolds;
using ::ngshard::MatchesStatus;
using ::ngshard::internal_http::DefaultMockHttpTransport;
using ::ngshard::internal_http::HttpResponse;
using ::testing::ElementsAre;

class HttpAccessorTest : public ::testing::Test {
 protected:
  std::shared_ptr<DefaultMockHttpTransport> transport_ =
      std::make_shared<DefaultMockHttpTransport>(
          absl::flat_hash_map<std::string, HttpResponse>{
              {"https://example.com/data/info",
               HttpResponse{200, absl::Cord("{\"scales\":[]}"), {}}},
              {"https://example.com/data/8_8_8/00.shard",
               HttpResponse{200, absl::Cord("0123456789"), {}}},
              {"https://example.com/data/8_8_8/0-64_0-64_0-64",
               HttpResponse{200, absl::Cord("chunk"), {}}},
              {"HEAD https://example.com/data/forbidden",
               HttpResponse{403, absl::Cord(), {}}},
              {"https://example.com/data/broken",
               HttpResponse{500, absl::Cord("oops"), {}}},
              {"GET https://example.com/data/moved",
               HttpResponse{301, absl::Cord(), {}}},
          });
  HttpAccessor accessor_{"https://example.com/data?token=x", transport_};
};

TEST_F(HttpAccessorTest, NormalizesBaseUrl) {
  EXPECT_EQ("https://example.com/data/", accessor_.base_url());
  EXPECT_EQ("https://example.com/data/",
            HttpAccessor("https://example.com/data/#frag", transport_)
                .base_url());
}

TEST_F(HttpAccessorTest, FetchFile) {
  EXPECT_THAT(accessor_.FetchFile("info"),
              IsOkAndHolds(absl::Cord("{\"scales\":[]}")));
  EXPECT_THAT(accessor_.FetchFile("missing"),
              MatchesStatus(absl::StatusCode::kNotFound,
                            "Error reading https://example.com/data/missing: "
                            "Unexpected HTTP response code 404.*"));
  EXPECT_THAT(accessor_.FetchFile("broken"),
              MatchesStatus(absl::StatusCode::kUnavailable));
}

TEST_F(HttpAccessorTest, FileExists) {
  EXPECT_THAT(accessor_.FileExists("info"), IsOkAndHolds(true));
  EXPECT_THAT(accessor_.FileExists("missing"), IsOkAndHolds(false));
  EXPECT_THAT(accessor_.FileExists("forbidden"),
              MatchesStatus(absl::StatusCode::kPermissionDenied));
  ASSERT_FALSE(transport_->requests().empty());
  EXPECT_EQ("HEAD", transport_->requests().back().method);
}

TEST_F(HttpAccessorTest, ReadBytes) {
  EXPECT_THAT(accessor_.ReadBytes("8_8_8/00.shard", ByteRange{2, 6}),
              IsOkAndHolds(absl::Cord("2345")));
  EXPECT_THAT(transport_->requests().back().headers,
              ElementsAre("Range: bytes=2-5"));

  // The server returns only 2 of the requested bytes.
  EXPECT_THAT(accessor_.ReadBytes("8_8_8/00.shard", ByteRange{8, 12}),
              MatchesStatus(absl::StatusCode::kDataLoss,
                            ".*expected 4 bytes \\(Range: bytes=8-11\\), but "
                            "got 2"));
  EXPECT_THAT(accessor_.ReadBytes("8_8_8/00.shard", ByteRange{20, 24}),
              MatchesStatus(absl::StatusCode::kOutOfRange));
  EXPECT_THAT(accessor_.ReadBytes("missing", ByteRange{0, 4}),
              MatchesStatus(absl::StatusCode::kNotFound));
  EXPECT_THAT(accessor_.ReadBytes("moved", ByteRange{0, 4}),
              MatchesStatus(absl::StatusCode::kFailedPrecondition,
                            ".*Unexpected HTTP response code 301.*"));
}

TEST_F(HttpAccessorTest, EmptyRangeIssuesNoRequest) {
  const size_t before = transport_->requests().size();
  EXPECT_THAT(accessor_.ReadBytes("8_8_8/00.shard", ByteRange{4, 4}),
              IsOkAndHolds(absl::Cord()));
  EXPECT_EQ(before, transport_->requests().size());
}

TEST_F(HttpAccessorTest, FetchChunkUsesFlatPattern) {
  EXPECT_THAT(accessor_.FetchChunk("8_8_8", ChunkCoords{0, 64, 0, 64, 0, 64}),
              IsOkAndHolds(absl::Cord("chunk")));
}

TEST_F(HttpAccessorTest, ReadOnly) {
  EXPECT_THAT(accessor_.StoreFile("info", absl::Cord("{}")),
              MatchesStatus(absl::StatusCode::kUnimplemented));
  EXPECT_THAT(accessor_.OpenWriter("0.shard"),
              MatchesStatus(absl::StatusCode::kUnimplemented));
  EXPECT_THAT(accessor_.StoreChunk("8_8_8", ChunkCoords{0, 64, 0, 64, 0, 64},
                                   absl::Cord("x"), {}),
              MatchesStatus(absl::StatusCode::kUnimplemented));
}

}  // namespace
