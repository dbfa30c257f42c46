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

#include "ngshard/kvstore/byte_range.h"

#include <sstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "ngshard/util/status_testutil.h"

namespace {

using ::ngshard::ByteRange;
using ::ngshard::IsOk;
using ::ngshard::MatchesStatus;

TEST(ByteRangeTest, SatisfiesInvariants) {
  EXPECT_TRUE((ByteRange{0, 0}).SatisfiesInvariants());
  EXPECT_TRUE((ByteRange{0, 1}).SatisfiesInvariants());
  EXPECT_TRUE((ByteRange{0, 100}).SatisfiesInvariants());
  EXPECT_TRUE((ByteRange{10, 100}).SatisfiesInvariants());
  EXPECT_FALSE((ByteRange{-1, 0}).SatisfiesInvariants());
  EXPECT_FALSE((ByteRange{11, 10}).SatisfiesInvariants());
}

TEST(ByteRangeTest, Size) {
  EXPECT_EQ(5, (ByteRange{2, 7}).size());
  EXPECT_EQ(0, (ByteRange{7, 7}).size());
  EXPECT_TRUE((ByteRange{7, 7}).empty());
  EXPECT_FALSE((ByteRange{2, 7}).empty());
  EXPECT_EQ((ByteRange{16, 40}), ByteRange::FromOffsetLength(16, 24));
}

TEST(ByteRangeTest, Validate) {
  EXPECT_THAT((ByteRange{0, 10}).Validate(10), IsOk());
  EXPECT_THAT((ByteRange{10, 10}).Validate(10), IsOk());
  EXPECT_THAT((ByteRange{5, 11}).Validate(10),
              MatchesStatus(absl::StatusCode::kOutOfRange,
                            "Requested byte range \\[5, 11\\) is not valid "
                            "for value of size 10"));
  EXPECT_THAT((ByteRange{6, 5}).Validate(10),
              MatchesStatus(absl::StatusCode::kOutOfRange));
}

TEST(ByteRangeTest, Print) {
  std::ostringstream os;
  os << ByteRange{1, 5};
  EXPECT_EQ("[1, 5)", os.str());
}

}  // namespace
