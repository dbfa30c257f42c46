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


#include "ngshard/internal/json/value_as.h"

#include <stdint.h>

#include <array>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "absl/status/status.h"
#include "ngshard/util/status_testutil.h"

namespace {

using ::ngshard::IsOkAndHolds;
using ::ngshard::MatchesStatus;
using ::ngshard::internal_json::JsonExtractMember;
using ::ngshard::internal_json::JsonRequireInteger;
using ::ngshard::internal_json::JsonRequireIntegerTriple;
using ::ngshard::internal_json::JsonRequireNumber;
using ::ngshard::internal_json::JsonRequireNumberTriple;
using ::ngshard::internal_json::JsonRequireString;
using ::ngshard::internal_json::JsonValueAsInteger;
using ::ngshard::internal_json::MaybeAnnotateMemberError;

TEST(JsonValueAsIntegerTest, Conversions) {
  EXPECT_EQ(3, JsonValueAsInteger(3).value());
  EXPECT_EQ(-3, JsonValueAsInteger(-3).value());
  EXPECT_EQ(4, JsonValueAsInteger(4.0).value());
  EXPECT_FALSE(JsonValueAsInteger(4.5).has_value());
  EXPECT_FALSE(JsonValueAsInteger("4").has_value());
  EXPECT_FALSE(JsonValueAsInteger(uint64_t(1) << 63).has_value());
  EXPECT_FALSE(JsonValueAsInteger(nullptr).has_value());
}

TEST(JsonRequireIntegerTest, Range) {
  EXPECT_THAT(JsonRequireInteger(5, 1, 10), IsOkAndHolds(5));
  EXPECT_THAT(JsonRequireInteger(0, 1, 10),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Expected integer in the range \\[1, 10\\], but "
                            "received: 0"));
  EXPECT_THAT(JsonRequireInteger("x"),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Expected 64-bit signed integer, but received: "
                            "\"x\""));
}

TEST(JsonRequireTest, NumberAndString) {
  EXPECT_THAT(JsonRequireNumber(1.5), IsOkAndHolds(1.5));
  EXPECT_THAT(JsonRequireNumber(2), IsOkAndHolds(2.0));
  EXPECT_THAT(JsonRequireNumber("1.5"),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(JsonRequireString("abc"), IsOkAndHolds(std::string("abc")));
  EXPECT_THAT(JsonRequireString(1),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Expected string, but received: 1"));
}

TEST(JsonRequireTripleTest, Integers) {
  EXPECT_THAT(JsonRequireIntegerTriple(::nlohmann::json{1, 2, 3}),
              IsOkAndHolds(std::array<int64_t, 3>{{1, 2, 3}}));
  EXPECT_THAT(JsonRequireIntegerTriple(::nlohmann::json{1, 2}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Expected array of 3 integers, .*"));
  EXPECT_THAT(JsonRequireIntegerTriple(::nlohmann::json{1, 0, 3}, 1),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Error parsing value at position 1: .*"));
}

TEST(JsonRequireTripleTest, Numbers) {
  EXPECT_THAT(JsonRequireNumberTriple(::nlohmann::json{1, 2.5, 3}),
              IsOkAndHolds(std::array<double, 3>{{1, 2.5, 3}}));
  EXPECT_THAT(JsonRequireNumberTriple(::nlohmann::json{1, "2", 3}),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
}

TEST(JsonExtractMemberTest, Basic) {
  ::nlohmann::json::object_t obj{{"a", 1}, {"b", 2}};
  auto a = JsonExtractMember(obj, "a");
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(::nlohmann::json(1), *a);
  EXPECT_FALSE(JsonExtractMember(obj, "a").has_value());
  EXPECT_EQ(1u, obj.size());
}

TEST(MaybeAnnotateMemberErrorTest, Basic) {
  EXPECT_THAT(
      MaybeAnnotateMemberError(absl::InvalidArgumentError("bad"), "size"),
      MatchesStatus(absl::StatusCode::kInvalidArgument,
                    "Error parsing object member \"size\": bad"));
  EXPECT_TRUE(MaybeAnnotateMemberError(absl::OkStatus(), "size").ok());
}

}  // namespace
