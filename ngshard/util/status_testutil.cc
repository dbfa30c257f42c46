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


#include "ngshard/util/status_testutil.h"

#include <optional>
#include <ostream>
#include <regex>  // NOLINT
#include <string>
#include <utility>

#include <gmock/gmock.h>
#include "absl/status/status.h"

namespace ngshard {
namespace internal_status {

MatchesStatusMatcher::MatchesStatusMatcher(
    absl::StatusCode code, std::optional<std::string> message_pattern)
    : code_(code), message_pattern_(std::move(message_pattern)) {
  if (message_pattern_) message_regex_.emplace(*message_pattern_);
}

void MatchesStatusMatcher::DescribeTo(std::ostream* os) const {
  *os << "has status code " << absl::StatusCodeToString(code_);
  if (message_pattern_) {
    *os << " and a message matching ";
    ::testing::internal::UniversalPrint(*message_pattern_, os);
  }
}

void MatchesStatusMatcher::DescribeNegationTo(std::ostream* os) const {
  *os << "doesn't have status code " << absl::StatusCodeToString(code_);
  if (message_pattern_) {
    *os << " or a message matching ";
    ::testing::internal::UniversalPrint(*message_pattern_, os);
  }
}

bool MatchesStatusMatcher::MatchStatus(
    const absl::Status& status,
    ::testing::MatchResultListener* listener) const {
  if (status.code() != code_) {
    *listener << "whose status is " << status;
    return false;
  }
  if (message_regex_) {
    const std::string message(status.message());
    if (!std::regex_match(message, *message_regex_)) {
      *listener << "whose message \"" << message << "\" doesn't match";
      return false;
    }
  }
  return true;
}

}  // namespace internal_status

::testing::PolymorphicMatcher<internal_status::MatchesStatusMatcher>
MatchesStatus(absl::StatusCode code) {
  return ::testing::MakePolymorphicMatcher(
      internal_status::MatchesStatusMatcher(code, std::nullopt));
}

::testing::PolymorphicMatcher<internal_status::MatchesStatusMatcher>
MatchesStatus(absl::StatusCode code, const std::string& message_pattern) {
  return ::testing::MakePolymorphicMatcher(
      internal_status::MatchesStatusMatcher(code, message_pattern));
}

}  // namespace ngshard
