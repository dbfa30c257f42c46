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


#ifndef NGSHARD_UTIL_STATUS_TESTUTIL_H_
#define NGSHARD_UTIL_STATUS_TESTUTIL_H_

/// \file
/// gMock matchers for `absl::Status` and `ngshard::Result`.
///
/// All matchers are polymorphic: they accept either an `absl::Status` or a
/// `Result<T>` for any `T`.

#include <optional>
#include <ostream>
#include <regex>  // NOLINT
#include <string>
#include <type_traits>
#include <utility>

#include <gmock/gmock.h>
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "ngshard/util/result.h"
#include "ngshard/util/status.h"

namespace ngshard {
namespace internal_status {

class IsOkMatcher {
 public:
  void DescribeTo(std::ostream* os) const { *os << "is OK"; }
  void DescribeNegationTo(std::ostream* os) const { *os << "is not OK"; }

  template <typename StatusType>
  bool MatchAndExplain(const StatusType& actual,
                       ::testing::MatchResultListener* listener) const {
    const absl::Status& status = ::ngshard::GetStatus(actual);
    if (!status.ok()) *listener << "whose status is " << status;
    return status.ok();
  }
};

template <typename InnerMatcher>
class IsOkAndHoldsMatcher {
 public:
  explicit IsOkAndHoldsMatcher(InnerMatcher inner)
      : inner_(std::move(inner)) {}

  void DescribeTo(std::ostream* os) const {
    *os << "is OK and holds a matching value";
  }
  void DescribeNegationTo(std::ostream* os) const {
    *os << "is not OK or holds a value that doesn't match";
  }

  template <typename T>
  bool MatchAndExplain(const absl::StatusOr<T>& actual,
                       ::testing::MatchResultListener* listener) const {
    if (!actual.ok()) {
      *listener << "whose status is " << actual.status();
      return false;
    }
    const auto matcher = ::testing::SafeMatcherCast<const T&>(inner_);
    ::testing::StringMatchResultListener inner_listener;
    if (matcher.MatchAndExplain(*actual, &inner_listener)) return true;
    *listener << "whose value " << ::testing::PrintToString(*actual)
              << " doesn't match";
    if (auto* os = listener->stream()) {
      *os << ", expected a value that ";
      matcher.DescribeTo(os);
    }
    if (!inner_listener.str().empty()) {
      *listener << ", " << inner_listener.str();
    }
    return false;
  }

 private:
  InnerMatcher inner_;
};

class MatchesStatusMatcher {
 public:
  MatchesStatusMatcher(absl::StatusCode code,
                       std::optional<std::string> message_pattern);

  void DescribeTo(std::ostream* os) const;
  void DescribeNegationTo(std::ostream* os) const;

  template <typename StatusType>
  bool MatchAndExplain(const StatusType& actual,
                       ::testing::MatchResultListener* listener) const {
    return MatchStatus(::ngshard::GetStatus(actual), listener);
  }

 private:
  bool MatchStatus(const absl::Status& status,
                   ::testing::MatchResultListener* listener) const;

  absl::StatusCode code_;
  std::optional<std::string> message_pattern_;
  std::optional<std::regex> message_regex_;
};

}  // namespace internal_status

/// Matches an OK `absl::Status` or `Result`.
inline ::testing::PolymorphicMatcher<internal_status::IsOkMatcher> IsOk() {
  return ::testing::MakePolymorphicMatcher(internal_status::IsOkMatcher());
}

/// Matches an OK `Result` whose value matches `inner`, which is either a
/// matcher or a value compared for equality.
template <typename InnerMatcher>
::testing::PolymorphicMatcher<
    internal_status::IsOkAndHoldsMatcher<std::decay_t<InnerMatcher>>>
IsOkAndHolds(InnerMatcher&& inner) {
  return ::testing::MakePolymorphicMatcher(
      internal_status::IsOkAndHoldsMatcher<std::decay_t<InnerMatcher>>(
          std::forward<InnerMatcher>(inner)));
}

/// Matches an `absl::Status` or `Result` with the error code `code`, and, if
/// specified, a message that fully matches the ECMAScript regular expression
/// `message_pattern`.
::testing::PolymorphicMatcher<internal_status::MatchesStatusMatcher>
MatchesStatus(absl::StatusCode code);
::testing::PolymorphicMatcher<internal_status::MatchesStatusMatcher>
MatchesStatus(absl::StatusCode code, const std::string& message_pattern);

}  // namespace ngshard

#define NGSHARD_EXPECT_OK(expr) EXPECT_THAT(expr, ::ngshard::IsOk())

#define NGSHARD_ASSERT_OK(expr) ASSERT_THAT(expr, ::ngshard::IsOk())

/// Assigns the value of the `Result` `expr` to `decl`, or fails the current
/// test with the error status.
#define NGSHARD_ASSERT_OK_AND_ASSIGN(decl, expr)                      \
  NGSHARD_ASSIGN_OR_RETURN(decl, expr,                                \
                           ([&] { FAIL() << #expr << ": " << _; })()) \
  /**/

#endif  // NGSHARD_UTIL_STATUS_TESTUTIL_H_
