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


#ifndef NGSHARD_INTERNAL_JSON_VALUE_AS_H_
#define NGSHARD_INTERNAL_JSON_VALUE_AS_H_

/// \file
///
/// Low-level functions for extracting values from JSON documents, used by the
/// metadata parsers.

#include <stdint.h>

#include <array>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include "absl/status/status.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace internal_json {

/// Returns an error message for a json value with the expected type.
absl::Status ExpectedError(const ::nlohmann::json& j,
                           std::string_view type_name);

/// Returns `status` prefixed with `Error parsing object member "<member>"`.
absl::Status MaybeAnnotateMemberError(const absl::Status& status,
                                      std::string_view member);

/// Converts `j` to an integer without loss.  Floating-point values with an
/// integral value are accepted, strings are not.
std::optional<int64_t> JsonValueAsInteger(const ::nlohmann::json& j);

/// Requires `j` to be an integer in the range `[min_value, max_value]`.
///
/// \error `absl::StatusCode::kInvalidArgument` otherwise.
Result<int64_t> JsonRequireInteger(
    const ::nlohmann::json& j,
    int64_t min_value = std::numeric_limits<int64_t>::min(),
    int64_t max_value = std::numeric_limits<int64_t>::max());

/// Requires `j` to be a number.
Result<double> JsonRequireNumber(const ::nlohmann::json& j);

/// Requires `j` to be a string.
Result<std::string> JsonRequireString(const ::nlohmann::json& j);

/// Requires `j` to be an array of exactly 3 integers, each in the range
/// `[min_value, max_value]`.
Result<std::array<int64_t, 3>> JsonRequireIntegerTriple(
    const ::nlohmann::json& j,
    int64_t min_value = std::numeric_limits<int64_t>::min(),
    int64_t max_value = std::numeric_limits<int64_t>::max());

/// Requires `j` to be an array of exactly 3 numbers.
Result<std::array<double, 3>> JsonRequireNumberTriple(
    const ::nlohmann::json& j);

/// Removes and returns member `name` of `obj`, or returns `std::nullopt` if
/// there is no such member.
std::optional<::nlohmann::json> JsonExtractMember(
    ::nlohmann::json::object_t& obj, std::string_view name);

}  // namespace internal_json
}  // namespace ngshard

#endif  // NGSHARD_INTERNAL_JSON_VALUE_AS_H_
