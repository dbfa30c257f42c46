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

#include <stddef.h>
#include <stdint.h>

#include <array>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "ngshard/util/quote_string.h"
#include "ngshard/util/result.h"
#include "ngshard/util/status.h"

namespace ngshard {
namespace internal_json {

absl::Status ExpectedError(const ::nlohmann::json& j,
                           std::string_view type_name) {
  return absl::InvalidArgumentError(
      absl::StrCat("Expected ", type_name, ", but received: ", j.dump()));
}

absl::Status MaybeAnnotateMemberError(const absl::Status& status,
                                      std::string_view member) {
  return MaybeAnnotateStatus(
      status, absl::StrCat("Error parsing object member ",
                           QuoteString(member)));
}

std::optional<int64_t> JsonValueAsInteger(const ::nlohmann::json& j) {
  if (j.is_number_unsigned()) {
    auto x = j.get<uint64_t>();
    if (x <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return static_cast<int64_t>(x);
    }
  } else if (j.is_number_integer()) {
    return j.get<int64_t>();
  } else if (j.is_number_float()) {
    auto x = j.get<double>();
    if (x >= -9223372036854775808.0 /*=-2^63*/ &&
        x < 9223372036854775808.0 /*=2^63*/ && x == std::floor(x)) {
      return static_cast<int64_t>(x);
    }
  }
  return std::nullopt;
}

Result<int64_t> JsonRequireInteger(const ::nlohmann::json& j,
                                   int64_t min_value, int64_t max_value) {
  if (auto x = JsonValueAsInteger(j)) {
    if (*x >= min_value && *x <= max_value) return *x;
  }
  if (min_value == std::numeric_limits<int64_t>::min() &&
      max_value == std::numeric_limits<int64_t>::max()) {
    return ExpectedError(j, "64-bit signed integer");
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Expected integer in the range [", min_value, ", ",
                   max_value, "], but received: ", j.dump()));
}

Result<double> JsonRequireNumber(const ::nlohmann::json& j) {
  if (!j.is_number()) return ExpectedError(j, "64-bit floating-point number");
  return j.get<double>();
}

Result<std::string> JsonRequireString(const ::nlohmann::json& j) {
  if (!j.is_string()) return ExpectedError(j, "string");
  return j.get<std::string>();
}

Result<std::array<int64_t, 3>> JsonRequireIntegerTriple(
    const ::nlohmann::json& j, int64_t min_value, int64_t max_value) {
  if (!j.is_array() || j.size() != 3) {
    return ExpectedError(j, "array of 3 integers");
  }
  std::array<int64_t, 3> result;
  for (size_t i = 0; i < 3; ++i) {
    NGSHARD_ASSIGN_OR_RETURN(
        result[i], JsonRequireInteger(j[i], min_value, max_value),
        MaybeAnnotateStatus(_, absl::StrCat("Error parsing value at position ",
                                            i)));
  }
  return result;
}

Result<std::array<double, 3>> JsonRequireNumberTriple(
    const ::nlohmann::json& j) {
  if (!j.is_array() || j.size() != 3) {
    return ExpectedError(j, "array of 3 numbers");
  }
  std::array<double, 3> result;
  for (size_t i = 0; i < 3; ++i) {
    NGSHARD_ASSIGN_OR_RETURN(
        result[i], JsonRequireNumber(j[i]),
        MaybeAnnotateStatus(_, absl::StrCat("Error parsing value at position ",
                                            i)));
  }
  return result;
}

std::optional<::nlohmann::json> JsonExtractMember(
    ::nlohmann::json::object_t& obj, std::string_view name) {
  auto it = obj.find(std::string(name));
  if (it == obj.end()) return std::nullopt;
  ::nlohmann::json value = std::move(it->second);
  obj.erase(it);
  return value;
}

}  // namespace internal_json
}  // namespace ngshard
