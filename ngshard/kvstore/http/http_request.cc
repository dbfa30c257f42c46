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

#include "ngshard/kvstore/http/http_request.h"

#include <stdint.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "ngshard/kvstore/byte_range.h"

namespace ngshard {
namespace internal_http {

std::optional<std::string_view> HttpRequest::GetHeader(
    std::string_view name) const {
  for (std::string_view header : headers) {
    size_t colon = header.find(':');
    if (colon == std::string_view::npos) continue;
    if (!absl::EqualsIgnoreCase(header.substr(0, colon), name)) continue;
    return absl::StripAsciiWhitespace(header.substr(colon + 1));
  }
  return std::nullopt;
}

std::optional<std::string> FormatRangeHeader(ByteRange byte_range) {
  if (byte_range.empty()) return std::nullopt;
  return absl::StrFormat("Range: bytes=%d-%d", byte_range.inclusive_min,
                         byte_range.exclusive_max - 1);
}

std::optional<ByteRange> ParseRangeHeader(std::string_view value) {
  if (!absl::ConsumePrefix(&value, "bytes=")) return std::nullopt;
  std::pair<std::string_view, std::string_view> parts =
      absl::StrSplit(value, absl::MaxSplits('-', 1));
  int64_t first, last;
  if (!absl::SimpleAtoi(parts.first, &first) ||
      !absl::SimpleAtoi(parts.second, &last) || first < 0 || last < first) {
    return std::nullopt;
  }
  return ByteRange{first, last + 1};
}

}  // namespace internal_http
}  // namespace ngshard
