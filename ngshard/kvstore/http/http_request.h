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

#ifndef NGSHARD_KVSTORE_HTTP_HTTP_REQUEST_H_
#define NGSHARD_KVSTORE_HTTP_HTTP_REQUEST_H_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/strings/str_format.h"
#include "ngshard/kvstore/byte_range.h"

namespace ngshard {
namespace internal_http {

/// HttpRequest encapsulates a single HTTP request.
struct HttpRequest {
  std::string method;
  std::string url;
  std::vector<std::string> headers = {};

  /// Returns the value of the first header named `name`, compared
  /// case-insensitively.
  std::optional<std::string_view> GetHeader(std::string_view name) const;

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const HttpRequest& request) {
    absl::Format(&sink, "HttpRequest{%s %s, headers=<", request.method,
                 request.url);
    const char* sep = "";
    for (const auto& v : request.headers) {
      sink.Append(sep);
      sink.Append(v);
      sep = "  ";
    }
    sink.Append(">}");
  }
};

/// Formats a `Range` header for `byte_range`, or `std::nullopt` if the range
/// is empty, in which case no request is needed.
std::optional<std::string> FormatRangeHeader(ByteRange byte_range);

/// Parses the value of a `Range: bytes=<first>-<last>` header.
std::optional<ByteRange> ParseRangeHeader(std::string_view value);

}  // namespace internal_http
}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_HTTP_HTTP_REQUEST_H_
