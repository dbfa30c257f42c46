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

#ifndef NGSHARD_KVSTORE_HTTP_HTTP_RESPONSE_H_
#define NGSHARD_KVSTORE_HTTP_HTTP_RESPONSE_H_

#include <stdint.h>

#include <initializer_list>
#include <map>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_format.h"

namespace ngshard {
namespace internal_http {

/// HttpResponse contains the results of an HTTP request.  Header names are
/// stored lower-cased.
struct HttpResponse {
  int32_t status_code;
  absl::Cord payload;
  std::multimap<std::string, std::string> headers;

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const HttpResponse& response) {
    absl::Format(&sink, "HttpResponse{code=%d, payload.size=%d",
                 response.status_code, response.payload.size());
    if (response.payload.size() <= 64) {
      absl::Format(&sink, ", payload=%s}", std::string(response.payload));
    } else {
      sink.Append("}");
    }
  }
};

/// Returns the `absl::StatusCode` for an HTTP status code.  Codes that a
/// static file server returns for missing, forbidden or unsatisfiable reads
/// are mapped specifically; other 4xx codes are `kFailedPrecondition` and
/// 5xx codes are `kUnavailable`.
absl::StatusCode HttpStatusToStatusCode(int32_t http_status);

/// Returns `absl::OkStatus()` if the status code of `response` is one of
/// `accepted`.  Otherwise returns an error whose message includes the code and
/// the start of the response body.
absl::Status CheckHttpResponse(const HttpResponse& response,
                               std::initializer_list<int32_t> accepted);

}  // namespace internal_http
}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_HTTP_HTTP_RESPONSE_H_
