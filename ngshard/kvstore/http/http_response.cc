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


#include "ngshard/kvstore/http/http_response.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <initializer_list>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"

namespace ngshard {
namespace internal_http {
namespace {

// Bytes of the response body included in error messages.
constexpr size_t kMaxBodyInMessage = 256;

}  // namespace

absl::StatusCode HttpStatusToStatusCode(int32_t http_status) {
  if (http_status >= 200 && http_status < 300) return absl::StatusCode::kOk;
  switch (http_status) {
    case 400:
      return absl::StatusCode::kInvalidArgument;
    case 401:
    case 403:
      return absl::StatusCode::kPermissionDenied;
    case 404:
    case 410:
      return absl::StatusCode::kNotFound;
    case 416:
      return absl::StatusCode::kOutOfRange;
    case 408:
    case 429:
      return absl::StatusCode::kUnavailable;
  }
  if (http_status >= 300 && http_status < 500) {
    return absl::StatusCode::kFailedPrecondition;
  }
  if (http_status >= 500 && http_status < 600) {
    return absl::StatusCode::kUnavailable;
  }
  return absl::StatusCode::kUnknown;
}

absl::Status CheckHttpResponse(const HttpResponse& response,
                               std::initializer_list<int32_t> accepted) {
  if (std::find(accepted.begin(), accepted.end(), response.status_code) !=
      accepted.end()) {
    return absl::OkStatus();
  }
  absl::StatusCode code = HttpStatusToStatusCode(response.status_code);
  // A success code that the caller cannot handle, such as 200 for a
  // HEAD-only probe, is still an error.
  if (code == absl::StatusCode::kOk) code = absl::StatusCode::kUnknown;
  std::string message =
      absl::StrCat("Unexpected HTTP response code ", response.status_code);
  if (!response.payload.empty()) {
    const size_t n = std::min(kMaxBodyInMessage, response.payload.size());
    absl::StrAppend(&message, " with body",
                    n < response.payload.size() ? " (clipped)" : "", ": ",
                    std::string(response.payload.Subcord(0, n)));
  }
  return absl::Status(code, message);
}

}  // namespace internal_http
}  // namespace ngshard
