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

#include "ngshard/kvstore/http/mock_http_transport.h"

#include <stdint.h>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/absl_log.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "ngshard/kvstore/byte_range.h"
#include "ngshard/kvstore/http/http_request.h"
#include "ngshard/kvstore/http/http_response.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace internal_http {

DefaultMockHttpTransport::DefaultMockHttpTransport(
    absl::flat_hash_map<std::string, HttpResponse> url_to_response) {
  Reset(std::move(url_to_response));
}

void DefaultMockHttpTransport::Reset(
    absl::flat_hash_map<std::string, HttpResponse> url_to_response) {
  absl::MutexLock l(&mutex_);
  requests_.clear();
  url_to_response_ = std::move(url_to_response);
}

std::vector<HttpRequest> DefaultMockHttpTransport::requests() const {
  absl::MutexLock l(&mutex_);
  return requests_;
}

Result<HttpResponse> DefaultMockHttpTransport::IssueRequest(
    const HttpRequest& request, absl::Cord payload) {
  std::string key = absl::StrCat(request.method, " ", request.url);
  ABSL_LOG(INFO) << key;
  absl::MutexLock l(&mutex_);
  requests_.push_back(request);

  if (auto it = url_to_response_.find(key); it != url_to_response_.end()) {
    return it->second;
  }
  auto it = url_to_response_.find(request.url);
  if (it == url_to_response_.end()) {
    return HttpResponse{404, absl::Cord(key), {}};
  }
  HttpResponse response = it->second;
  if (request.method == "HEAD") {
    response.payload.Clear();
    return response;
  }
  if (response.status_code != 200) return response;
  if (auto range_header = request.GetHeader("range")) {
    auto range = ParseRangeHeader(*range_header);
    const int64_t size = static_cast<int64_t>(response.payload.size());
    if (!range || range->inclusive_min >= size) {
      return HttpResponse{416, absl::Cord(), {}};
    }
    const int64_t end = std::min(range->exclusive_max, size);
    response.payload = response.payload.Subcord(
        range->inclusive_min, end - range->inclusive_min);
    response.status_code = 206;
    response.headers.emplace(
        "content-range",
        absl::StrCat("bytes ", range->inclusive_min, "-", end - 1, "/", size));
  }
  return response;
}

}  // namespace internal_http
}  // namespace ngshard
