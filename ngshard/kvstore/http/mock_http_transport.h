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

#ifndef NGSHARD_KVSTORE_HTTP_MOCK_HTTP_TRANSPORT_H_
#define NGSHARD_KVSTORE_HTTP_MOCK_HTTP_TRANSPORT_H_

#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/strings/cord.h"
#include "absl/synchronization/mutex.h"
#include "ngshard/kvstore/http/http_request.h"
#include "ngshard/kvstore/http/http_response.h"
#include "ngshard/kvstore/http/http_transport.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace internal_http {

/// In-memory `HttpTransport` for tests.
///
/// Responses are looked up by `"<method> <url>"`, then by `<url>` alone.  A
/// `HEAD` request served from a `<url>` entry returns its status without a
/// body, and a `GET` with a `Range` header served from a 200 response returns
/// 206 with the requested slice.  Unknown URLs return 404.
class DefaultMockHttpTransport : public HttpTransport {
 public:
  explicit DefaultMockHttpTransport(
      absl::flat_hash_map<std::string, HttpResponse> url_to_response);

  void Reset(absl::flat_hash_map<std::string, HttpResponse> url_to_response);

  std::vector<HttpRequest> requests() const ABSL_LOCKS_EXCLUDED(mutex_);

  using HttpTransport::IssueRequest;

  Result<HttpResponse> IssueRequest(const HttpRequest& request,
                                    absl::Cord payload) override;

 private:
  mutable absl::Mutex mutex_;
  std::vector<HttpRequest> requests_ ABSL_GUARDED_BY(mutex_);
  absl::flat_hash_map<std::string, HttpResponse> url_to_response_
      ABSL_GUARDED_BY(mutex_);
};

}  // namespace internal_http
}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_HTTP_MOCK_HTTP_TRANSPORT_H_
