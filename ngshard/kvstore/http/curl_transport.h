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

#ifndef NGSHARD_KVSTORE_HTTP_CURL_TRANSPORT_H_
#define NGSHARD_KVSTORE_HTTP_CURL_TRANSPORT_H_

#include <stdint.h>

#include <memory>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include <curl/curl.h>
#include "ngshard/kvstore/http/http_request.h"
#include "ngshard/kvstore/http/http_response.h"
#include "ngshard/kvstore/http/http_transport.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace internal_http {

struct CurlPtrCleanup {
  void operator()(CURL*);
};
struct CurlSlistCleanup {
  void operator()(curl_slist*);
};

/// CurlPtr holds a CURL* handle and automatically cleans it up.
using CurlPtr = std::unique_ptr<CURL, CurlPtrCleanup>;

/// CurlHeaders holds a singly-linked list of headers.
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistCleanup>;

/// Returns the user agent sent with every request.
std::string GetCurlUserAgent();

/// Returns an `absl::Status` corresponding to a `CURLcode`.
absl::Status CurlCodeToStatus(CURLcode code, std::string_view detail);

/// HttpTransport implementation backed by a libcurl easy handle per request.
class CurlTransport : public HttpTransport {
 public:
  struct Options {
    /// Timeout for the whole request in milliseconds; 0 means none.
    int64_t request_timeout_ms = 0;
    /// Timeout for establishing the connection in milliseconds; 0 means the
    /// libcurl default.
    int64_t connect_timeout_ms = 0;
  };

  CurlTransport();
  explicit CurlTransport(Options options);

  using HttpTransport::IssueRequest;

  Result<HttpResponse> IssueRequest(const HttpRequest& request,
                                    absl::Cord payload) override;

 private:
  Options options_;
};

}  // namespace internal_http
}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_HTTP_CURL_TRANSPORT_H_
