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

#ifndef NGSHARD_KVSTORE_HTTP_HTTP_TRANSPORT_H_
#define NGSHARD_KVSTORE_HTTP_HTTP_TRANSPORT_H_

#include "absl/strings/cord.h"
#include "ngshard/kvstore/http/http_request.h"
#include "ngshard/kvstore/http/http_response.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace internal_http {

/// HttpTransport is an interface class for making blocking HTTP requests.
///
/// A transport returns an error only when no response was received; HTTP
/// error responses are returned as an `HttpResponse`.  Transports do not
/// retry.
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  /// Issues `request` with the provided body `payload`.
  virtual Result<HttpResponse> IssueRequest(const HttpRequest& request,
                                            absl::Cord payload) = 0;

  Result<HttpResponse> IssueRequest(const HttpRequest& request) {
    return IssueRequest(request, absl::Cord());
  }
};

}  // namespace internal_http
}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_HTTP_HTTP_TRANSPORT_H_
