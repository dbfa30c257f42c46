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

#include "ngshard/kvstore/http/curl_transport.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/cord.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"
#include <curl/curl.h>
#include "ngshard/internal/log/verbose_flag.h"
#include "ngshard/kvstore/http/http_request.h"
#include "ngshard/kvstore/http/http_response.h"
#include "ngshard/util/result.h"
#include "ngshard/util/status.h"

namespace ngshard {
namespace internal_http {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag http_logging("http");

void InitializeCurlOnce() {
  static const CURLcode init_result = curl_global_init(CURL_GLOBAL_ALL);
  ABSL_LOG_IF(ERROR, init_result != CURLE_OK)
      << "curl_global_init failed: " << curl_easy_strerror(init_result);
}

struct CurlRequestState {
  HttpResponse response{0, absl::Cord(), {}};
  std::string upload;
  size_t upload_offset = 0;
  char error_buffer[CURL_ERROR_SIZE];

  static size_t WriteCallback(void* contents, size_t size, size_t nmemb,
                              void* userdata) {
    auto* self = static_cast<CurlRequestState*>(userdata);
    const size_t n = size * nmemb;
    self->response.payload.Append(
        std::string_view(static_cast<const char*>(contents), n));
    return n;
  }

  static size_t ReadCallback(char* buffer, size_t size, size_t nitems,
                             void* userdata) {
    auto* self = static_cast<CurlRequestState*>(userdata);
    const size_t n = std::min(size * nitems,
                              self->upload.size() - self->upload_offset);
    self->upload.copy(buffer, n, self->upload_offset);
    self->upload_offset += n;
    return n;
  }

  static size_t HeaderCallback(char* contents, size_t size, size_t nitems,
                               void* userdata) {
    auto* self = static_cast<CurlRequestState*>(userdata);
    const size_t n = size * nitems;
    std::string_view line(contents, n);
    if (absl::StartsWith(line, "HTTP/")) {
      // A new status line starts the header block of another response,
      // e.g. after a redirect.
      self->response.headers.clear();
      return n;
    }
    size_t colon = line.find(':');
    if (colon == std::string_view::npos) return n;
    std::string name = absl::AsciiStrToLower(
        absl::StripAsciiWhitespace(line.substr(0, colon)));
    self->response.headers.emplace(
        std::move(name),
        std::string(absl::StripAsciiWhitespace(line.substr(colon + 1))));
    return n;
  }
};

}  // namespace

void CurlPtrCleanup::operator()(CURL* c) { curl_easy_cleanup(c); }
void CurlSlistCleanup::operator()(curl_slist* s) { curl_slist_free_all(s); }

std::string GetCurlUserAgent() {
  static const std::string agent = absl::StrCat("ngshard/0.1 ", curl_version());
  return agent;
}

absl::Status CurlCodeToStatus(CURLcode code, std::string_view detail) {
  auto error_code = absl::StatusCode::kUnknown;
  switch (code) {
    case CURLE_OK:
      return absl::OkStatus();

    case CURLE_COULDNT_RESOLVE_PROXY:
      error_code = absl::StatusCode::kUnavailable;
      if (detail.empty()) detail = "Failed to resolve proxy";
      break;

    case CURLE_OPERATION_TIMEDOUT:
      error_code = absl::StatusCode::kDeadlineExceeded;
      if (detail.empty()) detail = "Timed out";
      break;

    case CURLE_COULDNT_CONNECT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_GOT_NOTHING:
    case CURLE_PARTIAL_FILE:
    case CURLE_RECV_ERROR:
    case CURLE_SEND_ERROR:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_UNSUPPORTED_PROTOCOL:
      error_code = absl::StatusCode::kUnavailable;
      break;

    case CURLE_URL_MALFORMAT:
      error_code = absl::StatusCode::kInvalidArgument;
      break;

    case CURLE_WRITE_ERROR:
      error_code = absl::StatusCode::kCancelled;
      break;

    case CURLE_ABORTED_BY_CALLBACK:
      error_code = absl::StatusCode::kAborted;
      break;

    case CURLE_REMOTE_ACCESS_DENIED:
      error_code = absl::StatusCode::kPermissionDenied;
      break;

    case CURLE_RANGE_ERROR:  // The server does not support range requests.
    case CURLE_BAD_FUNCTION_ARGUMENT:
    case CURLE_OUT_OF_MEMORY:
    case CURLE_NOT_BUILT_IN:
    case CURLE_UNKNOWN_OPTION:
      error_code = absl::StatusCode::kInternal;
      break;

    default:
      break;
  }

  return absl::Status(
      error_code, absl::StrCat("CURL error[", code, "] ",
                               curl_easy_strerror(code),
                               detail.empty() ? "" : ": ", detail));
}

CurlTransport::CurlTransport() : CurlTransport(Options{}) {}

CurlTransport::CurlTransport(Options options) : options_(options) {
  InitializeCurlOnce();
}

Result<HttpResponse> CurlTransport::IssueRequest(const HttpRequest& request,
                                                 absl::Cord payload) {
  ABSL_LOG_IF(INFO, http_logging) << request;

  CurlPtr handle(curl_easy_init());
  if (!handle) {
    return absl::InternalError("Failed to create CURL handle");
  }
  CURL* curl = handle.get();
  CurlRequestState state;
  state.error_buffer[0] = 0;

  curl_slist* head = nullptr;
  for (const std::string& h : request.headers) {
    head = curl_slist_append(head, h.c_str());
  }
  CurlHeaders headers(head);
  const std::string user_agent = GetCurlUserAgent();

  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, state.error_buffer);
  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION,
                   &CurlRequestState::WriteCallback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION,
                   &CurlRequestState::HeaderCallback);
  if (options_.request_timeout_ms > 0) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(options_.request_timeout_ms));
  }
  if (options_.connect_timeout_ms > 0) {
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options_.connect_timeout_ms));
  }

  if (request.method == "HEAD") {
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
  } else if (request.method == "GET") {
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  } else {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
  }
  if (!payload.empty()) {
    state.upload = std::string(payload);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_READDATA, &state);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION,
                     &CurlRequestState::ReadCallback);
    curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                     static_cast<curl_off_t>(state.upload.size()));
  }

  CURLcode code = curl_easy_perform(curl);
  NGSHARD_RETURN_IF_ERROR(
      CurlCodeToStatus(code, state.error_buffer),
      MaybeAnnotateStatus(_, absl::StrCat(request.method, " ", request.url)));

  long response_code = 0;
  NGSHARD_RETURN_IF_ERROR(CurlCodeToStatus(
      curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code),
      "Failed to read response code"));
  state.response.status_code = static_cast<int32_t>(response_code);

  ABSL_LOG_IF(INFO, http_logging.Level(1)) << state.response;
  return std::move(state.response);
}

}  // namespace internal_http
}  // namespace ngshard
