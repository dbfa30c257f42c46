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

#include "ngshard/kvstore/http/http_accessor.h"

#include <stdint.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "ngshard/internal/log/verbose_flag.h"
#include "ngshard/kvstore/byte_range.h"
#include "ngshard/kvstore/http/http_request.h"
#include "ngshard/kvstore/http/http_response.h"
#include "ngshard/kvstore/http/http_transport.h"
#include "ngshard/util/result.h"
#include "ngshard/util/status.h"

namespace ngshard {
namespace {

using ::ngshard::internal_http::HttpRequest;
using ::ngshard::internal_http::HttpResponse;

ABSL_CONST_INIT internal_log::VerboseFlag http_logging("http");

std::string NormalizeBaseUrl(std::string_view url) {
  url = url.substr(0, url.find_first_of("?#"));
  std::string result(url);
  if (result.empty() || result.back() != '/') result += '/';
  return result;
}

absl::Status ReadOnlyError(std::string_view url) {
  return absl::UnimplementedError(
      absl::StrCat("HTTP accessor is read-only: cannot write ", url));
}

}  // namespace

HttpAccessor::HttpAccessor(
    std::string_view base_url,
    std::shared_ptr<internal_http::HttpTransport> transport)
    : base_url_(NormalizeBaseUrl(base_url)), transport_(std::move(transport)) {}

Result<absl::Cord> HttpAccessor::FetchFile(std::string_view path) {
  HttpRequest request{"GET", absl::StrCat(base_url_, path)};
  ABSL_LOG_IF(INFO, http_logging) << "Fetching " << request.url;
  NGSHARD_ASSIGN_OR_RETURN(HttpResponse response,
                           transport_->IssueRequest(request));
  NGSHARD_RETURN_IF_ERROR(
      internal_http::CheckHttpResponse(response, {200}),
      MaybeAnnotateStatus(_, absl::StrCat("Error reading ", request.url)));
  return std::move(response.payload);
}

absl::Status HttpAccessor::StoreFile(std::string_view path, absl::Cord value,
                                     const StoreOptions& options) {
  return ReadOnlyError(absl::StrCat(base_url_, path));
}

Result<bool> HttpAccessor::FileExists(std::string_view path) {
  HttpRequest request{"HEAD", absl::StrCat(base_url_, path)};
  NGSHARD_ASSIGN_OR_RETURN(HttpResponse response,
                           transport_->IssueRequest(request));
  ABSL_LOG_IF(INFO, http_logging)
      << "HEAD " << request.url << ": " << response.status_code;
  if (response.status_code == 404) return false;
  NGSHARD_RETURN_IF_ERROR(
      internal_http::CheckHttpResponse(response, {200}),
      MaybeAnnotateStatus(
          _, absl::StrCat("Error probing existence of ", request.url)));
  return true;
}

Result<absl::Cord> HttpAccessor::ReadBytes(std::string_view path,
                                           ByteRange range) {
  if (!range.SatisfiesInvariants()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid byte range ", range.inclusive_min, "-",
                     range.exclusive_max));
  }
  auto range_header = internal_http::FormatRangeHeader(range);
  if (!range_header) return absl::Cord();
  HttpRequest request{"GET", absl::StrCat(base_url_, path), {*range_header}};
  ABSL_LOG_IF(INFO, http_logging)
      << "Fetching " << request.url << " (" << *range_header << ")";
  NGSHARD_ASSIGN_OR_RETURN(HttpResponse response,
                           transport_->IssueRequest(request));
  NGSHARD_RETURN_IF_ERROR(
      internal_http::CheckHttpResponse(response, {200, 206}),
      MaybeAnnotateStatus(_, absl::StrCat("Error reading ", request.url, " (",
                                          *range_header, ")")));
  if (static_cast<int64_t>(response.payload.size()) != range.size()) {
    return absl::DataLossError(absl::StrCat(
        "Error reading ", request.url, ": expected ", range.size(),
        " bytes (", *range_header, "), but got ", response.payload.size()));
  }
  return std::move(response.payload);
}

Result<std::unique_ptr<FileWriter>> HttpAccessor::OpenWriter(
    std::string_view path) {
  return ReadOnlyError(absl::StrCat(base_url_, path));
}

}  // namespace ngshard
