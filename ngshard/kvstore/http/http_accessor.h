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

#ifndef NGSHARD_KVSTORE_HTTP_HTTP_ACCESSOR_H_
#define NGSHARD_KVSTORE_HTTP_HTTP_ACCESSOR_H_

#include <memory>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "ngshard/kvstore/accessor.h"
#include "ngshard/kvstore/byte_range.h"
#include "ngshard/kvstore/http/http_transport.h"
#include "ngshard/util/result.h"

namespace ngshard {

/// Read-only accessor for a dataset served over HTTP(S).
///
/// Chunks are fetched with the flat naming scheme.  Errors are reported as
/// received; retrying is left to the transport.
class HttpAccessor : public Accessor {
 public:
  /// `base_url` is the URL of the dataset directory.  Any query or fragment
  /// is discarded and a trailing `/` is added if missing.
  HttpAccessor(std::string_view base_url,
               std::shared_ptr<internal_http::HttpTransport> transport);

  using Accessor::StoreFile;

  Result<absl::Cord> FetchFile(std::string_view path) override;
  absl::Status StoreFile(std::string_view path, absl::Cord value,
                         const StoreOptions& options) override;
  Result<bool> FileExists(std::string_view path) override;
  Result<absl::Cord> ReadBytes(std::string_view path,
                               ByteRange range) override;
  Result<std::unique_ptr<FileWriter>> OpenWriter(
      std::string_view path) override;

  const std::string& base_url() const { return base_url_; }

 private:
  std::string base_url_;
  std::shared_ptr<internal_http::HttpTransport> transport_;
};

}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_HTTP_HTTP_ACCESSOR_H_
