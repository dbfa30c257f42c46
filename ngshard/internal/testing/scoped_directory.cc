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


#include "ngshard/internal/testing/scoped_directory.h"

#include <errno.h>
#include <stdlib.h>

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "ngshard/internal/os/error_code.h"
#include "ngshard/internal/os/file_util.h"
#include "ngshard/util/status.h"

namespace ngshard {
namespace internal_testing {
namespace {

std::string_view GetTemporaryRoot() {
  for (const char* name : {"TEST_TMPDIR", "TMPDIR"}) {
    const char* value = ::getenv(name);
    if (value != nullptr && *value != 0) return value;
  }
  return "/tmp";
}

}  // namespace

ScopedTemporaryDirectory::ScopedTemporaryDirectory(std::string_view prefix) {
  NGSHARD_CHECK_OK(internal_os::MakeDirectories(GetTemporaryRoot()));
  std::string path = absl::StrCat(GetTemporaryRoot(), "/", prefix, "_XXXXXX");
  if (::mkdtemp(path.data()) == nullptr) {
    NGSHARD_CHECK_OK(internal_os::StatusFromOsError(
        errno, "Failed to create temporary directory ", path));
  }
  path_ = std::move(path);
}

ScopedTemporaryDirectory::~ScopedTemporaryDirectory() {
  auto status = internal_os::RemoveAll(path_);
  if (absl::IsNotFound(status)) status = absl::OkStatus();
  NGSHARD_CHECK_OK(status);
}

std::string ScopedTemporaryDirectory::Join(std::string_view relative) const {
  return absl::StrCat(path_, "/", relative);
}

}  // namespace internal_testing
}  // namespace ngshard
