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

#include "ngshard/internal/os/error_code.h"

#include <string.h>

#include <string>

namespace ngshard {
namespace internal_os {
namespace {

// The XSI variant of strerror_r returns int; the GNU variant returns char*.
[[maybe_unused]] const char* GetStrerrorResult(const char* buf, int) {
  return buf;
}
[[maybe_unused]] const char* GetStrerrorResult(const char* buf,
                                               const char* result) {
  return result == nullptr ? buf : result;
}

}  // namespace

std::string GetOsErrorMessage(int error) {
  char buf[4096];
  buf[0] = 0;
  return GetStrerrorResult(buf, ::strerror_r(error, buf, sizeof(buf)));
}

}  // namespace internal_os
}  // namespace ngshard
