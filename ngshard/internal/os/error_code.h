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

#ifndef NGSHARD_INTERNAL_OS_ERROR_CODE_H_
#define NGSHARD_INTERNAL_OS_ERROR_CODE_H_

#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace ngshard {
namespace internal_os {

/// Returns the error message associated with an `errno` value.
std::string GetOsErrorMessage(int error);

/// Returns an `absl::Status` for an `errno` value, with a code derived by
/// `absl::ErrnoToStatusCode`.  The message is the concatenation of `parts`
/// followed by the OS error description.
template <typename... Parts>
absl::Status StatusFromOsError(int error, const Parts&... parts) {
  return absl::Status(absl::ErrnoToStatusCode(error),
                      absl::StrCat(parts..., " [OS error ", error, ": ",
                                   GetOsErrorMessage(error), "]"));
}

}  // namespace internal_os
}  // namespace ngshard

#endif  // NGSHARD_INTERNAL_OS_ERROR_CODE_H_
