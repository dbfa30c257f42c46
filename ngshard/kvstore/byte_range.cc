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

#include "ngshard/kvstore/byte_range.h"

#include <stdint.h>

#include <ostream>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace ngshard {

std::ostream& operator<<(std::ostream& os, const ByteRange& r) {
  return os << "[" << r.inclusive_min << ", " << r.exclusive_max << ")";
}

absl::Status ByteRange::Validate(int64_t size) const {
  if (!SatisfiesInvariants() || exclusive_max > size) {
    return absl::OutOfRangeError(
        absl::StrCat("Requested byte range [", inclusive_min, ", ",
                     exclusive_max, ") is not valid for value of size ",
                     size));
  }
  return absl::OkStatus();
}

}  // namespace ngshard
