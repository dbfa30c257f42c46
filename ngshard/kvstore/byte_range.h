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

#ifndef NGSHARD_KVSTORE_BYTE_RANGE_H_
#define NGSHARD_KVSTORE_BYTE_RANGE_H_

#include <stdint.h>

#include <cassert>
#include <ostream>

#include "absl/status/status.h"

namespace ngshard {

/// Half-open range of bytes within a file, as stored in shard and minishard
/// indices.
struct ByteRange {
  int64_t inclusive_min;
  int64_t exclusive_max;

  static constexpr ByteRange FromOffsetLength(int64_t offset, int64_t length) {
    return ByteRange{offset, offset + length};
  }

  /// Returns `true` if the range is non-negative and not inverted.
  constexpr bool SatisfiesInvariants() const {
    return inclusive_min >= 0 && exclusive_max >= inclusive_min;
  }

  /// \dchecks `SatisfiesInvariants()`
  int64_t size() const {
    assert(SatisfiesInvariants());
    return exclusive_max - inclusive_min;
  }

  bool empty() const { return exclusive_max == inclusive_min; }

  /// Returns `absl::StatusCode::kOutOfRange` unless the range is valid and
  /// lies within a value of `size` bytes.
  absl::Status Validate(int64_t size) const;

  friend bool operator==(const ByteRange& a, const ByteRange& b) {
    return a.inclusive_min == b.inclusive_min &&
           a.exclusive_max == b.exclusive_max;
  }
  friend bool operator!=(const ByteRange& a, const ByteRange& b) {
    return !(a == b);
  }

  /// Prints `[inclusive_min, exclusive_max)`.
  friend std::ostream& operator<<(std::ostream& os, const ByteRange& r);
};

}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_BYTE_RANGE_H_
