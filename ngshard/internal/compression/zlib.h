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

#ifndef NGSHARD_INTERNAL_COMPRESSION_ZLIB_H_
#define NGSHARD_INTERNAL_COMPRESSION_ZLIB_H_

/// \file
/// Convenience interface to the zlib library.
///
/// Gzip is the only compression used by the precomputed format; both the
/// chunk payloads and the minishard indices of a sharded scale may be stored
/// gzip-compressed.

#include "absl/status/status.h"
#include "absl/strings/cord.h"

namespace ngshard {
namespace zlib {

/// Framing of a compressed stream.
enum class Header {
  /// zlib header and adler32 trailer (RFC 1950).
  kZlib,
  /// gzip header and crc32 trailer (RFC 1952).
  kGzip,
  /// Decoding only: accepts either of the above.
  kAuto,
};

struct Options {
  /// Specifies the compression level, must be in the range `[-1, 9]`, with `0`
  /// being no compression and `9` being the most compression.  The special
  /// value `-1` indicates the zlib default compression, which is equivalent to
  /// 6.
  int level = 9;

  /// Specifies the framing written.  `Header::kAuto` is treated as
  /// `Header::kGzip`.
  Header header = Header::kGzip;
};

/// Compresses `input` and appends the result to `*output`.
void Encode(const absl::Cord& input, absl::Cord* output,
            const Options& options = {});

/// Decompresses `input` and appends the result to `*output`.
///
/// \error `absl::StatusCode::kDataLoss` if `input` is corrupt, truncated, or
///     followed by trailing data.
absl::Status Decode(const absl::Cord& input, absl::Cord* output,
                    Header header = Header::kAuto);

}  // namespace zlib
}  // namespace ngshard

#endif  // NGSHARD_INTERNAL_COMPRESSION_ZLIB_H_
