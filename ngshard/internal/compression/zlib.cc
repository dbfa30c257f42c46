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

#include "ngshard/internal/compression/zlib.h"

#include <cstddef>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/string_view.h"
#include "ngshard/util/status.h"

// Include zlib header last because it defines a bunch of poorly-named macros.
#include <zlib.h>

namespace ngshard {
namespace zlib {
namespace {

constexpr size_t kBufferSize = 16 * 1024;

int WindowBits(Header header, bool decode) {
  switch (header) {
    case Header::kZlib:
      return 15;
    case Header::kGzip:
      return 15 + 16;
    case Header::kAuto:
      return decode ? 15 + 32 : 15 + 16;
  }
  return 15;
}

struct InflateOp {
  static int Init(z_stream* s, [[maybe_unused]] int level, int window_bits) {
    return inflateInit2(s, window_bits);
  }
  static int Process(z_stream* s, int flags) { return inflate(s, flags); }
  static int Destroy(z_stream* s) { return inflateEnd(s); }
};

struct DeflateOp {
  static int Init(z_stream* s, int level, int window_bits) {
    return deflateInit2(s, level, Z_DEFLATED, window_bits,
                        /*memLevel=*/8, Z_DEFAULT_STRATEGY);
  }
  static int Process(z_stream* s, int flags) { return deflate(s, flags); }
  static int Destroy(z_stream* s) { return deflateEnd(s); }
};

/// Inflates or deflates `input`, appending to `*output`.
///
/// \tparam Op Either `InflateOp` or `DeflateOp`.
template <typename Op>
absl::Status ProcessZlib(const absl::Cord& input, absl::Cord* output,
                         int level, int window_bits) {
  z_stream s = {};
  if (Op::Init(&s, level, window_bits) != Z_OK) {
    return absl::ResourceExhaustedError("Failed to initialize zlib stream");
  }
  struct StreamDestroyer {
    z_stream* s;
    ~StreamDestroyer() { Op::Destroy(s); }
  } stream_destroyer{&s};

  char buffer[kBufferSize];
  auto chunk_it = input.chunk_begin();
  const auto chunk_end = input.chunk_end();
  int err;
  while (true) {
    if (s.avail_in == 0 && chunk_it != chunk_end) {
      absl::string_view chunk = *chunk_it;
      ++chunk_it;
      s.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(chunk.data()));
      s.avail_in = static_cast<uInt>(chunk.size());
    }
    const bool input_complete = chunk_it == chunk_end;
    s.next_out = reinterpret_cast<Bytef*>(buffer);
    s.avail_out = kBufferSize;
    err = Op::Process(&s, input_complete ? Z_FINISH : Z_NO_FLUSH);
    const size_t produced = kBufferSize - s.avail_out;
    if (produced != 0) {
      output->Append(absl::string_view(buffer, produced));
    }
    if (err == Z_OK) continue;
    if (err == Z_BUF_ERROR &&
        (produced != 0 || (s.avail_in == 0 && !input_complete))) {
      continue;
    }
    break;
  }
  if (err == Z_STREAM_END && s.avail_in == 0 && chunk_it == chunk_end) {
    return absl::OkStatus();
  }
  return absl::DataLossError("Error decoding zlib-compressed data");
}

}  // namespace

void Encode(const absl::Cord& input, absl::Cord* output,
            const Options& options) {
  // Deflate only fails on allocation failure or invalid options.
  NGSHARD_CHECK_OK(ProcessZlib<DeflateOp>(
      input, output, options.level,
      WindowBits(options.header, /*decode=*/false)));
}

absl::Status Decode(const absl::Cord& input, absl::Cord* output,
                    Header header) {
  return ProcessZlib<InflateOp>(input, output, 0,
                                WindowBits(header, /*decode=*/true));
}

}  // namespace zlib
}  // namespace ngshard
