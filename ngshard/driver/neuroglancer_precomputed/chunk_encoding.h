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


#ifndef NGSHARD_DRIVER_NEUROGLANCER_PRECOMPUTED_CHUNK_ENCODING_H_
#define NGSHARD_DRIVER_NEUROGLANCER_PRECOMPUTED_CHUNK_ENCODING_H_

#include <stdint.h>

#include <array>
#include <string>
#include <string_view>

#include "absl/strings/cord.h"
#include "ngshard/driver/neuroglancer_precomputed/data_type.h"
#include "ngshard/driver/neuroglancer_precomputed/metadata.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace internal_neuroglancer_precomputed {

/// Decoded chunk, stored as contiguous little-endian elements in
/// "czyx" order.
struct ChunkArray {
  DataType data_type = DataType::uint8;
  /// `{channels, z, y, x}`.
  std::array<int64_t, 4> shape{};
  std::string data;

  /// Returns a zero-filled array.
  static ChunkArray Allocate(DataType data_type,
                             const std::array<int64_t, 4>& shape);

  int64_t num_elements() const {
    return shape[0] * shape[1] * shape[2] * shape[3];
  }
};

bool operator==(const ChunkArray& a, const ChunkArray& b);
inline bool operator!=(const ChunkArray& a, const ChunkArray& b) {
  return !(a == b);
}

/// Encodes and decodes the chunks of one scale.
class ChunkEncoder {
 public:
  /// Returns the encoder for `scale` of `metadata`.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if the encoding does not
  ///     support the data type.
  /// \error `absl::StatusCode::kUnimplemented` for the `"jpeg"` encoding.
  static Result<ChunkEncoder> Create(const MultiscaleMetadata& metadata,
                                     const ScaleMetadata& scale);

  /// Encodes `chunk`, which may be smaller than the chunk size at the upper
  /// bounds of the volume.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if the data type, the
  ///     channel count or the data size of `chunk` does not match.
  Result<absl::Cord> Encode(const ChunkArray& chunk) const;

  /// Decodes a chunk of `chunk_size`, in xyz order.
  ///
  /// \error `absl::StatusCode::kDataLoss` if `buffer` is not a valid
  ///     encoding of such a chunk.
  Result<ChunkArray> Decode(const absl::Cord& buffer,
                            const std::array<int64_t, 3>& chunk_size) const;

  ScaleMetadata::Encoding encoding() const { return encoding_; }
  DataType data_type() const { return data_type_; }
  int64_t num_channels() const { return num_channels_; }

  /// MIME type of the encoded chunks.
  std::string_view mime_type() const;

 private:
  ChunkEncoder() = default;

  Result<absl::Cord> EncodeCompressedSegmentation(
      const ChunkArray& chunk) const;
  Result<ChunkArray> DecodeRaw(const absl::Cord& buffer,
                               const std::array<int64_t, 4>& shape) const;
  Result<ChunkArray> DecodeCompressedSegmentation(
      const absl::Cord& buffer, const std::array<int64_t, 4>& shape) const;

  ScaleMetadata::Encoding encoding_ = ScaleMetadata::Encoding::raw;
  DataType data_type_ = DataType::uint8;
  int64_t num_channels_ = 1;
  /// xyz order.
  std::array<int64_t, 3> block_size_{};
};

}  // namespace internal_neuroglancer_precomputed
}  // namespace ngshard

#endif  // NGSHARD_DRIVER_NEUROGLANCER_PRECOMPUTED_CHUNK_ENCODING_H_
