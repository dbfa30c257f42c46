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


#include "ngshard/driver/neuroglancer_precomputed/chunk_encoding.h"

#include <stddef.h>
#include <stdint.h>

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/base/internal/endian.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "ngshard/driver/neuroglancer_precomputed/data_type.h"
#include "ngshard/driver/neuroglancer_precomputed/metadata.h"
#include "ngshard/internal/compression/neuroglancer_compressed_segmentation.h"
#include "ngshard/internal/compression/zlib.h"
#include "ngshard/util/result.h"
#include "ngshard/util/status.h"

namespace ngshard {
namespace internal_neuroglancer_precomputed {
namespace {

namespace ncs = ::ngshard::neuroglancer_compressed_segmentation;

template <typename Label>
Label LoadLabel(const char* p);
template <>
uint32_t LoadLabel<uint32_t>(const char* p) {
  return absl::little_endian::Load32(p);
}
template <>
uint64_t LoadLabel<uint64_t>(const char* p) {
  return absl::little_endian::Load64(p);
}

void StoreLabel(char* p, uint32_t value) {
  absl::little_endian::Store32(p, value);
}
void StoreLabel(char* p, uint64_t value) {
  absl::little_endian::Store64(p, value);
}

template <typename Label>
absl::Status EncodeLabels(const ChunkArray& chunk,
                          const std::array<int64_t, 3>& block_size,
                          std::string* out) {
  std::vector<Label> labels(chunk.num_elements());
  for (size_t i = 0; i < labels.size(); ++i) {
    labels[i] = LoadLabel<Label>(chunk.data.data() + i * sizeof(Label));
  }
  const auto& shape = chunk.shape;
  const std::ptrdiff_t input_shape[4] = {shape[0], shape[1], shape[2],
                                         shape[3]};
  constexpr std::ptrdiff_t s = sizeof(Label);
  const std::ptrdiff_t input_byte_strides[4] = {
      shape[1] * shape[2] * shape[3] * s, shape[2] * shape[3] * s,
      shape[3] * s, s};
  const std::ptrdiff_t block_shape[3] = {block_size[2], block_size[1],
                                         block_size[0]};
  return ncs::EncodeChannels(labels.data(), input_shape, input_byte_strides,
                             block_shape, out);
}

template <typename Label>
absl::Status DecodeLabels(std::string_view input,
                          const std::array<int64_t, 3>& block_size,
                          ChunkArray* chunk) {
  std::vector<Label> labels(chunk->num_elements());
  const auto& shape = chunk->shape;
  const std::ptrdiff_t output_shape[4] = {shape[0], shape[1], shape[2],
                                          shape[3]};
  constexpr std::ptrdiff_t s = sizeof(Label);
  const std::ptrdiff_t output_byte_strides[4] = {
      shape[1] * shape[2] * shape[3] * s, shape[2] * shape[3] * s,
      shape[3] * s, s};
  const std::ptrdiff_t block_shape[3] = {block_size[2], block_size[1],
                                         block_size[0]};
  NGSHARD_RETURN_IF_ERROR(ncs::DecodeChannels(
      input, block_shape, output_shape, output_byte_strides, labels.data()));
  for (size_t i = 0; i < labels.size(); ++i) {
    StoreLabel(chunk->data.data() + i * sizeof(Label), labels[i]);
  }
  return absl::OkStatus();
}

}  // namespace

ChunkArray ChunkArray::Allocate(DataType data_type,
                                const std::array<int64_t, 4>& shape) {
  ChunkArray array;
  array.data_type = data_type;
  array.shape = shape;
  array.data.assign(array.num_elements() * DataTypeSize(data_type), '\0');
  return array;
}

bool operator==(const ChunkArray& a, const ChunkArray& b) {
  return a.data_type == b.data_type && a.shape == b.shape && a.data == b.data;
}

Result<ChunkEncoder> ChunkEncoder::Create(const MultiscaleMetadata& metadata,
                                          const ScaleMetadata& scale) {
  if (scale.encoding == ScaleMetadata::Encoding::jpeg) {
    return absl::UnimplementedError(
        absl::StrCat("\"jpeg\" encoding of scale ", scale.key,
                     " is not supported"));
  }
  NGSHARD_RETURN_IF_ERROR(ValidateEncodingDataType(
      scale.encoding, metadata.data_type, metadata.num_channels));
  ChunkEncoder encoder;
  encoder.encoding_ = scale.encoding;
  encoder.data_type_ = metadata.data_type;
  encoder.num_channels_ = metadata.num_channels;
  encoder.block_size_ = scale.compressed_segmentation_block_size;
  return encoder;
}

std::string_view ChunkEncoder::mime_type() const {
  return "application/octet-stream";
}

Result<absl::Cord> ChunkEncoder::Encode(const ChunkArray& chunk) const {
  if (chunk.data_type != data_type_) {
    return absl::InvalidArgumentError(
        absl::StrCat("Expected chunk of data type ", to_string(data_type_),
                     ", but received ", to_string(chunk.data_type)));
  }
  if (chunk.shape[0] != num_channels_) {
    return absl::InvalidArgumentError(
        absl::StrCat("Expected chunk with ", num_channels_,
                     " channels, but received ", chunk.shape[0]));
  }
  for (int64_t extent : chunk.shape) {
    if (extent <= 0) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Chunk shape [", chunk.shape[0], ", ", chunk.shape[1], ", ",
          chunk.shape[2], ", ", chunk.shape[3], "] is empty"));
    }
  }
  const int64_t expected_bytes =
      chunk.num_elements() * static_cast<int64_t>(DataTypeSize(data_type_));
  if (static_cast<int64_t>(chunk.data.size()) != expected_bytes) {
    return absl::InvalidArgumentError(
        absl::StrCat("Expected chunk data of ", expected_bytes,
                     " bytes, but received ", chunk.data.size(), " bytes"));
  }
  switch (encoding_) {
    case ScaleMetadata::Encoding::raw:
      return absl::Cord(chunk.data);
    case ScaleMetadata::Encoding::gzip: {
      absl::Cord encoded;
      zlib::Encode(absl::Cord(chunk.data), &encoded);
      return encoded;
    }
    case ScaleMetadata::Encoding::compressed_segmentation:
      return EncodeCompressedSegmentation(chunk);
    case ScaleMetadata::Encoding::jpeg:
      break;
  }
  return absl::UnimplementedError("\"jpeg\" encoding is not supported");
}

Result<absl::Cord> ChunkEncoder::EncodeCompressedSegmentation(
    const ChunkArray& chunk) const {
  std::string out;
  if (data_type_ == DataType::uint32) {
    NGSHARD_RETURN_IF_ERROR(EncodeLabels<uint32_t>(chunk, block_size_, &out));
  } else {
    NGSHARD_RETURN_IF_ERROR(EncodeLabels<uint64_t>(chunk, block_size_, &out));
  }
  return absl::Cord(std::move(out));
}

Result<ChunkArray> ChunkEncoder::Decode(
    const absl::Cord& buffer, const std::array<int64_t, 3>& chunk_size) const {
  const std::array<int64_t, 4> shape{num_channels_, chunk_size[2],
                                     chunk_size[1], chunk_size[0]};
  switch (encoding_) {
    case ScaleMetadata::Encoding::raw:
      return DecodeRaw(buffer, shape);
    case ScaleMetadata::Encoding::gzip: {
      absl::Cord decoded;
      NGSHARD_RETURN_IF_ERROR(
          zlib::Decode(buffer, &decoded),
          MaybeAnnotateStatus(_, "Error decoding gzip-encoded chunk"));
      return DecodeRaw(decoded, shape);
    }
    case ScaleMetadata::Encoding::compressed_segmentation:
      return DecodeCompressedSegmentation(buffer, shape);
    case ScaleMetadata::Encoding::jpeg:
      break;
  }
  return absl::UnimplementedError("\"jpeg\" encoding is not supported");
}

Result<ChunkArray> ChunkEncoder::DecodeRaw(
    const absl::Cord& buffer, const std::array<int64_t, 4>& shape) const {
  ChunkArray chunk;
  chunk.data_type = data_type_;
  chunk.shape = shape;
  const int64_t expected_bytes =
      chunk.num_elements() * static_cast<int64_t>(DataTypeSize(data_type_));
  if (static_cast<int64_t>(buffer.size()) != expected_bytes) {
    return absl::DataLossError(
        absl::StrCat("Expected chunk length to be ", expected_bytes,
                     ", but received ", buffer.size(), " bytes"));
  }
  chunk.data = std::string(buffer);
  return chunk;
}

Result<ChunkArray> ChunkEncoder::DecodeCompressedSegmentation(
    const absl::Cord& buffer, const std::array<int64_t, 4>& shape) const {
  ChunkArray chunk = ChunkArray::Allocate(data_type_, shape);
  const std::string flat(buffer);
  absl::Status status;
  if (data_type_ == DataType::uint32) {
    status = DecodeLabels<uint32_t>(flat, block_size_, &chunk);
  } else {
    status = DecodeLabels<uint64_t>(flat, block_size_, &chunk);
  }
  NGSHARD_RETURN_IF_ERROR(
      status, MaybeAnnotateStatus(
                  _, "Corrupted Neuroglancer compressed segmentation"));
  return chunk;
}

}  // namespace internal_neuroglancer_precomputed
}  // namespace ngshard
