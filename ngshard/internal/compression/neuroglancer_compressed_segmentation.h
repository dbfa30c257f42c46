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

#ifndef NGSHARD_INTERNAL_COMPRESSION_NEUROGLANCER_COMPRESSED_SEGMENTATION_H_
#define NGSHARD_INTERNAL_COMPRESSION_NEUROGLANCER_COMPRESSED_SEGMENTATION_H_

/// \file
/// Implements the Neuroglancer compressed segmentation format.
///
/// Only uint32 and uint64 labels are supported.
///
/// A 3-D label array is split into a grid of fixed-size blocks.  Each block is
/// encoded as a sorted table of the distinct labels it contains (the lookup
/// table) plus, for every voxel, an index into that table packed into 32-bit
/// little-endian words using 0, 1, 2, 4, 8, 16 or 32 bits per voxel: the
/// smallest of these for which `2**bits >= table size`.  Blocks at the upper
/// edge of the array are padded up to the full block shape with the most
/// frequent label of the block (the smallest such label on ties).
///
/// Encoded channel layout, all offsets in 32-bit words relative to the start
/// of the channel:
///
///   [block header] * <number of blocks>
///   for each block, in z, y, x order:
///     [lookup table]     (omitted when an identical table was already written)
///     [encoded values]
///
/// Blocks are numbered as `x + grid_shape.x * (y + grid_shape.y * z)`.  Each
/// block header is 8 bytes:
///
///   lookup_table_offset : 24-bit LE integer
///   encoding_bits : 8-bit unsigned integer
///   encoded_values_offset : 32-bit LE integer
///
/// A multi-channel chunk is prefixed by one uint32le per channel giving the
/// offset of that channel's encoding in words from the start of the chunk.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"

namespace ngshard {
namespace neuroglancer_compressed_segmentation {

/// Lookup tables already written to the current channel, mapped to their word
/// offset.
template <class Label>
using EncodedValueCache = absl::flat_hash_map<std::vector<Label>, uint32_t>;

/// Returns the number of bits used to encode indices into a lookup table of
/// `num_values` entries.
size_t GetEncodingBits(size_t num_values);

/// Encodes a single block.
///
/// \tparam Label Must be `std::uint32_t` or `std::uint64_t`.
/// \param input Pointer to input array.  If `input_shape` is smaller than
///     `block_shape`, the block is padded with its most frequent label.
/// \param input_shape Dimensions of input array, in z, y, x order.
/// \param input_byte_strides Stride in bytes between consecutive elements
///     along each dimension of the input array.
/// \param block_shape Full block shape, in z, y, x order.
/// \param base_offset Byte offset into `*output` relative to which word
///     offsets are computed.
/// \param encoded_bits_output[out] Set to the number of bits per index.
/// \param table_offset_output[out] Set to the word offset of the new or reused
///     lookup table.
/// \param encoded_values_offset_output[out] Set to the word offset of the
///     packed indices.
/// \param cache Lookup tables already written for this channel.
/// \param output[out] String to which the encoded block is appended.
/// \pre `0 < input_shape[i] <= block_shape[i]`
/// \error `absl::StatusCode::kInvalidArgument` if the lookup table offset does
///     not fit in 24 bits.
template <typename Label>
absl::Status EncodeBlock(const Label* input,
                         const std::ptrdiff_t input_shape[3],
                         const std::ptrdiff_t input_byte_strides[3],
                         const std::ptrdiff_t block_shape[3],
                         size_t base_offset, size_t* encoded_bits_output,
                         size_t* table_offset_output,
                         size_t* encoded_values_offset_output,
                         EncodedValueCache<Label>* cache, std::string* output);

/// Encodes a single channel, appending the result to `*output`.
///
/// \param input_shape Dimensions of input array, in z, y, x order.
/// \param block_shape Block shape, in z, y, x order.
template <typename Label>
absl::Status EncodeChannel(const Label* input,
                           const std::ptrdiff_t input_shape[3],
                           const std::ptrdiff_t input_byte_strides[3],
                           const std::ptrdiff_t block_shape[3],
                           std::string* output);

/// Encodes multiple channels, appending the result to `*output`.
///
/// \param input_shape Dimensions of input array.  The first dimension
///     corresponds to the channel, followed by z, y, x.
template <typename Label>
absl::Status EncodeChannels(const Label* input,
                            const std::ptrdiff_t input_shape[3 + 1],
                            const std::ptrdiff_t input_byte_strides[3 + 1],
                            const std::ptrdiff_t block_shape[3],
                            std::string* output);

/// Decodes a single block.
///
/// \param encoded_bits Number of bits used to encode each index.
/// \param encoded_input Pointer to the packed indices.  Not accessed when
///     `encoded_bits == 0`.
/// \param table_input Pointer to the lookup table.
/// \param table_size Number of labels in the lookup table.
/// \param output_shape Shape of the output region, `<= block_shape`.
/// \returns `true` on success, or `false` if an index is out of range of the
///     lookup table.
template <typename Label>
bool DecodeBlock(size_t encoded_bits, const char* encoded_input,
                 const char* table_input, size_t table_size,
                 const std::ptrdiff_t block_shape[3],
                 const std::ptrdiff_t output_shape[3],
                 const std::ptrdiff_t output_byte_strides[3], Label* output);

/// Decodes a single channel.
///
/// \error `absl::StatusCode::kDataLoss` if `input` is corrupt.
template <typename Label>
absl::Status DecodeChannel(std::string_view input,
                           const std::ptrdiff_t block_shape[3],
                           const std::ptrdiff_t output_shape[3],
                           const std::ptrdiff_t output_byte_strides[3],
                           Label* output);

/// Decodes multiple channels.
///
/// \param output_shape Shape of the output array.  The first dimension
///     corresponds to the channel.
/// \error `absl::StatusCode::kDataLoss` if `input` is corrupt.
template <typename Label>
absl::Status DecodeChannels(std::string_view input,
                            const std::ptrdiff_t block_shape[3],
                            const std::ptrdiff_t output_shape[3 + 1],
                            const std::ptrdiff_t output_byte_strides[3 + 1],
                            Label* output);

}  // namespace neuroglancer_compressed_segmentation
}  // namespace ngshard

#endif  // NGSHARD_INTERNAL_COMPRESSION_NEUROGLANCER_COMPRESSED_SEGMENTATION_H_
