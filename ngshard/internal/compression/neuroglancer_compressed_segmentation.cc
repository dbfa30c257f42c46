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

#include "ngshard/internal/compression/neuroglancer_compressed_segmentation.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "absl/base/internal/endian.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "ngshard/util/status.h"

namespace ngshard {
namespace neuroglancer_compressed_segmentation {
namespace {

constexpr size_t kBlockHeaderSize = 2;
constexpr size_t kMaxTableOffset = 0xffffff;
constexpr size_t kMaxEncodedValuesOffset = 0xffffffff;

bool IsValidEncodingBits(size_t bits) {
  return bits == 0 || bits == 1 || bits == 2 || bits == 4 || bits == 8 ||
         bits == 16 || bits == 32;
}

void WriteBlockHeader(size_t encoded_values_offset, size_t table_offset,
                      size_t encoding_bits, void* output) {
  absl::little_endian::Store32(
      output, static_cast<uint32_t>(table_offset | (encoding_bits << 24)));
  absl::little_endian::Store32(static_cast<char*>(output) + 4,
                               static_cast<uint32_t>(encoded_values_offset));
}

void ReadBlockHeader(const void* header, size_t* encoded_values_offset,
                     size_t* table_offset, size_t* encoding_bits) {
  const uint64_t h = absl::little_endian::Load64(header);
  *table_offset = h & 0xffffff;
  *encoding_bits = (h >> 24) & 0xff;
  *encoded_values_offset = h >> 32;
}

size_t NumBlockElements(const std::ptrdiff_t block_shape[3]) {
  return static_cast<size_t>(block_shape[0]) * block_shape[1] * block_shape[2];
}

}  // namespace

size_t GetEncodingBits(size_t num_values) {
  size_t bits = 0;
  while (bits < 32 && (uint64_t(1) << bits) < num_values) {
    bits = (bits == 0) ? 1 : bits * 2;
  }
  return bits;
}

template <typename Label>
absl::Status EncodeBlock(const Label* input,
                         const std::ptrdiff_t input_shape[3],
                         const std::ptrdiff_t input_byte_strides[3],
                         const std::ptrdiff_t block_shape[3],
                         size_t base_offset, size_t* encoded_bits_output,
                         size_t* table_offset_output,
                         size_t* encoded_values_offset_output,
                         EncodedValueCache<Label>* cache, std::string* output) {
  constexpr size_t num_32bit_words_per_label = sizeof(Label) / 4;

  const auto* input_bytes = reinterpret_cast<const char*>(input);
  const auto GetElement = [&](std::ptrdiff_t z, std::ptrdiff_t y,
                              std::ptrdiff_t x) {
    return *reinterpret_cast<const Label*>(
        input_bytes + z * input_byte_strides[0] + y * input_byte_strides[1] +
        x * input_byte_strides[2]);
  };

  // Count occurrences of each distinct value.  Consecutive equal values are
  // accumulated as a run to skip most hash table lookups.
  absl::flat_hash_map<Label, size_t> counts;
  {
    Label run_value = input[0];
    size_t run_length = 0;
    for (std::ptrdiff_t z = 0; z < input_shape[0]; ++z) {
      for (std::ptrdiff_t y = 0; y < input_shape[1]; ++y) {
        for (std::ptrdiff_t x = 0; x < input_shape[2]; ++x) {
          const Label value = GetElement(z, y, x);
          if (value != run_value) {
            counts[run_value] += run_length;
            run_value = value;
            run_length = 0;
          }
          ++run_length;
        }
      }
    }
    counts[run_value] += run_length;
  }

  std::vector<Label> table;
  table.reserve(counts.size());
  for (const auto& entry : counts) table.push_back(entry.first);
  std::sort(table.begin(), table.end());

  absl::flat_hash_map<Label, uint32_t> table_index;
  uint32_t pad_index = 0;
  size_t pad_count = 0;
  for (size_t i = 0; i < table.size(); ++i) {
    table_index[table[i]] = static_cast<uint32_t>(i);
    // Strict comparison keeps the smallest label on ties.
    if (const size_t count = counts[table[i]]; count > pad_count) {
      pad_count = count;
      pad_index = static_cast<uint32_t>(i);
    }
  }

  const size_t encoded_bits = GetEncodingBits(table.size());
  *encoded_bits_output = encoded_bits;

  // Write the lookup table, unless an identical one was already written.
  if (auto it = cache->find(table); it != cache->end()) {
    *table_offset_output = it->second;
  } else {
    const size_t table_offset = (output->size() - base_offset) / 4;
    if (table_offset > kMaxTableOffset) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "compressed_segmentation lookup table offset %d exceeds 24 bits",
          table_offset));
    }
    const size_t table_byte_offset = output->size();
    output->resize(table_byte_offset +
                   table.size() * num_32bit_words_per_label * 4);
    char* output_ptr = output->data() + table_byte_offset;
    for (const Label value : table) {
      for (size_t word_i = 0; word_i < num_32bit_words_per_label; ++word_i) {
        absl::little_endian::Store32(
            output_ptr + word_i * 4,
            static_cast<uint32_t>(static_cast<uint64_t>(value) >>
                                  (32 * word_i)));
      }
      output_ptr += num_32bit_words_per_label * 4;
    }
    cache->emplace(table, static_cast<uint32_t>(table_offset));
    *table_offset_output = table_offset;
  }

  // Write the packed indices.  Remaining bits of the last word stay zero.
  const size_t encoded_size_32bits =
      (encoded_bits * NumBlockElements(block_shape) + 31) / 32;
  const size_t encoded_values_byte_offset = output->size();
  const size_t encoded_values_offset =
      (encoded_values_byte_offset - base_offset) / 4;
  if (encoded_values_offset > kMaxEncodedValuesOffset) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "compressed_segmentation encoded values offset %d exceeds 32 bits",
        encoded_values_offset));
  }
  *encoded_values_offset_output = encoded_values_offset;
  output->resize(encoded_values_byte_offset + encoded_size_32bits * 4);
  if (encoded_bits == 0) return absl::OkStatus();

  char* output_ptr = output->data() + encoded_values_byte_offset;
  Label previous_value = input[0];
  uint32_t previous_index = table_index.at(previous_value);
  for (std::ptrdiff_t z = 0; z < block_shape[0]; ++z) {
    for (std::ptrdiff_t y = 0; y < block_shape[1]; ++y) {
      for (std::ptrdiff_t x = 0; x < block_shape[2]; ++x) {
        uint32_t index = pad_index;
        if (z < input_shape[0] && y < input_shape[1] && x < input_shape[2]) {
          const Label value = GetElement(z, y, x);
          if (value != previous_value) {
            previous_value = value;
            previous_index = table_index.at(value);
          }
          index = previous_index;
        }
        const size_t bit_offset =
            (x + block_shape[2] * (y + block_shape[1] * z)) * encoded_bits;
        char* cur_ptr = output_ptr + bit_offset / 32 * 4;
        absl::little_endian::Store32(
            cur_ptr, absl::little_endian::Load32(cur_ptr) |
                         (index << (bit_offset % 32)));
      }
    }
  }
  return absl::OkStatus();
}

template <class Label>
absl::Status EncodeChannel(const Label* input,
                           const std::ptrdiff_t input_shape[3],
                           const std::ptrdiff_t input_byte_strides[3],
                           const std::ptrdiff_t block_shape[3],
                           std::string* output) {
  EncodedValueCache<Label> cache;
  const size_t base_offset = output->size();
  std::ptrdiff_t grid_shape[3];
  size_t block_index_size = kBlockHeaderSize;
  for (size_t i = 0; i < 3; ++i) {
    grid_shape[i] = (input_shape[i] + block_shape[i] - 1) / block_shape[i];
    block_index_size *= grid_shape[i];
  }
  output->resize(base_offset + block_index_size * 4);
  std::ptrdiff_t block[3];
  for (block[0] = 0; block[0] < grid_shape[0]; ++block[0]) {
    for (block[1] = 0; block[1] < grid_shape[1]; ++block[1]) {
      for (block[2] = 0; block[2] < grid_shape[2]; ++block[2]) {
        const size_t block_offset =
            block[2] + grid_shape[2] * (block[1] + grid_shape[1] * block[0]);
        std::ptrdiff_t input_block_shape[3];
        std::ptrdiff_t input_offset = 0;
        for (size_t i = 0; i < 3; ++i) {
          auto pos = block[i] * block_shape[i];
          input_block_shape[i] = std::min(block_shape[i], input_shape[i] - pos);
          input_offset += pos * input_byte_strides[i];
        }
        size_t encoded_bits, table_offset, encoded_values_offset;
        NGSHARD_RETURN_IF_ERROR(EncodeBlock(
            reinterpret_cast<const Label*>(
                reinterpret_cast<const char*>(input) + input_offset),
            input_block_shape, input_byte_strides, block_shape, base_offset,
            &encoded_bits, &table_offset, &encoded_values_offset, &cache,
            output));
        WriteBlockHeader(
            encoded_values_offset, table_offset, encoded_bits,
            output->data() + base_offset + block_offset * kBlockHeaderSize * 4);
      }
    }
  }
  return absl::OkStatus();
}

template <class Label>
absl::Status EncodeChannels(const Label* input,
                            const std::ptrdiff_t input_shape[3 + 1],
                            const std::ptrdiff_t input_byte_strides[3 + 1],
                            const std::ptrdiff_t block_shape[3],
                            std::string* output) {
  const size_t base_offset = output->size();
  output->resize(base_offset + input_shape[0] * 4);
  for (std::ptrdiff_t channel_i = 0; channel_i < input_shape[0]; ++channel_i) {
    absl::little_endian::Store32(
        output->data() + base_offset + channel_i * 4,
        static_cast<uint32_t>((output->size() - base_offset) / 4));
    NGSHARD_RETURN_IF_ERROR(EncodeChannel(
        reinterpret_cast<const Label*>(reinterpret_cast<const char*>(input) +
                                       input_byte_strides[0] * channel_i),
        input_shape + 1, input_byte_strides + 1, block_shape, output));
  }
  return absl::OkStatus();
}

template <typename Label>
bool DecodeBlock(size_t encoded_bits, const char* encoded_input,
                 const char* table_input, size_t table_size,
                 const std::ptrdiff_t block_shape[3],
                 const std::ptrdiff_t output_shape[3],
                 const std::ptrdiff_t output_byte_strides[3], Label* output) {
  const uint32_t encoded_value_mask =
      (encoded_bits == 32) ? 0xffffffffu
                           : (uint32_t(1) << encoded_bits) - 1;
  auto* output_z = reinterpret_cast<char*>(output);
  for (std::ptrdiff_t z = 0; z < output_shape[0]; ++z) {
    auto* output_y = output_z;
    for (std::ptrdiff_t y = 0; y < output_shape[1]; ++y) {
      auto* output_x = output_y;
      for (std::ptrdiff_t x = 0; x < output_shape[2]; ++x) {
        uint32_t index = 0;
        if (encoded_bits != 0) {
          const size_t bit_offset =
              (x + block_shape[2] * (y + block_shape[1] * z)) * encoded_bits;
          index = (absl::little_endian::Load32(encoded_input +
                                               bit_offset / 32 * 4) >>
                   (bit_offset % 32)) &
                  encoded_value_mask;
        }
        if (index >= table_size) return false;
        auto& label = *reinterpret_cast<Label*>(output_x);
        if constexpr (sizeof(Label) == 4) {
          label =
              absl::little_endian::Load32(table_input + index * sizeof(Label));
        } else {
          label =
              absl::little_endian::Load64(table_input + index * sizeof(Label));
        }
        output_x += output_byte_strides[2];
      }
      output_y += output_byte_strides[1];
    }
    output_z += output_byte_strides[0];
  }
  return true;
}

template <typename Label>
absl::Status DecodeChannel(std::string_view input,
                           const std::ptrdiff_t block_shape[3],
                           const std::ptrdiff_t output_shape[3],
                           const std::ptrdiff_t output_byte_strides[3],
                           Label* output) {
  if ((input.size() % 4) != 0) {
    return absl::DataLossError(absl::StrFormat(
        "compressed_segmentation data length %d is not a multiple of 4",
        input.size()));
  }
  const size_t input_words = input.size() / 4;
  std::ptrdiff_t grid_shape[3];
  size_t block_index_size = kBlockHeaderSize;
  for (size_t i = 0; i < 3; ++i) {
    grid_shape[i] = (output_shape[i] + block_shape[i] - 1) / block_shape[i];
    block_index_size *= grid_shape[i];
  }
  if (input_words < block_index_size) {
    return absl::DataLossError(absl::StrFormat(
        "compressed_segmentation data too short for %d block headers",
        block_index_size / kBlockHeaderSize));
  }
  const size_t encoded_block_elements = NumBlockElements(block_shape);
  std::ptrdiff_t block[3];
  for (block[0] = 0; block[0] < grid_shape[0]; ++block[0]) {
    for (block[1] = 0; block[1] < grid_shape[1]; ++block[1]) {
      for (block[2] = 0; block[2] < grid_shape[2]; ++block[2]) {
        const size_t block_offset =
            block[2] + grid_shape[2] * (block[1] + grid_shape[1] * block[0]);
        std::ptrdiff_t output_block_shape[3];
        std::ptrdiff_t output_offset = 0;
        for (size_t i = 0; i < 3; ++i) {
          auto pos = block[i] * block_shape[i];
          output_block_shape[i] =
              std::min(block_shape[i], output_shape[i] - pos);
          output_offset += pos * output_byte_strides[i];
        }
        size_t encoded_values_offset, encoded_bits, table_offset;
        ReadBlockHeader(input.data() + block_offset * kBlockHeaderSize * 4,
                        &encoded_values_offset, &table_offset, &encoded_bits);
        if (!IsValidEncodingBits(encoded_bits)) {
          return absl::DataLossError(absl::StrFormat(
              "Invalid number of encoding bits for compressed_segmentation "
              "block (%d)",
              encoded_bits));
        }
        if (table_offset > input_words) {
          return absl::DataLossError(absl::StrFormat(
              "compressed_segmentation lookup table offset %d is past the end "
              "of the data",
              table_offset));
        }
        const size_t encoded_size_32bits =
            (encoded_bits * encoded_block_elements + 31) / 32;
        if (encoded_values_offset > input_words ||
            encoded_size_32bits > input_words - encoded_values_offset) {
          return absl::DataLossError(
              "compressed_segmentation data too short: insufficient room for "
              "encoded values");
        }
        const uint64_t available =
            (input.size() - table_offset * 4) / sizeof(Label);
        const size_t table_size = static_cast<size_t>(
            std::min<uint64_t>(available, uint64_t(1) << encoded_bits));
        auto* block_output = reinterpret_cast<Label*>(
            reinterpret_cast<char*>(output) + output_offset);
        if (!DecodeBlock(encoded_bits,
                         input.data() + encoded_values_offset * 4,
                         input.data() + table_offset * 4, table_size,
                         block_shape, output_block_shape, output_byte_strides,
                         block_output)) {
          return absl::DataLossError(
              "Invalid compressed_segmentation data: indexing out of the "
              "lookup table");
        }
      }
    }
  }
  return absl::OkStatus();
}

template <typename Label>
absl::Status DecodeChannels(std::string_view input,
                            const std::ptrdiff_t block_shape[3],
                            const std::ptrdiff_t output_shape[3 + 1],
                            const std::ptrdiff_t output_byte_strides[3 + 1],
                            Label* output) {
  if ((input.size() % 4) != 0) {
    return absl::DataLossError(absl::StrFormat(
        "compressed_segmentation data length %d is not a multiple of 4",
        input.size()));
  }
  if (input.size() / 4 < static_cast<size_t>(output_shape[0])) {
    return absl::DataLossError(
        "compressed_segmentation data too short for channel offsets");
  }
  for (std::ptrdiff_t channel_i = 0; channel_i < output_shape[0]; ++channel_i) {
    const size_t offset =
        absl::little_endian::Load32(input.data() + channel_i * 4);
    if (offset > input.size() / 4) {
      return absl::DataLossError(absl::StrFormat(
          "compressed_segmentation channel %d offset %d is past the end of the "
          "data",
          channel_i, offset));
    }
    NGSHARD_RETURN_IF_ERROR(
        DecodeChannel(
            input.substr(offset * 4), block_shape, output_shape + 1,
            output_byte_strides + 1,
            reinterpret_cast<Label*>(reinterpret_cast<char*>(output) +
                                     output_byte_strides[0] * channel_i)),
        MaybeAnnotateStatus(_, absl::StrFormat("Channel %d", channel_i)));
  }
  return absl::OkStatus();
}

#define DO_INSTANTIATE(Label)                                                  \
  template absl::Status EncodeBlock<Label>(                                    \
      const Label* input, const std::ptrdiff_t input_shape[3],                 \
      const std::ptrdiff_t input_byte_strides[3],                              \
      const std::ptrdiff_t block_shape[3], size_t base_offset,                 \
      size_t* encoded_bits_output, size_t* table_offset_output,                \
      size_t* encoded_values_offset_output, EncodedValueCache<Label>* cache,   \
      std::string* output);                                                    \
  template absl::Status EncodeChannel<Label>(                                  \
      const Label* input, const std::ptrdiff_t input_shape[3],                 \
      const std::ptrdiff_t input_byte_strides[3],                              \
      const std::ptrdiff_t block_shape[3], std::string* output);               \
  template absl::Status EncodeChannels<Label>(                                 \
      const Label* input, const std::ptrdiff_t input_shape[3 + 1],             \
      const std::ptrdiff_t input_byte_strides[3 + 1],                          \
      const std::ptrdiff_t block_shape[3], std::string* output);               \
  template bool DecodeBlock(                                                   \
      size_t encoded_bits, const char* encoded_input, const char* table_input, \
      size_t table_size, const std::ptrdiff_t block_shape[3],                  \
      const std::ptrdiff_t output_shape[3],                                    \
      const std::ptrdiff_t output_byte_strides[3], Label* output);             \
  template absl::Status DecodeChannel<Label>(                                  \
      std::string_view input, const std::ptrdiff_t block_shape[3],             \
      const std::ptrdiff_t output_shape[3],                                    \
      const std::ptrdiff_t output_byte_strides[3], Label* output);             \
  template absl::Status DecodeChannels(                                        \
      std::string_view input, const std::ptrdiff_t block_shape[3],             \
      const std::ptrdiff_t output_shape[3 + 1],                                \
      const std::ptrdiff_t output_byte_strides[3 + 1], Label* output);         \
  /**/

DO_INSTANTIATE(std::uint32_t)
DO_INSTANTIATE(std::uint64_t)

#undef DO_INSTANTIATE

}  // namespace neuroglancer_compressed_segmentation
}  // namespace ngshard
