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


#include "ngshard/kvstore/neuroglancer_uint64_sharded/compressed_morton_code.h"

#include <stdint.h>

#include <algorithm>
#include <array>
#include <ostream>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ngshard/kvstore/chunk_coords.h"
#include "ngshard/util/division.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace neuroglancer_uint64_sharded {
namespace {

constexpr const char kDimensionNames[] = "xyz";

}  // namespace

std::array<int, 3> GetCompressedMortonCodeBits(
    const std::array<int64_t, 3>& grid_sizes) {
  std::array<int, 3> bits;
  for (int i = 0; i < 3; ++i) {
    bits[i] = CeilLog2(grid_sizes[i]);
  }
  return bits;
}

uint64_t EncodeCompressedMortonCode(const std::array<int64_t, 3>& grid_coords,
                                    const std::array<int, 3>& bits) {
  const int max_bit = std::max(bits[0], std::max(bits[1], bits[2]));
  int out_bit = 0;
  uint64_t x = 0;
  for (int bit = 0; bit < max_bit; ++bit) {
    for (int i = 0; i < 3; ++i) {
      if (bit < bits[i]) {
        x |= ((static_cast<uint64_t>(grid_coords[i]) >> bit) & 1)
             << (out_bit++);
      }
    }
  }
  return x;
}

Result<ShardVolumeSpec> ShardVolumeSpec::Create(
    const std::array<int64_t, 3>& chunk_sizes,
    const std::array<int64_t, 3>& volume_sizes) {
  for (int i = 0; i < 3; ++i) {
    if (chunk_sizes[i] <= 0 || volume_sizes[i] <= 0) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "chunk_sizes [%s] and volume sizes [%s] must all be positive",
          absl::StrJoin(chunk_sizes, ", "), absl::StrJoin(volume_sizes, ", ")));
    }
  }
  ShardVolumeSpec spec;
  spec.chunk_sizes_ = chunk_sizes;
  spec.volume_sizes_ = volume_sizes;
  for (int i = 0; i < 3; ++i) {
    spec.grid_sizes_[i] = CeilOfRatio(volume_sizes[i], chunk_sizes[i]);
  }
  spec.num_bits_ = GetCompressedMortonCodeBits(spec.grid_sizes_);
  const int total_bits = spec.num_bits_[0] + spec.num_bits_[1] +
                         spec.num_bits_[2];
  if (total_bits > 64) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Chunk grid [%s] requires %d bits of Morton code, which exceeds 64",
        absl::StrJoin(spec.grid_sizes_, ", "), total_bits));
  }
  return spec;
}

Result<uint64_t> ShardVolumeSpec::CompressedMortonCode(
    const std::array<int64_t, 3>& grid_coords) const {
  for (int i = 0; i < 3; ++i) {
    if (grid_coords[i] < 0 || grid_coords[i] >= grid_sizes_[i]) {
      return absl::OutOfRangeError(absl::StrFormat(
          "Grid coordinate %d in dimension %c is outside the chunk grid [0, "
          "%d)",
          grid_coords[i], kDimensionNames[i], grid_sizes_[i]));
    }
  }
  return EncodeCompressedMortonCode(grid_coords, num_bits_);
}

Result<uint64_t> ShardVolumeSpec::GetCmc(
    const ChunkCoords& chunk_coords) const {
  std::array<int64_t, 3> grid_coords;
  for (int i = 0; i < 3; ++i) {
    const int64_t min = chunk_coords[2 * i];
    if (min % chunk_sizes_[i] != 0) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "%d must be an integer multiple of the corresponding chunk size "
          "%d, but is not",
          min, chunk_sizes_[i]));
    }
    grid_coords[i] = min / chunk_sizes_[i];
  }
  return CompressedMortonCode(grid_coords);
}

std::ostream& operator<<(std::ostream& os, const ShardVolumeSpec& x) {
  return os << "{chunk_sizes=[" << absl::StrJoin(x.chunk_sizes_, ", ")
            << "], volume_sizes=[" << absl::StrJoin(x.volume_sizes_, ", ")
            << "]}";
}

}  // namespace neuroglancer_uint64_sharded
}  // namespace ngshard
