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

#ifndef NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_COMPRESSED_MORTON_CODE_H_
#define NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_COMPRESSED_MORTON_CODE_H_

#include <stdint.h>

#include <array>
#include <iosfwd>

#include "ngshard/kvstore/chunk_coords.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace neuroglancer_uint64_sharded {

/// Returns the number of bits of each grid coordinate that contribute to the
/// compressed Morton code, `ceil(log2(grid_sizes[i]))`.
std::array<int, 3> GetCompressedMortonCodeBits(
    const std::array<int64_t, 3>& grid_sizes);

/// Interleaves the low `bits[i]` bits of each of `grid_coords`.
///
/// Bit `b` of dimension `i` is emitted, in order of increasing `b` and then
/// `i`, only while `b < bits[i]`, so that a dimension with a smaller grid
/// stops contributing once its bits are exhausted.
uint64_t EncodeCompressedMortonCode(const std::array<int64_t, 3>& grid_coords,
                                    const std::array<int, 3>& bits);

/// Chunk grid of one scale of a sharded volume.
class ShardVolumeSpec {
 public:
  /// Returns a validated volume spec.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if any size is not positive,
  ///     or if the chunk grid needs more than 64 bits of Morton code.
  static Result<ShardVolumeSpec> Create(
      const std::array<int64_t, 3>& chunk_sizes,
      const std::array<int64_t, 3>& volume_sizes);

  const std::array<int64_t, 3>& chunk_sizes() const { return chunk_sizes_; }
  const std::array<int64_t, 3>& volume_sizes() const { return volume_sizes_; }
  const std::array<int64_t, 3>& grid_sizes() const { return grid_sizes_; }
  const std::array<int, 3>& num_bits() const { return num_bits_; }

  /// Returns the Morton code of the chunk at `grid_coords`.
  ///
  /// \error `absl::StatusCode::kOutOfRange` if a coordinate is negative or
  ///     not less than the grid size.
  Result<uint64_t> CompressedMortonCode(
      const std::array<int64_t, 3>& grid_coords) const;

  /// Returns the Morton code of the chunk with voxel bounds `chunk_coords`.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if a lower bound is not a
  ///     multiple of the chunk size.
  /// \error `absl::StatusCode::kOutOfRange` if the chunk lies outside the
  ///     grid.
  Result<uint64_t> GetCmc(const ChunkCoords& chunk_coords) const;

  friend bool operator==(const ShardVolumeSpec& a, const ShardVolumeSpec& b) {
    return a.chunk_sizes_ == b.chunk_sizes_ &&
           a.volume_sizes_ == b.volume_sizes_;
  }
  friend bool operator!=(const ShardVolumeSpec& a, const ShardVolumeSpec& b) {
    return !(a == b);
  }
  friend std::ostream& operator<<(std::ostream& os, const ShardVolumeSpec& x);

 private:
  ShardVolumeSpec() = default;

  std::array<int64_t, 3> chunk_sizes_;
  std::array<int64_t, 3> volume_sizes_;
  std::array<int64_t, 3> grid_sizes_;
  std::array<int, 3> num_bits_;
};

}  // namespace neuroglancer_uint64_sharded
}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_NEUROGLANCER_UINT64_SHARDED_COMPRESSED_MORTON_CODE_H_
