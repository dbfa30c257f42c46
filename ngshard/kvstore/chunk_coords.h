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

#ifndef NGSHARD_KVSTORE_CHUNK_COORDS_H_
#define NGSHARD_KVSTORE_CHUNK_COORDS_H_

#include <stdint.h>

#include <array>
#include <string>
#include <string_view>

namespace ngshard {

/// Voxel-space bounds of a chunk: `{xmin, xmax, ymin, ymax, zmin, zmax}`,
/// half-open in each dimension.
using ChunkCoords = std::array<int64_t, 6>;

/// Naming scheme of unsharded chunk files below a scale directory.
enum class ChunkPattern {
  /// `"{key}/{x0}-{x1}_{y0}-{y1}_{z0}-{z1}"`
  kFlat,
  /// `"{key}/{x0}-{x1}/{y0}-{y1}/{z0}-{z1}"`
  kSubdirectory,
};

/// Returns the path of the chunk `coords` of scale `key` under `pattern`.
std::string GetChunkPath(std::string_view key, const ChunkCoords& coords,
                         ChunkPattern pattern = ChunkPattern::kFlat);

/// Formats `coords` as `"x0-x1_y0-y1_z0-z1"` for messages.
std::string FormatChunkCoords(const ChunkCoords& coords);

}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_CHUNK_COORDS_H_
