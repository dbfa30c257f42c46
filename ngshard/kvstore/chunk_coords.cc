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

#include "ngshard/kvstore/chunk_coords.h"

#include <string>
#include <string_view>

#include "absl/strings/str_cat.h"

namespace ngshard {

std::string FormatChunkCoords(const ChunkCoords& coords) {
  return absl::StrCat(coords[0], "-", coords[1], "_", coords[2], "-",
                      coords[3], "_", coords[4], "-", coords[5]);
}

std::string GetChunkPath(std::string_view key, const ChunkCoords& coords,
                         ChunkPattern pattern) {
  const char* separator = pattern == ChunkPattern::kFlat ? "_" : "/";
  return absl::StrCat(key, "/", coords[0], "-", coords[1], separator,
                      coords[2], "-", coords[3], separator, coords[4], "-",
                      coords[5]);
}

}  // namespace ngshard
