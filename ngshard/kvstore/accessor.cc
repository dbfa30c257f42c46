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

#include "ngshard/kvstore/accessor.h"

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "ngshard/kvstore/chunk_coords.h"
#include "ngshard/util/result.h"
#include "ngshard/util/status.h"

namespace ngshard {

FileWriter::~FileWriter() = default;

Accessor::~Accessor() = default;

Result<absl::Cord> Accessor::FetchChunk(std::string_view key,
                                        const ChunkCoords& coords) {
  NGSHARD_ASSIGN_OR_RETURN(
      auto value, FetchFile(GetChunkPath(key, coords)),
      MaybeAnnotateStatus(_, absl::StrCat("Error reading chunk ", key, "/",
                                          FormatChunkCoords(coords))));
  return value;
}

absl::Status Accessor::StoreChunk(std::string_view key,
                                  const ChunkCoords& coords, absl::Cord value,
                                  const StoreOptions& options) {
  NGSHARD_RETURN_IF_ERROR(
      StoreFile(GetChunkPath(key, coords), std::move(value), options),
      MaybeAnnotateStatus(_, absl::StrCat("Error storing chunk ", key, "/",
                                          FormatChunkCoords(coords))));
  return absl::OkStatus();
}

}  // namespace ngshard
