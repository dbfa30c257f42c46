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

#ifndef NGSHARD_KVSTORE_FILE_FILE_ACCESSOR_H_
#define NGSHARD_KVSTORE_FILE_FILE_ACCESSOR_H_

#include <memory>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "ngshard/kvstore/accessor.h"
#include "ngshard/kvstore/byte_range.h"
#include "ngshard/kvstore/chunk_coords.h"
#include "ngshard/util/result.h"

namespace ngshard {

/// Accessor for a dataset on the local filesystem.
///
/// Paths are resolved relative to `base_dir`; absolute paths and paths with a
/// `..` component are rejected.  Files may be stored gzip-compressed under a
/// `.gz` suffix, which is transparent to `FetchFile` and `FileExists`.
class FileAccessor : public Accessor {
 public:
  struct Options {
    /// Compress stored files with gzip, except for the MIME types that are
    /// already compressed or must stay readable (`application/json`,
    /// `image/jpeg`, `image/png`).
    bool gzip = true;

    /// zlib compression level.
    int compression_level = 9;

    /// Naming scheme for newly stored chunks.  Both schemes are probed when
    /// reading.
    ChunkPattern chunk_pattern = ChunkPattern::kSubdirectory;
  };

  explicit FileAccessor(std::string base_dir, Options options = {});

  using Accessor::StoreFile;

  Result<absl::Cord> FetchFile(std::string_view path) override;
  absl::Status StoreFile(std::string_view path, absl::Cord value,
                         const StoreOptions& options) override;
  Result<bool> FileExists(std::string_view path) override;
  Result<absl::Cord> ReadBytes(std::string_view path,
                               ByteRange range) override;
  Result<std::unique_ptr<FileWriter>> OpenWriter(
      std::string_view path) override;

  Result<absl::Cord> FetchChunk(std::string_view key,
                                const ChunkCoords& coords) override;
  absl::Status StoreChunk(std::string_view key, const ChunkCoords& coords,
                          absl::Cord value,
                          const StoreOptions& options) override;

  const std::string& base_dir() const { return base_dir_; }
  const Options& options() const { return options_; }

 private:
  /// Returns the filesystem path of `path`.
  Result<std::string> ResolvePath(std::string_view path) const;

  /// Fetches the file at the resolved `full_path`, or `full_path.gz`.
  /// Returns `kNotFound` if neither exists.
  Result<absl::Cord> FetchResolved(const std::string& full_path);

  absl::Status StoreResolved(const std::string& full_path, absl::Cord value,
                             const StoreOptions& options);

  std::string base_dir_;
  Options options_;
};

}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_FILE_FILE_ACCESSOR_H_
