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

#ifndef NGSHARD_KVSTORE_ACCESSOR_H_
#define NGSHARD_KVSTORE_ACCESSOR_H_

/// \file
/// Byte-oriented access to the files of a precomputed dataset.
///
/// An `Accessor` stores and fetches whole files by path relative to the
/// dataset root, reads byte ranges of files, and streams large files through
/// a `FileWriter`.  It does not interpret file contents.

#include <stdint.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "ngshard/kvstore/byte_range.h"
#include "ngshard/kvstore/chunk_coords.h"
#include "ngshard/util/result.h"

namespace ngshard {

/// Options for `Accessor::StoreFile`.
struct StoreOptions {
  std::string mime_type = "application/octet-stream";

  /// Replace an existing file instead of failing with
  /// `absl::StatusCode::kAlreadyExists`.
  bool overwrite = false;
};

/// Sequential writer for a single file.
///
/// Output becomes visible at the destination path only on `Commit`.  A writer
/// destroyed without a successful `Commit` discards its output.
class FileWriter {
 public:
  virtual ~FileWriter();

  /// Appends `data` at the end of the file.
  virtual absl::Status Append(const absl::Cord& data) = 0;

  /// Overwrites bytes already written, starting at `offset`.
  ///
  /// \error `absl::StatusCode::kOutOfRange` if the write extends past `size()`.
  virtual absl::Status PWrite(int64_t offset, const absl::Cord& data) = 0;

  /// Number of bytes written so far.
  virtual int64_t size() const = 0;

  virtual absl::Status Commit() = 0;
};

/// Abstract store/fetch-by-path primitive.
class Accessor {
 public:
  virtual ~Accessor();

  /// Returns the full contents of `path`.
  ///
  /// \error `absl::StatusCode::kNotFound` if `path` does not exist.
  virtual Result<absl::Cord> FetchFile(std::string_view path) = 0;

  virtual absl::Status StoreFile(std::string_view path, absl::Cord value,
                                 const StoreOptions& options) = 0;
  absl::Status StoreFile(std::string_view path, absl::Cord value) {
    return StoreFile(path, std::move(value), StoreOptions{});
  }

  virtual Result<bool> FileExists(std::string_view path) = 0;

  /// Returns exactly the bytes of `path` within `range`.
  ///
  /// \error `absl::StatusCode::kDataLoss` if fewer bytes are available.
  virtual Result<absl::Cord> ReadBytes(std::string_view path,
                                       ByteRange range) = 0;

  virtual Result<std::unique_ptr<FileWriter>> OpenWriter(
      std::string_view path) = 0;

  /// Returns the payload of an unsharded chunk of scale `key`.
  virtual Result<absl::Cord> FetchChunk(std::string_view key,
                                        const ChunkCoords& coords);

  /// Stores the payload of an unsharded chunk of scale `key`.
  virtual absl::Status StoreChunk(std::string_view key,
                                  const ChunkCoords& coords, absl::Cord value,
                                  const StoreOptions& options);
};

}  // namespace ngshard

#endif  // NGSHARD_KVSTORE_ACCESSOR_H_
