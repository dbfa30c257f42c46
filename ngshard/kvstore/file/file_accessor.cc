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

#include "ngshard/kvstore/file/file_accessor.h"

#include <stdint.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "ngshard/internal/compression/zlib.h"
#include "ngshard/internal/log/verbose_flag.h"
#include "ngshard/internal/os/file_util.h"
#include "ngshard/kvstore/accessor.h"
#include "ngshard/kvstore/byte_range.h"
#include "ngshard/kvstore/chunk_coords.h"
#include "ngshard/util/quote_string.h"
#include "ngshard/util/result.h"
#include "ngshard/util/status.h"

namespace ngshard {
namespace {

namespace os = ::ngshard::internal_os;

ABSL_CONST_INIT internal_log::VerboseFlag file_logging("file");

constexpr std::string_view kGzipSuffix = ".gz";

bool IsNoCompressMimeType(std::string_view mime_type) {
  return mime_type == "application/json" || mime_type == "image/jpeg" ||
         mime_type == "image/png";
}

/// Writes to a temporary file beside the destination, which is renamed over
/// the destination on `Commit`.
class FileWriterImpl : public FileWriter {
 public:
  FileWriterImpl(os::UniqueFileDescriptor fd, std::string temp_path,
                 std::string full_path)
      : fd_(std::move(fd)),
        temp_path_(std::move(temp_path)),
        full_path_(std::move(full_path)) {}

  ~FileWriterImpl() override {
    if (committed_) return;
    fd_.reset();
    auto status = os::DeleteFile(temp_path_);
    ABSL_LOG_IF(WARNING, !status.ok())
        << "Failed to remove uncommitted output: " << status;
  }

  absl::Status Append(const absl::Cord& data) override {
    NGSHARD_RETURN_IF_ERROR(CheckWritable());
    NGSHARD_RETURN_IF_ERROR(os::WriteAllToFile(fd_.get(), data),
                            MaybeAnnotateStatus(_, Context()));
    size_ += static_cast<int64_t>(data.size());
    return absl::OkStatus();
  }

  absl::Status PWrite(int64_t offset, const absl::Cord& data) override {
    NGSHARD_RETURN_IF_ERROR(CheckWritable());
    NGSHARD_RETURN_IF_ERROR(
        ByteRange::FromOffsetLength(offset, data.size()).Validate(size_),
        MaybeAnnotateStatus(_, Context()));
    NGSHARD_RETURN_IF_ERROR(os::PWriteAllToFile(fd_.get(), data, offset),
                            MaybeAnnotateStatus(_, Context()));
    return absl::OkStatus();
  }

  int64_t size() const override { return size_; }

  absl::Status Commit() override {
    NGSHARD_RETURN_IF_ERROR(CheckWritable());
    NGSHARD_RETURN_IF_ERROR(os::FsyncFile(fd_.get()),
                            MaybeAnnotateStatus(_, Context()));
    fd_.reset();
    NGSHARD_RETURN_IF_ERROR(os::RenameFile(temp_path_, full_path_));
    committed_ = true;
    ABSL_LOG_IF(INFO, file_logging)
        << "Wrote " << size_ << " bytes to " << QuoteString(full_path_);
    return absl::OkStatus();
  }

 private:
  absl::Status CheckWritable() const {
    if (!fd_.valid() || committed_) {
      return absl::FailedPreconditionError(
          absl::StrCat(Context(), ": writer is closed"));
    }
    return absl::OkStatus();
  }

  std::string Context() const {
    return absl::StrCat("Error writing ", QuoteString(full_path_));
  }

  os::UniqueFileDescriptor fd_;
  std::string temp_path_;
  std::string full_path_;
  int64_t size_ = 0;
  bool committed_ = false;
};

}  // namespace

FileAccessor::FileAccessor(std::string base_dir, Options options)
    : base_dir_(std::move(base_dir)), options_(options) {
  while (base_dir_.size() > 1 && base_dir_.back() == '/') base_dir_.pop_back();
  if (base_dir_.empty()) base_dir_ = ".";
}

Result<std::string> FileAccessor::ResolvePath(std::string_view path) const {
  if (path.empty() || path.front() == '/') {
    return absl::InvalidArgumentError(
        absl::StrCat("Only relative paths are accepted: ", QuoteString(path)));
  }
  for (std::string_view component : absl::StrSplit(path, '/')) {
    if (component == "..") {
      return absl::InvalidArgumentError(
          absl::StrCat("Only paths pointing under the base directory are "
                       "accepted: ",
                       QuoteString(path)));
    }
  }
  return absl::StrCat(base_dir_, "/", path);
}

Result<absl::Cord> FileAccessor::FetchResolved(const std::string& full_path) {
  NGSHARD_ASSIGN_OR_RETURN(bool plain_exists, os::FileExists(full_path));
  if (plain_exists) {
    NGSHARD_ASSIGN_OR_RETURN(std::string data, os::ReadAllToString(full_path));
    return absl::Cord(std::move(data));
  }
  const std::string gz_path = absl::StrCat(full_path, kGzipSuffix);
  NGSHARD_ASSIGN_OR_RETURN(bool gz_exists, os::FileExists(gz_path));
  if (!gz_exists) {
    return absl::NotFoundError(
        absl::StrCat("Cannot find ", QuoteString(full_path)));
  }
  NGSHARD_ASSIGN_OR_RETURN(std::string compressed,
                           os::ReadAllToString(gz_path));
  absl::Cord decoded;
  NGSHARD_RETURN_IF_ERROR(
      zlib::Decode(absl::Cord(std::move(compressed)), &decoded),
      MaybeAnnotateStatus(_, absl::StrCat("Error decompressing ",
                                          QuoteString(gz_path))));
  return decoded;
}

Result<absl::Cord> FileAccessor::FetchFile(std::string_view path) {
  NGSHARD_ASSIGN_OR_RETURN(std::string full_path, ResolvePath(path));
  return FetchResolved(full_path);
}

absl::Status FileAccessor::StoreResolved(const std::string& full_path,
                                         absl::Cord value,
                                         const StoreOptions& options) {
  std::string target = full_path;
  if (options_.gzip && !IsNoCompressMimeType(options.mime_type)) {
    absl::Cord compressed;
    zlib::Options zlib_options;
    zlib_options.level = options_.compression_level;
    zlib::Encode(value, &compressed, zlib_options);
    value = std::move(compressed);
    absl::StrAppend(&target, kGzipSuffix);
  }
  if (!options.overwrite) {
    NGSHARD_ASSIGN_OR_RETURN(bool exists, os::FileExists(target));
    if (exists) {
      return absl::AlreadyExistsError(
          absl::StrCat("File ", QuoteString(target), " already exists"));
    }
  }
  NGSHARD_RETURN_IF_ERROR(
      os::MakeDirectories(std::string(os::DirName(target))));
  NGSHARD_ASSIGN_OR_RETURN(auto temp, os::CreateTemporaryFile(target));
  FileWriterImpl writer(std::move(temp.first), std::move(temp.second),
                        target);
  NGSHARD_RETURN_IF_ERROR(writer.Append(value));
  return writer.Commit();
}

absl::Status FileAccessor::StoreFile(std::string_view path, absl::Cord value,
                                     const StoreOptions& options) {
  NGSHARD_ASSIGN_OR_RETURN(std::string full_path, ResolvePath(path));
  return StoreResolved(full_path, std::move(value), options);
}

Result<bool> FileAccessor::FileExists(std::string_view path) {
  NGSHARD_ASSIGN_OR_RETURN(std::string full_path, ResolvePath(path));
  NGSHARD_ASSIGN_OR_RETURN(bool exists, os::FileExists(full_path));
  if (exists) return true;
  return os::FileExists(absl::StrCat(full_path, kGzipSuffix));
}

Result<absl::Cord> FileAccessor::ReadBytes(std::string_view path,
                                           ByteRange range) {
  NGSHARD_ASSIGN_OR_RETURN(std::string full_path, ResolvePath(path));
  if (!range.SatisfiesInvariants()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid byte range ", range.inclusive_min, "-",
                     range.exclusive_max));
  }
  auto fd = os::OpenFileWrapper(full_path, os::OpenFlags::DefaultRead);
  if (absl::IsNotFound(fd.status())) {
    // Compressed files hold no addressable byte ranges.
    const std::string gz_path = absl::StrCat(full_path, kGzipSuffix);
    NGSHARD_ASSIGN_OR_RETURN(bool gz_exists, os::FileExists(gz_path));
    if (gz_exists) {
      return absl::FailedPreconditionError(absl::StrCat(
          "Cannot read a byte range of ", QuoteString(full_path),
          ": only the gzip-compressed ", QuoteString(gz_path), " exists"));
    }
  }
  NGSHARD_RETURN_IF_ERROR(fd.status());
  NGSHARD_ASSIGN_OR_RETURN(int64_t file_size, os::GetFileSize(fd->get()));
  if (range.exclusive_max > file_size) {
    return absl::DataLossError(absl::StrCat(
        "Reading ", QuoteString(full_path), ": byte range [",
        range.inclusive_min, ", ", range.exclusive_max,
        ") exceeds the file size of ", file_size));
  }
  NGSHARD_ASSIGN_OR_RETURN(
      absl::Cord data,
      os::ReadRangeFromFile(fd->get(), range.inclusive_min,
                            static_cast<size_t>(range.size())));
  if (static_cast<int64_t>(data.size()) != range.size()) {
    return absl::DataLossError(absl::StrCat(
        "Reading ", QuoteString(full_path), ": expected ", range.size(),
        " bytes at offset ", range.inclusive_min, ", but got ", data.size()));
  }
  ABSL_LOG_IF(INFO, file_logging.Level(1))
      << "Read " << range.size() << " bytes from " << QuoteString(full_path)
      << " at offset " << range.inclusive_min;
  return data;
}

Result<std::unique_ptr<FileWriter>> FileAccessor::OpenWriter(
    std::string_view path) {
  NGSHARD_ASSIGN_OR_RETURN(std::string full_path, ResolvePath(path));
  NGSHARD_RETURN_IF_ERROR(
      os::MakeDirectories(std::string(os::DirName(full_path))));
  NGSHARD_ASSIGN_OR_RETURN(auto temp, os::CreateTemporaryFile(full_path));
  return std::unique_ptr<FileWriter>(new FileWriterImpl(
      std::move(temp.first), std::move(temp.second), std::move(full_path)));
}

Result<absl::Cord> FileAccessor::FetchChunk(std::string_view key,
                                            const ChunkCoords& coords) {
  const ChunkPattern other = options_.chunk_pattern == ChunkPattern::kFlat
                                 ? ChunkPattern::kSubdirectory
                                 : ChunkPattern::kFlat;
  for (ChunkPattern pattern : {options_.chunk_pattern, other}) {
    NGSHARD_ASSIGN_OR_RETURN(std::string full_path,
                             ResolvePath(GetChunkPath(key, coords, pattern)));
    auto result = FetchResolved(full_path);
    if (!absl::IsNotFound(result.status())) {
      NGSHARD_RETURN_IF_ERROR(
          result.status(),
          MaybeAnnotateStatus(_, absl::StrCat("Error accessing chunk ", key,
                                              "/", FormatChunkCoords(coords))));
      return result;
    }
  }
  return absl::NotFoundError(absl::StrCat("Cannot find chunk ", key, "/",
                                          FormatChunkCoords(coords), " in ",
                                          QuoteString(base_dir_)));
}

absl::Status FileAccessor::StoreChunk(std::string_view key,
                                      const ChunkCoords& coords,
                                      absl::Cord value,
                                      const StoreOptions& options) {
  NGSHARD_ASSIGN_OR_RETURN(
      std::string full_path,
      ResolvePath(GetChunkPath(key, coords, options_.chunk_pattern)));
  NGSHARD_RETURN_IF_ERROR(
      StoreResolved(full_path, std::move(value), options),
      MaybeAnnotateStatus(_, absl::StrCat("Error storing chunk ", key, "/",
                                          FormatChunkCoords(coords))));
  return absl::OkStatus();
}

}  // namespace ngshard
