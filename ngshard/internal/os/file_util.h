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

#ifndef NGSHARD_INTERNAL_OS_FILE_UTIL_H_
#define NGSHARD_INTERNAL_OS_FILE_UTIL_H_

/// \file
/// Thin POSIX file wrappers that report failures as `absl::Status`.

#include <fcntl.h>
#include <stddef.h>
#include <stdint.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace internal_os {

using FileDescriptor = int;

/// Owning file descriptor; closes the descriptor on destruction.
class UniqueFileDescriptor {
 public:
  UniqueFileDescriptor() = default;
  explicit UniqueFileDescriptor(FileDescriptor fd) : fd_(fd) {}

  UniqueFileDescriptor(UniqueFileDescriptor&& other) noexcept
      : fd_(other.release()) {}
  UniqueFileDescriptor& operator=(UniqueFileDescriptor&& other) noexcept {
    reset(other.release());
    return *this;
  }
  UniqueFileDescriptor(const UniqueFileDescriptor&) = delete;
  UniqueFileDescriptor& operator=(const UniqueFileDescriptor&) = delete;

  ~UniqueFileDescriptor() { reset(); }

  FileDescriptor get() const { return fd_; }
  bool valid() const { return fd_ != -1; }

  FileDescriptor release() { return std::exchange(fd_, -1); }
  void reset(FileDescriptor fd = -1);

 private:
  FileDescriptor fd_ = -1;
};

enum class OpenFlags : int {
  OpenReadOnly = O_RDONLY,
  OpenWriteOnly = O_WRONLY,
  OpenReadWrite = O_RDWR,
  Create = O_CREAT,
  Append = O_APPEND,
  Exclusive = O_EXCL,
  Truncate = O_TRUNC,
  CloseOnExec = O_CLOEXEC,

  DefaultRead = O_RDONLY | O_CLOEXEC,
  DefaultWrite = O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC,
};

inline constexpr OpenFlags operator|(OpenFlags a, OpenFlags b) {
  return static_cast<OpenFlags>(static_cast<int>(a) | static_cast<int>(b));
}

Result<UniqueFileDescriptor> OpenFileWrapper(const std::string& path,
                                             OpenFlags flags);

/// Reads up to `count` bytes at `offset`.  Returns the number of bytes read,
/// which is 0 at end of file.
Result<ptrdiff_t> PReadFromFile(FileDescriptor fd, char* buffer, size_t count,
                                int64_t offset);

/// Reads `count` bytes at `offset`, stopping early only at end of file.  The
/// buffer is sized to the bytes remaining in the file, not to `count`.
Result<absl::Cord> ReadRangeFromFile(FileDescriptor fd, int64_t offset,
                                     size_t count);

Result<std::string> ReadAllToString(const std::string& path);

Result<ptrdiff_t> WriteToFile(FileDescriptor fd, const void* buf, size_t count);

Result<ptrdiff_t> WriteCordToFile(FileDescriptor fd, const absl::Cord& value);

/// Writes all of `value`, retrying partial writes.
absl::Status WriteAllToFile(FileDescriptor fd, absl::Cord value);

/// Writes all of `value` at `offset` without moving the file position.
absl::Status PWriteAllToFile(FileDescriptor fd, const absl::Cord& value,
                             int64_t offset);

Result<int64_t> GetFileSize(FileDescriptor fd);

absl::Status FsyncFile(FileDescriptor fd);

/// Sets the size of the file to `size` bytes.
absl::Status TruncateFile(FileDescriptor fd, int64_t size);

absl::Status RenameFile(const std::string& old_name,
                        const std::string& new_name);

absl::Status DeleteFile(const std::string& path);

/// Returns `true` if `path` names an existing regular file.
Result<bool> FileExists(const std::string& path);

/// Creates `path`; succeeds if it already exists.
absl::Status MakeDirectory(const std::string& path);

/// Creates `path` and any missing parents.
absl::Status MakeDirectories(std::string_view path);

/// Recursively removes `path`.  Returns `absl::StatusCode::kNotFound` if
/// `path` does not exist.
absl::Status RemoveAll(const std::string& path);

/// Creates a new file named `<prefix>.XXXXXX` with a unique suffix.
Result<std::pair<UniqueFileDescriptor, std::string>> CreateTemporaryFile(
    const std::string& prefix);

/// Creates a file in `directory` (or `$TMPDIR`, if empty) that is unlinked
/// immediately, so it is reclaimed when the descriptor is closed.
Result<UniqueFileDescriptor> CreateAnonymousTemporaryFile(
    const std::string& directory = {});

/// Returns the directory component of `path`, or an empty string.
std::string_view DirName(std::string_view path);

}  // namespace internal_os
}  // namespace ngshard

#endif  // NGSHARD_INTERNAL_OS_FILE_UTIL_H_
