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

#include "ngshard/internal/os/file_util.h"

#include <errno.h>
#include <fcntl.h>
#include <ftw.h>
#include <limits.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/uio.h>
#include <unistd.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/container/inlined_vector.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "ngshard/internal/log/verbose_flag.h"
#include "ngshard/internal/os/error_code.h"
#include "ngshard/util/quote_string.h"
#include "ngshard/util/result.h"
#include "ngshard/util/status.h"

#if defined(IOV_MAX)
#define NGSHARD_MAXIOV IOV_MAX
#else
#define NGSHARD_MAXIOV 1024
#endif

namespace ngshard {
namespace internal_os {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag file_logging("file");

}  // namespace

void UniqueFileDescriptor::reset(FileDescriptor fd) {
  FileDescriptor old = std::exchange(fd_, fd);
  if (old == -1) return;
  while (::close(old) != 0 && errno == EINTR) {
  }
}

Result<UniqueFileDescriptor> OpenFileWrapper(const std::string& path,
                                             OpenFlags flags) {
  FileDescriptor fd;
  do {
    fd = ::open(path.c_str(), static_cast<int>(flags), 0666);
  } while (fd == -1 && errno == EINTR);
  if (fd == -1) {
    return StatusFromOsError(errno, "Failed to open: ", QuoteString(path));
  }
  ABSL_LOG_IF(INFO, file_logging.Level(1))
      << "Opened " << QuoteString(path) << " as fd " << fd;
  return UniqueFileDescriptor(fd);
}

Result<ptrdiff_t> PReadFromFile(FileDescriptor fd, char* buffer, size_t count,
                                int64_t offset) {
  ssize_t n;
  do {
    n = ::pread(fd, buffer, count, static_cast<off_t>(offset));
  } while (n < 0 && (errno == EINTR || errno == EAGAIN));
  if (n >= 0) return n;
  return StatusFromOsError(errno, "Failed to read from file at offset ",
                           offset);
}

Result<absl::Cord> ReadRangeFromFile(FileDescriptor fd, int64_t offset,
                                     size_t count) {
  NGSHARD_ASSIGN_OR_RETURN(int64_t file_size, GetFileSize(fd));
  // `count` may be taken from a corrupt index and exceed the file size.
  if (offset >= file_size) return absl::Cord();
  count = static_cast<size_t>(
      std::min<uint64_t>(count, static_cast<uint64_t>(file_size - offset)));
  std::string buffer(count, '\0');
  size_t total = 0;
  while (total < count) {
    NGSHARD_ASSIGN_OR_RETURN(
        ptrdiff_t n,
        PReadFromFile(fd, buffer.data() + total, count - total,
                      offset + static_cast<int64_t>(total)));
    if (n == 0) break;
    total += static_cast<size_t>(n);
  }
  buffer.resize(total);
  return absl::Cord(std::move(buffer));
}

Result<std::string> ReadAllToString(const std::string& path) {
  NGSHARD_ASSIGN_OR_RETURN(auto fd,
                           OpenFileWrapper(path, OpenFlags::DefaultRead));
  NGSHARD_ASSIGN_OR_RETURN(int64_t size, GetFileSize(fd.get()));
  NGSHARD_ASSIGN_OR_RETURN(
      absl::Cord data,
      ReadRangeFromFile(fd.get(), 0, static_cast<size_t>(size)),
      MaybeAnnotateStatus(_, absl::StrCat("Reading ", QuoteString(path))));
  return std::string(data);
}

Result<ptrdiff_t> WriteToFile(FileDescriptor fd, const void* buf,
                              size_t count) {
  ssize_t n;
  do {
    n = ::write(fd, buf, count);
  } while (n < 0 && (errno == EINTR || errno == EAGAIN));
  if (count != 0 && n == 0) {
    errno = ENOSPC;
  } else if (n >= 0) {
    return n;
  }
  return StatusFromOsError(errno, "Failed to write to file");
}

Result<ptrdiff_t> WriteCordToFile(FileDescriptor fd, const absl::Cord& value) {
  absl::InlinedVector<iovec, 16> iovs;
  for (std::string_view chunk : value.Chunks()) {
    struct iovec iov;
    iov.iov_base = const_cast<char*>(chunk.data());
    iov.iov_len = chunk.size();
    iovs.emplace_back(iov);
    if (iovs.size() >= NGSHARD_MAXIOV) break;
  }
  ssize_t n;
  do {
    n = ::writev(fd, iovs.data(), static_cast<int>(iovs.size()));
  } while (n < 0 && (errno == EINTR || errno == EAGAIN));
  if (!value.empty() && n == 0) {
    errno = ENOSPC;
  } else if (n >= 0) {
    return n;
  }
  return StatusFromOsError(errno, "Failed to write to file");
}

absl::Status WriteAllToFile(FileDescriptor fd, absl::Cord value) {
  while (!value.empty()) {
    NGSHARD_ASSIGN_OR_RETURN(ptrdiff_t n, WriteCordToFile(fd, value));
    value.RemovePrefix(static_cast<size_t>(n));
  }
  return absl::OkStatus();
}

absl::Status PWriteAllToFile(FileDescriptor fd, const absl::Cord& value,
                             int64_t offset) {
  for (std::string_view chunk : value.Chunks()) {
    while (!chunk.empty()) {
      ssize_t n;
      do {
        n = ::pwrite(fd, chunk.data(), chunk.size(),
                     static_cast<off_t>(offset));
      } while (n < 0 && (errno == EINTR || errno == EAGAIN));
      if (n == 0) errno = ENOSPC;
      if (n <= 0) {
        return StatusFromOsError(errno, "Failed to write to file at offset ",
                                 offset);
      }
      chunk.remove_prefix(static_cast<size_t>(n));
      offset += n;
    }
  }
  return absl::OkStatus();
}

Result<int64_t> GetFileSize(FileDescriptor fd) {
  struct ::stat info;
  if (::fstat(fd, &info) != 0) {
    return StatusFromOsError(errno, "Failed to get file info");
  }
  return static_cast<int64_t>(info.st_size);
}

absl::Status FsyncFile(FileDescriptor fd) {
  if (::fsync(fd) == 0) return absl::OkStatus();
  return StatusFromOsError(errno, "Failed to fsync file");
}

absl::Status TruncateFile(FileDescriptor fd, int64_t size) {
  if (::ftruncate(fd, static_cast<off_t>(size)) == 0) {
    return absl::OkStatus();
  }
  return StatusFromOsError(errno, "Failed to truncate file to ", size,
                           " bytes");
}

absl::Status RenameFile(const std::string& old_name,
                        const std::string& new_name) {
  ABSL_LOG_IF(INFO, file_logging.Level(1))
      << "Renaming " << QuoteString(old_name) << " to "
      << QuoteString(new_name);
  if (::rename(old_name.c_str(), new_name.c_str()) == 0) {
    return absl::OkStatus();
  }
  return StatusFromOsError(errno, "Failed to rename ", QuoteString(old_name),
                           " to ", QuoteString(new_name));
}

absl::Status DeleteFile(const std::string& path) {
  if (::unlink(path.c_str()) == 0) return absl::OkStatus();
  return StatusFromOsError(errno, "Failed to delete: ", QuoteString(path));
}

Result<bool> FileExists(const std::string& path) {
  struct ::stat info;
  if (::stat(path.c_str(), &info) != 0) {
    if (errno == ENOENT || errno == ENOTDIR) return false;
    return StatusFromOsError(errno, "Failed to stat: ", QuoteString(path));
  }
  return S_ISREG(info.st_mode);
}

absl::Status MakeDirectory(const std::string& path) {
  if (::mkdir(path.c_str(), 0777) == 0 || errno == EEXIST) {
    return absl::OkStatus();
  }
  return StatusFromOsError(errno,
                           "Failed to create directory: ", QuoteString(path));
}

absl::Status MakeDirectories(std::string_view path) {
  for (size_t pos = path.find('/', 1); pos != std::string_view::npos;
       pos = path.find('/', pos + 1)) {
    NGSHARD_RETURN_IF_ERROR(MakeDirectory(std::string(path.substr(0, pos))));
  }
  if (path.empty() || path.back() == '/') return absl::OkStatus();
  return MakeDirectory(std::string(path));
}

absl::Status RemoveAll(const std::string& path) {
  struct ::stat info;
  if (::lstat(path.c_str(), &info) != 0) {
    return StatusFromOsError(errno, "Failed to stat: ", QuoteString(path));
  }
  constexpr auto remove_entry = [](const char* entry, const struct ::stat*,
                                   int, struct FTW*) -> int {
    return ::remove(entry);
  };
  if (::nftw(path.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS) != 0) {
    return StatusFromOsError(errno, "Failed to remove: ", QuoteString(path));
  }
  return absl::OkStatus();
}

Result<std::pair<UniqueFileDescriptor, std::string>> CreateTemporaryFile(
    const std::string& prefix) {
  std::string name = absl::StrCat(prefix, ".XXXXXX");
  FileDescriptor fd = ::mkostemp(name.data(), O_CLOEXEC);
  if (fd == -1) {
    return StatusFromOsError(errno, "Failed to create temporary file: ",
                             QuoteString(name));
  }
  return std::make_pair(UniqueFileDescriptor(fd), std::move(name));
}

Result<UniqueFileDescriptor> CreateAnonymousTemporaryFile(
    const std::string& directory) {
  std::string dir = directory;
  if (dir.empty()) {
    const char* tmpdir = ::getenv("TMPDIR");
    dir = (tmpdir && *tmpdir) ? tmpdir : "/tmp";
  }
  NGSHARD_ASSIGN_OR_RETURN(auto temp,
                           CreateTemporaryFile(absl::StrCat(dir, "/ngshard")));
  NGSHARD_RETURN_IF_ERROR(DeleteFile(temp.second));
  ABSL_LOG_IF(INFO, file_logging.Level(1))
      << "Created anonymous temporary file in " << QuoteString(dir);
  return std::move(temp.first);
}

std::string_view DirName(std::string_view path) {
  size_t pos = path.rfind('/');
  if (pos == std::string_view::npos) return {};
  if (pos == 0) return path.substr(0, 1);
  return path.substr(0, pos);
}

}  // namespace internal_os
}  // namespace ngshard
