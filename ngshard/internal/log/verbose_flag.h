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

#ifndef NGSHARD_INTERNAL_LOG_VERBOSE_FLAG_H_
#define NGSHARD_INTERNAL_LOG_VERBOSE_FLAG_H_

#include <atomic>
#include <string_view>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"

namespace ngshard {
namespace internal_log {

/// Sets the verbose logging levels.  `input` is a comma separated list of
/// `name` or `name=level` entries.  The special name `all` sets the level of
/// every flag not otherwise listed.  When `overwrite` is false, the entries
/// are merged into the current configuration.
void UpdateVerboseLogging(std::string_view input, bool overwrite);

/// Component-scoped switch for verbose logging, configured by the
/// `--ngshard_verbose_logging` flag and the `NGSHARD_VERBOSE_LOGGING`
/// environment variable.
///
/// Usage:
///
///   namespace {
///   ABSL_CONST_INIT internal_log::VerboseFlag verbose_logging("sharded");
///   }
///   ABSL_LOG_IF(INFO, verbose_logging) << "Closing shard " << key;
///
class VerboseFlag {
 public:
  explicit constexpr VerboseFlag(const char* name)
      : level_(-1), generation_(0), name_(name) {}

  VerboseFlag(const VerboseFlag&) = delete;
  VerboseFlag& operator=(const VerboseFlag&) = delete;

  /// Returns whether logging is enabled for the flag at `level`.
  ABSL_ATTRIBUTE_ALWAYS_INLINE bool Level(int level) {
    if (ABSL_PREDICT_FALSE(generation_.load(std::memory_order_acquire) !=
                           CurrentGeneration())) {
      Refresh();
    }
    return level <= level_.load(std::memory_order_relaxed);
  }

  /// Returns whether logging is enabled for the flag at level 0.
  ABSL_ATTRIBUTE_ALWAYS_INLINE operator bool() { return Level(0); }

  const char* name() const { return name_; }

 private:
  static int CurrentGeneration();
  void Refresh();

  std::atomic<int> level_;
  // Configuration generation `level_` was computed from; 0 means never.
  std::atomic<int> generation_;
  const char* const name_;
};

}  // namespace internal_log
}  // namespace ngshard

#endif  // NGSHARD_INTERNAL_LOG_VERBOSE_FLAG_H_
