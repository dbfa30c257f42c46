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

#include "ngshard/internal/log/verbose_flag.h"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <string>
#include <string_view>

#include "absl/base/const_init.h"
#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/flags/flag.h"
#include "absl/log/absl_log.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/synchronization/mutex.h"

ABSL_FLAG(std::string, ngshard_verbose_logging, {},
          "comma-separated list of ngshard verbose logging flags")
    .OnUpdate([]() {
      if (!absl::GetFlag(FLAGS_ngshard_verbose_logging).empty()) {
        ngshard::internal_log::UpdateVerboseLogging(
            absl::GetFlag(FLAGS_ngshard_verbose_logging), true);
      }
    });

namespace ngshard {
namespace internal_log {
namespace {

struct LoggingLevelConfig {
  int default_level = -1;
  absl::flat_hash_map<std::string, int> levels;
};

ABSL_CONST_INIT absl::Mutex g_mutex(absl::kConstInit);

// Incremented on every configuration change; starts at 1 so that freshly
// constructed flags (generation 0) always load their level once.
ABSL_CONST_INIT std::atomic<int> g_generation{1};

void ParseLoggingLevels(std::string_view input, LoggingLevelConfig& config) {
  for (std::string_view entry :
       absl::StrSplit(input, ',', absl::SkipEmpty())) {
    const size_t eq = entry.rfind('=');
    if (eq == std::string_view::npos) {
      config.levels.insert_or_assign(std::string(entry), 0);
      continue;
    }
    int level;
    if (eq == 0 || !absl::SimpleAtoi(entry.substr(eq + 1), &level)) continue;
    config.levels.insert_or_assign(std::string(entry.substr(0, eq)),
                                   std::clamp(level, -1, 1000));
  }
  if (auto it = config.levels.find("all"); it != config.levels.end()) {
    config.default_level = it->second;
  }
}

LoggingLevelConfig& GetLoggingLevelConfig()
    ABSL_EXCLUSIVE_LOCKS_REQUIRED(g_mutex) {
  // Never destroyed; the environment is consulted on first use.
  static LoggingLevelConfig* config = [] {
    auto* config = new LoggingLevelConfig;
    if (const char* env = std::getenv("NGSHARD_VERBOSE_LOGGING")) {
      ParseLoggingLevels(env, *config);
    }
    return config;
  }();
  return *config;
}

}  // namespace

void UpdateVerboseLogging(std::string_view input, bool overwrite) {
  ABSL_LOG(INFO) << "--ngshard_verbose_logging=" << input;
  absl::MutexLock lock(&g_mutex);
  LoggingLevelConfig& config = GetLoggingLevelConfig();
  if (overwrite) config = LoggingLevelConfig{};
  ParseLoggingLevels(input, config);
  g_generation.fetch_add(1, std::memory_order_acq_rel);
}

/* static */
int VerboseFlag::CurrentGeneration() {
  return g_generation.load(std::memory_order_acquire);
}

void VerboseFlag::Refresh() {
  absl::MutexLock lock(&g_mutex);
  const LoggingLevelConfig& config = GetLoggingLevelConfig();
  auto it = config.levels.find(std::string_view(name_));
  level_.store(it == config.levels.end() ? config.default_level : it->second,
               std::memory_order_relaxed);
  generation_.store(g_generation.load(std::memory_order_relaxed),
                    std::memory_order_release);
}

}  // namespace internal_log
}  // namespace ngshard
