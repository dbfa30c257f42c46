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


#include "ngshard/util/status.h"

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"

namespace ngshard {
namespace internal {

absl::Status MaybeAnnotateStatusImpl(absl::Status source,
                                     std::string_view prefix_message,
                                     std::optional<absl::StatusCode> new_code) {
  if (source.ok()) return source;
  std::string message;
  if (prefix_message.empty()) {
    message = std::string(source.message());
  } else if (source.message().empty()) {
    message = std::string(prefix_message);
  } else {
    message = absl::StrCat(prefix_message, ": ", source.message());
  }
  absl::Status dest(new_code.value_or(source.code()), message);
  source.ForEachPayload([&](auto name, const absl::Cord& value) {
    dest.SetPayload(name, value);
  });
  return dest;
}

[[noreturn]] void FatalStatus(const char* message, const absl::Status& status) {
  ABSL_LOG(FATAL) << message << ": " << status;
  std::abort();  // Unreachable.
}

}  // namespace internal
}  // namespace ngshard
