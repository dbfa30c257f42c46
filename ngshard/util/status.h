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

#ifndef NGSHARD_UTIL_STATUS_H_
#define NGSHARD_UTIL_STATUS_H_

#include <optional>
#include <string_view>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace ngshard {
namespace internal {

/// Returns a copy of `source` with `prefix_message` prepended to its message,
/// and the code optionally replaced by `new_code`.  Payloads are preserved.
absl::Status MaybeAnnotateStatusImpl(absl::Status source,
                                     std::string_view prefix_message,
                                     std::optional<absl::StatusCode> new_code);

[[noreturn]] void FatalStatus(const char* message, const absl::Status& status);

}  // namespace internal

/// If `source` is an error status, returns a status with the same code whose
/// message is `message` followed by the original message.
///
/// Example::
///
///     return MaybeAnnotateStatus(status, "Error reading shard index");
///
/// \ingroup error handling
inline absl::Status MaybeAnnotateStatus(absl::Status source,
                                        std::string_view message) {
  return internal::MaybeAnnotateStatusImpl(std::move(source), message,
                                           std::nullopt);
}

/// Same as above, but additionally replaces the status code.
inline absl::Status MaybeAnnotateStatus(absl::Status source,
                                        std::string_view message,
                                        absl::StatusCode new_code) {
  return internal::MaybeAnnotateStatusImpl(std::move(source), message,
                                           new_code);
}

/// Overloads used by the propagation macros to extract a status from either
/// an `absl::Status` or an `absl::StatusOr<T>`.
inline const absl::Status& GetStatus(const absl::Status& status) {
  return status;
}
inline absl::Status GetStatus(absl::Status&& status) {
  return std::move(status);
}
template <typename T>
inline const absl::Status& GetStatus(const absl::StatusOr<T>& result) {
  return result.status();
}
template <typename T>
inline absl::Status GetStatus(absl::StatusOr<T>&& result) {
  return std::move(result).status();
}

}  // namespace ngshard

/// Causes the containing function to return the specified `absl::Status`
/// value if it is an error status.
///
/// Example::
///
///     absl::Status GetSomeStatus();
///
///     absl::Status Bar() {
///       NGSHARD_RETURN_IF_ERROR(GetSomeStatus());
///       // More code
///       return absl::OkStatus();
///     }
///
/// An optional second argument specifies the return expression in the case of
/// an error.  A variable ``_`` bound to the error `absl::Status` value is in
/// scope within this expression.  For example::
///
///     NGSHARD_RETURN_IF_ERROR(GetSomeStatus(),
///                             MaybeAnnotateStatus(_, "In Bar"));
///
/// \ingroup error handling
#define NGSHARD_RETURN_IF_ERROR(...) \
  NGSHARD_INTERNAL_EXPAND(NGSHARD_INTERNAL_RETURN_IF_ERROR_IMPL(__VA_ARGS__, _))

#define NGSHARD_INTERNAL_EXPAND(x) x

#define NGSHARD_INTERNAL_RETURN_IF_ERROR_IMPL(expr, error_expr, ...) \
  for (absl::Status _ = ::ngshard::GetStatus(expr);                  \
       ABSL_PREDICT_FALSE(!_.ok());)                                 \
  return error_expr /**/

/// Logs an error and terminates the program if the specified `absl::Status` is
/// an error status.
///
/// \ingroup error handling
#define NGSHARD_CHECK_OK(...)                                             \
  do {                                                                    \
    [](const ::absl::Status& ngshard_check_ok_condition) {                \
      if (ABSL_PREDICT_FALSE(!ngshard_check_ok_condition.ok())) {         \
        ::ngshard::internal::FatalStatus("Status not ok: " #__VA_ARGS__,  \
                                         ngshard_check_ok_condition);     \
      }                                                                   \
    }(::ngshard::GetStatus((__VA_ARGS__)));                               \
  } while (false)

#endif  // NGSHARD_UTIL_STATUS_H_
