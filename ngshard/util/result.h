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

#ifndef NGSHARD_UTIL_RESULT_H_
#define NGSHARD_UTIL_RESULT_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/statusor.h"
#include "ngshard/util/status.h"

namespace ngshard {

/// Either a value of type `T` or an error `absl::Status`.
template <typename T>
using Result = absl::StatusOr<T>;

template <typename T>
constexpr inline bool IsResult = false;

template <typename T>
constexpr inline bool IsResult<absl::StatusOr<T>> = true;

}  // namespace ngshard

#define NGSHARD_INTERNAL_CAT_IMPL(a, b) a##b
#define NGSHARD_INTERNAL_CAT(a, b) NGSHARD_INTERNAL_CAT_IMPL(a, b)

#define NGSHARD_INTERNAL_ASSIGN_OR_RETURN_IMPL(temp, decl, expr, error_expr, \
                                               ...)                         \
  auto temp = (expr);                                                       \
  static_assert(::ngshard::IsResult<decltype(temp)>,                        \
                "NGSHARD_ASSIGN_OR_RETURN requires a Result value.");       \
  if (ABSL_PREDICT_FALSE(!temp.ok())) {                                     \
    auto _ = std::move(temp).status();                                      \
    static_cast<void>(_);                                                   \
    return (error_expr);                                                    \
  }                                                                         \
  decl = std::move(*temp);                                                  \
  /**/

/// Convenience macro for propagating errors when calling a function that
/// returns a `ngshard::Result`.
///
/// This macro generates multiple statements and should be invoked as follows::
///
///     Result<int> GetSomeResult();
///
///     NGSHARD_ASSIGN_OR_RETURN(int x, GetSomeResult());
///
/// An optional third argument specifies the return expression in the case of an
/// error.  A variable ``_`` bound to the error `absl::Status` value is in
/// scope within this expression.  For example::
///
///     NGSHARD_ASSIGN_OR_RETURN(int x, GetSomeResult(),
///                              MaybeAnnotateStatus(_, "Context message"));
///
/// \relates ngshard::Result
#define NGSHARD_ASSIGN_OR_RETURN(decl, ...)                          \
  NGSHARD_INTERNAL_EXPAND(NGSHARD_INTERNAL_ASSIGN_OR_RETURN_IMPL(    \
      NGSHARD_INTERNAL_CAT(ngshard_assign_or_return_, __LINE__), decl, \
      __VA_ARGS__, _))                                               \
  /**/

#endif  // NGSHARD_UTIL_RESULT_H_
