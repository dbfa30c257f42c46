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

#ifndef NGSHARD_UTIL_DIVISION_H_
#define NGSHARD_UTIL_DIVISION_H_

#include <cassert>
#include <type_traits>

namespace ngshard {

/// Returns the ceil of `numerator / denominator`.
///
/// \pre `numerator >= 0 && denominator > 0`
template <typename IntegralType>
constexpr IntegralType CeilOfRatio(IntegralType numerator,
                                   IntegralType denominator) {
  static_assert(std::is_integral<IntegralType>::value,
                "IntegralType must be an integral type.");
  assert(numerator >= 0 && denominator > 0);
  return numerator / denominator + (numerator % denominator != 0 ? 1 : 0);
}

/// Returns the smallest `n` such that `(IntegralType{1} << n) >= value`,
/// i.e. `ceil(log2(value))`, with `0` for `value <= 1`.
template <typename IntegralType>
constexpr int CeilLog2(IntegralType value) {
  static_assert(std::is_integral<IntegralType>::value,
                "IntegralType must be an integral type.");
  int bits = 0;
  while (bits < static_cast<int>(sizeof(IntegralType) * 8) &&
         (static_cast<IntegralType>(1) << bits) < value) {
    ++bits;
  }
  return bits;
}

}  // namespace ngshard

#endif  // NGSHARD_UTIL_DIVISION_H_
