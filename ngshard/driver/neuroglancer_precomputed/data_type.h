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


#ifndef NGSHARD_DRIVER_NEUROGLANCER_PRECOMPUTED_DATA_TYPE_H_
#define NGSHARD_DRIVER_NEUROGLANCER_PRECOMPUTED_DATA_TYPE_H_

#include <stddef.h>

#include <iosfwd>
#include <string_view>

#include "ngshard/util/result.h"

namespace ngshard {
namespace internal_neuroglancer_precomputed {

/// Element types of the `"data_type"` member of the `info` metadata.
enum class DataType {
  uint8,
  uint16,
  uint32,
  uint64,
  float32,
};

std::string_view to_string(DataType dtype);

std::ostream& operator<<(std::ostream& os, DataType dtype);

/// Returns the size in bytes of one element.
size_t DataTypeSize(DataType dtype);

/// Parses a data type name such as `"uint32"`.
///
/// \error `absl::StatusCode::kInvalidArgument` if `name` is not supported.
Result<DataType> ParseDataType(std::string_view name);

}  // namespace internal_neuroglancer_precomputed
}  // namespace ngshard

#endif  // NGSHARD_DRIVER_NEUROGLANCER_PRECOMPUTED_DATA_TYPE_H_
