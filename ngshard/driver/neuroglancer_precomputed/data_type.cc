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


#include "ngshard/driver/neuroglancer_precomputed/data_type.h"

#include <stddef.h>

#include <array>
#include <ostream>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "ngshard/util/quote_string.h"
#include "ngshard/util/result.h"

namespace ngshard {
namespace internal_neuroglancer_precomputed {
namespace {

constexpr std::array<DataType, 5> kSupportedDataTypes{
    DataType::uint8, DataType::uint16, DataType::uint32, DataType::uint64,
    DataType::float32,
};

}  // namespace

std::string_view to_string(DataType dtype) {
  switch (dtype) {
    case DataType::uint8:
      return "uint8";
    case DataType::uint16:
      return "uint16";
    case DataType::uint32:
      return "uint32";
    case DataType::uint64:
      return "uint64";
    case DataType::float32:
      return "float32";
  }
  return "uint8";
}

std::ostream& operator<<(std::ostream& os, DataType dtype) {
  return os << to_string(dtype);
}

size_t DataTypeSize(DataType dtype) {
  switch (dtype) {
    case DataType::uint8:
      return 1;
    case DataType::uint16:
      return 2;
    case DataType::uint32:
    case DataType::float32:
      return 4;
    case DataType::uint64:
      return 8;
  }
  return 1;
}

Result<DataType> ParseDataType(std::string_view name) {
  for (DataType dtype : kSupportedDataTypes) {
    if (to_string(dtype) == name) return dtype;
  }
  return absl::InvalidArgumentError(absl::StrCat(
      QuoteString(name), " data type is not one of the supported data types: ",
      absl::StrJoin(kSupportedDataTypes, ", ",
                    [](std::string* out, DataType dtype) {
                      absl::StrAppend(out, to_string(dtype));
                    })));
}

}  // namespace internal_neuroglancer_precomputed
}  // namespace ngshard
