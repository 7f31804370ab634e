/* Copyright 2026 The DimEq Authors.

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
==============================================================================*/

// Utilities for dealing with PrimitiveType enum values.

#ifndef DIMEQ_PRIMITIVE_UTIL_H_
#define DIMEQ_PRIMITIVE_UTIL_H_

#include <string_view>

#include "dimeq/dimeq.pb.h"

namespace dimeq::primitive_util {

constexpr bool IsSignedIntegralType(PrimitiveType type) {
  return type == S8 || type == S16 || type == S32 || type == S64;
}

constexpr bool IsUnsignedIntegralType(PrimitiveType type) {
  return type == U8 || type == U16 || type == U32 || type == U64;
}

constexpr bool IsIntegralType(PrimitiveType type) {
  return IsUnsignedIntegralType(type) || IsSignedIntegralType(type);
}

// Returns the lower-case name of the given primitive type, e.g. "s64".
std::string_view LowercasePrimitiveTypeName(PrimitiveType s);

}  // namespace dimeq::primitive_util

#endif  // DIMEQ_PRIMITIVE_UTIL_H_
