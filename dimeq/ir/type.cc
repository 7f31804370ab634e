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

#include "dimeq/ir/type.h"

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"

#include "dimeq/primitive_util.h"

namespace dimeq {

// static
Type Type::MakeArray(PrimitiveType element_type, int64_t rank) {
  CHECK_GE(rank, 0);
  Type type;
  type.kind_ = Kind::kArray;
  type.element_type_ = element_type;
  type.size_ = rank;
  return type;
}

// static
Type Type::MakeScalar(PrimitiveType element_type) {
  Type type;
  type.kind_ = Kind::kScalar;
  type.element_type_ = element_type;
  return type;
}

// static
Type Type::MakeUniTuple(PrimitiveType element_type, int64_t count) {
  CHECK_GE(count, 0);
  Type type;
  type.kind_ = Kind::kUniTuple;
  type.element_type_ = element_type;
  type.size_ = count;
  return type;
}

// static
Type Type::MakeModule(std::string_view name) {
  Type type;
  type.kind_ = Kind::kModule;
  type.name_ = std::string(name);
  return type;
}

// static
Type Type::MakeFunction(std::string_view name) {
  Type type;
  type.kind_ = Kind::kFunction;
  type.name_ = std::string(name);
  return type;
}

// static
Type Type::MakeOpaque(std::string_view name) {
  Type type;
  type.name_ = std::string(name);
  return type;
}

bool Type::IsInteger() const {
  return kind_ == Kind::kScalar &&
         primitive_util::IsIntegralType(element_type_);
}

PrimitiveType Type::element_type() const {
  CHECK(kind_ == Kind::kArray || kind_ == Kind::kScalar ||
        kind_ == Kind::kUniTuple)
      << "Type has no element type: " << ToString();
  return element_type_;
}

int64_t Type::rank() const {
  CHECK(IsArray()) << "Type is not an array: " << ToString();
  return size_;
}

int64_t Type::tuple_count() const {
  CHECK(IsUniTuple()) << "Type is not a tuple: " << ToString();
  return size_;
}

std::string Type::ToString() const {
  switch (kind_) {
    case Kind::kArray:
      return absl::StrCat(
          "array(", primitive_util::LowercasePrimitiveTypeName(element_type_),
          ", ", size_, "d)");
    case Kind::kScalar:
      return std::string(
          primitive_util::LowercasePrimitiveTypeName(element_type_));
    case Kind::kUniTuple:
      return absl::StrCat(
          "UniTuple(",
          primitive_util::LowercasePrimitiveTypeName(element_type_), " x ",
          size_, ")");
    case Kind::kModule:
      return absl::StrCat("Module(", name_, ")");
    case Kind::kFunction:
      return absl::StrCat("Function(", name_, ")");
    case Kind::kOpaque:
      return name_.empty() ? "opaque" : name_;
  }
  return "unknown";
}

bool Type::operator==(const Type& other) const {
  return kind_ == other.kind_ && element_type_ == other.element_type_ &&
         size_ == other.size_ && name_ == other.name_;
}

std::ostream& operator<<(std::ostream& out, const Type& type) {
  return out << type.ToString();
}

}  // namespace dimeq
