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

#ifndef DIMEQ_IR_TYPE_H_
#define DIMEQ_IR_TYPE_H_

#include <stdint.h>

#include <ostream>
#include <string>
#include <string_view>

#include "dimeq/dimeq.pb.h"

namespace dimeq {

// Static type of a variable in the function IR, as produced by the type
// inference of the host compiler. Only the properties the array analysis
// needs are modeled: the rank of arrays, the element kind of scalars and the
// element count of homogeneous tuples.
class Type {
 public:
  enum class Kind {
    kArray,
    kScalar,
    kUniTuple,
    kModule,
    kFunction,
    kOpaque,
  };

  // Creates an opaque type without a name.
  Type() = default;

  static Type MakeArray(PrimitiveType element_type, int64_t rank);
  static Type MakeScalar(PrimitiveType element_type);
  // A tuple of `count` elements that all have the scalar type `element_type`.
  static Type MakeUniTuple(PrimitiveType element_type, int64_t count);
  static Type MakeModule(std::string_view name);
  static Type MakeFunction(std::string_view name);
  static Type MakeOpaque(std::string_view name);

  Kind kind() const { return kind_; }
  bool IsArray() const { return kind_ == Kind::kArray; }
  bool IsScalar() const { return kind_ == Kind::kScalar; }
  bool IsUniTuple() const { return kind_ == Kind::kUniTuple; }

  // Returns true for scalar integer types.
  bool IsInteger() const;

  // Element type of arrays, scalars and tuples. CHECKs otherwise.
  PrimitiveType element_type() const;

  // Number of dimensions. CHECKs if this is not an array.
  int64_t rank() const;

  // Number of tuple elements. CHECKs if this is not a tuple.
  int64_t tuple_count() const;

  // Name of module, function and opaque types.
  const std::string& name() const { return name_; }

  std::string ToString() const;

  bool operator==(const Type& other) const;
  bool operator!=(const Type& other) const { return !(*this == other); }

 private:
  Kind kind_ = Kind::kOpaque;
  PrimitiveType element_type_ = PRIMITIVE_TYPE_INVALID;
  // Rank for arrays, element count for tuples.
  int64_t size_ = 0;
  std::string name_;
};

std::ostream& operator<<(std::ostream& out, const Type& type);

}  // namespace dimeq

#endif  // DIMEQ_IR_TYPE_H_
