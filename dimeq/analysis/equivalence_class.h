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

#ifndef DIMEQ_ANALYSIS_EQUIVALENCE_CLASS_H_
#define DIMEQ_ANALYSIS_EQUIVALENCE_CLASS_H_

#include <stdint.h>

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/types/span.h"

namespace dimeq {

// Identifies a set of array dimensions that are provably equal in length at
// runtime. Positive ids are allocated by the EquivalenceClassRegistry.
using EquivalenceClass = int64_t;

// Dimensions statically known to have size 1, including the leading
// dimensions added when broadcasting operands of lower rank.
inline constexpr EquivalenceClass kSizeOneClass = 0;

// A dimension with no equality proof. Never merged and never used as a key of
// the class size table.
inline constexpr EquivalenceClass kUnknownClass = -1;

// One equivalence class per dimension of an array.
using ShapeVector = std::vector<EquivalenceClass>;

// Returns e.g. "[1, 2, -1]".
std::string ShapeVectorToString(absl::Span<const EquivalenceClass> shape);

// A value that equals the runtime length of a dimension: either a variable of
// the function or an integer constant.
class DimSize {
 public:
  static DimSize Variable(std::string name) {
    return DimSize(std::move(name));
  }
  static DimSize Constant(int64_t value) { return DimSize(value); }

  bool is_variable() const {
    return std::holds_alternative<std::string>(value_);
  }
  bool is_constant() const { return std::holds_alternative<int64_t>(value_); }

  // CHECK-fail if the size is of the other kind.
  const std::string& variable() const;
  int64_t constant() const;

  std::string ToString() const;

  bool operator==(const DimSize& other) const { return value_ == other.value_; }
  bool operator!=(const DimSize& other) const { return !(*this == other); }

 private:
  explicit DimSize(std::string name) : value_(std::move(name)) {}
  explicit DimSize(int64_t value) : value_(value) {}

  std::variant<std::string, int64_t> value_;
};

std::string DimSizesToString(absl::Span<const DimSize> sizes);

}  // namespace dimeq

#endif  // DIMEQ_ANALYSIS_EQUIVALENCE_CLASS_H_
