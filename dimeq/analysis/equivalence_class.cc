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

#include "dimeq/analysis/equivalence_class.h"

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace dimeq {

std::string ShapeVectorToString(absl::Span<const EquivalenceClass> shape) {
  return absl::StrCat("[", absl::StrJoin(shape, ", "), "]");
}

const std::string& DimSize::variable() const {
  CHECK(is_variable()) << "Size is the constant " << ToString();
  return std::get<std::string>(value_);
}

int64_t DimSize::constant() const {
  CHECK(is_constant()) << "Size is the variable " << ToString();
  return std::get<int64_t>(value_);
}

std::string DimSize::ToString() const {
  if (is_variable()) {
    return std::get<std::string>(value_);
  }
  return absl::StrCat(std::get<int64_t>(value_));
}

std::string DimSizesToString(absl::Span<const DimSize> sizes) {
  return absl::StrCat("[",
                      absl::StrJoin(sizes, ", ",
                                    [](std::string* out, const DimSize& size) {
                                      absl::StrAppend(out, size.ToString());
                                    }),
                      "]");
}

}  // namespace dimeq
