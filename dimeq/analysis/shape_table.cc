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

#include "dimeq/analysis/shape_table.h"

#include <algorithm>
#include <utility>

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace dimeq {

const ShapeVector& ShapeTable::Lookup(std::string_view variable) const {
  auto it = shapes_.find(variable);
  CHECK(it != shapes_.end()) << "No shape recorded for variable " << variable;
  return it->second;
}

absl::Status ShapeTable::Record(std::string_view variable, ShapeVector shape) {
  auto [it, inserted] = shapes_.try_emplace(std::string(variable), shape);
  if (inserted || it->second == shape) {
    return absl::OkStatus();
  }
  std::string previous = ShapeVectorToString(it->second);
  it->second.assign(it->second.size(), kUnknownClass);
  sizes_.erase(variable);
  return absl::FailedPreconditionError(absl::StrFormat(
      "Incompatible array shapes in control flow for %s: %s vs %s", variable,
      previous, ShapeVectorToString(shape)));
}

void ShapeTable::ReplaceClasses(EquivalenceClass c1, EquivalenceClass c2,
                                EquivalenceClass replacement) {
  for (auto& [variable, shape] : shapes_) {
    for (EquivalenceClass& c : shape) {
      if (c == c1 || c == c2) {
        c = replacement;
      }
    }
  }
}

void ShapeTable::SetSizes(std::string_view variable,
                          std::vector<DimSize> sizes) {
  sizes_[std::string(variable)] = std::move(sizes);
}

const std::vector<DimSize>* ShapeTable::FindSizes(
    std::string_view variable) const {
  auto it = sizes_.find(variable);
  return it == sizes_.end() ? nullptr : &it->second;
}

std::string ShapeTable::ToString() const {
  std::vector<std::string_view> names;
  names.reserve(shapes_.size());
  for (const auto& [variable, shape] : shapes_) {
    names.push_back(variable);
  }
  std::sort(names.begin(), names.end());

  std::string out;
  for (std::string_view name : names) {
    absl::StrAppend(&out, name, ": ", ShapeVectorToString(Lookup(name)));
    if (const std::vector<DimSize>* sizes = FindSizes(name)) {
      absl::StrAppend(&out, " sizes=", DimSizesToString(*sizes));
    }
    absl::StrAppend(&out, "\n");
  }
  return out;
}

}  // namespace dimeq
