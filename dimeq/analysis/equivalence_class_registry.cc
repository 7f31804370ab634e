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

#include "dimeq/analysis/equivalence_class_registry.h"

#include <algorithm>
#include <utility>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

namespace dimeq {

EquivalenceClassRegistry::EquivalenceClassRegistry(ShapeTable* shapes)
    : shapes_(shapes) {
  CHECK(shapes_ != nullptr);
  class_sizes_[kSizeOneClass] = {DimSize::Constant(1)};
}

EquivalenceClass EquivalenceClassRegistry::Merge(EquivalenceClass c1,
                                                 EquivalenceClass c2) {
  CHECK(c1 != kUnknownClass && c2 != kUnknownClass)
      << "Cannot merge unknown classes: " << c1 << ", " << c2;
  CHECK(c1 != kSizeOneClass && c2 != kSizeOneClass)
      << "Cannot merge the size-one class: " << c1 << ", " << c2;
  if (c1 == c2) {
    return c1;
  }

  EquivalenceClass merged = Allocate();
  shapes_->ReplaceClasses(c1, c2, merged);

  std::vector<DimSize> sizes;
  for (EquivalenceClass c : {c1, c2}) {
    auto it = class_sizes_.find(c);
    if (it == class_sizes_.end()) {
      continue;
    }
    sizes.insert(sizes.end(), std::make_move_iterator(it->second.begin()),
                 std::make_move_iterator(it->second.end()));
    class_sizes_.erase(it);
  }
  if (!sizes.empty()) {
    class_sizes_[merged] = std::move(sizes);
  }
  VLOG(2) << "Merged classes " << c1 << " and " << c2 << " into " << merged;
  return merged;
}

bool EquivalenceClassRegistry::HasSizes(EquivalenceClass c) const {
  auto it = class_sizes_.find(c);
  return it != class_sizes_.end() && !it->second.empty();
}

absl::Span<const DimSize> EquivalenceClassRegistry::Sizes(
    EquivalenceClass c) const {
  auto it = class_sizes_.find(c);
  CHECK(it != class_sizes_.end() && !it->second.empty())
      << "Class " << c << " has no size";
  return it->second;
}

void EquivalenceClassRegistry::SetSizes(EquivalenceClass c,
                                        std::vector<DimSize> sizes) {
  CHECK_NE(c, kUnknownClass);
  class_sizes_[c] = std::move(sizes);
}

std::string EquivalenceClassRegistry::ToString() const {
  std::vector<EquivalenceClass> classes;
  classes.reserve(class_sizes_.size());
  for (const auto& [c, sizes] : class_sizes_) {
    classes.push_back(c);
  }
  std::sort(classes.begin(), classes.end());

  std::string out;
  for (EquivalenceClass c : classes) {
    absl::StrAppend(&out, c, ": ", DimSizesToString(class_sizes_.at(c)), "\n");
  }
  return out;
}

}  // namespace dimeq
