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

#include "dimeq/analysis/broadcast_resolver.h"

#include <algorithm>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/str_join.h"

namespace dimeq {

ShapeVector BroadcastResolver::Resolve(absl::Span<const std::string> operands) {
  CHECK(absl::c_any_of(operands,
                       [&](const std::string& operand) {
                         return function_->IsArray(operand);
                       }))
      << "Broadcast without array operand: " << absl::StrJoin(operands, ", ");

  std::vector<ShapeVector> shapes;
  shapes.reserve(operands.size());
  size_t rank = 0;
  for (const std::string& operand : operands) {
    if (function_->IsArray(operand)) {
      shapes.push_back(shapes_->Lookup(operand));
    } else {
      shapes.emplace_back();
    }
    rank = std::max(rank, shapes.back().size());
  }
  for (ShapeVector& shape : shapes) {
    shape.insert(shape.begin(), rank - shape.size(), kSizeOneClass);
  }

  ShapeVector result(rank, kUnknownClass);
  for (size_t i = 0; i < rank; ++i) {
    EquivalenceClass c = shapes[0][i];
    for (size_t j = 1; j < shapes.size(); ++j) {
      // Merges rename classes in the shape table only; keep `shapes` and the
      // dimensions already resolved in `result` in sync with the rename.
      EquivalenceClass e = shapes[j][i];
      if (e == kSizeOneClass || e == c) {
        continue;
      }
      if (c == kSizeOneClass) {
        c = e;
      } else if (c == kUnknownClass || e == kUnknownClass) {
        c = kUnknownClass;
      } else {
        EquivalenceClass merged = registry_->Merge(c, e);
        auto renamed = [&](EquivalenceClass x) { return x == c || x == e; };
        for (ShapeVector& shape : shapes) {
          absl::c_replace_if(shape, renamed, merged);
        }
        absl::c_replace_if(result, renamed, merged);
        c = merged;
      }
    }
    result[i] = c;
  }
  VLOG(3) << "Broadcast of (" << absl::StrJoin(operands, ", ")
          << ") = " << ShapeVectorToString(result);
  return result;
}

}  // namespace dimeq
