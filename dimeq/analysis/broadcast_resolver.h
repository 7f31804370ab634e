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

#ifndef DIMEQ_ANALYSIS_BROADCAST_RESOLVER_H_
#define DIMEQ_ANALYSIS_BROADCAST_RESOLVER_H_

#include <string>

#include "absl/types/span.h"

#include "dimeq/analysis/equivalence_class.h"
#include "dimeq/analysis/equivalence_class_registry.h"
#include "dimeq/analysis/shape_table.h"
#include "dimeq/ir/function_ir.h"

namespace dimeq {

// Applies the NumPy broadcasting rule to the shapes of a set of operands and
// records every dimension equality it implies as a class merge.
//
// Shapes are aligned at their trailing dimension; missing leading dimensions
// and non-array operands count as kSizeOneClass. In each dimension the result
// is the operands' common class: size-one classes are compatible with
// anything, and two distinct classes must be equal for the operation to be
// legal, so they are merged. A dimension involving kUnknownClass has no
// provable size and yields kUnknownClass.
//
// See https://numpy.org/doc/stable/user/basics.broadcasting.html
class BroadcastResolver {
 public:
  // All arguments must outlive the resolver.
  BroadcastResolver(const FunctionIr* function, const ShapeTable* shapes,
                    EquivalenceClassRegistry* registry)
      : function_(function), shapes_(shapes), registry_(registry) {}

  // Returns the broadcast shape of `operands`. At least one operand must be
  // an array with a recorded shape.
  ShapeVector Resolve(absl::Span<const std::string> operands);

 private:
  const FunctionIr* function_;
  const ShapeTable* shapes_;
  EquivalenceClassRegistry* registry_;
};

}  // namespace dimeq

#endif  // DIMEQ_ANALYSIS_BROADCAST_RESOLVER_H_
