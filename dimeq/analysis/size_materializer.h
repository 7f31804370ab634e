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

#ifndef DIMEQ_ANALYSIS_SIZE_MATERIALIZER_H_
#define DIMEQ_ANALYSIS_SIZE_MATERIALIZER_H_

#include <stdint.h>

#include <string>
#include <string_view>
#include <vector>

#include "absl/types/span.h"

#include "dimeq/analysis/equivalence_class.h"
#include "dimeq/analysis/equivalence_class_registry.h"
#include "dimeq/analysis/shape_table.h"
#include "dimeq/ir/function_ir.h"
#include "dimeq/ir/instruction.h"

namespace dimeq {

// Provides a runtime size value for every dimension of newly defined arrays.
//
// A dimension whose class already has a size reuses the first one. Otherwise
// the size is read from the array's shape metadata:
//
//   A_sh_attr0.1 = getattr(value=A, attr=shape)
//   $constA0.2 = const(int, 0)
//   Asize0.3 = static_getitem(value=A_sh_attr0.1, index=0,
//                             index_var=$constA0.2)
//
// and Asize0.3 becomes the size of the dimension's class, so later arrays of
// the same class need no fetch.
class SizeMaterializer {
 public:
  // All pointers must outlive this object.
  SizeMaterializer(FunctionIr* function, ShapeTable* shapes,
                   EquivalenceClassRegistry* registry)
      : function_(function), shapes_(shapes), registry_(registry) {}

  // Chooses a size for each dimension of `array`, whose classes are `shape`,
  // and records them in the shape table. Returns the instructions emitted to
  // fetch missing sizes; they must be placed right after the instruction that
  // defines `array`.
  std::vector<Instruction> Materialize(
      std::string_view array, absl::Span<const EquivalenceClass> shape);

 private:
  // Appends the instructions fetching dimension `dim` of `array` to `out` and
  // returns the variable holding the size.
  std::string EmitSizeFetch(std::string_view array, int64_t rank, int64_t dim,
                            std::vector<Instruction>* out);

  FunctionIr* function_;
  ShapeTable* shapes_;
  EquivalenceClassRegistry* registry_;
};

}  // namespace dimeq

#endif  // DIMEQ_ANALYSIS_SIZE_MATERIALIZER_H_
