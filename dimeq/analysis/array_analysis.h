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

#ifndef DIMEQ_ANALYSIS_ARRAY_ANALYSIS_H_
#define DIMEQ_ANALYSIS_ARRAY_ANALYSIS_H_

#include <stdint.h>

#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/statusor.h"

#include "dimeq/analysis/broadcast_resolver.h"
#include "dimeq/analysis/equivalence_class.h"
#include "dimeq/analysis/equivalence_class_registry.h"
#include "dimeq/analysis/shape_inference.h"
#include "dimeq/analysis/shape_table.h"
#include "dimeq/analysis/size_materializer.h"
#include "dimeq/analysis/symbol_tables.h"
#include "dimeq/array_analysis_flags.h"
#include "dimeq/dimeq.pb.h"
#include "dimeq/ir/function_ir.h"

namespace dimeq {

// Infers, for every array variable of a function, an equivalence class per
// dimension such that dimensions of the same class have the same length at
// runtime. Every dimension of every array also gets a size value; where no
// value of the right class exists yet, instructions reading it from the
// array's shape are inserted after the array's definition.
//
// Blocks are visited once each, in storage order, ignoring control flow. A
// variable assigned shapes that disagree in different blocks ends up with
// kUnknownClass in all dimensions. Constructs without a shape rule give
// unknown dimensions as well; the analysis never fails on them.
//
// An ArrayAnalysis object owns all state of the analysis of one function.
// Running it again over the same function re-analyzes only the instructions
// it has not seen. That memory lives in the object: a new ArrayAnalysis over
// an already analyzed function does not recognize the size fetches an
// earlier one inserted, and inserts its own fetches next to them.
class ArrayAnalysis {
 public:
  // `function` must outlive the analysis.
  explicit ArrayAnalysis(
      FunctionIr* function,
      ArrayAnalysisOptions options = GetArrayAnalysisOptionsFromFlags());

  ArrayAnalysis(const ArrayAnalysis&) = delete;
  ArrayAnalysis& operator=(const ArrayAnalysis&) = delete;

  std::string_view name() const { return "array-analysis"; }

  // Analyzes all blocks of the function. Returns true if instructions were
  // inserted.
  absl::StatusOr<bool> Run();

  const ShapeTable& shape_table() const { return shape_table_; }
  const EquivalenceClassRegistry& class_registry() const { return registry_; }
  const SymbolTables& symbol_tables() const { return symbols_; }

  // Returns the classes of `array`. CHECKs that it was analyzed.
  const ShapeVector& GetShape(std::string_view array) const {
    return shape_table_.Lookup(array);
  }

  // Returns the size values chosen for the dimensions of `array`, or nullptr
  // if it has none (not analyzed, or downgraded by a conflict).
  const std::vector<DimSize>* GetSizes(std::string_view array) const {
    return shape_table_.FindSizes(array);
  }

  // Dumps all tables of the analysis.
  std::string ToString() const;

 private:
  // Analyzes the instructions of `block` and splices the generated ones into
  // it. Returns true if instructions were inserted.
  bool RunOnBlock(Block& block);

  // Analyzes one assignment. Returns the instructions to insert after it.
  std::vector<Instruction> AnalyzeAssign(int64_t unique_id,
                                         const Assign& assign);

  FunctionIr* function_;
  ArrayAnalysisOptions options_;
  ShapeTable shape_table_;
  EquivalenceClassRegistry registry_;
  SymbolTables symbols_;
  BroadcastResolver broadcast_;
  ShapeInference inference_;
  SizeMaterializer materializer_;

  // Unique ids of the array assignments analyzed so far.
  absl::flat_hash_set<int64_t> analyzed_instructions_;
};

}  // namespace dimeq

#endif  // DIMEQ_ANALYSIS_ARRAY_ANALYSIS_H_
