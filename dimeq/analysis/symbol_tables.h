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

#ifndef DIMEQ_ANALYSIS_SYMBOL_TABLES_H_
#define DIMEQ_ANALYSIS_SYMBOL_TABLES_H_

#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"

#include "dimeq/analysis/equivalence_class.h"
#include "dimeq/ir/function_ir.h"

namespace dimeq {

// A method looked up on an array, e.g. `t = A.sum` is {"sum", "A"}. Calling
// `t(x)` then means `sum(A, x)`.
struct ArrayAttrCall {
  std::string method;
  std::string receiver;
};

// Side tables that let the analysis recognize array operations spelled as
// several generic instructions. `np = global(numpy)`, `f = getattr(np, zeros)`
// and `B = call f(s)` together mean `B = zeros(s)`; these tables connect the
// three.
class SymbolTables {
 public:
  // `function` must outlive this object.
  SymbolTables(const FunctionIr* function, std::string_view array_module_name);

  // Records what `assign` defines, if it is relevant. Assignments are observed
  // in the order the analysis visits them.
  void Observe(const Assign& assign);

  // True if `variable` holds the array-math module.
  bool IsArrayModule(std::string_view variable) const {
    return array_module_globals_.contains(variable);
  }

  // True if calling `variable` applies a function elementwise.
  bool IsMapCall(std::string_view variable) const {
    return map_calls_.contains(variable);
  }

  // Returns the name of the array-module function held by `variable`.
  const std::string* FindArrayModuleCall(std::string_view variable) const;

  // Returns the array method held by `variable`.
  const ArrayAttrCall* FindArrayAttrCall(std::string_view variable) const;

  // Returns the elements of the statically built tuple held by `variable`.
  const std::vector<DimSize>* FindTuple(std::string_view variable) const;

  // Dumps all tables, sorted by variable name.
  std::string ToString() const;

 private:
  const FunctionIr* function_;  // not owned
  std::string array_module_name_;

  absl::flat_hash_set<std::string> array_module_globals_;
  absl::flat_hash_set<std::string> map_calls_;
  absl::flat_hash_map<std::string, std::string> array_module_calls_;
  absl::flat_hash_map<std::string, ArrayAttrCall> array_attr_calls_;
  absl::flat_hash_map<std::string, std::vector<DimSize>> tuples_;
};

}  // namespace dimeq

#endif  // DIMEQ_ANALYSIS_SYMBOL_TABLES_H_
