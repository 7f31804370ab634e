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

#ifndef DIMEQ_ANALYSIS_SHAPE_TABLE_H_
#define DIMEQ_ANALYSIS_SHAPE_TABLE_H_

#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"

#include "dimeq/analysis/equivalence_class.h"

namespace dimeq {

// Maps each array variable to the equivalence classes of its dimensions, and
// to the size values chosen for those dimensions.
//
// Blocks are analyzed in storage order without regard to control flow, so a
// variable may be recorded once per block that assigns it. Shapes that agree
// are kept; shapes that disagree downgrade the variable to all-unknown for
// the rest of the analysis.
class ShapeTable {
 public:
  bool Contains(std::string_view variable) const {
    return shapes_.contains(variable);
  }

  // Returns the recorded shape of `variable`. CHECK-fails if none was
  // recorded. The reference is invalidated by Record() and by class merges;
  // copy it to keep it.
  const ShapeVector& Lookup(std::string_view variable) const;

  // Records the shape of `variable`. Returns a FailedPrecondition error if a
  // different shape was recorded before; the variable's shape is then replaced
  // by kUnknownClass in every dimension and its sizes are dropped.
  absl::Status Record(std::string_view variable, ShapeVector shape);

  // Rewrites every occurrence of `c1` or `c2` in every recorded shape to
  // `replacement`.
  void ReplaceClasses(EquivalenceClass c1, EquivalenceClass c2,
                      EquivalenceClass replacement);

  // Sets the per-dimension size values of `variable`.
  void SetSizes(std::string_view variable, std::vector<DimSize> sizes);

  // Returns the size values of `variable` or nullptr.
  const std::vector<DimSize>* FindSizes(std::string_view variable) const;

  int64_t size() const { return shapes_.size(); }

  // Dumps all shapes and sizes, sorted by variable name.
  std::string ToString() const;

 private:
  absl::flat_hash_map<std::string, ShapeVector> shapes_;
  absl::flat_hash_map<std::string, std::vector<DimSize>> sizes_;
};

}  // namespace dimeq

#endif  // DIMEQ_ANALYSIS_SHAPE_TABLE_H_
