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

#ifndef DIMEQ_ANALYSIS_EQUIVALENCE_CLASS_REGISTRY_H_
#define DIMEQ_ANALYSIS_EQUIVALENCE_CLASS_REGISTRY_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/types/span.h"

#include "dimeq/analysis/equivalence_class.h"
#include "dimeq/analysis/shape_table.h"

namespace dimeq {

// Allocates equivalence classes and keeps, for each class, the list of values
// known to equal its length (the class size table).
//
// Merging is eager: the two merged classes are replaced by a new one in every
// shape recorded in the ShapeTable, so shapes looked up after a merge already
// carry the merged class.
class EquivalenceClassRegistry {
 public:
  // `shapes` must outlive the registry.
  explicit EquivalenceClassRegistry(ShapeTable* shapes);

  EquivalenceClassRegistry(const EquivalenceClassRegistry&) = delete;
  EquivalenceClassRegistry& operator=(const EquivalenceClassRegistry&) =
      delete;

  // Returns a class id that has never been returned before.
  EquivalenceClass Allocate() { return next_class_++; }

  // Records that `c1` and `c2` have equal length and returns the class that
  // now stands for both. If they differ, a new class replaces both of them in
  // all shapes, and its sizes are the sizes of `c1` followed by those of `c2`.
  // Neither class may be kUnknownClass or kSizeOneClass.
  EquivalenceClass Merge(EquivalenceClass c1, EquivalenceClass c2);

  bool HasSizes(EquivalenceClass c) const;

  // Returns the sizes of `c`. CHECK-fails if it has none.
  absl::Span<const DimSize> Sizes(EquivalenceClass c) const;

  // Replaces the sizes of `c`. `c` may not be kUnknownClass.
  void SetSizes(EquivalenceClass c, std::vector<DimSize> sizes);

  // The id the next call to Allocate() returns.
  EquivalenceClass next_class() const { return next_class_; }

  // Dumps the class size table sorted by class.
  std::string ToString() const;

 private:
  ShapeTable* shapes_;  // not owned
  EquivalenceClass next_class_ = 1;
  absl::flat_hash_map<EquivalenceClass, std::vector<DimSize>> class_sizes_;
};

}  // namespace dimeq

#endif  // DIMEQ_ANALYSIS_EQUIVALENCE_CLASS_REGISTRY_H_
