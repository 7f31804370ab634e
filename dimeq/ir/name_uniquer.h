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

#ifndef DIMEQ_IR_NAME_UNIQUER_H_
#define DIMEQ_IR_NAME_UNIQUER_H_

#include <stdint.h>

#include <string>
#include <string_view>

#include "absl/container/flat_hash_set.h"

namespace dimeq {

// Generates variable names that are unique within one function. A generated
// name is the requested prefix followed by the separator and a number, e.g.
// "asize0.3".
class NameUniquer {
 public:
  explicit NameUniquer(std::string_view separator = ".");

  // Returns a name that starts with `prefix` and has neither been returned
  // before nor reserved.
  std::string GetUniqueName(std::string_view prefix);

  // Marks `name` as taken so that GetUniqueName never returns it.
  void Reserve(std::string_view name);

  bool IsTaken(std::string_view name) const {
    return used_names_.contains(name);
  }

 private:
  std::string separator_;
  int64_t next_id_ = 0;
  absl::flat_hash_set<std::string> used_names_;
};

}  // namespace dimeq

#endif  // DIMEQ_IR_NAME_UNIQUER_H_
