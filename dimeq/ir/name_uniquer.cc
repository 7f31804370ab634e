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

#include "dimeq/ir/name_uniquer.h"

#include "absl/strings/str_cat.h"

namespace dimeq {

NameUniquer::NameUniquer(std::string_view separator)
    : separator_(separator) {}

std::string NameUniquer::GetUniqueName(std::string_view prefix) {
  std::string name;
  do {
    name = absl::StrCat(prefix, separator_, next_id_++);
  } while (used_names_.contains(name));
  used_names_.insert(name);
  return name;
}

void NameUniquer::Reserve(std::string_view name) {
  used_names_.insert(std::string(name));
}

}  // namespace dimeq
