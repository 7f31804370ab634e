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

#include "dimeq/analysis/size_materializer.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

namespace dimeq {

std::vector<Instruction> SizeMaterializer::Materialize(
    std::string_view array, absl::Span<const EquivalenceClass> shape) {
  std::vector<Instruction> generated;
  std::vector<DimSize> sizes;
  sizes.reserve(shape.size());
  for (int64_t i = 0; i < static_cast<int64_t>(shape.size()); ++i) {
    EquivalenceClass c = shape[i];
    if (c != kUnknownClass && registry_->HasSizes(c)) {
      sizes.push_back(registry_->Sizes(c).front());
      continue;
    }
    std::string size_var =
        EmitSizeFetch(array, shape.size(), i, &generated);
    DimSize size = DimSize::Variable(std::move(size_var));
    if (c != kUnknownClass) {
      registry_->SetSizes(c, {size});
    }
    sizes.push_back(std::move(size));
  }
  VLOG(2) << "Sizes of " << array << ": " << DimSizesToString(sizes);
  shapes_->SetSizes(array, std::move(sizes));
  return generated;
}

std::string SizeMaterializer::EmitSizeFetch(std::string_view array,
                                            int64_t rank, int64_t dim,
                                            std::vector<Instruction>* out) {
  std::string attr_var =
      function_->GetUniqueVariableName(absl::StrCat(array, "_sh_attr", dim));
  function_->SetType(attr_var, Type::MakeUniTuple(S64, rank));
  out->push_back(function_->CreateInstruction(
      Assign{attr_var, GetAttr{std::string(array), "shape"}}));

  std::string const_var =
      function_->GetUniqueVariableName(absl::StrCat("$const", array, dim));
  function_->SetType(const_var, Type::MakeScalar(S64));
  out->push_back(
      function_->CreateInstruction(Assign{const_var, Const{dim}}));

  std::string size_var =
      function_->GetUniqueVariableName(absl::StrCat(array, "size", dim));
  function_->SetType(size_var, Type::MakeScalar(S64));
  Instruction getitem = function_->CreateInstruction(
      Assign{size_var, StaticGetItem{attr_var, dim, const_var}});
  function_->mutable_call_types()[getitem.unique_id()] = std::nullopt;
  out->push_back(std::move(getitem));
  return size_var;
}

}  // namespace dimeq
