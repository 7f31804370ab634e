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

#include "dimeq/analysis/symbol_tables.h"

#include <algorithm>
#include <type_traits>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace dimeq {
namespace {

template <typename Container>
std::vector<std::string> SortedKeys(const Container& container) {
  std::vector<std::string> keys;
  keys.reserve(container.size());
  for (const auto& entry : container) {
    if constexpr (std::is_same_v<typename Container::value_type,
                                 std::string>) {
      keys.push_back(entry);
    } else {
      keys.push_back(entry.first);
    }
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

}  // namespace

SymbolTables::SymbolTables(const FunctionIr* function,
                           std::string_view array_module_name)
    : function_(function), array_module_name_(array_module_name) {}

void SymbolTables::Observe(const Assign& assign) {
  const std::string& lhs = assign.target;
  if (const auto* global = std::get_if<Global>(&assign.value)) {
    if (global->value.kind() == GlobalValue::Kind::kUfunc) {
      map_calls_.insert(lhs);
    } else if (global->value.kind() == GlobalValue::Kind::kModule &&
               global->value.name() == array_module_name_) {
      array_module_globals_.insert(lhs);
    }
  } else if (const auto* getattr = std::get_if<GetAttr>(&assign.value)) {
    if (IsArrayModule(getattr->value)) {
      array_module_calls_[lhs] = getattr->attr;
    } else if (function_->IsArray(getattr->value)) {
      array_attr_calls_[lhs] = ArrayAttrCall{getattr->attr, getattr->value};
    }
  } else if (const auto* tuple = std::get_if<BuildTuple>(&assign.value)) {
    std::vector<DimSize> items;
    items.reserve(tuple->items.size());
    for (const std::string& item : tuple->items) {
      items.push_back(DimSize::Variable(item));
    }
    tuples_[lhs] = std::move(items);
  } else if (const auto* constant = std::get_if<Const>(&assign.value)) {
    if (const auto* values =
            std::get_if<std::vector<int64_t>>(&constant->value)) {
      std::vector<DimSize> items;
      items.reserve(values->size());
      for (int64_t value : *values) {
        items.push_back(DimSize::Constant(value));
      }
      tuples_[lhs] = std::move(items);
    }
  }
}

const std::string* SymbolTables::FindArrayModuleCall(
    std::string_view variable) const {
  auto it = array_module_calls_.find(variable);
  return it == array_module_calls_.end() ? nullptr : &it->second;
}

const ArrayAttrCall* SymbolTables::FindArrayAttrCall(
    std::string_view variable) const {
  auto it = array_attr_calls_.find(variable);
  return it == array_attr_calls_.end() ? nullptr : &it->second;
}

const std::vector<DimSize>* SymbolTables::FindTuple(
    std::string_view variable) const {
  auto it = tuples_.find(variable);
  return it == tuples_.end() ? nullptr : &it->second;
}

std::string SymbolTables::ToString() const {
  std::string out;
  absl::StrAppend(&out, "array module globals: [",
                  absl::StrJoin(SortedKeys(array_module_globals_), ", "),
                  "]\n");
  absl::StrAppend(&out, "map calls: [",
                  absl::StrJoin(SortedKeys(map_calls_), ", "), "]\n");
  absl::StrAppend(&out, "array module calls:\n");
  for (const std::string& name : SortedKeys(array_module_calls_)) {
    absl::StrAppend(&out, "  ", name, ": ", array_module_calls_.at(name),
                    "\n");
  }
  absl::StrAppend(&out, "array attr calls:\n");
  for (const std::string& name : SortedKeys(array_attr_calls_)) {
    const ArrayAttrCall& call = array_attr_calls_.at(name);
    absl::StrAppend(&out, "  ", name, ": (", call.method, ", ", call.receiver,
                    ")\n");
  }
  absl::StrAppend(&out, "tuple table:\n");
  for (const std::string& name : SortedKeys(tuples_)) {
    absl::StrAppend(&out, "  ", name, ": ", DimSizesToString(tuples_.at(name)),
                    "\n");
  }
  return out;
}

}  // namespace dimeq
