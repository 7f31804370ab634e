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

#include "dimeq/ir/function_ir.h"

#include <utility>

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace dimeq {

std::string CallSignature::ToString() const {
  return absl::StrCat(
      "(",
      absl::StrJoin(arg_types, ", ",
                    [](std::string* out, const Type& type) {
                      absl::StrAppend(out, type.ToString());
                    }),
      ") -> ", return_type.ToString());
}

std::string Block::ToString(const TypeMap* types) const {
  std::string out = absl::StrCat("label ", label_, ":\n");
  for (const Instruction& instruction : instructions_) {
    absl::StrAppend(&out, "    ", instruction.ToString());
    const Assign* assign = instruction.assign();
    if (types != nullptr && assign != nullptr) {
      auto it = types->find(assign->target);
      if (it != types->end()) {
        absl::StrAppend(&out, "  :: ", it->second.ToString());
      }
    }
    absl::StrAppend(&out, "\n");
  }
  return out;
}

Block& FunctionIr::AddBlock(int64_t label) {
  CHECK(FindBlock(label) == nullptr) << "Duplicate block label " << label;
  return blocks_.emplace_back(label);
}

const Block* FunctionIr::FindBlock(int64_t label) const {
  for (const Block& block : blocks_) {
    if (block.label() == label) {
      return &block;
    }
  }
  return nullptr;
}

const Type* FunctionIr::FindType(std::string_view variable) const {
  auto it = type_map_.find(variable);
  return it == type_map_.end() ? nullptr : &it->second;
}

const Type& FunctionIr::GetType(std::string_view variable) const {
  const Type* type = FindType(variable);
  CHECK(type != nullptr) << "No type for variable " << variable
                         << " in function " << name_;
  return *type;
}

void FunctionIr::SetType(std::string_view variable, Type type) {
  name_uniquer_.Reserve(variable);
  type_map_[std::string(variable)] = std::move(type);
}

bool FunctionIr::IsArray(std::string_view variable) const {
  return GetType(variable).IsArray();
}

Instruction FunctionIr::CreateInstruction(Instruction::Body body) {
  return Instruction(next_unique_id_++, std::move(body));
}

int64_t FunctionIr::instruction_count() const {
  int64_t count = 0;
  for (const Block& block : blocks_) {
    count += block.instructions().size();
  }
  return count;
}

std::string FunctionIr::ToString() const {
  std::string out = absl::StrCat("function ", name_, "\n");
  for (const Block& block : blocks_) {
    absl::StrAppend(&out, block.ToString(&type_map_));
  }
  return out;
}

FunctionIr::Builder& FunctionIr::Builder::StartBlock(int64_t label) {
  function_->AddBlock(label);
  return *this;
}

const Instruction& FunctionIr::Builder::Add(Instruction::Body body) {
  CHECK(!function_->blocks_.empty()) << "StartBlock must be called first";
  Block& block = function_->blocks_.back();
  block.AddInstruction(function_->CreateInstruction(std::move(body)));
  return block.instructions().back();
}

const Instruction& FunctionIr::Builder::AddParameter(std::string_view name,
                                                     Type type) {
  return AddAssign(name, std::move(type),
                   Arg{parameter_count_++, std::string(name)});
}

const Instruction& FunctionIr::Builder::AddAssign(std::string_view target,
                                                  Type type,
                                                  Expression value) {
  function_->SetType(target, std::move(type));
  return Add(Assign{std::string(target), std::move(value)});
}

const Instruction& FunctionIr::Builder::AddGlobal(std::string_view target,
                                                  GlobalValue value) {
  Type type = value.kind() == GlobalValue::Kind::kModule
                  ? Type::MakeModule(value.name())
                  : Type::MakeFunction(value.name());
  std::string name = value.name();
  return AddAssign(target, std::move(type),
                   Global{std::move(name), std::move(value)});
}

const Instruction& FunctionIr::Builder::AddConstant(std::string_view target,
                                                    int64_t value) {
  return AddAssign(target, Type::MakeScalar(S64), Const{value});
}

const Instruction& FunctionIr::Builder::AddConstantTuple(
    std::string_view target, std::vector<int64_t> values) {
  Type type = Type::MakeUniTuple(S64, values.size());
  return AddAssign(target, std::move(type), Const{std::move(values)});
}

const Instruction& FunctionIr::Builder::AddBuildTuple(
    std::string_view target, std::vector<std::string> items) {
  Type type = Type::MakeUniTuple(S64, items.size());
  return AddAssign(target, std::move(type), BuildTuple{std::move(items)});
}

const Instruction& FunctionIr::Builder::AddGetAttr(std::string_view target,
                                                   Type type,
                                                   std::string_view value,
                                                   std::string_view attr) {
  return AddAssign(target, std::move(type),
                   GetAttr{std::string(value), std::string(attr)});
}

const Instruction& FunctionIr::Builder::AddCall(
    std::string_view target, Type type, std::string_view func,
    std::vector<std::string> args) {
  return AddAssign(target, std::move(type),
                   Call{std::string(func), std::move(args), {}});
}

const Instruction& FunctionIr::Builder::AddBinaryOp(std::string_view target,
                                                    Type type,
                                                    std::string_view fn,
                                                    std::string_view lhs,
                                                    std::string_view rhs) {
  return AddAssign(
      target, std::move(type),
      BinaryOp{std::string(fn), std::string(lhs), std::string(rhs)});
}

const Instruction& FunctionIr::Builder::AddReturn(std::string_view value) {
  return Add(Return{std::string(value)});
}

const Instruction& FunctionIr::Builder::AddJump(int64_t target) {
  return Add(Jump{target});
}

const Instruction& FunctionIr::Builder::AddBranch(std::string_view cond,
                                                  int64_t true_target,
                                                  int64_t false_target) {
  return Add(Branch{std::string(cond), true_target, false_target});
}

std::unique_ptr<FunctionIr> FunctionIr::Builder::Build() {
  return std::move(function_);
}

}  // namespace dimeq
