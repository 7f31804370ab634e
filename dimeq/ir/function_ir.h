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

#ifndef DIMEQ_IR_FUNCTION_IR_H_
#define DIMEQ_IR_FUNCTION_IR_H_

#include <stdint.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "dimeq/ir/expression.h"
#include "dimeq/ir/instruction.h"
#include "dimeq/ir/name_uniquer.h"
#include "dimeq/ir/type.h"

namespace dimeq {

// Resolved signature of a call-like instruction, consumed by lowering.
struct CallSignature {
  Type return_type;
  std::vector<Type> arg_types;

  std::string ToString() const;
};

// Variable name -> static type.
using TypeMap = absl::flat_hash_map<std::string, Type>;

// Instruction unique id -> signature of the call-like expression it holds. An
// empty optional means the instruction needs no signature.
using CallTypeMap = absl::flat_hash_map<int64_t, std::optional<CallSignature>>;

// A basic block: a label and a straight-line list of instructions.
class Block {
 public:
  explicit Block(int64_t label) : label_(label) {}

  int64_t label() const { return label_; }

  const std::vector<Instruction>& instructions() const {
    return instructions_;
  }
  void AddInstruction(Instruction instruction) {
    instructions_.push_back(std::move(instruction));
  }
  void set_instructions(std::vector<Instruction> instructions) {
    instructions_ = std::move(instructions);
  }

  std::string ToString(const TypeMap* types = nullptr) const;

 private:
  int64_t label_;
  std::vector<Instruction> instructions_;
};

// The IR of one function: its blocks in storage order together with the type
// map and call-type map produced by type inference. Passes mutate it in place.
class FunctionIr {
 public:
  class Builder;

  explicit FunctionIr(std::string_view name) : name_(name) {}

  FunctionIr(const FunctionIr&) = delete;
  FunctionIr& operator=(const FunctionIr&) = delete;

  const std::string& name() const { return name_; }

  const std::vector<Block>& blocks() const { return blocks_; }
  std::vector<Block>& mutable_blocks() { return blocks_; }

  // Appends an empty block. The returned reference is invalidated by the next
  // call to AddBlock.
  Block& AddBlock(int64_t label);

  // Returns the block with the given label or nullptr.
  const Block* FindBlock(int64_t label) const;

  const TypeMap& type_map() const { return type_map_; }
  const CallTypeMap& call_types() const { return call_types_; }
  CallTypeMap& mutable_call_types() { return call_types_; }

  // Returns the type of `variable` or nullptr if it has none.
  const Type* FindType(std::string_view variable) const;

  // Returns the type of `variable`. CHECKs that it has one.
  const Type& GetType(std::string_view variable) const;

  // Sets the type of `variable` and reserves its name.
  void SetType(std::string_view variable, Type type);

  // Returns true if `variable` has an array type. CHECKs that it has a type.
  bool IsArray(std::string_view variable) const;

  // Creates an instruction with a fresh unique id. The instruction is not
  // added to any block.
  Instruction CreateInstruction(Instruction::Body body);

  // Returns a fresh variable name starting with `prefix`.
  std::string GetUniqueVariableName(std::string_view prefix) {
    return name_uniquer_.GetUniqueName(prefix);
  }

  int64_t instruction_count() const;

  std::string ToString() const;

 private:
  std::string name_;
  std::vector<Block> blocks_;
  TypeMap type_map_;
  CallTypeMap call_types_;
  NameUniquer name_uniquer_;
  int64_t next_unique_id_ = 0;
};

// Builds a FunctionIr block by block. Every variable defined through the
// builder gets its type registered.
//
//   FunctionIr::Builder b("add");
//   b.StartBlock(0);
//   b.AddParameter("a", Type::MakeArray(F64, 1));
//   b.AddParameter("b", Type::MakeArray(F64, 1));
//   b.AddBinaryOp("c", Type::MakeArray(F64, 1), "+", "a", "b");
//   b.AddReturn("c");
//   std::unique_ptr<FunctionIr> function = b.Build();
class FunctionIr::Builder {
 public:
  explicit Builder(std::string_view name)
      : function_(std::make_unique<FunctionIr>(name)) {}

  // Starts a new block. Instructions added afterwards go to it.
  Builder& StartBlock(int64_t label);

  // Adds `name = arg(i, name=name)` where i counts the parameters added so far.
  const Instruction& AddParameter(std::string_view name, Type type);

  // Adds `target = value` and sets the type of `target`.
  const Instruction& AddAssign(std::string_view target, Type type,
                               Expression value);

  // Adds `target = global(name: value)` typed as a module or function.
  const Instruction& AddGlobal(std::string_view target, GlobalValue value);

  const Instruction& AddConstant(std::string_view target, int64_t value);
  const Instruction& AddConstantTuple(std::string_view target,
                                      std::vector<int64_t> values);
  // Builds a tuple of integer scalars.
  const Instruction& AddBuildTuple(std::string_view target,
                                   std::vector<std::string> items);
  const Instruction& AddGetAttr(std::string_view target, Type type,
                                std::string_view value, std::string_view attr);
  const Instruction& AddCall(std::string_view target, Type type,
                             std::string_view func,
                             std::vector<std::string> args);
  const Instruction& AddBinaryOp(std::string_view target, Type type,
                                 std::string_view fn, std::string_view lhs,
                                 std::string_view rhs);

  const Instruction& AddReturn(std::string_view value);
  const Instruction& AddJump(int64_t target);
  const Instruction& AddBranch(std::string_view cond, int64_t true_target,
                               int64_t false_target);

  // Registers a type for a variable that is not defined by the builder.
  void SetType(std::string_view variable, Type type) {
    function_->SetType(variable, std::move(type));
  }

  std::unique_ptr<FunctionIr> Build();

 private:
  const Instruction& Add(Instruction::Body body);

  std::unique_ptr<FunctionIr> function_;
  int64_t parameter_count_ = 0;
};

}  // namespace dimeq

#endif  // DIMEQ_IR_FUNCTION_IR_H_
