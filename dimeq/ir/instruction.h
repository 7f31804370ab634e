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

#ifndef DIMEQ_IR_INSTRUCTION_H_
#define DIMEQ_IR_INSTRUCTION_H_

#include <stdint.h>

#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include "dimeq/ir/expression.h"

namespace dimeq {

// target = value
struct Assign {
  std::string target;
  Expression value;
};

struct Return {
  std::string value;
};

// Unconditional jump to the block labeled `target`.
struct Jump {
  int64_t target;
};

struct Branch {
  std::string cond;
  int64_t true_target;
  int64_t false_target;
};

// A statement of a block. Instructions are identified by an id that is unique
// within their function; side tables such as the call-type map are keyed on
// it.
class Instruction {
 public:
  using Body = std::variant<Assign, Return, Jump, Branch>;

  Instruction(int64_t unique_id, Body body)
      : unique_id_(unique_id), body_(std::move(body)) {}

  int64_t unique_id() const { return unique_id_; }
  const Body& body() const { return body_; }

  // Returns the assignment if this instruction is one, nullptr otherwise.
  const Assign* assign() const { return std::get_if<Assign>(&body_); }

  std::string ToString() const;

 private:
  int64_t unique_id_;
  Body body_;
};

std::ostream& operator<<(std::ostream& out, const Instruction& instruction);

}  // namespace dimeq

#endif  // DIMEQ_IR_INSTRUCTION_H_
