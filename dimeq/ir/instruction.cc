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

#include "dimeq/ir/instruction.h"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace dimeq {
namespace {

struct InstructionPrinter {
  std::string operator()(const Assign& assign) const {
    return absl::StrCat(assign.target, " = ",
                        ExpressionToString(assign.value));
  }
  std::string operator()(const Return& ret) const {
    return absl::StrCat("return ", ret.value);
  }
  std::string operator()(const Jump& jump) const {
    return absl::StrCat("jump ", jump.target);
  }
  std::string operator()(const Branch& branch) const {
    return absl::StrFormat("branch %s, %d, %d", branch.cond,
                           branch.true_target, branch.false_target);
  }
};

}  // namespace

std::string Instruction::ToString() const {
  return std::visit(InstructionPrinter(), body_);
}

std::ostream& operator<<(std::ostream& out, const Instruction& instruction) {
  return out << instruction.ToString();
}

}  // namespace dimeq
