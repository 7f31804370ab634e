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

#ifndef DIMEQ_IR_EXPRESSION_H_
#define DIMEQ_IR_EXPRESSION_H_

#include <stdint.h>

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace dimeq {

// The value bound by a `Global` expression.
class GlobalValue {
 public:
  enum class Kind {
    // An imported module, e.g. numpy.
    kModule,
    // A universal function object. Calls to it are elementwise maps.
    kUfunc,
    // Any other object (builtins, user functions, classes).
    kObject,
  };

  static GlobalValue Module(std::string_view name) {
    return GlobalValue(Kind::kModule, name);
  }
  static GlobalValue Ufunc(std::string_view name) {
    return GlobalValue(Kind::kUfunc, name);
  }
  static GlobalValue Object(std::string_view name) {
    return GlobalValue(Kind::kObject, name);
  }

  Kind kind() const { return kind_; }
  const std::string& name() const { return name_; }

  std::string ToString() const;

 private:
  GlobalValue(Kind kind, std::string_view name)
      : kind_(kind), name_(name) {}

  Kind kind_;
  std::string name_;
};

// Reads the function parameter at `index`.
struct Arg {
  int64_t index;
  std::string name;
};

// Loads a global or imported value.
struct Global {
  std::string name;
  GlobalValue value;
};

// Value of a `Const` expression. A vector holds a constant integer tuple.
using ConstValue =
    std::variant<std::monostate, bool, int64_t, double, std::vector<int64_t>>;

struct Const {
  ConstValue value;
};

// Copies another variable.
struct VarRef {
  std::string name;
};

struct UnaryOp {
  std::string fn;
  std::string value;
};

struct BinaryOp {
  std::string fn;
  std::string lhs;
  std::string rhs;
};

// In-place operator such as `+=`. `immutable_fn` is the equivalent
// out-of-place operator (`+`).
struct InplaceBinaryOp {
  std::string fn;
  std::string immutable_fn;
  std::string lhs;
  std::string rhs;
};

// A node of a fused elementwise expression tree.
struct ArrayExprNode {
  enum class Kind { kVariable, kConstant, kOperation };

  static ArrayExprNode Variable(std::string_view name);
  static ArrayExprNode Constant(double value);
  static ArrayExprNode Operation(std::string_view op,
                                 std::vector<ArrayExprNode> operands);

  Kind kind = Kind::kConstant;
  // Variable name for kVariable, operator for kOperation.
  std::string name;
  double constant = 0;
  std::vector<ArrayExprNode> operands;
};

// Several elementwise operations over arrays fused into one expression.
struct ArrayExpr {
  ArrayExprNode root;

  // Returns the variables referenced in the tree, each once, in order of first
  // appearance.
  std::vector<std::string> ListVariables() const;
};

// Conversion of a value to the type of the assignment target.
struct Cast {
  std::string value;
};

struct Call {
  std::string func;
  std::vector<std::string> args;
  std::vector<std::pair<std::string, std::string>> kws;
};

struct GetAttr {
  std::string value;
  std::string attr;
};

struct BuildTuple {
  std::vector<std::string> items;
};

// Indexing with a statically known index. `index_var` holds the same index
// at runtime.
struct StaticGetItem {
  std::string value;
  int64_t index;
  std::string index_var;
};

// Right-hand side of an assignment.
using Expression =
    std::variant<Arg, Global, Const, VarRef, UnaryOp, BinaryOp,
                 InplaceBinaryOp, ArrayExpr, Cast, Call, GetAttr, BuildTuple,
                 StaticGetItem>;

std::string ConstValueToString(const ConstValue& value);
std::string ArrayExprNodeToString(const ArrayExprNode& node);
std::string ExpressionToString(const Expression& expression);

}  // namespace dimeq

#endif  // DIMEQ_IR_EXPRESSION_H_
