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

#include "dimeq/ir/expression.h"

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"

namespace dimeq {
namespace {

void CollectVariables(const ArrayExprNode& node,
                      absl::flat_hash_set<std::string>& seen,
                      std::vector<std::string>& out) {
  switch (node.kind) {
    case ArrayExprNode::Kind::kVariable:
      if (seen.insert(node.name).second) {
        out.push_back(node.name);
      }
      break;
    case ArrayExprNode::Kind::kConstant:
      break;
    case ArrayExprNode::Kind::kOperation:
      for (const ArrayExprNode& operand : node.operands) {
        CollectVariables(operand, seen, out);
      }
      break;
  }
}

struct ConstValuePrinter {
  std::string operator()(std::monostate) const { return "none, None"; }
  std::string operator()(bool value) const {
    return absl::StrCat("bool, ", value ? "True" : "False");
  }
  std::string operator()(int64_t value) const {
    return absl::StrCat("int, ", value);
  }
  std::string operator()(double value) const {
    return absl::StrCat("float, ", value);
  }
  std::string operator()(const std::vector<int64_t>& value) const {
    return absl::StrCat("tuple, (", absl::StrJoin(value, ", "),
                        value.size() == 1 ? ",)" : ")");
  }
};

struct ExpressionPrinter {
  std::string operator()(const Arg& arg) const {
    return absl::StrFormat("arg(%d, name=%s)", arg.index, arg.name);
  }
  std::string operator()(const Global& global) const {
    return absl::StrFormat("global(%s: %s)", global.name,
                           global.value.ToString());
  }
  std::string operator()(const Const& constant) const {
    return absl::StrCat("const(", ConstValueToString(constant.value), ")");
  }
  std::string operator()(const VarRef& ref) const { return ref.name; }
  std::string operator()(const UnaryOp& op) const {
    return absl::StrFormat("unary(fn=%s, value=%s)", op.fn, op.value);
  }
  std::string operator()(const BinaryOp& op) const {
    return absl::StrFormat("%s %s %s", op.lhs, op.fn, op.rhs);
  }
  std::string operator()(const InplaceBinaryOp& op) const {
    return absl::StrFormat("inplace_binop(fn=%s, immutable_fn=%s, lhs=%s, "
                           "rhs=%s)",
                           op.fn, op.immutable_fn, op.lhs, op.rhs);
  }
  std::string operator()(const ArrayExpr& expr) const {
    return absl::StrCat("arrayexpr(", ArrayExprNodeToString(expr.root), ")");
  }
  std::string operator()(const Cast& cast) const {
    return absl::StrCat("cast(value=", cast.value, ")");
  }
  std::string operator()(const Call& call) const {
    return absl::StrFormat(
        "call %s(%s, kws=[%s])", call.func, absl::StrJoin(call.args, ", "),
        absl::StrJoin(call.kws, ", ", absl::PairFormatter("=")));
  }
  std::string operator()(const GetAttr& getattr) const {
    return absl::StrFormat("getattr(value=%s, attr=%s)", getattr.value,
                           getattr.attr);
  }
  std::string operator()(const BuildTuple& tuple) const {
    return absl::StrCat("build_tuple(items=[", absl::StrJoin(tuple.items, ", "),
                        "])");
  }
  std::string operator()(const StaticGetItem& getitem) const {
    return absl::StrFormat("static_getitem(value=%s, index=%d, index_var=%s)",
                           getitem.value, getitem.index, getitem.index_var);
  }
};

}  // namespace

std::string GlobalValue::ToString() const {
  switch (kind_) {
    case Kind::kModule:
      return absl::StrCat("<module '", name_, "'>");
    case Kind::kUfunc:
      return absl::StrCat("<ufunc '", name_, "'>");
    case Kind::kObject:
      return absl::StrCat("<object '", name_, "'>");
  }
  return name_;
}

// static
ArrayExprNode ArrayExprNode::Variable(std::string_view name) {
  ArrayExprNode node;
  node.kind = Kind::kVariable;
  node.name = std::string(name);
  return node;
}

// static
ArrayExprNode ArrayExprNode::Constant(double value) {
  ArrayExprNode node;
  node.kind = Kind::kConstant;
  node.constant = value;
  return node;
}

// static
ArrayExprNode ArrayExprNode::Operation(std::string_view op,
                                       std::vector<ArrayExprNode> operands) {
  ArrayExprNode node;
  node.kind = Kind::kOperation;
  node.name = std::string(op);
  node.operands = std::move(operands);
  return node;
}

std::vector<std::string> ArrayExpr::ListVariables() const {
  absl::flat_hash_set<std::string> seen;
  std::vector<std::string> out;
  CollectVariables(root, seen, out);
  return out;
}

std::string ConstValueToString(const ConstValue& value) {
  return std::visit(ConstValuePrinter(), value);
}

std::string ArrayExprNodeToString(const ArrayExprNode& node) {
  switch (node.kind) {
    case ArrayExprNode::Kind::kVariable:
      return node.name;
    case ArrayExprNode::Kind::kConstant:
      return absl::StrCat(node.constant);
    case ArrayExprNode::Kind::kOperation:
      if (node.operands.size() == 2) {
        return absl::StrCat("(", ArrayExprNodeToString(node.operands[0]), " ",
                            node.name, " ",
                            ArrayExprNodeToString(node.operands[1]), ")");
      }
      return absl::StrCat(
          node.name, "(",
          absl::StrJoin(node.operands, ", ",
                        [](std::string* out, const ArrayExprNode& operand) {
                          absl::StrAppend(out, ArrayExprNodeToString(operand));
                        }),
          ")");
  }
  return "";
}

std::string ExpressionToString(const Expression& expression) {
  return std::visit(ExpressionPrinter(), expression);
}

}  // namespace dimeq
