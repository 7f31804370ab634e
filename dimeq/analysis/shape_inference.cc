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

#include "dimeq/analysis/shape_inference.h"

#include <algorithm>
#include <initializer_list>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"

#include "xla/tsl/platform/errors.h"
#include "xla/tsl/platform/statusor.h"

namespace dimeq {
namespace {

bool IsOneOf(std::string_view name,
             std::initializer_list<std::string_view> names) {
  return absl::c_linear_search(names, name);
}

}  // namespace

class ShapeInference::ExpressionVisitor {
 public:
  explicit ExpressionVisitor(ShapeInference* inference)
      : inference_(inference) {}

  absl::StatusOr<ShapeVector> operator()(const Arg& arg) const {
    const FunctionIr& function = *inference_->function_;
    if (!function.IsArray(arg.name)) {
      return absl::UnimplementedError(
          absl::StrCat("Parameter ", arg.name, " is not an array"));
    }
    if (inference_->shapes_->Contains(arg.name)) {
      return inference_->shapes_->Lookup(arg.name);
    }
    ShapeVector shape;
    int64_t rank = function.GetType(arg.name).rank();
    for (int64_t i = 0; i < rank; ++i) {
      shape.push_back(inference_->registry_->Allocate());
    }
    TF_RETURN_IF_ERROR(inference_->shapes_->Record(arg.name, shape));
    return shape;
  }

  absl::StatusOr<ShapeVector> operator()(const Global& global) const {
    return Unsupported("global", global.name);
  }

  absl::StatusOr<ShapeVector> operator()(const Const& constant) const {
    return Unsupported("const", ConstValueToString(constant.value));
  }

  absl::StatusOr<ShapeVector> operator()(const VarRef& ref) const {
    return inference_->OperandShape(ref.name);
  }

  absl::StatusOr<ShapeVector> operator()(const UnaryOp& op) const {
    if (!inference_->unary_operators_.contains(op.fn)) {
      return Unsupported("unary operator", op.fn);
    }
    return inference_->OperandShape(op.value);
  }

  absl::StatusOr<ShapeVector> operator()(const BinaryOp& op) const {
    if (!inference_->binary_operators_.contains(op.fn)) {
      return Unsupported("binary operator", op.fn);
    }
    return inference_->Broadcast({op.lhs, op.rhs});
  }

  absl::StatusOr<ShapeVector> operator()(const InplaceBinaryOp& op) const {
    if (!inference_->binary_operators_.contains(op.immutable_fn)) {
      return Unsupported("in-place operator", op.fn);
    }
    return inference_->Broadcast({op.lhs, op.rhs});
  }

  absl::StatusOr<ShapeVector> operator()(const ArrayExpr& expr) const {
    return inference_->Broadcast(expr.ListVariables());
  }

  absl::StatusOr<ShapeVector> operator()(const Cast& cast) const {
    return inference_->OperandShape(cast.value);
  }

  absl::StatusOr<ShapeVector> operator()(const Call& call) const {
    const SymbolTables& symbols = *inference_->symbols_;
    if (symbols.IsMapCall(call.func)) {
      if (call.args.empty()) {
        return absl::InvalidArgumentError(
            absl::StrCat("Map call ", call.func, " has no arguments"));
      }
      return inference_->OperandShape(call.args[0]);
    }
    if (const std::string* name = symbols.FindArrayModuleCall(call.func)) {
      return inference_->InferNamedCall(*name, call.args);
    }
    if (const ArrayAttrCall* attr_call = symbols.FindArrayAttrCall(call.func)) {
      std::vector<std::string> args;
      args.reserve(call.args.size() + 1);
      args.push_back(attr_call->receiver);
      args.insert(args.end(), call.args.begin(), call.args.end());
      return inference_->InferNamedCall(attr_call->method, args);
    }
    return Unsupported("call to", call.func);
  }

  absl::StatusOr<ShapeVector> operator()(const GetAttr& getattr) const {
    if (getattr.attr == "T" && inference_->function_->IsArray(getattr.value)) {
      return inference_->InferNamedCall("transpose", {getattr.value});
    }
    return Unsupported("attribute", getattr.attr);
  }

  absl::StatusOr<ShapeVector> operator()(const BuildTuple& tuple) const {
    return Unsupported("build_tuple", absl::StrJoin(tuple.items, ", "));
  }

  absl::StatusOr<ShapeVector> operator()(const StaticGetItem& getitem) const {
    return Unsupported("static_getitem of", getitem.value);
  }

 private:
  static absl::Status Unsupported(std::string_view what,
                                  std::string_view detail) {
    return absl::UnimplementedError(
        absl::StrCat("No shape rule for ", what, " ", detail));
  }

  ShapeInference* inference_;
};

ShapeInference::ShapeInference(const FunctionIr* function,
                               const ArrayAnalysisOptions& options,
                               ShapeTable* shapes,
                               EquivalenceClassRegistry* registry,
                               const SymbolTables* symbols,
                               BroadcastResolver* broadcast)
    : function_(function),
      shapes_(shapes),
      registry_(registry),
      symbols_(symbols),
      broadcast_(broadcast),
      ufunc_names_(options.ufunc_names().begin(), options.ufunc_names().end()),
      unary_operators_(options.unary_operators().begin(),
                       options.unary_operators().end()),
      binary_operators_(options.binary_operators().begin(),
                        options.binary_operators().end()) {}

absl::StatusOr<ShapeVector> ShapeInference::InferShape(
    const Expression& expression) {
  return std::visit(ExpressionVisitor(this), expression);
}

absl::StatusOr<ShapeVector> ShapeInference::OperandShape(
    std::string_view variable) const {
  if (!function_->IsArray(variable)) {
    return absl::InvalidArgumentError(
        absl::StrCat(variable, " is not an array"));
  }
  if (!shapes_->Contains(variable)) {
    return absl::NotFoundError(
        absl::StrCat("Shape of ", variable, " is not known yet"));
  }
  return shapes_->Lookup(variable);
}

absl::StatusOr<ShapeVector> ShapeInference::Broadcast(
    absl::Span<const std::string> operands) {
  bool has_array = false;
  for (const std::string& operand : operands) {
    if (!function_->IsArray(operand)) {
      continue;
    }
    has_array = true;
    if (!shapes_->Contains(operand)) {
      return absl::NotFoundError(
          absl::StrCat("Shape of ", operand, " is not known yet"));
    }
  }
  if (!has_array) {
    return absl::InvalidArgumentError(absl::StrCat(
        "No array among broadcast operands ", absl::StrJoin(operands, ", ")));
  }
  return broadcast_->Resolve(operands);
}

absl::StatusOr<ShapeVector> ShapeInference::InferNamedCall(
    std::string_view name, absl::Span<const std::string> args) {
  VLOG(3) << "Array call " << name << "(" << absl::StrJoin(args, ", ") << ")";
  if (args.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Array call ", name, " has no arguments"));
  }
  if (name == "transpose") {
    if (args.size() != 1) {
      return absl::UnimplementedError(
          "transpose with explicit axes is not supported");
    }
    TF_ASSIGN_OR_RETURN(ShapeVector shape, OperandShape(args[0]));
    std::reverse(shape.begin(), shape.end());
    return shape;
  }
  if (IsOneOf(name, {"empty", "zeros", "ones"})) {
    return ShapeFromShapeArgument(args[0]);
  }
  if (IsOneOf(name, {"empty_like", "zeros_like", "ones_like"})) {
    return OperandShape(args[0]);
  }
  if (name == "reshape") {
    if (args.size() == 2) {
      return ShapeFromShapeArgument(args[1]);
    }
    // A.reshape(n, m, ...) passes each dimension as its own argument.
    ShapeVector shape;
    for (const std::string& arg : args.subspan(1)) {
      if (!function_->GetType(arg).IsInteger()) {
        return absl::UnimplementedError(
            absl::StrCat("reshape dimension ", arg, " is not an integer"));
      }
      shape.push_back(ClassForDimSize(DimSize::Variable(arg)));
    }
    return shape;
  }
  if (name == "dot") {
    return InferDot(args);
  }
  if (ufunc_names_.contains(name)) {
    return Broadcast(args);
  }
  return absl::UnimplementedError(
      absl::StrCat("Unknown array call: ", name));
}

absl::StatusOr<ShapeVector> ShapeInference::InferDot(
    absl::Span<const std::string> args) {
  // See https://numpy.org/doc/stable/reference/generated/numpy.dot.html. The
  // last dimension of the first operand is contracted with the second to last
  // dimension of the second operand, or with its only dimension if it is 1D.
  // An optional third argument is the output buffer.
  if (args.size() != 2 && args.size() != 3) {
    return absl::InvalidArgumentError(
        absl::StrFormat("dot takes 2 or 3 arguments, got %d", args.size()));
  }
  TF_ASSIGN_OR_RETURN(ShapeVector lhs, OperandShape(args[0]));
  TF_ASSIGN_OR_RETURN(ShapeVector rhs, OperandShape(args[1]));
  const size_t lhs_rank = lhs.size();
  const size_t rhs_rank = rhs.size();
  if (lhs_rank == 0 || rhs_rank == 0) {
    return absl::UnimplementedError("dot of 0D arrays is not supported");
  }

  EquivalenceClass c1 = lhs[lhs_rank - 1];
  EquivalenceClass c2 = rhs_rank == 1 ? rhs[0] : rhs[rhs_rank - 2];
  if (c1 != kUnknownClass && c2 != kUnknownClass && c1 != kSizeOneClass &&
      c2 != kSizeOneClass) {
    registry_->Merge(c1, c2);
    // The merge renames classes in the table; read the operands again.
    lhs = shapes_->Lookup(args[0]);
    rhs = shapes_->Lookup(args[1]);
  }

  ShapeVector result(lhs.begin(), lhs.end() - 1);
  if (rhs_rank > 1) {
    result.insert(result.end(), rhs.begin(), rhs.end() - 2);
    result.push_back(rhs[rhs_rank - 1]);
  }
  return result;
}

absl::StatusOr<ShapeVector> ShapeInference::ShapeFromShapeArgument(
    std::string_view shape_arg) {
  const Type& type = function_->GetType(shape_arg);
  if (type.IsInteger()) {
    return ShapeVector{
        ClassForDimSize(DimSize::Variable(std::string(shape_arg)))};
  }
  if (!type.IsUniTuple()) {
    return absl::UnimplementedError(absl::StrCat(
        "Shape argument ", shape_arg, " has unsupported type ",
        type.ToString()));
  }
  // Tuples not built in this function (e.g. parameters) give classes without
  // sizes; they are materialized from the created array.
  const std::vector<DimSize>* elements = symbols_->FindTuple(shape_arg);
  ShapeVector shape;
  for (int64_t i = 0; i < type.tuple_count(); ++i) {
    if (elements != nullptr && i < static_cast<int64_t>(elements->size())) {
      shape.push_back(ClassForDimSize((*elements)[i]));
    } else {
      shape.push_back(registry_->Allocate());
    }
  }
  return shape;
}

EquivalenceClass ShapeInference::ClassForDimSize(const DimSize& size) {
  if (size.is_constant()) {
    if (size.constant() == 1) {
      return kSizeOneClass;
    }
    if (size.constant() < 0) {
      // A -1 placeholder of reshape; its length is only known at runtime.
      return registry_->Allocate();
    }
  }
  EquivalenceClass c = registry_->Allocate();
  registry_->SetSizes(c, {size});
  return c;
}

}  // namespace dimeq
