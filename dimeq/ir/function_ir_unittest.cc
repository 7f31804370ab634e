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

#include <stdint.h>

#include <memory>
#include <variant>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace dimeq {
namespace {

using ::testing::ElementsAre;

TEST(ExpressionTest, ToString) {
  EXPECT_EQ(ExpressionToString(Arg{0, "a"}), "arg(0, name=a)");
  EXPECT_EQ(ExpressionToString(Global{"np", GlobalValue::Module("numpy")}),
            "global(np: <module 'numpy'>)");
  EXPECT_EQ(ExpressionToString(Const{int64_t{3}}), "const(int, 3)");
  EXPECT_EQ(ExpressionToString(Const{std::vector<int64_t>{2, 3}}),
            "const(tuple, (2, 3))");
  EXPECT_EQ(ExpressionToString(Const{std::vector<int64_t>{2}}),
            "const(tuple, (2,))");
  EXPECT_EQ(ExpressionToString(BinaryOp{"+", "a", "b"}), "a + b");
  EXPECT_EQ(ExpressionToString(UnaryOp{"-", "a"}), "unary(fn=-, value=a)");
  EXPECT_EQ(ExpressionToString(Call{"$zeros", {"n"}, {{"dtype", "$f8"}}}),
            "call $zeros(n, kws=[dtype=$f8])");
  EXPECT_EQ(ExpressionToString(GetAttr{"a", "shape"}),
            "getattr(value=a, attr=shape)");
  EXPECT_EQ(ExpressionToString(StaticGetItem{"s", 1, "$c"}),
            "static_getitem(value=s, index=1, index_var=$c)");
}

TEST(ExpressionTest, ArrayExprListsEachVariableOnce) {
  // (a * b) + sqrt(a, 2)
  ArrayExpr expr{ArrayExprNode::Operation(
      "+", {ArrayExprNode::Operation("*", {ArrayExprNode::Variable("a"),
                                           ArrayExprNode::Variable("b")}),
            ArrayExprNode::Operation("sqrt", {ArrayExprNode::Variable("a"),
                                              ArrayExprNode::Constant(2)})})};
  EXPECT_THAT(expr.ListVariables(), ElementsAre("a", "b"));
  EXPECT_EQ(ExpressionToString(expr), "arrayexpr(((a * b) + sqrt(a, 2)))");
}

TEST(InstructionTest, ToString) {
  EXPECT_EQ(Instruction(0, Return{"c"}).ToString(), "return c");
  EXPECT_EQ(Instruction(1, Jump{4}).ToString(), "jump 4");
  EXPECT_EQ(Instruction(2, Branch{"p", 1, 2}).ToString(), "branch p, 1, 2");
  Instruction assign(3, Assign{"c", VarRef{"a"}});
  ASSERT_NE(assign.assign(), nullptr);
  EXPECT_EQ(assign.ToString(), "c = a");
  EXPECT_EQ(Instruction(4, Return{"c"}).assign(), nullptr);
}

TEST(FunctionIrTest, BuilderAssignsTypesAndIds) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  int64_t a_id = builder.AddParameter("a", Type::MakeArray(F64, 2)).unique_id();
  int64_t n_id = builder.AddParameter("n", Type::MakeScalar(S64)).unique_id();
  builder.AddGlobal("$np", GlobalValue::Module("numpy"));
  builder.AddGlobal("$sin", GlobalValue::Ufunc("sin"));
  builder.StartBlock(1);
  builder.AddReturn("a");
  std::unique_ptr<FunctionIr> function = builder.Build();

  EXPECT_NE(a_id, n_id);
  EXPECT_EQ(function->instruction_count(), 5);
  ASSERT_EQ(function->blocks().size(), 2);
  EXPECT_NE(function->FindBlock(1), nullptr);
  EXPECT_EQ(function->FindBlock(7), nullptr);

  EXPECT_TRUE(function->IsArray("a"));
  EXPECT_FALSE(function->IsArray("n"));
  EXPECT_EQ(function->GetType("$np"), Type::MakeModule("numpy"));
  EXPECT_EQ(function->GetType("$sin"), Type::MakeFunction("sin"));
  EXPECT_EQ(function->FindType("b"), nullptr);

  const Assign* n = function->blocks()[0].instructions()[1].assign();
  ASSERT_NE(n, nullptr);
  const auto* arg = std::get_if<Arg>(&n->value);
  ASSERT_NE(arg, nullptr);
  EXPECT_EQ(arg->index, 1);
}

TEST(FunctionIrTest, UniqueVariableNamesAvoidExistingVariables) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("x.0", Type::MakeArray(F64, 1));
  std::unique_ptr<FunctionIr> function = builder.Build();

  EXPECT_EQ(function->GetUniqueVariableName("x"), "x.1");
  EXPECT_EQ(function->GetUniqueVariableName("y"), "y.2");
}

TEST(FunctionIrTest, ToString) {
  FunctionIr::Builder builder("add");
  builder.StartBlock(0);
  builder.AddParameter("a", Type::MakeArray(F64, 1));
  builder.AddParameter("b", Type::MakeArray(F64, 1));
  builder.AddBinaryOp("c", Type::MakeArray(F64, 1), "+", "a", "b");
  builder.AddReturn("c");
  std::unique_ptr<FunctionIr> function = builder.Build();

  EXPECT_EQ(function->ToString(),
            "function add\n"
            "label 0:\n"
            "    a = arg(0, name=a)  :: array(f64, 1d)\n"
            "    b = arg(1, name=b)  :: array(f64, 1d)\n"
            "    c = a + b  :: array(f64, 1d)\n"
            "    return c\n");
}

TEST(FunctionIrDeathTest, DuplicateBlockLabelDies) {
  FunctionIr function("f");
  function.AddBlock(0);
  EXPECT_DEATH(function.AddBlock(0), "Duplicate block label 0");
}

TEST(FunctionIrDeathTest, GetTypeOfUnknownVariableDies) {
  FunctionIr function("f");
  EXPECT_DEATH(function.GetType("a"), "No type for variable a in function f");
}

}  // namespace
}  // namespace dimeq
