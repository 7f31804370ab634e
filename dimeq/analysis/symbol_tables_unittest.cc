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

#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "dimeq/ir/function_ir.h"

namespace dimeq {
namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::Pointee;

void ObserveAll(const FunctionIr& function, SymbolTables* symbols) {
  for (const Block& block : function.blocks()) {
    for (const Instruction& instruction : block.instructions()) {
      if (const Assign* assign = instruction.assign()) {
        symbols->Observe(*assign);
      }
    }
  }
}

TEST(SymbolTablesTest, RecognizesArrayModuleAndItsFunctions) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  builder.AddGlobal("$np", GlobalValue::Module("numpy"));
  builder.AddGlobal("$math", GlobalValue::Module("math"));
  builder.AddGetAttr("$zeros", Type::MakeFunction("zeros"), "$np", "zeros");
  builder.AddGetAttr("$sqrt", Type::MakeFunction("sqrt"), "$math", "sqrt");
  std::unique_ptr<FunctionIr> function = builder.Build();

  SymbolTables symbols(function.get(), "numpy");
  ObserveAll(*function, &symbols);

  EXPECT_TRUE(symbols.IsArrayModule("$np"));
  EXPECT_FALSE(symbols.IsArrayModule("$math"));
  EXPECT_THAT(symbols.FindArrayModuleCall("$zeros"), Pointee(Eq("zeros")));
  EXPECT_EQ(symbols.FindArrayModuleCall("$sqrt"), nullptr);
  EXPECT_EQ(symbols.FindArrayAttrCall("$sqrt"), nullptr);
}

TEST(SymbolTablesTest, HonorsArrayModuleName) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddGlobal("$np", GlobalValue::Module("numpy"));
  builder.AddGlobal("$cp", GlobalValue::Module("cupy"));
  std::unique_ptr<FunctionIr> function = builder.Build();

  SymbolTables symbols(function.get(), "cupy");
  ObserveAll(*function, &symbols);

  EXPECT_FALSE(symbols.IsArrayModule("$np"));
  EXPECT_TRUE(symbols.IsArrayModule("$cp"));
}

TEST(SymbolTablesTest, RecognizesMethodsOfArrays) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  builder.AddGetAttr("$sum", Type::MakeFunction("sum"), "a", "sum");
  std::unique_ptr<FunctionIr> function = builder.Build();

  SymbolTables symbols(function.get(), "numpy");
  ObserveAll(*function, &symbols);

  const ArrayAttrCall* call = symbols.FindArrayAttrCall("$sum");
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->method, "sum");
  EXPECT_EQ(call->receiver, "a");
}

TEST(SymbolTablesTest, RecognizesMapCalls) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddGlobal("$vf", GlobalValue::Ufunc("vectorized_f"));
  builder.AddGlobal("$len", GlobalValue::Object("len"));
  std::unique_ptr<FunctionIr> function = builder.Build();

  SymbolTables symbols(function.get(), "numpy");
  ObserveAll(*function, &symbols);

  EXPECT_TRUE(symbols.IsMapCall("$vf"));
  EXPECT_FALSE(symbols.IsMapCall("$len"));
}

TEST(SymbolTablesTest, RecordsStaticTuples) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("n", Type::MakeScalar(S64));
  builder.AddParameter("m", Type::MakeScalar(S64));
  builder.AddBuildTuple("$shape", {"n", "m"});
  builder.AddConstantTuple("$const_shape", {3, 1});
  builder.AddConstant("$c", 3);
  std::unique_ptr<FunctionIr> function = builder.Build();

  SymbolTables symbols(function.get(), "numpy");
  ObserveAll(*function, &symbols);

  EXPECT_THAT(symbols.FindTuple("$shape"),
              Pointee(ElementsAre(DimSize::Variable("n"),
                                  DimSize::Variable("m"))));
  EXPECT_THAT(symbols.FindTuple("$const_shape"),
              Pointee(ElementsAre(DimSize::Constant(3),
                                  DimSize::Constant(1))));
  EXPECT_EQ(symbols.FindTuple("$c"), nullptr);
  EXPECT_EQ(symbols.FindTuple("n"), nullptr);
}

TEST(SymbolTablesTest, ToString) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("a", Type::MakeArray(F64, 1));
  builder.AddGlobal("$np", GlobalValue::Module("numpy"));
  builder.AddGetAttr("$dot", Type::MakeFunction("dot"), "$np", "dot");
  builder.AddGetAttr("$sum", Type::MakeFunction("sum"), "a", "sum");
  builder.AddConstantTuple("$shape", {2, 3});
  std::unique_ptr<FunctionIr> function = builder.Build();

  SymbolTables symbols(function.get(), "numpy");
  ObserveAll(*function, &symbols);

  EXPECT_EQ(symbols.ToString(),
            "array module globals: [$np]\n"
            "map calls: []\n"
            "array module calls:\n"
            "  $dot: dot\n"
            "array attr calls:\n"
            "  $sum: (sum, a)\n"
            "tuple table:\n"
            "  $shape: [2, 3]\n");
}

}  // namespace
}  // namespace dimeq
