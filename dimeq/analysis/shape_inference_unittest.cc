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

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

#include "dimeq/array_analysis_flags.h"
#include "xla/tsl/platform/status_matchers.h"
#include "xla/tsl/platform/statusor.h"

namespace dimeq {
namespace {

using ::testing::ElementsAre;

class ShapeInferenceTest : public ::testing::Test {
 protected:
  ShapeInferenceTest()
      : options_(DefaultArrayAnalysisOptions()), registry_(&shapes_) {}

  // Takes `builder`'s function and observes all of its assignments.
  void Init(FunctionIr::Builder& builder) {
    function_ = builder.Build();
    symbols_ = std::make_unique<SymbolTables>(function_.get(),
                                              options_.array_module_name());
    for (const Block& block : function_->blocks()) {
      for (const Instruction& instruction : block.instructions()) {
        if (const Assign* assign = instruction.assign()) {
          symbols_->Observe(*assign);
        }
      }
    }
    broadcast_ = std::make_unique<BroadcastResolver>(function_.get(),
                                                     &shapes_, &registry_);
    inference_ = std::make_unique<ShapeInference>(
        function_.get(), options_, &shapes_, &registry_, symbols_.get(),
        broadcast_.get());
  }

  const Assign& FindAssign(std::string_view target) const {
    for (const Block& block : function_->blocks()) {
      for (const Instruction& instruction : block.instructions()) {
        const Assign* assign = instruction.assign();
        if (assign != nullptr && assign->target == target) {
          return *assign;
        }
      }
    }
    LOG(FATAL) << "No assignment to " << target;
  }

  absl::StatusOr<ShapeVector> Infer(std::string_view target) {
    return inference_->InferShape(FindAssign(target).value);
  }

  // Infers the shape of `target` and records it.
  ShapeVector Define(std::string_view target) {
    absl::StatusOr<ShapeVector> shape = Infer(target);
    CHECK_OK(shape.status());
    CHECK_OK(shapes_.Record(target, *shape));
    return *shape;
  }

  ArrayAnalysisOptions options_;
  ShapeTable shapes_;
  EquivalenceClassRegistry registry_;
  std::unique_ptr<FunctionIr> function_;
  std::unique_ptr<SymbolTables> symbols_;
  std::unique_ptr<BroadcastResolver> broadcast_;
  std::unique_ptr<ShapeInference> inference_;
};

// Starts a builder with the array module imported as `$np`.
FunctionIr::Builder MakeBuilder() {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddGlobal("$np", GlobalValue::Module("numpy"));
  return builder;
}

void AddArrayModuleCall(FunctionIr::Builder& builder, std::string_view target,
                        Type type, std::string_view name,
                        std::vector<std::string> args) {
  std::string func = absl::StrCat("$np_", name);
  builder.AddGetAttr(func, Type::MakeFunction(name), "$np", name);
  builder.AddCall(target, std::move(type), func, std::move(args));
}

TEST_F(ShapeInferenceTest, ParameterGetsOneClassPerDimension) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 3));
  Init(builder);

  ShapeVector a = Define("a");
  EXPECT_THAT(a, ElementsAre(1, 2, 3));
  // Parameters keep their classes when analyzed again.
  TF_ASSERT_OK_AND_ASSIGN(ShapeVector inferred_a, Infer("a"));
  EXPECT_EQ(inferred_a, a);
}

TEST_F(ShapeInferenceTest, ScalarParameterIsUnsupported) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("n", Type::MakeScalar(S64));
  Init(builder);

  EXPECT_EQ(Infer("n").status().code(), absl::StatusCode::kUnimplemented);
}

TEST_F(ShapeInferenceTest, CopiesAndCastsKeepTheShape) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  builder.AddAssign("b", Type::MakeArray(F64, 2), VarRef{"a"});
  builder.AddAssign("c", Type::MakeArray(F32, 2), Cast{"a"});
  builder.AddAssign("d", Type::MakeArray(F64, 2), UnaryOp{"-", "a"});
  Init(builder);

  ShapeVector a = Define("a");
  TF_ASSERT_OK_AND_ASSIGN(ShapeVector inferred_b, Infer("b"));
  EXPECT_EQ(inferred_b, a);
  TF_ASSERT_OK_AND_ASSIGN(ShapeVector inferred_c, Infer("c"));
  EXPECT_EQ(inferred_c, a);
  TF_ASSERT_OK_AND_ASSIGN(ShapeVector inferred_d, Infer("d"));
  EXPECT_EQ(inferred_d, a);
}

TEST_F(ShapeInferenceTest, OperandDefinedLaterIsNotFound) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddAssign("b", Type::MakeArray(F64, 1), VarRef{"a"});
  builder.SetType("a", Type::MakeArray(F64, 1));
  Init(builder);

  EXPECT_EQ(Infer("b").status().code(), absl::StatusCode::kNotFound);
}

TEST_F(ShapeInferenceTest, BinaryOperatorBroadcasts) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  builder.AddParameter("b", Type::MakeArray(F64, 1));
  builder.AddParameter("s", Type::MakeScalar(F64));
  builder.AddBinaryOp("c", Type::MakeArray(F64, 2), "+", "a", "b");
  builder.AddBinaryOp("d", Type::MakeArray(F64, 2), "*", "c", "s");
  builder.AddAssign("e", Type::MakeArray(F64, 2),
                    InplaceBinaryOp{"+=", "+", "d", "b"});
  Init(builder);

  Define("a");
  Define("b");
  ShapeVector c = Define("c");
  EXPECT_EQ(shapes_.Lookup("a"), c);
  EXPECT_THAT(shapes_.Lookup("b"), ElementsAre(c[1]));
  ShapeVector d = Define("d");
  EXPECT_EQ(d, c);
  TF_ASSERT_OK_AND_ASSIGN(ShapeVector inferred_e, Infer("e"));
  EXPECT_EQ(inferred_e, c);
}

TEST_F(ShapeInferenceTest, UnknownOperatorIsUnsupported) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  builder.AddBinaryOp("c", Type::MakeArray(F64, 2), "@", "a", "a");
  builder.AddAssign("d", Type::MakeArray(F64, 2), UnaryOp{"not", "a"});
  Init(builder);

  Define("a");
  EXPECT_EQ(Infer("c").status().code(), absl::StatusCode::kUnimplemented);
  EXPECT_EQ(Infer("d").status().code(), absl::StatusCode::kUnimplemented);
}

TEST_F(ShapeInferenceTest, ArrayExprBroadcastsAllVariables) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 1));
  builder.AddParameter("b", Type::MakeArray(F64, 1));
  builder.AddParameter("s", Type::MakeScalar(F64));
  // a + (a * b) - s
  builder.AddAssign(
      "c", Type::MakeArray(F64, 1),
      ArrayExpr{ArrayExprNode::Operation(
          "-", {ArrayExprNode::Operation(
                    "+", {ArrayExprNode::Variable("a"),
                          ArrayExprNode::Operation(
                              "*", {ArrayExprNode::Variable("a"),
                                    ArrayExprNode::Variable("b")})}),
                ArrayExprNode::Variable("s")})});
  Init(builder);

  Define("a");
  Define("b");
  ShapeVector c = Define("c");
  EXPECT_EQ(shapes_.Lookup("a"), c);
  EXPECT_EQ(shapes_.Lookup("b"), c);
}

TEST_F(ShapeInferenceTest, TransposeIsInvolution) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 3));
  builder.AddGetAttr("t", Type::MakeArray(F64, 3), "a", "T");
  AddArrayModuleCall(builder, "tt", Type::MakeArray(F64, 3), "transpose",
                     {"t"});
  Init(builder);

  ShapeVector a = Define("a");
  ShapeVector t = Define("t");
  EXPECT_THAT(t, ElementsAre(a[2], a[1], a[0]));
  TF_ASSERT_OK_AND_ASSIGN(ShapeVector inferred_tt, Infer("tt"));
  EXPECT_EQ(inferred_tt, a);
}

TEST_F(ShapeInferenceTest, TransposeWithAxesIsUnsupported) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  builder.AddConstantTuple("$axes", {1, 0});
  AddArrayModuleCall(builder, "t", Type::MakeArray(F64, 2), "transpose",
                     {"a", "$axes"});
  Init(builder);

  Define("a");
  EXPECT_EQ(Infer("t").status().code(), absl::StatusCode::kUnimplemented);
}

TEST_F(ShapeInferenceTest, DotMergesContractedDimensions) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  builder.AddParameter("b", Type::MakeArray(F64, 2));
  AddArrayModuleCall(builder, "c", Type::MakeArray(F64, 2), "dot",
                     {"a", "b"});
  Init(builder);

  ShapeVector a = Define("a");
  ShapeVector b = Define("b");
  ASSERT_NE(a[1], b[0]);

  ShapeVector c = Define("c");
  const ShapeVector& a_after = shapes_.Lookup("a");
  const ShapeVector& b_after = shapes_.Lookup("b");
  EXPECT_EQ(a_after[1], b_after[0]);
  EXPECT_NE(a_after[1], a[1]);
  EXPECT_THAT(c, ElementsAre(a[0], b[1]));
}

TEST_F(ShapeInferenceTest, DotOfMatrixAndVector) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  builder.AddParameter("v", Type::MakeArray(F64, 1));
  AddArrayModuleCall(builder, "c", Type::MakeArray(F64, 1), "dot",
                     {"a", "v"});
  Init(builder);

  ShapeVector a = Define("a");
  Define("v");
  TF_ASSERT_OK_AND_ASSIGN(ShapeVector inferred_c, Infer("c"));
  EXPECT_THAT(inferred_c, ElementsAre(a[0]));
  EXPECT_EQ(shapes_.Lookup("a")[1], shapes_.Lookup("v")[0]);
}

TEST_F(ShapeInferenceTest, DotMethodCall) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  builder.AddParameter("b", Type::MakeArray(F64, 2));
  builder.AddGetAttr("$a_dot", Type::MakeFunction("dot"), "a", "dot");
  builder.AddCall("c", Type::MakeArray(F64, 2), "$a_dot", {"b"});
  Init(builder);

  ShapeVector a = Define("a");
  ShapeVector b = Define("b");
  TF_ASSERT_OK_AND_ASSIGN(ShapeVector inferred_c, Infer("c"));
  EXPECT_THAT(inferred_c, ElementsAre(a[0], b[1]));
  EXPECT_EQ(shapes_.Lookup("a")[1], shapes_.Lookup("b")[0]);
}

TEST_F(ShapeInferenceTest, ZerosWithScalarShape) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("n", Type::MakeScalar(S64));
  AddArrayModuleCall(builder, "z", Type::MakeArray(F64, 1), "zeros", {"n"});
  Init(builder);

  ShapeVector z = Define("z");
  ASSERT_EQ(z.size(), 1);
  EXPECT_THAT(registry_.Sizes(z[0]), ElementsAre(DimSize::Variable("n")));
}

TEST_F(ShapeInferenceTest, CreationWithBuiltTupleShape) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("n", Type::MakeScalar(S64));
  builder.AddParameter("m", Type::MakeScalar(S64));
  builder.AddBuildTuple("$shape", {"n", "m"});
  AddArrayModuleCall(builder, "z", Type::MakeArray(F64, 2), "empty",
                     {"$shape"});
  Init(builder);

  ShapeVector z = Define("z");
  ASSERT_EQ(z.size(), 2);
  EXPECT_THAT(registry_.Sizes(z[0]), ElementsAre(DimSize::Variable("n")));
  EXPECT_THAT(registry_.Sizes(z[1]), ElementsAre(DimSize::Variable("m")));
}

TEST_F(ShapeInferenceTest, ConstantOneDimensionIsSizeOneClass) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddConstantTuple("$shape", {5, 1});
  AddArrayModuleCall(builder, "z", Type::MakeArray(F64, 2), "ones",
                     {"$shape"});
  Init(builder);

  ShapeVector z = Define("z");
  ASSERT_EQ(z.size(), 2);
  EXPECT_EQ(z[1], kSizeOneClass);
  EXPECT_THAT(registry_.Sizes(z[0]), ElementsAre(DimSize::Constant(5)));
}

TEST_F(ShapeInferenceTest, ShapeTupleOfUnknownOriginGetsFreshClasses) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("shape", Type::MakeUniTuple(S64, 2));
  AddArrayModuleCall(builder, "z", Type::MakeArray(F64, 2), "zeros",
                     {"shape"});
  Init(builder);

  ShapeVector z = Define("z");
  ASSERT_EQ(z.size(), 2);
  EXPECT_NE(z[0], z[1]);
  EXPECT_FALSE(registry_.HasSizes(z[0]));
  EXPECT_FALSE(registry_.HasSizes(z[1]));
}

TEST_F(ShapeInferenceTest, CreationLikeCopiesTheShape) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  AddArrayModuleCall(builder, "z", Type::MakeArray(F64, 2), "zeros_like",
                     {"a"});
  AddArrayModuleCall(builder, "e", Type::MakeArray(F64, 2), "empty_like",
                     {"a"});
  Init(builder);

  ShapeVector a = Define("a");
  TF_ASSERT_OK_AND_ASSIGN(ShapeVector inferred_z, Infer("z"));
  EXPECT_EQ(inferred_z, a);
  TF_ASSERT_OK_AND_ASSIGN(ShapeVector inferred_e, Infer("e"));
  EXPECT_EQ(inferred_e, a);
}

TEST_F(ShapeInferenceTest, ReshapeWithTuple) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 1));
  builder.AddParameter("n", Type::MakeScalar(S64));
  builder.AddConstantTuple("$shape", {-1, 4});
  builder.AddBuildTuple("$shape2", {"n", "n"});
  builder.AddGetAttr("$reshape", Type::MakeFunction("reshape"), "a",
                     "reshape");
  builder.AddCall("r", Type::MakeArray(F64, 2), "$reshape", {"$shape"});
  AddArrayModuleCall(builder, "r2", Type::MakeArray(F64, 2), "reshape",
                     {"a", "$shape2"});
  Init(builder);

  Define("a");
  ShapeVector r = Define("r");
  ASSERT_EQ(r.size(), 2);
  EXPECT_FALSE(registry_.HasSizes(r[0]));
  EXPECT_THAT(registry_.Sizes(r[1]), ElementsAre(DimSize::Constant(4)));

  ShapeVector r2 = Define("r2");
  ASSERT_EQ(r2.size(), 2);
  EXPECT_NE(r2[0], r2[1]);
  EXPECT_THAT(registry_.Sizes(r2[0]), ElementsAre(DimSize::Variable("n")));
}

TEST_F(ShapeInferenceTest, ReshapeWithSeparateDimensions) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 1));
  builder.AddParameter("n", Type::MakeScalar(S64));
  builder.AddParameter("m", Type::MakeScalar(S64));
  builder.AddGetAttr("$reshape", Type::MakeFunction("reshape"), "a",
                     "reshape");
  builder.AddCall("r", Type::MakeArray(F64, 2), "$reshape", {"n", "m"});
  Init(builder);

  Define("a");
  ShapeVector r = Define("r");
  ASSERT_EQ(r.size(), 2);
  EXPECT_THAT(registry_.Sizes(r[0]), ElementsAre(DimSize::Variable("n")));
  EXPECT_THAT(registry_.Sizes(r[1]), ElementsAre(DimSize::Variable("m")));
}

TEST_F(ShapeInferenceTest, UniversalFunctionBroadcasts) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  builder.AddParameter("b", Type::MakeArray(F64, 2));
  AddArrayModuleCall(builder, "c", Type::MakeArray(F64, 2), "arctan2",
                     {"a", "b"});
  Init(builder);

  Define("a");
  Define("b");
  ShapeVector c = Define("c");
  EXPECT_EQ(shapes_.Lookup("a"), c);
  EXPECT_EQ(shapes_.Lookup("b"), c);
}

TEST_F(ShapeInferenceTest, ExtraUniversalFunctionFromOptions) {
  options_.add_ufunc_names("erf");
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  AddArrayModuleCall(builder, "c", Type::MakeArray(F64, 2), "erf", {"a"});
  Init(builder);

  ShapeVector a = Define("a");
  TF_ASSERT_OK_AND_ASSIGN(ShapeVector inferred_c, Infer("c"));
  EXPECT_EQ(inferred_c, a);
}

TEST_F(ShapeInferenceTest, MapCallKeepsFirstArgumentShape) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  builder.AddParameter("s", Type::MakeScalar(F64));
  builder.AddGlobal("$vf", GlobalValue::Ufunc("vectorized_f"));
  builder.AddCall("c", Type::MakeArray(F64, 2), "$vf", {"a", "s"});
  Init(builder);

  ShapeVector a = Define("a");
  TF_ASSERT_OK_AND_ASSIGN(ShapeVector inferred_c, Infer("c"));
  EXPECT_EQ(inferred_c, a);
}

TEST_F(ShapeInferenceTest, UnknownCallsAreUnsupported) {
  FunctionIr::Builder builder = MakeBuilder();
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  AddArrayModuleCall(builder, "c", Type::MakeArray(F64, 1), "diagonal",
                     {"a"});
  builder.AddGlobal("$f", GlobalValue::Object("user_function"));
  builder.AddCall("d", Type::MakeArray(F64, 2), "$f", {"a"});
  builder.AddGetAttr("e", Type::MakeArray(F64, 2), "a", "real");
  Init(builder);

  Define("a");
  EXPECT_EQ(Infer("c").status().code(), absl::StatusCode::kUnimplemented);
  EXPECT_EQ(Infer("d").status().code(), absl::StatusCode::kUnimplemented);
  EXPECT_EQ(Infer("e").status().code(), absl::StatusCode::kUnimplemented);
}

}  // namespace
}  // namespace dimeq
