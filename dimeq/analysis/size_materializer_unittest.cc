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

#include "dimeq/analysis/size_materializer.h"

#include <memory>
#include <variant>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace dimeq {
namespace {

using ::testing::ElementsAre;
using ::testing::Pointee;

class SizeMaterializerTest : public ::testing::Test {
 protected:
  SizeMaterializerTest() : registry_(&shapes_) {
    FunctionIr::Builder builder("f");
    builder.StartBlock(0);
    builder.AddParameter("a", Type::MakeArray(F64, 2));
    builder.AddParameter("b", Type::MakeArray(F64, 2));
    function_ = builder.Build();
    materializer_ = std::make_unique<SizeMaterializer>(function_.get(),
                                                       &shapes_, &registry_);
  }

  ShapeTable shapes_;
  EquivalenceClassRegistry registry_;
  std::unique_ptr<FunctionIr> function_;
  std::unique_ptr<SizeMaterializer> materializer_;
};

TEST_F(SizeMaterializerTest, FetchesSizesFromShapeAttribute) {
  EquivalenceClass c = registry_.Allocate();

  std::vector<Instruction> generated =
      materializer_->Materialize("a", {c, kSizeOneClass});
  ASSERT_EQ(generated.size(), 3);

  const Assign* attr = generated[0].assign();
  ASSERT_NE(attr, nullptr);
  EXPECT_EQ(attr->target, "a_sh_attr0.0");
  const auto* getattr = std::get_if<GetAttr>(&attr->value);
  ASSERT_NE(getattr, nullptr);
  EXPECT_EQ(getattr->value, "a");
  EXPECT_EQ(getattr->attr, "shape");
  EXPECT_EQ(function_->GetType("a_sh_attr0.0"), Type::MakeUniTuple(S64, 2));

  const Assign* index = generated[1].assign();
  ASSERT_NE(index, nullptr);
  EXPECT_EQ(index->target, "$consta0.1");
  EXPECT_EQ(function_->GetType("$consta0.1"), Type::MakeScalar(S64));

  const Assign* size = generated[2].assign();
  ASSERT_NE(size, nullptr);
  EXPECT_EQ(size->target, "asize0.2");
  const auto* getitem = std::get_if<StaticGetItem>(&size->value);
  ASSERT_NE(getitem, nullptr);
  EXPECT_EQ(getitem->value, "a_sh_attr0.0");
  EXPECT_EQ(getitem->index, 0);
  EXPECT_EQ(getitem->index_var, "$consta0.1");
  EXPECT_EQ(function_->GetType("asize0.2"), Type::MakeScalar(S64));

  // The getitem is a builtin that needs no call signature.
  auto it = function_->call_types().find(generated[2].unique_id());
  ASSERT_NE(it, function_->call_types().end());
  EXPECT_FALSE(it->second.has_value());

  EXPECT_THAT(registry_.Sizes(c), ElementsAre(DimSize::Variable("asize0.2")));
  EXPECT_THAT(shapes_.FindSizes("a"),
              Pointee(ElementsAre(DimSize::Variable("asize0.2"),
                                  DimSize::Constant(1))));
}

TEST_F(SizeMaterializerTest, ReusesExistingClassSize) {
  EquivalenceClass c = registry_.Allocate();
  EquivalenceClass d = registry_.Allocate();
  registry_.SetSizes(c, {DimSize::Variable("n"), DimSize::Variable("m")});
  registry_.SetSizes(d, {DimSize::Constant(4)});

  EXPECT_TRUE(materializer_->Materialize("a", {c, d}).empty());
  EXPECT_THAT(shapes_.FindSizes("a"),
              Pointee(ElementsAre(DimSize::Variable("n"),
                                  DimSize::Constant(4))));
}

TEST_F(SizeMaterializerTest, SecondArrayOfSameClassReusesFetchedSize) {
  EquivalenceClass c = registry_.Allocate();
  EquivalenceClass d = registry_.Allocate();

  EXPECT_EQ(materializer_->Materialize("a", {c, d}).size(), 6);
  EXPECT_TRUE(materializer_->Materialize("b", {c, d}).empty());
  EXPECT_EQ(*shapes_.FindSizes("b"), *shapes_.FindSizes("a"));
}

TEST_F(SizeMaterializerTest, UnknownClassIsAlwaysFetchedAndNeverShared) {
  EXPECT_EQ(materializer_->Materialize("a", {kUnknownClass}).size(), 3);
  EXPECT_EQ(materializer_->Materialize("b", {kUnknownClass}).size(), 3);
  EXPECT_FALSE(registry_.HasSizes(kUnknownClass));
  EXPECT_NE(*shapes_.FindSizes("a"), *shapes_.FindSizes("b"));
}

TEST_F(SizeMaterializerTest, GeneratedInstructionsHaveFreshIds) {
  Instruction existing = function_->blocks()[0].instructions().back();
  std::vector<Instruction> generated =
      materializer_->Materialize("a", {registry_.Allocate()});
  ASSERT_EQ(generated.size(), 3);
  EXPECT_GT(generated[0].unique_id(), existing.unique_id());
  EXPECT_LT(generated[0].unique_id(), generated[1].unique_id());
  EXPECT_LT(generated[1].unique_id(), generated[2].unique_id());
}

}  // namespace
}  // namespace dimeq
