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

#include "dimeq/analysis/broadcast_resolver.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "dimeq/analysis/equivalence_class_registry.h"
#include "dimeq/analysis/shape_table.h"
#include "dimeq/ir/function_ir.h"

namespace dimeq {
namespace {

using ::testing::ElementsAre;

class BroadcastResolverTest : public ::testing::Test {
 protected:
  BroadcastResolverTest() : registry_(&shapes_) {}

  // Builds a function whose parameters have the given ranks; rank -1 makes a
  // scalar parameter.
  void BuildFunction(
      const std::vector<std::pair<std::string, int64_t>>& params) {
    FunctionIr::Builder builder("f");
    builder.StartBlock(0);
    for (const auto& [name, rank] : params) {
      builder.AddParameter(name, rank < 0 ? Type::MakeScalar(F64)
                                          : Type::MakeArray(F64, rank));
    }
    function_ = builder.Build();
    resolver_ = std::make_unique<BroadcastResolver>(function_.get(), &shapes_,
                                                    &registry_);
  }

  // Records a shape of fresh classes for `name`.
  ShapeVector Define(const std::string& name, int64_t rank) {
    ShapeVector shape;
    for (int64_t i = 0; i < rank; ++i) {
      shape.push_back(registry_.Allocate());
    }
    EXPECT_TRUE(shapes_.Record(name, shape).ok());
    return shape;
  }

  ShapeTable shapes_;
  EquivalenceClassRegistry registry_;
  std::unique_ptr<FunctionIr> function_;
  std::unique_ptr<BroadcastResolver> resolver_;
};

TEST_F(BroadcastResolverTest, SameRankOperandsMergeEveryDimension) {
  BuildFunction({{"a", 2}, {"b", 2}});
  Define("a", 2);
  Define("b", 2);

  ShapeVector result = resolver_->Resolve({"a", "b"});
  ASSERT_EQ(result.size(), 2);
  EXPECT_NE(result[0], result[1]);
  EXPECT_EQ(shapes_.Lookup("a"), result);
  EXPECT_EQ(shapes_.Lookup("b"), result);
}

TEST_F(BroadcastResolverTest, SizeOneDimensionsAdoptTheOtherClass) {
  BuildFunction({{"a", 2}, {"b", 2}});
  EquivalenceClass five_a = registry_.Allocate();
  EquivalenceClass five_b = registry_.Allocate();
  ASSERT_TRUE(shapes_.Record("a", {five_a, kSizeOneClass}).ok());
  ASSERT_TRUE(shapes_.Record("b", {kSizeOneClass, five_b}).ok());
  EquivalenceClass next = registry_.next_class();

  EXPECT_THAT(resolver_->Resolve({"a", "b"}), ElementsAre(five_a, five_b));
  // No merge happened.
  EXPECT_EQ(registry_.next_class(), next);
}

TEST_F(BroadcastResolverTest, MissingLeadingDimensionsAreSizeOne) {
  BuildFunction({{"a", 2}, {"b", 1}});
  ShapeVector a = Define("a", 2);
  Define("b", 1);

  ShapeVector result = resolver_->Resolve({"a", "b"});
  ASSERT_EQ(result.size(), 2);
  EXPECT_EQ(result[0], a[0]);
  EXPECT_EQ(shapes_.Lookup("a"), result);
  EXPECT_THAT(shapes_.Lookup("b"), ElementsAre(result[1]));
}

TEST_F(BroadcastResolverTest, ScalarOperandsDoNotContribute) {
  BuildFunction({{"a", 2}, {"s", -1}});
  ShapeVector a = Define("a", 2);
  EquivalenceClass next = registry_.next_class();

  EXPECT_EQ(resolver_->Resolve({"s", "a"}), a);
  EXPECT_EQ(registry_.next_class(), next);
}

TEST_F(BroadcastResolverTest, UnknownDimensionIsNotMerged) {
  BuildFunction({{"a", 2}, {"b", 2}});
  EquivalenceClass a1 = registry_.Allocate();
  ASSERT_TRUE(shapes_.Record("a", {kUnknownClass, a1}).ok());
  ShapeVector b = Define("b", 2);

  ShapeVector result = resolver_->Resolve({"a", "b"});
  EXPECT_EQ(result[0], kUnknownClass);
  EXPECT_THAT(shapes_.Lookup("b"), ElementsAre(b[0], result[1]));
  EXPECT_THAT(shapes_.Lookup("a"), ElementsAre(kUnknownClass, result[1]));
}

TEST_F(BroadcastResolverTest, LaterOperandsSeeEarlierMerges) {
  BuildFunction({{"a", 1}, {"b", 1}, {"c", 1}});
  Define("a", 1);
  Define("b", 1);
  Define("c", 1);

  ShapeVector result = resolver_->Resolve({"a", "b", "c"});
  ASSERT_EQ(result.size(), 1);
  EXPECT_THAT(shapes_.Lookup("a"), ElementsAre(result[0]));
  EXPECT_THAT(shapes_.Lookup("b"), ElementsAre(result[0]));
  EXPECT_THAT(shapes_.Lookup("c"), ElementsAre(result[0]));
}

TEST_F(BroadcastResolverTest, MergeRenamesEarlierResultDimensions) {
  BuildFunction({{"a", 2}, {"b", 2}});
  EquivalenceClass x = registry_.Allocate();
  EquivalenceClass y = registry_.Allocate();
  EquivalenceClass z = registry_.Allocate();
  ASSERT_TRUE(shapes_.Record("a", {x, y}).ok());
  ASSERT_TRUE(shapes_.Record("b", {z, x}).ok());

  // Dimension 0 merges x with z and dimension 1 merges that class with y, so
  // both result dimensions end up in one class.
  ShapeVector result = resolver_->Resolve({"a", "b"});
  ASSERT_EQ(result.size(), 2);
  EXPECT_EQ(result[0], result[1]);
  EXPECT_EQ(shapes_.Lookup("a"), result);
  EXPECT_EQ(shapes_.Lookup("b"), result);
}

TEST_F(BroadcastResolverTest, MergedClassCollectsOperandSizes) {
  BuildFunction({{"a", 1}, {"b", 1}});
  ShapeVector a = Define("a", 1);
  ShapeVector b = Define("b", 1);
  registry_.SetSizes(a[0], {DimSize::Variable("n")});
  registry_.SetSizes(b[0], {DimSize::Variable("m")});

  ShapeVector result = resolver_->Resolve({"a", "b"});
  EXPECT_THAT(registry_.Sizes(result[0]),
              ElementsAre(DimSize::Variable("n"), DimSize::Variable("m")));
}

using BroadcastResolverDeathTest = BroadcastResolverTest;

TEST_F(BroadcastResolverDeathTest, NoArrayOperandDies) {
  BuildFunction({{"s", -1}, {"t", -1}});
  EXPECT_DEATH(resolver_->Resolve({"s", "t"}),
               "Broadcast without array operand");
}

}  // namespace
}  // namespace dimeq
