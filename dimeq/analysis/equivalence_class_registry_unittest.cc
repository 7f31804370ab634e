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

#include "dimeq/analysis/equivalence_class_registry.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "dimeq/analysis/shape_table.h"

namespace dimeq {
namespace {

using ::testing::ElementsAre;

class EquivalenceClassRegistryTest : public ::testing::Test {
 protected:
  EquivalenceClassRegistryTest() : registry_(&shapes_) {}

  ShapeTable shapes_;
  EquivalenceClassRegistry registry_;
};

TEST_F(EquivalenceClassRegistryTest, AllocatesIncreasingPositiveClasses) {
  EXPECT_EQ(registry_.Allocate(), 1);
  EXPECT_EQ(registry_.Allocate(), 2);
  EXPECT_EQ(registry_.Allocate(), 3);
  EXPECT_EQ(registry_.next_class(), 4);
}

TEST_F(EquivalenceClassRegistryTest, SizeOneClassHasConstantSize) {
  ASSERT_TRUE(registry_.HasSizes(kSizeOneClass));
  EXPECT_THAT(registry_.Sizes(kSizeOneClass),
              ElementsAre(DimSize::Constant(1)));
}

TEST_F(EquivalenceClassRegistryTest, MergeOfEqualClassesIsNoOp) {
  EquivalenceClass a = registry_.Allocate();
  ASSERT_TRUE(shapes_.Record("A", {a}).ok());
  EXPECT_EQ(registry_.Merge(a, a), a);
  EXPECT_EQ(registry_.next_class(), a + 1);
  EXPECT_THAT(shapes_.Lookup("A"), ElementsAre(a));
}

TEST_F(EquivalenceClassRegistryTest, MergeRenamesRecordedShapes) {
  EquivalenceClass a = registry_.Allocate();
  EquivalenceClass b = registry_.Allocate();
  EquivalenceClass other = registry_.Allocate();
  ASSERT_TRUE(shapes_.Record("A", {a, other}).ok());
  ASSERT_TRUE(shapes_.Record("B", {b, b}).ok());
  registry_.SetSizes(a, {DimSize::Variable("n")});
  registry_.SetSizes(b, {DimSize::Variable("m")});

  EquivalenceClass merged = registry_.Merge(a, b);
  EXPECT_NE(merged, a);
  EXPECT_NE(merged, b);
  EXPECT_THAT(shapes_.Lookup("A"), ElementsAre(merged, other));
  EXPECT_THAT(shapes_.Lookup("B"), ElementsAre(merged, merged));
  EXPECT_THAT(registry_.Sizes(merged),
              ElementsAre(DimSize::Variable("n"), DimSize::Variable("m")));
  EXPECT_FALSE(registry_.HasSizes(a));
  EXPECT_FALSE(registry_.HasSizes(b));
}

TEST_F(EquivalenceClassRegistryTest, MergeIsTransitive) {
  EquivalenceClass a = registry_.Allocate();
  EquivalenceClass b = registry_.Allocate();
  EquivalenceClass c = registry_.Allocate();
  ASSERT_TRUE(shapes_.Record("A", {a}).ok());
  ASSERT_TRUE(shapes_.Record("B", {b}).ok());
  ASSERT_TRUE(shapes_.Record("C", {c}).ok());
  registry_.SetSizes(a, {DimSize::Variable("a0")});
  registry_.SetSizes(b, {DimSize::Variable("b0")});
  registry_.SetSizes(c, {DimSize::Variable("c0"), DimSize::Constant(4)});

  EquivalenceClass ab = registry_.Merge(a, b);
  EquivalenceClass abc = registry_.Merge(shapes_.Lookup("B")[0], c);

  EXPECT_EQ(shapes_.Lookup("A")[0], abc);
  EXPECT_EQ(shapes_.Lookup("B")[0], abc);
  EXPECT_EQ(shapes_.Lookup("C")[0], abc);
  EXPECT_FALSE(registry_.HasSizes(ab));
  EXPECT_THAT(registry_.Sizes(abc),
              ElementsAre(DimSize::Variable("a0"), DimSize::Variable("b0"),
                          DimSize::Variable("c0"), DimSize::Constant(4)));
}

TEST_F(EquivalenceClassRegistryTest, MergeWithoutSizesHasNoSizes) {
  EquivalenceClass a = registry_.Allocate();
  EquivalenceClass b = registry_.Allocate();
  EXPECT_FALSE(registry_.HasSizes(registry_.Merge(a, b)));
}

TEST_F(EquivalenceClassRegistryTest, ToStringIsSortedByClass) {
  EquivalenceClass a = registry_.Allocate();
  registry_.SetSizes(a, {DimSize::Variable("n")});
  EXPECT_EQ(registry_.ToString(), "0: [1]\n1: [n]\n");
}

using EquivalenceClassRegistryDeathTest = EquivalenceClassRegistryTest;

TEST_F(EquivalenceClassRegistryDeathTest, MergeOfUnknownClassDies) {
  EquivalenceClass a = registry_.Allocate();
  EXPECT_DEATH(registry_.Merge(a, kUnknownClass), "unknown classes");
}

TEST_F(EquivalenceClassRegistryDeathTest, MergeOfSizeOneClassDies) {
  EquivalenceClass a = registry_.Allocate();
  EXPECT_DEATH(registry_.Merge(kSizeOneClass, a), "size-one class");
}

TEST_F(EquivalenceClassRegistryDeathTest, SizesOfClassWithoutSizesDies) {
  EquivalenceClass a = registry_.Allocate();
  EXPECT_DEATH(registry_.Sizes(a), "has no size");
}

}  // namespace
}  // namespace dimeq
