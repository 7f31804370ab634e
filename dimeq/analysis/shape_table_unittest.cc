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

#include "dimeq/analysis/shape_table.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace dimeq {
namespace {

using ::testing::ElementsAre;
using ::testing::Pointee;

TEST(ShapeTableTest, RecordAndLookup) {
  ShapeTable table;
  EXPECT_FALSE(table.Contains("A"));
  ASSERT_TRUE(table.Record("A", {1, 2}).ok());
  EXPECT_TRUE(table.Contains("A"));
  EXPECT_THAT(table.Lookup("A"), ElementsAre(1, 2));
  EXPECT_EQ(table.size(), 1);
}

TEST(ShapeTableTest, RecordingTheSameShapeAgainIsAccepted) {
  ShapeTable table;
  ASSERT_TRUE(table.Record("A", {1, 2}).ok());
  table.SetSizes("A", {DimSize::Variable("n"), DimSize::Variable("m")});
  EXPECT_TRUE(table.Record("A", {1, 2}).ok());
  EXPECT_THAT(table.Lookup("A"), ElementsAre(1, 2));
  EXPECT_NE(table.FindSizes("A"), nullptr);
}

TEST(ShapeTableTest, ConflictingShapeDowngradesToUnknown) {
  ShapeTable table;
  ASSERT_TRUE(table.Record("A", {1, 2}).ok());
  table.SetSizes("A", {DimSize::Variable("n"), DimSize::Variable("m")});

  absl::Status status = table.Record("A", {1, 3});
  EXPECT_EQ(status.code(), absl::StatusCode::kFailedPrecondition);
  EXPECT_THAT(table.Lookup("A"), ElementsAre(kUnknownClass, kUnknownClass));
  EXPECT_EQ(table.FindSizes("A"), nullptr);

  // Once unknown, any further shape conflicts again.
  EXPECT_FALSE(table.Record("A", {1, 2}).ok());
  EXPECT_THAT(table.Lookup("A"), ElementsAre(kUnknownClass, kUnknownClass));
}

TEST(ShapeTableTest, ReplaceClassesRewritesEveryShape) {
  ShapeTable table;
  ASSERT_TRUE(table.Record("A", {1, 2, 3}).ok());
  ASSERT_TRUE(table.Record("B", {2, 2}).ok());
  table.ReplaceClasses(1, 2, 7);
  EXPECT_THAT(table.Lookup("A"), ElementsAre(7, 7, 3));
  EXPECT_THAT(table.Lookup("B"), ElementsAre(7, 7));
}

TEST(ShapeTableTest, Sizes) {
  ShapeTable table;
  EXPECT_EQ(table.FindSizes("A"), nullptr);
  table.SetSizes("A", {DimSize::Constant(3)});
  EXPECT_THAT(table.FindSizes("A"), Pointee(ElementsAre(DimSize::Constant(3))));
}

TEST(ShapeTableTest, ToString) {
  ShapeTable table;
  ASSERT_TRUE(table.Record("b", {2}).ok());
  ASSERT_TRUE(table.Record("a", {1, -1}).ok());
  table.SetSizes("b", {DimSize::Variable("bsize0.1")});
  EXPECT_EQ(table.ToString(), "a: [1, -1]\nb: [2] sizes=[bsize0.1]\n");
}

TEST(ShapeTableDeathTest, LookupOfUnrecordedVariableDies) {
  ShapeTable table;
  EXPECT_DEATH(table.Lookup("A"), "No shape recorded for variable A");
}

}  // namespace
}  // namespace dimeq
