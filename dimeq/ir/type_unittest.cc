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

#include "dimeq/ir/type.h"

#include "gtest/gtest.h"

namespace dimeq {
namespace {

TEST(TypeTest, Array) {
  Type type = Type::MakeArray(F64, 2);
  EXPECT_TRUE(type.IsArray());
  EXPECT_FALSE(type.IsInteger());
  EXPECT_EQ(type.rank(), 2);
  EXPECT_EQ(type.element_type(), F64);
  EXPECT_EQ(type.ToString(), "array(f64, 2d)");
}

TEST(TypeTest, Scalar) {
  EXPECT_TRUE(Type::MakeScalar(S64).IsInteger());
  EXPECT_TRUE(Type::MakeScalar(U8).IsInteger());
  EXPECT_FALSE(Type::MakeScalar(F32).IsInteger());
  EXPECT_FALSE(Type::MakeScalar(PRED).IsInteger());
  EXPECT_EQ(Type::MakeScalar(S64).ToString(), "s64");
}

TEST(TypeTest, UniTuple) {
  Type type = Type::MakeUniTuple(S64, 3);
  EXPECT_TRUE(type.IsUniTuple());
  EXPECT_FALSE(type.IsInteger());
  EXPECT_EQ(type.tuple_count(), 3);
  EXPECT_EQ(type.ToString(), "UniTuple(s64 x 3)");
}

TEST(TypeTest, NamedTypes) {
  EXPECT_EQ(Type::MakeModule("numpy").ToString(), "Module(numpy)");
  EXPECT_EQ(Type::MakeFunction("zeros").ToString(), "Function(zeros)");
  EXPECT_EQ(Type::MakeOpaque("list(int64)").ToString(), "list(int64)");
  EXPECT_EQ(Type().ToString(), "opaque");
  EXPECT_EQ(Type().kind(), Type::Kind::kOpaque);
}

TEST(TypeTest, Equality) {
  EXPECT_EQ(Type::MakeArray(F64, 2), Type::MakeArray(F64, 2));
  EXPECT_NE(Type::MakeArray(F64, 2), Type::MakeArray(F64, 1));
  EXPECT_NE(Type::MakeArray(F64, 2), Type::MakeArray(F32, 2));
  EXPECT_NE(Type::MakeUniTuple(S64, 2), Type::MakeArray(S64, 2));
  EXPECT_NE(Type::MakeModule("numpy"), Type::MakeFunction("numpy"));
}

TEST(TypeDeathTest, RankOfNonArrayDies) {
  EXPECT_DEATH(Type::MakeScalar(S64).rank(), "Type is not an array: s64");
}

TEST(TypeDeathTest, TupleCountOfNonTupleDies) {
  EXPECT_DEATH(Type::MakeArray(F64, 1).tuple_count(), "Type is not a tuple");
}

}  // namespace
}  // namespace dimeq
