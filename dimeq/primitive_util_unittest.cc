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

#include "dimeq/primitive_util.h"

#include "gtest/gtest.h"

namespace dimeq {
namespace {

TEST(PrimitiveUtilTest, IntegralTypes) {
  EXPECT_TRUE(primitive_util::IsSignedIntegralType(S32));
  EXPECT_FALSE(primitive_util::IsSignedIntegralType(U32));
  EXPECT_TRUE(primitive_util::IsUnsignedIntegralType(U64));
  EXPECT_TRUE(primitive_util::IsIntegralType(S8));
  EXPECT_TRUE(primitive_util::IsIntegralType(U16));
  EXPECT_FALSE(primitive_util::IsIntegralType(PRED));
  EXPECT_FALSE(primitive_util::IsIntegralType(F64));
  EXPECT_FALSE(primitive_util::IsIntegralType(C64));
}

TEST(PrimitiveUtilTest, LowercasePrimitiveTypeName) {
  EXPECT_EQ(primitive_util::LowercasePrimitiveTypeName(PRED), "pred");
  EXPECT_EQ(primitive_util::LowercasePrimitiveTypeName(S64), "s64");
  EXPECT_EQ(primitive_util::LowercasePrimitiveTypeName(F32), "f32");
  EXPECT_EQ(primitive_util::LowercasePrimitiveTypeName(C128), "c128");
}

}  // namespace
}  // namespace dimeq
