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

#include "dimeq/ir/name_uniquer.h"

#include "gtest/gtest.h"

namespace dimeq {
namespace {

TEST(NameUniquerTest, AppendsIncreasingSuffix) {
  NameUniquer uniquer;
  EXPECT_EQ("asize0.0", uniquer.GetUniqueName("asize0"));
  EXPECT_EQ("asize0.1", uniquer.GetUniqueName("asize0"));
  EXPECT_EQ("b.2", uniquer.GetUniqueName("b"));
}

TEST(NameUniquerTest, SkipsReservedNames) {
  NameUniquer uniquer;
  uniquer.Reserve("x.0");
  uniquer.Reserve("x.1");
  EXPECT_TRUE(uniquer.IsTaken("x.1"));
  EXPECT_EQ("x.2", uniquer.GetUniqueName("x"));
  EXPECT_TRUE(uniquer.IsTaken("x.2"));
}

TEST(NameUniquerTest, CustomSeparator) {
  NameUniquer uniquer("__");
  EXPECT_EQ("foo__0", uniquer.GetUniqueName("foo"));
}

}  // namespace
}  // namespace dimeq
