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

#include "dimeq/parse_flags_from_env.h"

#include <stdint.h>
#include <stdlib.h>

#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace dimeq {
namespace {

constexpr char kEnvVar[] = "DIMEQ_TEST_FLAGS";

class ParseFlagsFromEnvTest : public ::testing::Test {
 protected:
  void SetUp() override { ResetFlagsFromEnvForTesting(kEnvVar); }

  void SetEnv(const char* value) {
    ASSERT_EQ(setenv(kEnvVar, value, /*overwrite=*/1), 0);
  }

  bool simple_ = false;
  int32_t int_flag_ = 1;
  std::string with_value_;
  std::string embedded_quotes_;
  std::string single_quoted_;
  std::string double_quoted_;
  std::vector<tsl::Flag> flag_list_ = {
      tsl::Flag("simple", &simple_, ""),
      tsl::Flag("int_flag", &int_flag_, ""),
      tsl::Flag("with_value", &with_value_, ""),
      tsl::Flag("embedded_quotes", &embedded_quotes_, ""),
      tsl::Flag("single_quoted", &single_quoted_, ""),
      tsl::Flag("double_quoted", &double_quoted_, ""),
  };
};

TEST_F(ParseFlagsFromEnvTest, Basic) {
  SetEnv(
      "--simple "
      "--int_flag=3 "
      "--with_value=a_value "
      "--embedded_quotes=single'double\" "
      "--single_quoted='single quoted \\\\ \n \"' "
      "--double_quoted=\"double quoted \\\\ \n '\\\"\" ");
  ParseFlagsFromEnvAndDieIfUnknown(kEnvVar, flag_list_);

  EXPECT_TRUE(simple_);
  EXPECT_EQ(int_flag_, 3);
  EXPECT_EQ(with_value_, "a_value");
  EXPECT_EQ(embedded_quotes_, "single'double\"");
  EXPECT_EQ(single_quoted_, "single quoted \\\\ \n \"");
  EXPECT_EQ(double_quoted_, "double quoted \\ \n '\"");
}

TEST_F(ParseFlagsFromEnvTest, UnsetVariableLeavesFlags) {
  ASSERT_EQ(unsetenv(kEnvVar), 0);
  ParseFlagsFromEnvAndDieIfUnknown(kEnvVar, flag_list_);
  EXPECT_FALSE(simple_);
  EXPECT_EQ(int_flag_, 1);
}

TEST_F(ParseFlagsFromEnvTest, VariableIsReadOnce) {
  SetEnv("--int_flag=3");
  ParseFlagsFromEnvAndDieIfUnknown(kEnvVar, flag_list_);
  EXPECT_EQ(int_flag_, 3);

  SetEnv("--int_flag=4");
  ParseFlagsFromEnvAndDieIfUnknown(kEnvVar, flag_list_);
  EXPECT_EQ(int_flag_, 3);

  ResetFlagsFromEnvForTesting(kEnvVar);
  ParseFlagsFromEnvAndDieIfUnknown(kEnvVar, flag_list_);
  EXPECT_EQ(int_flag_, 4);
}

using ParseFlagsFromEnvDeathTest = ParseFlagsFromEnvTest;

TEST_F(ParseFlagsFromEnvDeathTest, UnknownFlagsDie) {
  SetEnv("--simple --bogus --also_bogus=1");
  EXPECT_DEATH(ParseFlagsFromEnvAndDieIfUnknown(kEnvVar, flag_list_),
               "Unknown flags in DIMEQ_TEST_FLAGS: --bogus --also_bogus=1");
}

TEST_F(ParseFlagsFromEnvDeathTest, ArgumentWithoutDashesDies) {
  SetEnv("simple");
  EXPECT_DEATH(ParseFlagsFromEnvAndDieIfUnknown(kEnvVar, flag_list_),
               "Unknown flag in DIMEQ_TEST_FLAGS: simple");
}

TEST_F(ParseFlagsFromEnvDeathTest, MalformedValueDies) {
  SetEnv("--int_flag=three");
  EXPECT_DEATH(ParseFlagsFromEnvAndDieIfUnknown(kEnvVar, flag_list_),
               "Failed to parse DIMEQ_TEST_FLAGS");
}

}  // namespace
}  // namespace dimeq
