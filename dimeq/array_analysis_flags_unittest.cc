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

#include "dimeq/array_analysis_flags.h"

#include <stdlib.h>

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "dimeq/parse_flags_from_env.h"

namespace dimeq {
namespace {

using ::testing::Contains;
using ::testing::Not;

TEST(ArrayAnalysisFlagsTest, Defaults) {
  ArrayAnalysisOptions options = DefaultArrayAnalysisOptions();
  EXPECT_EQ(options.array_module_name(), "numpy");
  EXPECT_FALSE(options.dump_tables());
  EXPECT_FALSE(options.dump_ir());
  EXPECT_THAT(options.ufunc_names(), Contains("add"));
  EXPECT_THAT(options.ufunc_names(), Contains("arctan2"));
  EXPECT_THAT(options.ufunc_names(), Not(Contains("dot")));
  EXPECT_THAT(options.unary_operators(), Contains("~"));
  EXPECT_THAT(options.binary_operators(), Contains("**"));
  EXPECT_THAT(options.binary_operators(), Not(Contains("@")));
}

class ArrayAnalysisFlagsParseTest : public ::testing::Test {
 protected:
  ArrayAnalysisFlagsParseTest() : options_(DefaultArrayAnalysisOptions()) {
    MakeArrayAnalysisFlags(&flag_objects_, &options_);
  }

  // Parses `flags` as if they were set on DIMEQ_FLAGS.
  void ParseFromEnv(const char* flags) {
    ASSERT_EQ(setenv("DIMEQ_FLAGS", flags, /*overwrite=*/1), 0);
    ResetFlagsFromEnvForTesting("DIMEQ_FLAGS");
    ParseFlagsFromEnvAndDieIfUnknown("DIMEQ_FLAGS", flag_objects_);
  }

  ArrayAnalysisOptions options_;
  std::vector<tsl::Flag> flag_objects_;
};

TEST_F(ArrayAnalysisFlagsParseTest, ParsesFlags) {
  int ufunc_count = options_.ufunc_names_size();
  ParseFromEnv(
      "--dimeq_dump_array_analysis "
      "--dimeq_dump_array_analysis_ir=false\t"
      "--dimeq_array_module_name=cupy\n"
      "--dimeq_extra_ufuncs=erf,,gamma");
  EXPECT_TRUE(options_.dump_tables());
  EXPECT_FALSE(options_.dump_ir());
  EXPECT_EQ(options_.array_module_name(), "cupy");
  EXPECT_EQ(options_.ufunc_names_size(), ufunc_count + 2);
  EXPECT_THAT(options_.ufunc_names(), Contains("erf"));
  EXPECT_THAT(options_.ufunc_names(), Contains("gamma"));
}

TEST_F(ArrayAnalysisFlagsParseTest, QuotedValueKeepsWhitespace) {
  ParseFromEnv(
      "--dimeq_array_module_name='my numpy' --dimeq_dump_array_analysis");
  EXPECT_EQ(options_.array_module_name(), "my numpy");
  EXPECT_TRUE(options_.dump_tables());
}

TEST_F(ArrayAnalysisFlagsParseTest, EmptyFlagsKeepOptions) {
  ParseFromEnv("  ");
  EXPECT_EQ(options_.SerializeAsString(),
            DefaultArrayAnalysisOptions().SerializeAsString());
}

TEST_F(ArrayAnalysisFlagsParseTest, ParsesCommandLine) {
  std::string arg0 = "dimeq";
  std::string arg1 = "--dimeq_dump_array_analysis_ir";
  std::string arg2 = "input.ir";
  std::vector<char*> argv = {arg0.data(), arg1.data(), arg2.data(), nullptr};
  int argc = 3;

  ASSERT_TRUE(tsl::Flags::Parse(&argc, argv.data(), flag_objects_));
  EXPECT_TRUE(options_.dump_ir());
  // Arguments that are not flags are left in place.
  ASSERT_EQ(argc, 2);
  EXPECT_EQ(std::string(argv[1]), "input.ir");
}

TEST_F(ArrayAnalysisFlagsParseTest, RejectsMalformedValues) {
  std::string arg0 = "dimeq";
  std::string arg1 = "--dimeq_dump_array_analysis=maybe";
  std::vector<char*> argv = {arg0.data(), arg1.data(), nullptr};
  int argc = 2;
  EXPECT_FALSE(tsl::Flags::Parse(&argc, argv.data(), flag_objects_));

  std::string arg2 = "--dimeq_array_module_name=";
  argv = {arg0.data(), arg2.data(), nullptr};
  argc = 2;
  EXPECT_FALSE(tsl::Flags::Parse(&argc, argv.data(), flag_objects_));
}

TEST(ArrayAnalysisFlagsTest, AppendedFlagsShareTheParsedOptions) {
  ASSERT_EQ(setenv("DIMEQ_FLAGS",
                   "--dimeq_dump_array_analysis --dimeq_extra_ufuncs=erf",
                   /*overwrite=*/1),
            0);
  ResetFlagsFromEnvForTesting("DIMEQ_FLAGS");
  std::vector<tsl::Flag> flag_list;
  AppendArrayAnalysisFlags(&flag_list);
  EXPECT_EQ(flag_list.size(), 4);

  ArrayAnalysisOptions options = GetArrayAnalysisOptionsFromFlags();
  EXPECT_TRUE(options.dump_tables());
  EXPECT_THAT(options.ufunc_names(), Contains("erf"));

  // The environment is read once per process.
  ASSERT_EQ(unsetenv("DIMEQ_FLAGS"), 0);
  options = GetArrayAnalysisOptionsFromFlags();
  EXPECT_TRUE(options.dump_tables());
}

using ArrayAnalysisFlagsDeathTest = ArrayAnalysisFlagsParseTest;

TEST_F(ArrayAnalysisFlagsDeathTest, UnknownFlagDies) {
  EXPECT_DEATH(ParseFromEnv("--dimeq_dump_array_analysis --no_such_flag"),
               "Unknown flag in DIMEQ_FLAGS: --no_such_flag");
}

TEST_F(ArrayAnalysisFlagsDeathTest, MalformedFlagDies) {
  EXPECT_DEATH(ParseFromEnv("--dimeq_dump_array_analysis=maybe"),
               "Failed to parse DIMEQ_FLAGS");
}

}  // namespace
}  // namespace dimeq
