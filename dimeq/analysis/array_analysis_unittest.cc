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

#include "dimeq/analysis/array_analysis.h"

#include <stdint.h>

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "absl/base/log_severity.h"
#include "absl/log/log_entry.h"
#include "absl/log/log_sink.h"
#include "absl/log/log_sink_registry.h"

#include "xla/tsl/platform/status_matchers.h"
#include "xla/tsl/platform/statusor.h"

namespace dimeq {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Pointee;

// Collects the warnings logged while it is registered.
class WarningCollector : public absl::LogSink {
 public:
  WarningCollector() { absl::AddLogSink(this); }
  ~WarningCollector() override { absl::RemoveLogSink(this); }

  void Send(const absl::LogEntry& entry) override {
    if (entry.log_severity() == absl::LogSeverity::kWarning) {
      warnings_.push_back(std::string(entry.text_message()));
    }
  }

  const std::vector<std::string>& warnings() const { return warnings_; }

 private:
  std::vector<std::string> warnings_;
};

// Returns the assignment targets of `block`, with "<ret>" for returns and
// "<jump>" for other terminators.
std::vector<std::string> Targets(const Block& block) {
  std::vector<std::string> targets;
  for (const Instruction& instruction : block.instructions()) {
    if (const Assign* assign = instruction.assign()) {
      targets.push_back(assign->target);
    } else if (std::holds_alternative<Return>(instruction.body())) {
      targets.push_back("<ret>");
    } else {
      targets.push_back("<jump>");
    }
  }
  return targets;
}

class ArrayAnalysisTest : public ::testing::Test {
 protected:
  void Analyze(FunctionIr::Builder& builder) {
    function_ = builder.Build();
    analysis_ = std::make_unique<ArrayAnalysis>(function_.get(), options_);
    absl::StatusOr<bool> changed = analysis_->Run();
    ASSERT_TRUE(changed.ok()) << changed.status();
    changed_ = *changed;
  }

  ArrayAnalysisOptions options_ = DefaultArrayAnalysisOptions();
  std::unique_ptr<FunctionIr> function_;
  std::unique_ptr<ArrayAnalysis> analysis_;
  bool changed_ = false;
};

TEST_F(ArrayAnalysisTest, ElementwiseAddOfParameters) {
  FunctionIr::Builder builder("add");
  builder.StartBlock(0);
  builder.AddParameter("a", Type::MakeArray(F64, 1));
  builder.AddParameter("b", Type::MakeArray(F64, 1));
  builder.AddBinaryOp("c", Type::MakeArray(F64, 1), "+", "a", "b");
  builder.AddReturn("c");
  Analyze(builder);

  EXPECT_TRUE(changed_);
  EXPECT_THAT(Targets(function_->blocks()[0]),
              ElementsAre("a", "a_sh_attr0.0", "$consta0.1", "asize0.2", "b",
                          "b_sh_attr0.3", "$constb0.4", "bsize0.5", "c",
                          "<ret>"));

  const ShapeVector& c = analysis_->GetShape("c");
  ASSERT_EQ(c.size(), 1);
  EXPECT_EQ(analysis_->GetShape("a"), c);
  EXPECT_EQ(analysis_->GetShape("b"), c);
  EXPECT_THAT(analysis_->class_registry().Sizes(c[0]),
              ElementsAre(DimSize::Variable("asize0.2"),
                          DimSize::Variable("bsize0.5")));
  EXPECT_THAT(analysis_->GetSizes("c"),
              Pointee(ElementsAre(DimSize::Variable("asize0.2"))));
}

TEST_F(ArrayAnalysisTest, ArraysOfKnownSizeNeedNoFetch) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("n", Type::MakeScalar(S64));
  builder.AddGlobal("$np", GlobalValue::Module("numpy"));
  builder.AddGetAttr("$zeros", Type::MakeFunction("zeros"), "$np", "zeros");
  builder.AddCall("z", Type::MakeArray(F64, 1), "$zeros", {"n"});
  builder.AddCall("w", Type::MakeArray(F64, 1), "$zeros", {"n"});
  builder.AddBinaryOp("x", Type::MakeArray(F64, 1), "*", "z", "w");
  builder.AddReturn("x");
  Analyze(builder);

  EXPECT_FALSE(changed_);
  EXPECT_EQ(function_->instruction_count(), 7);
  EXPECT_THAT(analysis_->GetSizes("z"),
              Pointee(ElementsAre(DimSize::Variable("n"))));
  EXPECT_THAT(analysis_->GetSizes("x"),
              Pointee(ElementsAre(DimSize::Variable("n"))));
  // Both calls create a class of their own; the product proves them equal.
  EXPECT_EQ(analysis_->GetShape("z"), analysis_->GetShape("w"));
}

TEST_F(ArrayAnalysisTest, ConflictingDefinitionsBecomeUnknown) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  builder.AddParameter("b", Type::MakeArray(F64, 2));
  builder.AddParameter("cond", Type::MakeScalar(PRED));
  builder.AddBranch("cond", 1, 2);
  builder.StartBlock(1);
  builder.AddAssign("c", Type::MakeArray(F64, 2), VarRef{"a"});
  builder.AddJump(3);
  builder.StartBlock(2);
  builder.AddAssign("c", Type::MakeArray(F64, 2), VarRef{"b"});
  builder.AddJump(3);
  builder.StartBlock(3);
  builder.AddReturn("c");
  Analyze(builder);

  EXPECT_THAT(analysis_->GetShape("c"),
              ElementsAre(kUnknownClass, kUnknownClass));
  EXPECT_EQ(analysis_->GetSizes("c"), nullptr);
  // The definitions themselves are untouched.
  EXPECT_NE(analysis_->GetShape("a"), analysis_->GetShape("b"));
  EXPECT_THAT(Targets(*function_->FindBlock(2)), ElementsAre("c", "<jump>"));
}

TEST_F(ArrayAnalysisTest, ConflictLogsTheTablesAsWarnings) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("a", Type::MakeArray(F64, 1));
  builder.AddParameter("b", Type::MakeArray(F64, 1));
  builder.AddParameter("cond", Type::MakeScalar(PRED));
  builder.AddBranch("cond", 1, 2);
  builder.StartBlock(1);
  builder.AddAssign("c", Type::MakeArray(F64, 1), VarRef{"a"});
  builder.AddJump(3);
  builder.StartBlock(2);
  builder.AddAssign("c", Type::MakeArray(F64, 1), VarRef{"b"});
  builder.AddJump(3);
  builder.StartBlock(3);
  builder.AddReturn("c");

  WarningCollector collector;
  Analyze(builder);

  // One warning per line: the conflict, then the table dump.
  EXPECT_THAT(collector.warnings(),
              Contains(HasSubstr("Incompatible array shapes in control flow "
                                 "for c")));
  EXPECT_THAT(collector.warnings(), Contains("shapes:"));
  EXPECT_THAT(collector.warnings(), Contains("c: [-1]"));
  EXPECT_THAT(collector.warnings(), Contains("class sizes:"));
}

TEST_F(ArrayAnalysisTest, AgreeingDefinitionsKeepTheirShape) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  builder.AddParameter("cond", Type::MakeScalar(PRED));
  builder.AddBranch("cond", 1, 2);
  builder.StartBlock(1);
  builder.AddAssign("c", Type::MakeArray(F64, 2), VarRef{"a"});
  builder.AddJump(3);
  builder.StartBlock(2);
  builder.AddAssign("c", Type::MakeArray(F64, 2), UnaryOp{"-", "a"});
  builder.AddJump(3);
  builder.StartBlock(3);
  builder.AddReturn("c");
  Analyze(builder);

  EXPECT_EQ(analysis_->GetShape("c"), analysis_->GetShape("a"));
  EXPECT_EQ(*analysis_->GetSizes("c"), *analysis_->GetSizes("a"));
}

TEST_F(ArrayAnalysisTest, UnsupportedExpressionGivesUnknownDimensions) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("a", Type::MakeArray(C128, 2));
  builder.AddGetAttr("r", Type::MakeArray(F64, 2), "a", "real");
  builder.AddReturn("r");
  Analyze(builder);

  EXPECT_THAT(analysis_->GetShape("r"),
              ElementsAre(kUnknownClass, kUnknownClass));
  // Every unknown dimension is read from the array itself.
  EXPECT_THAT(analysis_->GetSizes("r"),
              Pointee(ElementsAre(DimSize::Variable("rsize0.8"),
                                  DimSize::Variable("rsize1.11"))));
  EXPECT_EQ(function_->instruction_count(), 3 + 6 + 6);
}

TEST_F(ArrayAnalysisTest, RankMismatchGivesUnknownDimensions) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("v", Type::MakeArray(F64, 1));
  builder.AddAssign("m", Type::MakeArray(F64, 2), VarRef{"v"});
  builder.AddReturn("m");
  Analyze(builder);

  EXPECT_THAT(analysis_->GetShape("m"),
              ElementsAre(kUnknownClass, kUnknownClass));
}

TEST_F(ArrayAnalysisTest, OperandFromLaterBlockIsUnknown) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("a", Type::MakeArray(F64, 1));
  builder.AddJump(2);
  builder.StartBlock(1);
  builder.AddAssign("d", Type::MakeArray(F64, 1), VarRef{"c"});
  builder.AddReturn("d");
  builder.StartBlock(2);
  builder.AddAssign("c", Type::MakeArray(F64, 1), VarRef{"a"});
  builder.AddJump(1);
  Analyze(builder);

  EXPECT_THAT(analysis_->GetShape("d"), ElementsAre(kUnknownClass));
  EXPECT_EQ(analysis_->GetShape("c"), analysis_->GetShape("a"));
}

TEST_F(ArrayAnalysisTest, MatrixProductChain) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  builder.AddParameter("b", Type::MakeArray(F64, 2));
  builder.AddGlobal("$np", GlobalValue::Module("numpy"));
  builder.AddGetAttr("$dot", Type::MakeFunction("dot"), "$np", "dot");
  builder.AddCall("c", Type::MakeArray(F64, 2), "$dot", {"a", "b"});
  builder.AddGetAttr("ct", Type::MakeArray(F64, 2), "c", "T");
  builder.AddBinaryOp("d", Type::MakeArray(F64, 2), "-", "ct", "b");
  builder.AddReturn("d");
  Analyze(builder);

  const ShapeVector& a = analysis_->GetShape("a");
  const ShapeVector& b = analysis_->GetShape("b");
  // a: [m, k], b: [k, n], c: [m, n], c.T: [n, m], c.T - b forces n == k and
  // m == n.
  EXPECT_EQ(a[1], b[0]);
  EXPECT_EQ(a[0], a[1]);
  EXPECT_EQ(b[0], b[1]);
  EXPECT_EQ(analysis_->GetShape("d"), b);
}

TEST_F(ArrayAnalysisTest, SecondRunInsertsNothing) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("a", Type::MakeArray(F64, 2));
  builder.AddParameter("b", Type::MakeArray(F64, 1));
  builder.AddBinaryOp("c", Type::MakeArray(F64, 2), "+", "a", "b");
  builder.AddReturn("c");
  Analyze(builder);
  ASSERT_TRUE(changed_);

  int64_t instruction_count = function_->instruction_count();
  ShapeVector c = analysis_->GetShape("c");
  std::vector<DimSize> sizes = *analysis_->GetSizes("c");

  TF_ASSERT_OK_AND_ASSIGN(bool changed, analysis_->Run());
  EXPECT_FALSE(changed);
  EXPECT_EQ(function_->instruction_count(), instruction_count);
  EXPECT_EQ(analysis_->GetShape("c"), c);
  EXPECT_EQ(*analysis_->GetSizes("c"), sizes);
}

TEST_F(ArrayAnalysisTest, NewAnalysisFetchesSizesAgain) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("a", Type::MakeArray(F64, 1));
  builder.AddReturn("a");
  Analyze(builder);
  ASSERT_TRUE(changed_);
  int64_t instruction_count = function_->instruction_count();
  std::string size = analysis_->GetSizes("a")->front().variable();

  ArrayAnalysis second(function_.get(), options_);
  TF_ASSERT_OK_AND_ASSIGN(bool changed, second.Run());
  EXPECT_TRUE(changed);
  // Another getattr, constant and static_getitem for the one dimension.
  EXPECT_EQ(function_->instruction_count(), instruction_count + 3);
  EXPECT_NE(second.GetSizes("a")->front().variable(), size);
}

TEST_F(ArrayAnalysisTest, DumpsDoNotChangeTheResult) {
  options_.set_dump_tables(true);
  options_.set_dump_ir(true);
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("a", Type::MakeArray(F64, 1));
  builder.AddAssign("b", Type::MakeArray(F64, 1), UnaryOp{"-", "a"});
  builder.AddReturn("b");
  Analyze(builder);

  EXPECT_TRUE(changed_);
  EXPECT_EQ(analysis_->GetShape("b"), analysis_->GetShape("a"));
}

TEST_F(ArrayAnalysisTest, ToStringListsAllTables) {
  FunctionIr::Builder builder("f");
  builder.StartBlock(0);
  builder.AddParameter("a", Type::MakeArray(F64, 1));
  builder.AddGlobal("$np", GlobalValue::Module("numpy"));
  builder.AddReturn("a");
  Analyze(builder);

  std::string dump = analysis_->ToString();
  EXPECT_THAT(dump, HasSubstr("shapes:\na: [1] sizes=[asize0.2]\n"));
  EXPECT_THAT(dump, HasSubstr("class sizes:\n0: [1]\n1: [asize0.2]\n"));
  EXPECT_THAT(dump, HasSubstr("array module globals: [$np]\n"));
}

}  // namespace
}  // namespace dimeq
