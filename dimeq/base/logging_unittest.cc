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

#include "dimeq/base/logging.h"

#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "absl/log/log_entry.h"
#include "absl/log/log_sink.h"
#include "absl/log/log_sink_registry.h"

namespace dimeq::base {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;

class LogLinesTest : public ::testing::Test, public absl::LogSink {
 protected:
  LogLinesTest() { absl::AddLogSink(this); }
  ~LogLinesTest() override { absl::RemoveLogSink(this); }

  void Send(const absl::LogEntry& entry) override {
    if (entry.source_basename() == "logging_unittest.cc") {
      lines_.emplace_back(entry.log_severity(),
                          std::string(entry.text_message()));
    }
  }

  std::vector<std::pair<absl::LogSeverity, std::string>> lines_;
};

TEST_F(LogLinesTest, SplitsAtNewlines) {
  DIMEQ_LOG_LINES(WARNING, "first\nsecond\n\nfourth");
  EXPECT_THAT(lines_,
              ElementsAre(Pair(absl::LogSeverity::kWarning, "first"),
                          Pair(absl::LogSeverity::kWarning, "second"),
                          Pair(absl::LogSeverity::kWarning, ""),
                          Pair(absl::LogSeverity::kWarning, "fourth")));
}

TEST_F(LogLinesTest, TrailingNewlineAddsNoLine) {
  DIMEQ_LOG_LINES(INFO, "only\n");
  EXPECT_THAT(lines_, ElementsAre(Pair(absl::LogSeverity::kInfo, "only")));
}

TEST_F(LogLinesTest, VlogLinesIsSilentWhenVlogIsOff) {
  int evaluated = 0;
  DIMEQ_VLOG_LINES(10, (++evaluated, "hidden"));
  EXPECT_THAT(lines_, IsEmpty());
  EXPECT_EQ(evaluated, 0);
}

}  // namespace
}  // namespace dimeq::base
