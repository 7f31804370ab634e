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

#ifndef DIMEQ_BASE_LOGGING_H_
#define DIMEQ_BASE_LOGGING_H_

#include <string_view>

#include "absl/base/log_severity.h"
#include "absl/log/log.h"
#include "absl/log/vlog_is_on.h"

namespace dimeq::base {

// Split the text into multiple lines and log each line with the given
// severity, filename, and line number.
void LogLines(absl::LogSeverity sev, std::string_view text, const char* fname,
              int lineno);
inline void LogLinesINFO(std::string_view text, const char* fname, int lineno) {
  return LogLines(absl::LogSeverity::kInfo, text, fname, lineno);
}
inline void LogLinesWARNING(std::string_view text, const char* fname,
                            int lineno) {
  return LogLines(absl::LogSeverity::kWarning, text, fname, lineno);
}

}  // namespace dimeq::base

// Note that STRING is evaluated regardless of whether it will be logged.
#define DIMEQ_LOG_LINES(SEV, STRING) \
  ::dimeq::base::LogLines##SEV(STRING, __FILE__, __LINE__)

// Like DIMEQ_LOG_LINES, but only logs if VLOG is enabled for the given level.
// STRING is evaluated only if it will be logged.
#define DIMEQ_VLOG_LINES(LEVEL, STRING)                   \
  do {                                                    \
    if (VLOG_IS_ON(LEVEL)) DIMEQ_LOG_LINES(INFO, STRING); \
  } while (false)

#endif  // DIMEQ_BASE_LOGGING_H_
