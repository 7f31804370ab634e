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

#include "absl/base/const_init.h"
#include "absl/synchronization/mutex.h"

namespace dimeq::base {

void LogLines(absl::LogSeverity sev, std::string_view text, const char* fname,
              int lineno) {
  // Protect calls with a mutex so we don't interleave calls to LogLines from
  // multiple threads.
  static absl::Mutex log_lines_mu(absl::kConstInit);
  absl::MutexLock lock(&log_lines_mu);

  size_t cur = 0;
  while (cur < text.size()) {
    size_t eol = text.find('\n', cur);
    if (eol == std::string_view::npos) {
      eol = text.size();
    }
    LOG(LEVEL(sev)).AtLocation(fname, lineno) << text.substr(cur, eol - cur);
    cur = eol + 1;
  }
}

}  // namespace dimeq::base
