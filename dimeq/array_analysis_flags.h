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

#ifndef DIMEQ_ARRAY_ANALYSIS_FLAGS_H_
#define DIMEQ_ARRAY_ANALYSIS_FLAGS_H_

#include <string_view>
#include <vector>

#include "xla/tsl/util/command_line_flags.h"

#include "dimeq/dimeq.pb.h"

namespace dimeq {

// Name of the environment variable holding array analysis flags, e.g.
// DIMEQ_FLAGS="--dimeq_dump_array_analysis --dimeq_extra_ufuncs=erf,gamma".
inline constexpr std::string_view kFlagsEnvVar = "DIMEQ_FLAGS";

// Gets the options reflecting the defaults as if no flags were set: the NumPy
// module name, the universal functions, and the Python operators NumPy
// applies elementwise.
ArrayAnalysisOptions DefaultArrayAnalysisOptions();

// Appends flag definitions for array analysis options to `flag_list`. The
// setters write into `options`, which must outlive the flags.
void MakeArrayAnalysisFlags(std::vector<tsl::Flag>* flag_list,
                            ArrayAnalysisOptions* options);

// Appends the flag definitions backing GetArrayAnalysisOptionsFromFlags() to
// `flag_list`, so a binary can accept them on its command line. The first
// call to this function or GetArrayAnalysisOptionsFromFlags() fixes the
// defaults: `options`, or DefaultArrayAnalysisOptions() if it is nullptr.
void AppendArrayAnalysisFlags(std::vector<tsl::Flag>* flag_list,
                              ArrayAnalysisOptions* options = nullptr);

// Returns the options with the flags from the DIMEQ_FLAGS environment variable
// applied. Dies if the variable holds an unknown or malformed flag.
ArrayAnalysisOptions GetArrayAnalysisOptionsFromFlags();

}  // namespace dimeq

#endif  // DIMEQ_ARRAY_ANALYSIS_FLAGS_H_
