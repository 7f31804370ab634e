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

#ifndef DIMEQ_PARSE_FLAGS_FROM_ENV_H_
#define DIMEQ_PARSE_FLAGS_FROM_ENV_H_

// This module exports ParseFlagsFromEnvAndDieIfUnknown(), which parses
// tsl::Flags out of an environment variable such as DIMEQ_FLAGS.
//
// The variable holds whitespace separated flags in the usual command line
// form. A value may be quoted to embed whitespace:
//
//   DIMEQ_FLAGS="--dimeq_dump_array_analysis --dimeq_extra_ufuncs='erf,gamma'"
//
// The variable is read on first use and the argv built from it is cached.
// tsl::Flags::Parse consumes the flags it recognizes from that argv, so
// setting the variable again has no effect on later calls.

#include <string_view>
#include <vector>

#include "xla/tsl/util/command_line_flags.h"

namespace dimeq {

// Calls tsl::Flags::Parse(argc, argv, flag_list) against the argc/argv taken
// from the environment variable `envvar`. Dies if any of the flags is unknown
// or cannot be parsed.
void ParseFlagsFromEnvAndDieIfUnknown(std::string_view envvar,
                                      const std::vector<tsl::Flag>& flag_list);

// Testing only.
//
// Drops the cached argv for `envvar` so that the next call to
// ParseFlagsFromEnvAndDieIfUnknown() reads the variable anew.
void ResetFlagsFromEnvForTesting(std::string_view envvar);

}  // namespace dimeq

#endif  // DIMEQ_PARSE_FLAGS_FROM_ENV_H_
