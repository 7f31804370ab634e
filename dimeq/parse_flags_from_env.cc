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

#include <stdlib.h>
#include <string.h>

#include <memory>
#include <string>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/const_init.h"
#include "absl/container/flat_hash_map.h"
#include "absl/debugging/leak_check.h"
#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_join.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"

namespace dimeq {
namespace {

constexpr char kWhitespace[] = " \t\r\n";

// An argv[]-style array built from an environment variable. argv[0] is a
// dummy program name and argv[argc] is nullptr.
struct EnvArgv {
  bool initialized = false;
  int argc = 0;
  std::vector<char*> argv;
  // Owns the strings argv points into. tsl::Flags::Parse reorders argv.
  std::vector<std::unique_ptr<char[]>> storage;
};

void AppendToEnvArgv(std::string_view arg, EnvArgv* a) {
  auto str = std::make_unique<char[]>(arg.size() + 1);
  memcpy(str.get(), arg.data(), arg.size());
  str[arg.size()] = '\0';
  a->argv.push_back(str.get());
  a->storage.push_back(std::move(str));
  ++a->argc;
}

// Splits `flags` at whitespace. A value written as --name="..." or
// --name='...' keeps its whitespace and loses the quotes. Inside double quotes
// a backslash escapes the next character.
std::vector<std::string> SplitFlags(std::string_view flags) {
  std::vector<std::string> args;
  size_t pos = flags.find_first_not_of(kWhitespace);
  while (pos != std::string_view::npos) {
    std::string arg;
    while (pos < flags.size() && !absl::ascii_isspace(flags[pos])) {
      char c = flags[pos++];
      if ((c == '"' || c == '\'') && !arg.empty() && arg.back() == '=') {
        for (; pos < flags.size() && flags[pos] != c; ++pos) {
          if (c == '"' && flags[pos] == '\\' && pos + 1 < flags.size()) {
            ++pos;
          }
          arg.push_back(flags[pos]);
        }
        if (pos < flags.size()) {
          ++pos;  // closing quote
        }
        continue;
      }
      arg.push_back(c);
    }
    args.push_back(std::move(arg));
    pos = flags.find_first_not_of(kWhitespace, pos);
  }
  return args;
}

void SetArgvFromEnv(std::string_view envvar, EnvArgv* a) {
  if (a->initialized) {
    return;
  }
  AppendToEnvArgv("<argv[0]>", a);
  const char* env = getenv(std::string(envvar).c_str());
  if (env != nullptr) {
    for (const std::string& arg : SplitFlags(env)) {
      AppendToEnvArgv(arg, a);
    }
  }
  a->argv.push_back(nullptr);
  a->initialized = true;
}

// The argv parsed from each environment variable seen so far.
absl::flat_hash_map<std::string, EnvArgv>& EnvArgvs() {
  static auto* env_argvs =
      absl::IgnoreLeak(new absl::flat_hash_map<std::string, EnvArgv>());
  return *env_argvs;
}

ABSL_CONST_INIT absl::Mutex env_argv_mu(absl::kConstInit);

}  // namespace

void ParseFlagsFromEnvAndDieIfUnknown(
    std::string_view envvar, const std::vector<tsl::Flag>& flag_list) {
  absl::MutexLock lock(&env_argv_mu);
  EnvArgv& env_argv = EnvArgvs()[std::string(envvar)];
  SetArgvFromEnv(envvar, &env_argv);

  if (!tsl::Flags::Parse(&env_argv.argc, env_argv.argv.data(), flag_list)) {
    LOG(QFATAL) << "Failed to parse " << envvar << "\n"
                << tsl::Flags::Usage(std::string(envvar), flag_list);
  }
  // The dummy argv[0] is never consumed.
  if (env_argv.argc != 1) {
    absl::Span<char* const> unknown_flags(env_argv.argv.data() + 1,
                                          env_argv.argc - 1);
    LOG(QFATAL) << "Unknown flag" << (unknown_flags.size() > 1 ? "s" : "")
                << " in " << envvar << ": "
                << absl::StrJoin(unknown_flags, " ");
  }
}

void ResetFlagsFromEnvForTesting(std::string_view envvar) {
  absl::MutexLock lock(&env_argv_mu);
  EnvArgvs().erase(std::string(envvar));
}

}  // namespace dimeq
