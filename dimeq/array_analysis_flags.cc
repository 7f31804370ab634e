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

#include <string>
#include <utility>

#include "absl/base/call_once.h"
#include "absl/debugging/leak_check.h"
#include "absl/strings/str_split.h"

#include "dimeq/parse_flags_from_env.h"

namespace dimeq {
namespace {

// Universal functions NumPy provides, as supported by the host compiler.
constexpr std::string_view kUfuncNames[] = {
    // Math operations.
    "add", "subtract", "multiply", "divide", "logaddexp", "logaddexp2",
    "true_divide", "floor_divide", "negative", "power", "remainder", "mod",
    "fmod", "absolute", "rint", "sign", "conj", "exp", "exp2", "log", "log2",
    "log10", "expm1", "log1p", "sqrt", "square", "reciprocal", "conjugate",
    // Trigonometric functions.
    "sin", "cos", "tan", "arcsin", "arccos", "arctan", "arctan2", "hypot",
    "sinh", "cosh", "tanh", "arcsinh", "arccosh", "arctanh", "deg2rad",
    "rad2deg", "degrees", "radians",
    // Bit-twiddling functions.
    "bitwise_and", "bitwise_or", "bitwise_xor", "invert", "bitwise_not",
    "left_shift", "right_shift",
    // Comparison functions.
    "greater", "greater_equal", "less", "less_equal", "not_equal", "equal",
    "logical_and", "logical_or", "logical_xor", "logical_not", "maximum",
    "minimum", "fmax", "fmin",
    // Floating functions.
    "isfinite", "isinf", "isnan", "signbit", "copysign", "nextafter",
    "modf", "ldexp", "frexp", "floor", "ceil", "trunc", "spacing",
};

constexpr std::string_view kUnaryOperators[] = {"+", "-", "~"};

constexpr std::string_view kBinaryOperators[] = {
    "+",  "-",  "*",  "/",  "/?", "//", "%", "**", "<<", ">>",
    "&",  "|",  "^",  "==", "!=", "<",  "<=", ">", ">=",
};

}  // namespace

ArrayAnalysisOptions DefaultArrayAnalysisOptions() {
  ArrayAnalysisOptions opts;
  opts.set_array_module_name("numpy");
  for (std::string_view name : kUfuncNames) {
    opts.add_ufunc_names(std::string(name));
  }
  for (std::string_view op : kUnaryOperators) {
    opts.add_unary_operators(std::string(op));
  }
  for (std::string_view op : kBinaryOperators) {
    opts.add_binary_operators(std::string(op));
  }
  opts.set_dump_tables(false);
  opts.set_dump_ir(false);
  return opts;
}

static absl::once_flag flags_init;
static ArrayAnalysisOptions* flag_values;
static std::vector<tsl::Flag>* flag_objects;

void MakeArrayAnalysisFlags(std::vector<tsl::Flag>* flag_list,
                            ArrayAnalysisOptions* options) {
  // Returns a lambda that calls "member_setter" on "options" with the
  // argument passed in to the lambda.
  auto bool_setter_for =
      [options](void (ArrayAnalysisOptions::*member_setter)(bool)) {
        return [options, member_setter](bool value) {
          (options->*member_setter)(value);
          return true;
        };
      };

  auto setter_for_array_module_name = [options](std::string value) {
    if (value.empty()) {
      return false;
    }
    options->set_array_module_name(std::move(value));
    return true;
  };

  auto setter_for_extra_ufuncs = [options](std::string comma_separated) {
    for (std::string_view name :
         absl::StrSplit(comma_separated, ',', absl::SkipEmpty())) {
      options->add_ufunc_names(std::string(name));
    }
    return true;
  };

  flag_list->push_back(tsl::Flag(
      "dimeq_dump_array_analysis",
      bool_setter_for(&ArrayAnalysisOptions::set_dump_tables),
      options->dump_tables(),
      "Log the shape table and the class sizes after array analysis."));
  flag_list->push_back(tsl::Flag(
      "dimeq_dump_array_analysis_ir",
      bool_setter_for(&ArrayAnalysisOptions::set_dump_ir),
      options->dump_ir(), "Log the function IR before array analysis."));
  flag_list->push_back(tsl::Flag(
      "dimeq_array_module_name", setter_for_array_module_name,
      options->array_module_name(),
      "Name of the module whose array functions the analysis recognizes."));
  flag_list->push_back(tsl::Flag(
      "dimeq_extra_ufuncs", setter_for_extra_ufuncs, "",
      "Comma-separated list of additional elementwise functions of the array "
      "module, appended to the built-in universal functions."));
}

// Allocates flag_values and flag_objects; this function must not be called
// more than once - its call done via call_once.
static void AllocateFlags(ArrayAnalysisOptions* defaults) {
  if (defaults == nullptr) {
    defaults = absl::IgnoreLeak(
        new ArrayAnalysisOptions(DefaultArrayAnalysisOptions()));
  }
  flag_values = defaults;
  flag_objects = absl::IgnoreLeak(new std::vector<tsl::Flag>());
  MakeArrayAnalysisFlags(flag_objects, flag_values);
  ParseFlagsFromEnvAndDieIfUnknown(kFlagsEnvVar, *flag_objects);
}

void AppendArrayAnalysisFlags(std::vector<tsl::Flag>* flag_list,
                              ArrayAnalysisOptions* options) {
  absl::call_once(flags_init, &AllocateFlags, options);
  flag_list->insert(flag_list->end(), flag_objects->begin(),
                    flag_objects->end());
}

ArrayAnalysisOptions GetArrayAnalysisOptionsFromFlags() {
  absl::call_once(flags_init, &AllocateFlags, nullptr);
  return *flag_values;
}

}  // namespace dimeq
