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

#ifndef DIMEQ_ANALYSIS_SHAPE_INFERENCE_H_
#define DIMEQ_ANALYSIS_SHAPE_INFERENCE_H_

#include <string>
#include <string_view>

#include "absl/container/flat_hash_set.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"

#include "dimeq/analysis/broadcast_resolver.h"
#include "dimeq/analysis/equivalence_class.h"
#include "dimeq/analysis/equivalence_class_registry.h"
#include "dimeq/analysis/shape_table.h"
#include "dimeq/analysis/symbol_tables.h"
#include "dimeq/dimeq.pb.h"
#include "dimeq/ir/expression.h"
#include "dimeq/ir/function_ir.h"

namespace dimeq {

// Computes the equivalence classes of the array produced by an expression.
//
// Supported expressions:
//  - parameters: one fresh class per dimension, allocated on first use;
//  - variable copies, casts, and unary elementwise operators: the operand's
//    shape;
//  - binary and in-place elementwise operators, fused elementwise trees, and
//    universal functions: the broadcast of the operands;
//  - `.T`, transpose: the operand's shape reversed;
//  - elementwise map calls: the first argument's shape;
//  - empty, zeros, ones, reshape: classes built from the shape argument;
//  - empty_like, zeros_like, ones_like: the argument's shape;
//  - dot: the matrix product shape, merging the contracted dimensions.
//
// Anything else yields an Unimplemented error. Operands whose shape is not
// known yet (e.g. defined in a block visited later) yield NotFound. Callers
// treat both as an unknown result.
class ShapeInference {
 public:
  // All pointers must outlive this object.
  ShapeInference(const FunctionIr* function,
                 const ArrayAnalysisOptions& options, ShapeTable* shapes,
                 EquivalenceClassRegistry* registry,
                 const SymbolTables* symbols, BroadcastResolver* broadcast);

  // Returns the shape of the array `expression` evaluates to.
  absl::StatusOr<ShapeVector> InferShape(const Expression& expression);

  // Returns the shape of the array returned by the array-module function
  // `name` applied to `args`.
  absl::StatusOr<ShapeVector> InferNamedCall(
      std::string_view name, absl::Span<const std::string> args);

 private:
  class ExpressionVisitor;

  // Returns a copy of the recorded shape of the array `variable`.
  absl::StatusOr<ShapeVector> OperandShape(std::string_view variable) const;

  // Broadcasts `operands` after checking that their shapes are known.
  absl::StatusOr<ShapeVector> Broadcast(absl::Span<const std::string> operands);

  // Builds the classes of an array created with the shape `shape_arg`, an
  // integer or a tuple of integers.
  absl::StatusOr<ShapeVector> ShapeFromShapeArgument(
      std::string_view shape_arg);

  // Returns a class for a dimension of statically built shape whose length is
  // `size`.
  EquivalenceClass ClassForDimSize(const DimSize& size);

  absl::StatusOr<ShapeVector> InferDot(absl::Span<const std::string> args);

  const FunctionIr* function_;
  ShapeTable* shapes_;
  EquivalenceClassRegistry* registry_;
  const SymbolTables* symbols_;
  BroadcastResolver* broadcast_;

  absl::flat_hash_set<std::string> ufunc_names_;
  absl::flat_hash_set<std::string> unary_operators_;
  absl::flat_hash_set<std::string> binary_operators_;
};

}  // namespace dimeq

#endif  // DIMEQ_ANALYSIS_SHAPE_INFERENCE_H_
