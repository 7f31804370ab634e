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

#include <iterator>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

#include "dimeq/base/logging.h"

namespace dimeq {

ArrayAnalysis::ArrayAnalysis(FunctionIr* function,
                             ArrayAnalysisOptions options)
    : function_(function),
      options_(std::move(options)),
      registry_(&shape_table_),
      symbols_(function_, options_.array_module_name()),
      broadcast_(function_, &shape_table_, &registry_),
      inference_(function_, options_, &shape_table_, &registry_, &symbols_,
                 &broadcast_),
      materializer_(function_, &shape_table_, &registry_) {}

absl::StatusOr<bool> ArrayAnalysis::Run() {
  VLOG(1) << "Running " << name() << " on " << function_->name();
  if (options_.dump_ir()) {
    DIMEQ_LOG_LINES(INFO, function_->ToString());
  }

  bool changed = false;
  for (Block& block : function_->mutable_blocks()) {
    changed |= RunOnBlock(block);
  }

  if (options_.dump_tables()) {
    DIMEQ_LOG_LINES(INFO, ToString());
  }
  DIMEQ_VLOG_LINES(3, function_->ToString());
  return changed;
}

bool ArrayAnalysis::RunOnBlock(Block& block) {
  std::vector<Instruction> body;
  body.reserve(block.instructions().size());
  bool changed = false;
  for (const Instruction& instruction : block.instructions()) {
    std::vector<Instruction> generated;
    if (const Assign* assign = instruction.assign()) {
      generated = AnalyzeAssign(instruction.unique_id(), *assign);
    }
    body.push_back(instruction);
    if (!generated.empty()) {
      changed = true;
      body.insert(body.end(), std::make_move_iterator(generated.begin()),
                  std::make_move_iterator(generated.end()));
    }
  }
  block.set_instructions(std::move(body));
  return changed;
}

std::vector<Instruction> ArrayAnalysis::AnalyzeAssign(int64_t unique_id,
                                                      const Assign& assign) {
  symbols_.Observe(assign);

  const std::string& target = assign.target;
  if (!function_->IsArray(target)) {
    return {};
  }
  if (!analyzed_instructions_.insert(unique_id).second) {
    VLOG(3) << "Already analyzed: " << target;
    return {};
  }

  const int64_t rank = function_->GetType(target).rank();
  ShapeVector shape;
  absl::StatusOr<ShapeVector> inferred = inference_.InferShape(assign.value);
  if (!inferred.ok()) {
    LOG(WARNING) << "Can't find shape classes for " << target << " = "
                 << ExpressionToString(assign.value) << ": "
                 << inferred.status().message();
    shape.assign(rank, kUnknownClass);
  } else if (static_cast<int64_t>(inferred->size()) != rank) {
    LOG(WARNING) << "Inferred shape " << ShapeVectorToString(*inferred)
                 << " of " << target << " does not have rank " << rank;
    shape.assign(rank, kUnknownClass);
  } else {
    shape = *std::move(inferred);
  }

  if (absl::Status status = shape_table_.Record(target, shape); !status.ok()) {
    DIMEQ_LOG_LINES(WARNING, absl::StrCat(status.message(), "\n", ToString()));
    return {};
  }
  VLOG(2) << target << ": " << ShapeVectorToString(shape);
  return materializer_.Materialize(target, shape);
}

std::string ArrayAnalysis::ToString() const {
  return absl::StrCat("shapes:\n", shape_table_.ToString(), "class sizes:\n",
                      registry_.ToString(), symbols_.ToString());
}

}  // namespace dimeq
