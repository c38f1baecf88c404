/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "rowsel/codegen/SourceCodegenCtx.h"

#include <fmt/format.h>
#include <glog/logging.h>

#include "rowsel/common/base/Exceptions.h"

namespace rowsel::codegen {
namespace {
constexpr const char* kModuleHeader =
    "#include <stddef.h>\n"
    "#include <stdint.h>\n";
} // namespace

SourceCodegenCtx::SourceCodegenCtx(std::shared_ptr<Compiler> compiler)
    : compiler_(std::move(compiler)) {
  ROWSEL_CHECK_NOT_NULL(compiler_);
}

std::string SourceCodegenCtx::makeVariableName(const std::string& prefix) {
  auto& counter = nameCounters_[prefix];
  return fmt::format("{}_{}", prefix, counter++);
}

void SourceCodegenCtx::addNode(std::shared_ptr<CodegenNode> node) {
  ROWSEL_CHECK(!generated_, "Cannot add nodes after code generation");
  ROWSEL_CHECK_NOT_NULL(node);
  nodes_.push_back(std::move(node));
}

void SourceCodegenCtx::addFunction(std::string source) {
  ROWSEL_CHECK(!generated_, "Cannot add functions after code generation");
  functions_.push_back(std::move(source));
}

void SourceCodegenCtx::generate() {
  ROWSEL_CHECK(!generated_, "Code was already generated");
  for (const auto& node : nodes_) {
    node->generateCode(*this);
  }

  source_ = kModuleHeader;
  for (const auto& function : functions_) {
    source_ += "\n";
    source_ += function;
  }
  VLOG(2) << "Generated module:\n" << source_;

  if (!functions_.empty()) {
    module_ = compiler_->compile(source_);
    ROWSEL_CHECK_NOT_NULL(module_);
  }
  generated_ = true;
}

void* SourceCodegenCtx::getResult(const std::string& name) {
  ROWSEL_CHECK(generated_, "Code has not been generated yet");
  auto it = results_.find(name);
  if (it != results_.end()) {
    return it->second;
  }
  ROWSEL_CHECK_NOT_NULL(module_, "No functions were generated");
  void* result = module_->symbol(name);
  ROWSEL_CHECK_NOT_NULL(result, "Compiled function {} not found", name);
  results_.emplace(name, result);
  return result;
}

} // namespace rowsel::codegen
