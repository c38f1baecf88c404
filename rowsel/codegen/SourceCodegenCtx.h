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

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <folly/container/F14Map.h>

#include "rowsel/codegen/CodegenCtx.h"
#include "rowsel/codegen/Compiler.h"

namespace rowsel::codegen {

/// CodegenCtx assembling C source text and compiling it with 'compiler'.
class SourceCodegenCtx : public CodegenCtx {
 public:
  explicit SourceCodegenCtx(std::shared_ptr<Compiler> compiler);

  std::string makeVariableName(const std::string& prefix) override;

  void addNode(std::shared_ptr<CodegenNode> node) override;

  void addFunction(std::string source) override;

  void generate() override;

  bool isGenerated() const override {
    return generated_;
  }

  void* getResult(const std::string& name) override;

  /// Source of the generated module. Empty before generate().
  const std::string& source() const {
    return source_;
  }

 private:
  const std::shared_ptr<Compiler> compiler_;
  std::vector<std::shared_ptr<CodegenNode>> nodes_;
  std::vector<std::string> functions_;
  folly::F14FastMap<std::string, int32_t> nameCounters_;
  std::string source_;
  std::unique_ptr<CompiledModule> module_;
  folly::F14FastMap<std::string, void*> results_;
  bool generated_{false};
};

} // namespace rowsel::codegen
