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

namespace rowsel::codegen {

class CodegenCtx;

/// A participant in code generation. Registered with a CodegenCtx, it emits
/// its functions when the context generates the module.
class CodegenNode {
 public:
  virtual ~CodegenNode() = default;

  virtual void generateCode(CodegenCtx& ctx) = 0;
};

/// Collects generated C functions into one module and hands out pointers to
/// the compiled functions.
class CodegenCtx {
 public:
  virtual ~CodegenCtx() = default;

  /// Returns a name starting with 'prefix' that is unique in this context.
  virtual std::string makeVariableName(const std::string& prefix) = 0;

  virtual void addNode(std::shared_ptr<CodegenNode> node) = 0;

  /// Appends the source of one complete C function to the module.
  virtual void addFunction(std::string source) = 0;

  /// Runs code generation for all registered nodes and compiles the module.
  virtual void generate() = 0;

  virtual bool isGenerated() const = 0;

  /// Address of the compiled function 'name'. Valid after generate().
  virtual void* getResult(const std::string& name) = 0;
};

} // namespace rowsel::codegen
