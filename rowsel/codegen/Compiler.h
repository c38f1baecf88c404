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

/// A loaded, compiled module.
class CompiledModule {
 public:
  virtual ~CompiledModule() = default;

  /// Address of the symbol 'name', nullptr if the module has no such symbol.
  virtual void* symbol(const std::string& name) const = 0;
};

class Compiler {
 public:
  virtual ~Compiler() = default;

  /// Compiles a translation unit of C source code and loads it.
  virtual std::unique_ptr<CompiledModule> compile(
      const std::string& source) = 0;
};

/// Builds a shared object with an external C compiler and loads it with
/// dlopen(). The compiler command and the scratch directory default to
/// config::globalConfig().
class SharedObjectCompiler : public Compiler {
 public:
  SharedObjectCompiler();

  SharedObjectCompiler(std::string compilerCommand, std::string tmpDir);

  std::unique_ptr<CompiledModule> compile(const std::string& source) override;

 private:
  const std::string compilerCommand_;
  const std::string tmpDir_;
};

} // namespace rowsel::codegen
