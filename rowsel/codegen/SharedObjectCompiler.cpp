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

#include "rowsel/codegen/Compiler.h"

#include <dlfcn.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <vector>

#include <folly/ScopeGuard.h>
#include <glog/logging.h>

#include "rowsel/common/base/Exceptions.h"
#include "rowsel/common/config/GlobalConfig.h"

namespace rowsel::codegen {
namespace {

#define ROWSEL_COMPILE_FAIL(...)                   \
  _ROWSEL_THROW(                                   \
      ::rowsel::RowselRuntimeError,                \
      ::rowsel::error_source::kErrorSourceRuntime, \
      ::rowsel::error_code::kCompileError,         \
      "",                                          \
      __VA_ARGS__)

class SharedObjectModule : public CompiledModule {
 public:
  explicit SharedObjectModule(void* handle) : handle_(handle) {}

  ~SharedObjectModule() override {
    ::dlclose(handle_);
  }

  void* symbol(const std::string& name) const override {
    return ::dlsym(handle_, name.c_str());
  }

 private:
  void* const handle_;
};

std::string writeSource(const std::string& tmpDir, const std::string& source) {
  std::string pattern = tmpDir + "/rowsel_codegen_XXXXXX.c";
  std::vector<char> path(pattern.begin(), pattern.end());
  path.push_back('\0');
  const int fd = ::mkstemps(path.data(), 2);
  if (fd < 0) {
    ROWSEL_COMPILE_FAIL("Cannot create a source file in {}", tmpDir);
  }
  SCOPE_EXIT {
    ::close(fd);
  };
  size_t written = 0;
  while (written < source.size()) {
    const auto n =
        ::write(fd, source.data() + written, source.size() - written);
    if (n <= 0) {
      ::unlink(path.data());
      ROWSEL_COMPILE_FAIL("Cannot write generated source to {}", path.data());
    }
    written += n;
  }
  return std::string(path.data());
}

} // namespace

SharedObjectCompiler::SharedObjectCompiler()
    : SharedObjectCompiler(
          config::globalConfig().codegenCompiler,
          config::globalConfig().codegenTmpDir) {}

SharedObjectCompiler::SharedObjectCompiler(
    std::string compilerCommand,
    std::string tmpDir)
    : compilerCommand_(std::move(compilerCommand)),
      tmpDir_(std::move(tmpDir)) {}

std::unique_ptr<CompiledModule> SharedObjectCompiler::compile(
    const std::string& source) {
  const auto sourcePath = writeSource(tmpDir_, source);
  const auto libraryPath =
      sourcePath.substr(0, sourcePath.size() - 2) + ".so";
  SCOPE_EXIT {
    ::unlink(sourcePath.c_str());
    ::unlink(libraryPath.c_str());
  };

  const auto command = fmt::format(
      "{} -O2 -shared -fPIC -o '{}' '{}' 2>&1",
      compilerCommand_,
      libraryPath,
      sourcePath);
  VLOG(1) << "Compiling generated code: " << command;

  FILE* pipe = ::popen(command.c_str(), "r");
  if (pipe == nullptr) {
    ROWSEL_COMPILE_FAIL("Cannot run the compiler: {}", command);
  }
  std::string output;
  char buffer[256];
  while (::fgets(buffer, sizeof(buffer), pipe) != nullptr) {
    output += buffer;
  }
  const int status = ::pclose(pipe);
  if (status != 0) {
    LOG(WARNING) << "Compiler exited with status " << status << ": "
                 << command << "\n"
                 << output;
    ROWSEL_COMPILE_FAIL("Failed to compile generated code: {}", output);
  }

  void* handle = ::dlopen(libraryPath.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (handle == nullptr) {
    ROWSEL_COMPILE_FAIL("Cannot load {}: {}", libraryPath, ::dlerror());
  }
  return std::make_unique<SharedObjectModule>(handle);
}

} // namespace rowsel::codegen
