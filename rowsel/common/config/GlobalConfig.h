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

#include <cstdint>
#include <string>

namespace rowsel::config {

struct GlobalConfig {
  /// Number of rows handed to a compiled filter function per call when a row
  /// index is built from a predicate function.
  int32_t filterChunkSize{65'536};
  /// C compiler invoked to turn generated filter code into a shared object.
  std::string codegenCompiler{"cc"};
  /// Directory for generated sources and shared objects. Files are removed
  /// once the shared object is loaded.
  std::string codegenTmpDir{"/tmp"};
};

GlobalConfig& globalConfig();

} // namespace rowsel::config
