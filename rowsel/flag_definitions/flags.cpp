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

#include "rowsel/flag_definitions/flags.h"

#include "rowsel/common/base/Exceptions.h"
#include "rowsel/common/config/GlobalConfig.h"

DEFINE_int32(
    rowsel_filter_chunk_size,
    65'536,
    "Rows passed to a compiled filter function in one call");

DEFINE_string(
    rowsel_codegen_compiler,
    "cc",
    "C compiler used to build generated filter code into a shared object");

DEFINE_string(
    rowsel_codegen_tmp_dir,
    "/tmp",
    "Scratch directory for generated sources and shared objects");

namespace rowsel {

void translateFlagsToGlobalConfig() {
  ROWSEL_USER_CHECK(
      FLAGS_rowsel_filter_chunk_size > 0,
      "rowsel_filter_chunk_size must be positive, got {}",
      FLAGS_rowsel_filter_chunk_size);
  auto& config = config::globalConfig();
  config.filterChunkSize = FLAGS_rowsel_filter_chunk_size;
  config.codegenCompiler = FLAGS_rowsel_codegen_compiler;
  config.codegenTmpDir = FLAGS_rowsel_codegen_tmp_dir;
}

} // namespace rowsel
