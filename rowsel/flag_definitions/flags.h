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

#include <gflags/gflags.h>

/// When GFlags are used, they must be translated to
/// rowsel::config::GlobalConfig by invoking translateFlagsToGlobalConfig
namespace rowsel {
void translateFlagsToGlobalConfig();
}

/// Rows passed to a compiled filter function in one call while building a
/// row index from it.
DECLARE_int32(rowsel_filter_chunk_size);

/// C compiler used to build generated filter code into a shared object.
DECLARE_string(rowsel_codegen_compiler);

/// Scratch directory for generated sources and shared objects.
DECLARE_string(rowsel_codegen_tmp_dir);
