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

#include "rowsel/codegen/Compiler.h"
#include "rowsel/exec/Selector.h"

namespace rowsel::exec {

struct SelectOptions {
  /// Select the rows not matched by the selector.
  bool negate{false};

  /// When set, filter expressions are compiled with this compiler instead of
  /// being evaluated eagerly.
  std::shared_ptr<codegen::Compiler> compiler;
};

/// Returns a view of 'frame' over the rows matched by 'selector'. The view
/// shares the physical columns of 'frame'.
FramePtr selectRows(
    const FramePtr& frame,
    const Selector& selector,
    const SelectOptions& options = {});

/// Returns a view of 'frame' with the rows sorted by column 'name'.
FramePtr sortRows(
    const FramePtr& frame,
    const std::string& name,
    bool descending = false);

} // namespace rowsel::exec
