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

#include <string>

#include "rowsel/expression/Expr.h"

namespace rowsel::exec {

/// Proxy handed to rows functions. f["name"] and f[index] refer to columns of
/// the frame being selected from.
class ColumnScope {
 public:
  ExprPtr operator[](const std::string& name) const {
    return makeField(name);
  }

  ExprPtr operator[](column_index_t index) const {
    return makeField(index);
  }
};

} // namespace rowsel::exec
