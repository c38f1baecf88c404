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

#include <vector>

#include "rowsel/exec/Selector.h"

namespace rowsel::exec {

/// Normalized shape of a selector, independent of the frame it is applied to.
struct SelectorShape {
  enum class Kind {
    /// Every row.
    kAll,
    /// Boolean literal. Never a valid selector.
    kBoolean,
    /// List of integer, slice and range elements, in 'elements'.
    kElements,
    kArray,
    kFrame,
    kFunction,
    kExpr,
    /// Not a recognized selector.
    kUnknown,
  };

  Kind kind;

  std::vector<Selector> elements;

  /// True when 'elements' were produced by a generator.
  bool fromGenerator{false};
};

/// Classifies 'selector'. Scalars, slices and ranges become one-element
/// lists, sets become ascending lists of integers and generators are run to
/// exhaustion.
SelectorShape classifySelector(const Selector& selector);

} // namespace rowsel::exec
