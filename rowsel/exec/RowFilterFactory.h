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

#include "rowsel/exec/RowFilter.h"
#include "rowsel/exec/Selector.h"

namespace rowsel::exec {

/// Resolves 'selector' against the frame of 'ctx' into a RowFilter.
///
/// Integers, slices and ranges, alone or in lists, sets and generators,
/// collapse into the simplest equivalent rule: AllRows for the full range in
/// order, SliceRows for a single slice or a single row, ArrayRows for a list
/// of single rows and MultiSliceRows otherwise. Numeric arrays and single
/// column frames become BooleanColumnRows or IntegerColumnRows. Rows functions
/// are called with a ColumnScope and their result is resolved in turn;
/// 'nested' is set for that result, which may not be a function itself.
///
/// Throws RowselUserError with error code kTypeMismatch for selectors of the
/// wrong kind and kInvalidArgument for selectors with invalid values.
RowFilter
createRowFilter(const Selector& selector, EvalCtx& ctx, bool nested = false);

} // namespace rowsel::exec
