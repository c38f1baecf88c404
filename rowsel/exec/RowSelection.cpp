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

#include "rowsel/exec/RowSelection.h"

#include <glog/logging.h>

#include "rowsel/codegen/SourceCodegenCtx.h"
#include "rowsel/exec/RowFilterFactory.h"
#include "rowsel/exec/SortNode.h"

namespace rowsel::exec {

FramePtr selectRows(
    const FramePtr& frame,
    const Selector& selector,
    const SelectOptions& options) {
  ROWSEL_CHECK_NOT_NULL(frame);
  std::unique_ptr<codegen::SourceCodegenCtx> codegen;
  if (options.compiler) {
    codegen = std::make_unique<codegen::SourceCodegenCtx>(options.compiler);
  }
  EvalCtx ctx(frame, codegen.get());

  auto rowFilter = createRowFilter(selector, ctx);
  if (options.negate) {
    rowFilter.negate();
  }
  VLOG(1) << "Resolved " << selector.toString() << " to "
          << rowFilter.toString();
  if (codegen) {
    codegen->generate();
  }
  rowFilter.execute();
  return frame->withRowIndex(ctx.finalRowIndex());
}

FramePtr sortRows(
    const FramePtr& frame,
    const std::string& name,
    bool descending) {
  ROWSEL_CHECK_NOT_NULL(frame);
  EvalCtx ctx(frame);
  auto rowFilter = RowFilter::sorted(
      ctx,
      std::make_shared<SortNode>(
          frame, frame->getColumnIndex(name), descending));
  rowFilter.execute();
  return frame->withRowIndex(ctx.finalRowIndex());
}

} // namespace rowsel::exec
