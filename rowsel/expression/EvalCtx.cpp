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

#include "rowsel/expression/EvalCtx.h"

namespace rowsel::exec {

EvalCtx::EvalCtx(FramePtr frame, codegen::CodegenCtx* codegen)
    : frame_(std::move(frame)), codegen_(codegen) {
  ROWSEL_CHECK_NOT_NULL(frame_);
}

void EvalCtx::setSourceRowIndex(SourceRowIndex sourceRowIndex) {
  sourceRowIndex_ = std::move(sourceRowIndex);
}

void EvalCtx::setFinalRowIndex(
    RowIndexPtr finalRowIndex,
    RowIndexPtr targetRowIndex) {
  ROWSEL_CHECK(!hasFinalRowIndex_, "Final row index was already set");
  finalRowIndex_ = std::move(finalRowIndex);
  targetRowIndex_ = std::move(targetRowIndex);
  hasFinalRowIndex_ = true;
}

void EvalCtx::setCurrentRowIndex(RowIndexPtr rowIndex) {
  currentRowIndex_ = std::move(rowIndex);
}

int64_t EvalCtx::activeRowCount() const {
  const auto& rows = activeRows();
  return rows ? rows->size() : frame_->physicalRows();
}

} // namespace rowsel::exec
