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
#include <optional>

#include "rowsel/codegen/CodegenCtx.h"
#include "rowsel/vector/Frame.h"

namespace rowsel::exec {

/// Content of the "source" slot of an evaluation context: the row index of a
/// selection relative to the visible rows of the selected frame.
class SourceRowIndex {
 public:
  enum class State {
    /// Identity, every row is selected.
    kAbsent,
    /// The index is only known once generated code or a sort has run.
    kDeferred,
    kKnown,
  };

  static SourceRowIndex absent() {
    return SourceRowIndex(State::kAbsent, nullptr);
  }

  static SourceRowIndex deferred() {
    return SourceRowIndex(State::kDeferred, nullptr);
  }

  static SourceRowIndex known(RowIndexPtr rowIndex) {
    ROWSEL_CHECK_NOT_NULL(rowIndex);
    return SourceRowIndex(State::kKnown, std::move(rowIndex));
  }

  State state() const {
    return state_;
  }

  bool isAbsent() const {
    return state_ == State::kAbsent;
  }

  bool isDeferred() const {
    return state_ == State::kDeferred;
  }

  bool isKnown() const {
    return state_ == State::kKnown;
  }

  const RowIndexPtr& rowIndex() const {
    return rowIndex_;
  }

 private:
  SourceRowIndex(State state, RowIndexPtr rowIndex)
      : state_(state), rowIndex_(std::move(rowIndex)) {}

  State state_;
  RowIndexPtr rowIndex_;
};

/// Context of one row selection over 'frame'. Collects the source and final
/// row indices produced by the selection and exposes the selection in effect
/// to subsequent expression evaluation. Not thread-safe; one selection runs
/// per context.
class EvalCtx {
 public:
  /// 'codegen' is optional. When set, filter expressions are compiled into
  /// native loops instead of being evaluated eagerly. The caller keeps it
  /// alive for the lifetime of the context.
  explicit EvalCtx(FramePtr frame, codegen::CodegenCtx* codegen = nullptr);

  const FramePtr& frame() const {
    return frame_;
  }

  /// Number of visible rows of the frame.
  int64_t nrows() const {
    return frame_->nrows();
  }

  /// Row index of the frame if it is a view, nullptr otherwise.
  const RowIndexPtr& frameRowIndex() const {
    return frame_->rowIndex();
  }

  codegen::CodegenCtx* codegen() const {
    return codegen_;
  }

  void setSourceRowIndex(SourceRowIndex sourceRowIndex);

  const SourceRowIndex& sourceRowIndex() const {
    return sourceRowIndex_;
  }

  /// Records the final row index of the selection together with the row
  /// index that was in effect on the selected columns before it. May only be
  /// called once.
  void setFinalRowIndex(RowIndexPtr finalRowIndex, RowIndexPtr targetRowIndex);

  bool hasFinalRowIndex() const {
    return hasFinalRowIndex_;
  }

  /// Row index over the physical rows of the frame. nullptr means all rows.
  const RowIndexPtr& finalRowIndex() const {
    ROWSEL_CHECK(hasFinalRowIndex_, "Final row index has not been set");
    return finalRowIndex_;
  }

  const RowIndexPtr& targetRowIndex() const {
    ROWSEL_CHECK(hasFinalRowIndex_, "Final row index has not been set");
    return targetRowIndex_;
  }

  void setCurrentRowIndex(RowIndexPtr rowIndex);

  bool hasCurrentRowIndex() const {
    return currentRowIndex_.has_value();
  }

  /// Physical rows that expressions are evaluated over: the current row index
  /// once a selection is in effect, otherwise the frame's own row index.
  /// nullptr means every physical row.
  const RowIndexPtr& activeRows() const {
    return currentRowIndex_.has_value() ? *currentRowIndex_
                                        : frame_->rowIndex();
  }

  int64_t activeRowCount() const;

 private:
  const FramePtr frame_;
  codegen::CodegenCtx* const codegen_;

  SourceRowIndex sourceRowIndex_{SourceRowIndex::absent()};
  bool hasFinalRowIndex_{false};
  RowIndexPtr finalRowIndex_;
  RowIndexPtr targetRowIndex_;
  std::optional<RowIndexPtr> currentRowIndex_;
};

} // namespace rowsel::exec
