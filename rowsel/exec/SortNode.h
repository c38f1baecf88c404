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

#include "rowsel/vector/Frame.h"

namespace rowsel::exec {

/// Sort of the visible rows of 'frame' by the values of one column.
class SortNode {
 public:
  SortNode(FramePtr frame, column_index_t column, bool descending = false);

  const FramePtr& frame() const {
    return frame_;
  }

  column_index_t column() const {
    return column_;
  }

  bool descending() const {
    return descending_;
  }

  /// Physical rows of the frame in sorted order. The sort is stable.
  RowIndexPtr makeRowIndex() const;

 private:
  const FramePtr frame_;
  const column_index_t column_;
  const bool descending_;
};

} // namespace rowsel::exec
