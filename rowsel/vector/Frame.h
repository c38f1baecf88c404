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
#include <string>
#include <vector>

#include "rowsel/vector/Column.h"
#include "rowsel/vector/RowIndex.h"

namespace rowsel {

class Frame;

using FramePtr = std::shared_ptr<const Frame>;

/// A set of named, equally sized columns. When 'rowIndex' is set the frame is
/// a view: its visible row i is the physical row rowIndex[i] of the columns.
/// Views never nest, a view of a view references the physical columns
/// through an uplifted row index.
class Frame {
 public:
  Frame(
      std::vector<std::string> names,
      std::vector<ColumnPtr> columns,
      RowIndexPtr rowIndex = nullptr);

  static FramePtr create(
      std::vector<std::string> names,
      std::vector<ColumnPtr> columns,
      RowIndexPtr rowIndex = nullptr) {
    return std::make_shared<const Frame>(
        std::move(names), std::move(columns), std::move(rowIndex));
  }

  /// Number of visible rows.
  int64_t nrows() const {
    return rowIndex_ ? rowIndex_->size() : physicalRows_;
  }

  /// Number of rows stored in the columns.
  int64_t physicalRows() const {
    return physicalRows_;
  }

  column_index_t ncols() const {
    return columns_.size();
  }

  bool isView() const {
    return rowIndex_ != nullptr;
  }

  const RowIndexPtr& rowIndex() const {
    return rowIndex_;
  }

  const std::vector<std::string>& names() const {
    return names_;
  }

  const std::string& nameOf(column_index_t index) const;

  const ColumnPtr& column(column_index_t index) const;

  /// Row index through which column 'index' is read. All columns of a frame
  /// share the frame's row index.
  const RowIndexPtr& columnRowIndex(column_index_t index) const;

  std::optional<column_index_t> columnIndex(const std::string& name) const;

  /// Same as columnIndex() but throws if there is no such column.
  column_index_t getColumnIndex(const std::string& name) const;

  /// Returns column 'index' with the visible rows copied out of a view.
  ColumnPtr materializedColumn(column_index_t index) const;

  /// Returns a frame owning copies of the visible rows.
  FramePtr materialize() const;

  /// Returns a frame over the same physical columns, with 'rowIndex' replacing
  /// the current row index. 'rowIndex' addresses physical rows.
  FramePtr withRowIndex(RowIndexPtr rowIndex) const;

  /// Value of visible row 'row' of column 'index'.
  template <typename T>
  T valueAt(column_index_t index, int64_t row) const {
    const auto physicalRow = rowIndex_ ? (*rowIndex_)[row] : row;
    return column(index)->asChecked<T>()->valueAt(physicalRow);
  }

  std::string toString() const;

 private:
  const std::vector<std::string> names_;
  const std::vector<ColumnPtr> columns_;
  const RowIndexPtr rowIndex_;
  int64_t physicalRows_{0};
};

} // namespace rowsel
