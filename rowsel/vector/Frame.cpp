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

#include "rowsel/vector/Frame.h"

#include <unordered_set>

#include <fmt/format.h>

namespace rowsel {

Frame::Frame(
    std::vector<std::string> names,
    std::vector<ColumnPtr> columns,
    RowIndexPtr rowIndex)
    : names_(std::move(names)),
      columns_(std::move(columns)),
      rowIndex_(std::move(rowIndex)) {
  ROWSEL_CHECK_EQ(names_.size(), columns_.size());
  std::unordered_set<std::string> uniqueNames;
  for (column_index_t i = 0; i < columns_.size(); ++i) {
    ROWSEL_CHECK_NOT_NULL(columns_[i]);
    ROWSEL_USER_CHECK(
        uniqueNames.insert(names_[i]).second,
        "Duplicate column name `{}`",
        names_[i]);
    if (i == 0) {
      physicalRows_ = columns_[i]->size();
    } else {
      ROWSEL_USER_CHECK(
          columns_[i]->size() == physicalRows_,
          "Column `{}` has {} rows, expected {}",
          names_[i],
          columns_[i]->size(),
          physicalRows_);
    }
  }
  if (rowIndex_) {
    ROWSEL_CHECK_LT(
        rowIndex_->max(),
        physicalRows_,
        "Row index of a view does not fit into its columns");
  }
}

const std::string& Frame::nameOf(column_index_t index) const {
  ROWSEL_CHECK_LT(index, names_.size());
  return names_[index];
}

const ColumnPtr& Frame::column(column_index_t index) const {
  ROWSEL_USER_CHECK(
      index < columns_.size(),
      "Column index {} is invalid for a Frame with {} columns",
      index,
      columns_.size());
  return columns_[index];
}

const RowIndexPtr& Frame::columnRowIndex(column_index_t index) const {
  ROWSEL_CHECK_LT(index, columns_.size());
  return rowIndex_;
}

std::optional<column_index_t> Frame::columnIndex(
    const std::string& name) const {
  for (column_index_t i = 0; i < names_.size(); ++i) {
    if (names_[i] == name) {
      return i;
    }
  }
  return std::nullopt;
}

column_index_t Frame::getColumnIndex(const std::string& name) const {
  auto index = columnIndex(name);
  ROWSEL_USER_CHECK(
      index.has_value(), "Column `{}` does not exist in the Frame", name);
  return index.value();
}

ColumnPtr Frame::materializedColumn(column_index_t index) const {
  const auto& physical = column(index);
  if (!rowIndex_) {
    return physical;
  }
  return physical->copyRows(*rowIndex_);
}

FramePtr Frame::materialize() const {
  std::vector<ColumnPtr> columns;
  columns.reserve(columns_.size());
  for (column_index_t i = 0; i < columns_.size(); ++i) {
    columns.push_back(materializedColumn(i));
  }
  return create(names_, std::move(columns));
}

FramePtr Frame::withRowIndex(RowIndexPtr rowIndex) const {
  return create(names_, columns_, std::move(rowIndex));
}

std::string Frame::toString() const {
  std::string result = fmt::format(
      "Frame [{} rows x {} columns{}]",
      nrows(),
      columns_.size(),
      isView() ? ", view" : "");
  for (column_index_t i = 0; i < columns_.size(); ++i) {
    result += fmt::format(
        "\n  {}: {}", names_[i], materializedColumn(i)->toString());
  }
  return result;
}

} // namespace rowsel
