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

#include "rowsel/exec/SortNode.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <type_traits>

namespace rowsel::exec {
namespace {

// NaN compares greater than any other value and equal to itself.
template <typename T>
bool lessThan(const T& left, const T& right) {
  if constexpr (std::is_floating_point_v<T>) {
    if (std::isnan(left)) {
      return false;
    }
    if (std::isnan(right)) {
      return true;
    }
  }
  return left < right;
}

template <typename T>
void sortRows(
    const BaseColumn& column,
    bool descending,
    std::vector<int64_t>& rows) {
  const auto* values = column.asChecked<T>();
  if (descending) {
    std::stable_sort(rows.begin(), rows.end(), [&](int64_t a, int64_t b) {
      return lessThan(values->valueAt(b), values->valueAt(a));
    });
  } else {
    std::stable_sort(rows.begin(), rows.end(), [&](int64_t a, int64_t b) {
      return lessThan(values->valueAt(a), values->valueAt(b));
    });
  }
}

} // namespace

SortNode::SortNode(FramePtr frame, column_index_t column, bool descending)
    : frame_(std::move(frame)), column_(column), descending_(descending) {
  ROWSEL_CHECK_NOT_NULL(frame_);
  ROWSEL_USER_CHECK(
      column_ < frame_->ncols(),
      "Column index {} is out of range for a Frame with {} columns",
      column_,
      frame_->ncols());
}

RowIndexPtr SortNode::makeRowIndex() const {
  std::vector<int64_t> rows;
  if (const auto& rowIndex = frame_->columnRowIndex(column_)) {
    rows = rowIndex->toVector();
  } else {
    rows.resize(frame_->physicalRows());
    std::iota(rows.begin(), rows.end(), 0);
  }

  const auto& column = *frame_->column(column_);
  switch (column.typeKind()) {
    case TypeKind::BOOLEAN:
      sortRows<bool>(column, descending_, rows);
      break;
    case TypeKind::INTEGER:
      sortRows<int32_t>(column, descending_, rows);
      break;
    case TypeKind::BIGINT:
      sortRows<int64_t>(column, descending_, rows);
      break;
    case TypeKind::DOUBLE:
      sortRows<double>(column, descending_, rows);
      break;
    case TypeKind::VARCHAR:
      sortRows<std::string>(column, descending_, rows);
      break;
  }
  return RowIndex::fromArray(std::move(rows));
}

} // namespace rowsel::exec
