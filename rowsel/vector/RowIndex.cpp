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

#include "rowsel/vector/RowIndex.h"

#include <algorithm>
#include <limits>

#include <folly/String.h>

#include "rowsel/common/base/Exceptions.h"
#include "rowsel/common/config/GlobalConfig.h"
#include "rowsel/vector/Column.h"

namespace rowsel {
namespace {

constexpr int64_t kMaxPrintedIndices = 20;

template <typename T>
void appendColumnIndices(const BaseColumn& column, std::vector<int64_t>& out) {
  const auto* flat = column.asChecked<T>();
  const auto& values = flat->values();
  out.reserve(values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    ROWSEL_USER_CHECK(
        values[i] >= 0,
        "Row indices in an integer column cannot be negative, got {} at row {}",
        values[i],
        i);
    out.push_back(values[i]);
  }
}

} // namespace

RowIndex::RowIndex(int64_t start, int64_t count, int64_t step)
    : kind_(Kind::kSlice), start_(start), count_(count), step_(step) {
  if (count_ > 0) {
    auto last = start_ + (count_ - 1) * step_;
    min_ = std::min(start_, last);
    max_ = std::max(start_, last);
  }
}

RowIndex::RowIndex(std::vector<int64_t> indices)
    : kind_(Kind::kArray), indices_(std::move(indices)) {
  if (!indices_.empty()) {
    auto [minIt, maxIt] = std::minmax_element(indices_.begin(), indices_.end());
    min_ = *minIt;
    max_ = *maxIt;
  }
}

// static
RowIndexPtr RowIndex::fromSlice(int64_t start, int64_t count, int64_t step) {
  ROWSEL_CHECK_GE(start, 0);
  ROWSEL_CHECK_GE(count, 0);
  if (count > 0) {
    ROWSEL_CHECK_GE(
        start + (count - 1) * step, 0, "Slice generates a negative position");
  }
  return create(start, count, step);
}

// static
RowIndexPtr RowIndex::fromArray(std::vector<int64_t> indices) {
  auto rowIndex = create(std::move(indices));
  ROWSEL_CHECK(
      rowIndex->empty() || rowIndex->min() >= 0,
      "Row index cannot contain negative positions");
  return rowIndex;
}

// static
RowIndexPtr RowIndex::fromSliceList(
    const std::vector<int64_t>& bases,
    const std::vector<int64_t>& counts,
    const std::vector<int64_t>& steps) {
  ROWSEL_CHECK_EQ(counts.size(), steps.size());
  ROWSEL_CHECK_LE(counts.size(), bases.size());
  if (bases.size() == 1) {
    return counts.empty() ? fromSlice(bases[0], 1, 1)
                          : fromSlice(bases[0], counts[0], steps[0]);
  }

  std::vector<int64_t> indices;
  for (size_t i = 0; i < bases.size(); ++i) {
    const auto base = bases[i];
    const auto count = i < counts.size() ? counts[i] : 1;
    const auto step = i < steps.size() ? steps[i] : 1;
    ROWSEL_CHECK_GE(base, 0);
    ROWSEL_CHECK_GE(count, 0);
    if (count > 0) {
      ROWSEL_CHECK_GE(base + (count - 1) * step, 0);
    }
    for (int64_t j = 0; j < count; ++j) {
      indices.push_back(base + j * step);
    }
  }
  return create(std::move(indices));
}

// static
RowIndexPtr RowIndex::fromColumn(const BaseColumn& column) {
  std::vector<int64_t> indices;
  switch (column.typeKind()) {
    case TypeKind::BOOLEAN: {
      const auto& mask = column.asChecked<bool>()->values();
      for (size_t i = 0; i < mask.size(); ++i) {
        if (mask[i]) {
          indices.push_back(i);
        }
      }
      break;
    }
    case TypeKind::INTEGER:
      appendColumnIndices<int32_t>(column, indices);
      break;
    case TypeKind::BIGINT:
      appendColumnIndices<int64_t>(column, indices);
      break;
    default:
      ROWSEL_TYPE_FAIL(
          "Cannot build a row index from a column of type {}",
          mapTypeKindToName(column.typeKind()));
  }
  return create(std::move(indices));
}

// static
RowIndexPtr RowIndex::fromFilterFunction(FilterFunction filter, int64_t nrows) {
  ROWSEL_CHECK_NOT_NULL(filter);
  ROWSEL_CHECK_GE(nrows, 0);
  ROWSEL_USER_CHECK(
      nrows <= std::numeric_limits<int32_t>::max(),
      "Compiled filters support at most {} rows, got {}",
      std::numeric_limits<int32_t>::max(),
      nrows);

  const int64_t chunkSize = config::globalConfig().filterChunkSize;
  ROWSEL_CHECK_GT(chunkSize, 0);

  std::vector<int32_t> buffer(std::min(chunkSize, nrows));
  std::vector<int64_t> indices;
  for (int64_t row0 = 0; row0 < nrows; row0 += chunkSize) {
    const auto row1 = std::min(row0 + chunkSize, nrows);
    size_t numOut = 0;
    filter(row0, row1, buffer.data(), &numOut);
    ROWSEL_CHECK_LE(static_cast<int64_t>(numOut), row1 - row0);
    for (size_t i = 0; i < numOut; ++i) {
      ROWSEL_CHECK(
          buffer[i] >= row0 && buffer[i] < row1,
          "Filter function returned row {} outside of [{}, {})",
          buffer[i],
          row0,
          row1);
      indices.push_back(buffer[i]);
    }
  }
  return create(std::move(indices));
}

int64_t RowIndex::sliceStart() const {
  ROWSEL_CHECK(isSlice());
  return start_;
}

int64_t RowIndex::sliceStep() const {
  ROWSEL_CHECK(isSlice());
  return step_;
}

const std::vector<int64_t>& RowIndex::indices() const {
  ROWSEL_CHECK(isArray());
  return indices_;
}

std::vector<int64_t> RowIndex::toVector() const {
  if (isArray()) {
    return indices_;
  }
  std::vector<int64_t> result(count_);
  for (int64_t i = 0; i < count_; ++i) {
    result[i] = start_ + i * step_;
  }
  return result;
}

RowIndexPtr RowIndex::uplift(const RowIndex& parent) const {
  ROWSEL_CHECK_LT(
      max(), parent.size(), "Row index does not fit into its parent");
  if (empty()) {
    return fromSlice(0, 0, 1);
  }
  if (isSlice() && parent.isSlice()) {
    return fromSlice(
        parent.start_ + start_ * parent.step_, count_, step_ * parent.step_);
  }
  const auto n = size();
  std::vector<int64_t> indices(n);
  for (int64_t i = 0; i < n; ++i) {
    indices[i] = parent[(*this)[i]];
  }
  return create(std::move(indices));
}

RowIndexPtr RowIndex::inverse(int64_t nrows) const {
  ROWSEL_CHECK_GE(nrows, 0);
  ROWSEL_CHECK_LT(max(), nrows, "Row index does not fit into {} rows", nrows);

  std::vector<bool> selected(nrows, false);
  const auto n = size();
  for (int64_t i = 0; i < n; ++i) {
    selected[(*this)[i]] = true;
  }
  std::vector<int64_t> indices;
  indices.reserve(nrows - std::min(n, nrows));
  for (int64_t row = 0; row < nrows; ++row) {
    if (!selected[row]) {
      indices.push_back(row);
    }
  }

  if (indices.empty()) {
    return fromSlice(0, 0, 1);
  }
  const auto count = static_cast<int64_t>(indices.size());
  if (indices.back() - indices.front() + 1 == count) {
    return fromSlice(indices.front(), count, 1);
  }
  return create(std::move(indices));
}

bool RowIndex::operator==(const RowIndex& other) const {
  const auto n = size();
  if (n != other.size()) {
    return false;
  }
  for (int64_t i = 0; i < n; ++i) {
    if ((*this)[i] != other[i]) {
      return false;
    }
  }
  return true;
}

std::string RowIndex::toString() const {
  if (isSlice()) {
    return fmt::format(
        "RowIndex(slice: start={}, count={}, step={})", start_, count_, step_);
  }
  if (size() <= kMaxPrintedIndices) {
    return fmt::format("RowIndex(array: [{}])", folly::join(", ", indices_));
  }
  return fmt::format(
      "RowIndex(array: [{}, ...], size={})",
      folly::join(
          ", ", indices_.begin(), indices_.begin() + kMaxPrintedIndices),
      size());
}

} // namespace rowsel
