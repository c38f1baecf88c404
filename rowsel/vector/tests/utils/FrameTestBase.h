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

#include <numeric>
#include <string>
#include <vector>

#include "rowsel/vector/Frame.h"

namespace rowsel::test {

/// Helpers for building columns and frames in tests.
class FrameTestBase {
 protected:
  template <typename T>
  static ColumnPtr makeColumn(const std::vector<T>& values) {
    return makeFlatColumn<T>(values);
  }

  static FramePtr makeFrame(
      std::vector<std::string> names,
      std::vector<ColumnPtr> columns,
      RowIndexPtr rowIndex = nullptr) {
    return Frame::create(
        std::move(names), std::move(columns), std::move(rowIndex));
  }

  /// Frame with a single BIGINT column "A" holding 0, 1, ..., size - 1.
  static FramePtr makeSequenceFrame(int64_t size) {
    std::vector<int64_t> values(size);
    std::iota(values.begin(), values.end(), 0);
    return makeFrame({"A"}, {makeColumn(values)});
  }

  /// Visible values of BIGINT column 'index' of 'frame'.
  static std::vector<int64_t> bigintValues(
      const Frame& frame,
      column_index_t index = 0) {
    std::vector<int64_t> values;
    for (int64_t row = 0; row < frame.nrows(); ++row) {
      values.push_back(frame.valueAt<int64_t>(index, row));
    }
    return values;
  }

  static std::vector<int64_t> positions(const RowIndexPtr& rowIndex) {
    return rowIndex ? rowIndex->toVector() : std::vector<int64_t>{};
  }
};

} // namespace rowsel::test
