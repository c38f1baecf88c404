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

#include "rowsel/vector/Column.h"

#include <algorithm>
#include <type_traits>

#include "rowsel/vector/RowIndex.h"

namespace rowsel {
namespace {
constexpr int64_t kMaxPrintedValues = 10;
} // namespace

std::string BaseColumn::toString() const {
  std::string result =
      fmt::format("[{} x {}: ", mapTypeKindToName(typeKind_), size_);
  const auto n = std::min(size_, kMaxPrintedValues);
  for (int64_t i = 0; i < n; ++i) {
    if (i > 0) {
      result += ", ";
    }
    result += toString(i);
  }
  if (n < size_) {
    result += ", ...";
  }
  return result + "]";
}

template <typename T>
ColumnPtr FlatColumn<T>::copyRows(const RowIndex& rows) const {
  ROWSEL_CHECK_LT(rows.max(), size());
  std::vector<Storage> values(rows.size());
  for (int64_t i = 0; i < rows.size(); ++i) {
    values[i] = values_[rows[i]];
  }
  return std::make_shared<FlatColumn<T>>(std::move(values));
}

template <typename T>
std::string FlatColumn<T>::toString(int64_t index) const {
  if constexpr (std::is_same_v<T, bool>) {
    return values_[index] ? "true" : "false";
  } else if constexpr (std::is_same_v<T, std::string>) {
    return fmt::format("\"{}\"", values_[index]);
  } else {
    return fmt::format("{}", values_[index]);
  }
}

template class FlatColumn<bool>;
template class FlatColumn<int32_t>;
template class FlatColumn<int64_t>;
template class FlatColumn<double>;
template class FlatColumn<std::string>;

} // namespace rowsel
