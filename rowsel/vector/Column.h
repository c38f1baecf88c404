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

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "rowsel/common/base/Exceptions.h"
#include "rowsel/type/Type.h"

namespace rowsel {

class BaseColumn;
class RowIndex;

template <typename T>
class FlatColumn;

using ColumnPtr = std::shared_ptr<const BaseColumn>;

/// Immutable typed column of values over the physical rows of a frame.
class BaseColumn {
 public:
  BaseColumn(TypeKind typeKind, int64_t size)
      : typeKind_(typeKind), size_(size) {}

  virtual ~BaseColumn() = default;

  TypeKind typeKind() const {
    return typeKind_;
  }

  int64_t size() const {
    return size_;
  }

  template <typename T>
  const FlatColumn<T>* as() const {
    return dynamic_cast<const FlatColumn<T>*>(this);
  }

  template <typename T>
  const FlatColumn<T>* asChecked() const {
    auto* flat = as<T>();
    ROWSEL_CHECK_NOT_NULL(
        flat,
        "Wrong type cast: column of type {} is not {}",
        mapTypeKindToName(typeKind_),
        mapTypeKindToName(CppToType<T>::typeKind));
    return flat;
  }

  /// Pointer to the contiguous storage of the values.
  virtual const void* rawData() const = 0;

  /// Returns a new column holding the values at the positions of 'rows'.
  virtual ColumnPtr copyRows(const RowIndex& rows) const = 0;

  virtual std::string toString(int64_t index) const = 0;

  std::string toString() const;

 private:
  const TypeKind typeKind_;
  const int64_t size_;
};

template <typename T>
class FlatColumn : public BaseColumn {
 public:
  using Storage = typename StorageType<T>::type;

  explicit FlatColumn(std::vector<Storage> values)
      : BaseColumn(CppToType<T>::typeKind, values.size()),
        values_(std::move(values)) {}

  T valueAt(int64_t index) const {
    return static_cast<T>(values_[index]);
  }

  const std::vector<Storage>& values() const {
    return values_;
  }

  const void* rawData() const override {
    return values_.data();
  }

  ColumnPtr copyRows(const RowIndex& rows) const override;

  std::string toString(int64_t index) const override;

 private:
  const std::vector<Storage> values_;
};

extern template class FlatColumn<bool>;
extern template class FlatColumn<int32_t>;
extern template class FlatColumn<int64_t>;
extern template class FlatColumn<double>;
extern template class FlatColumn<std::string>;

/// Creates a column from C++ values. Booleans are repacked one per byte.
template <typename T>
ColumnPtr makeFlatColumn(const std::vector<T>& values) {
  using Storage = typename StorageType<T>::type;
  return std::make_shared<FlatColumn<T>>(
      std::vector<Storage>(values.begin(), values.end()));
}

} // namespace rowsel
