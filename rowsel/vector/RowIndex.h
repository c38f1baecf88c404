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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace rowsel {

class BaseColumn;
class RowIndex;

using RowIndexPtr = std::shared_ptr<const RowIndex>;

/// Signature of a compiled row filter. The function inspects rows
/// [row0, row1), writes the positions of the selected rows into 'out' in
/// ascending order and stores their number in '*numOut'.
using FilterFunction =
    void (*)(int64_t row0, int64_t row1, int32_t* out, size_t* numOut);

/// Immutable addressing of a subset, or a permutation, of a frame's rows.
/// Either a slice (start, count, step) or an explicit array of positions.
/// Instances are shared read-only between frames.
class RowIndex {
 public:
  enum class Kind { kSlice, kArray };

  /// Positions start + i * step for i in [0, count). 'step' may be negative
  /// or zero, but every generated position must be non-negative.
  static RowIndexPtr fromSlice(int64_t start, int64_t count, int64_t step);

  static RowIndexPtr fromArray(std::vector<int64_t> indices);

  /// Concatenation of slices (bases[i], counts[i], steps[i]). 'counts' and
  /// 'steps' have equal lengths and may be shorter than 'bases'; missing
  /// entries are 1.
  static RowIndexPtr fromSliceList(
      const std::vector<int64_t>& bases,
      const std::vector<int64_t>& counts,
      const std::vector<int64_t>& steps);

  /// From a boolean column, selects the positions of true values. From an
  /// integer column, uses the values as positions.
  static RowIndexPtr fromColumn(const BaseColumn& column);

  /// Runs 'filter' over [0, nrows) in chunks of
  /// config::globalConfig().filterChunkSize rows.
  static RowIndexPtr fromFilterFunction(FilterFunction filter, int64_t nrows);

  Kind kind() const {
    return kind_;
  }

  bool isSlice() const {
    return kind_ == Kind::kSlice;
  }

  bool isArray() const {
    return kind_ == Kind::kArray;
  }

  int64_t size() const {
    return kind_ == Kind::kSlice ? count_
                                 : static_cast<int64_t>(indices_.size());
  }

  bool empty() const {
    return size() == 0;
  }

  int64_t operator[](int64_t i) const {
    return kind_ == Kind::kSlice ? start_ + i * step_ : indices_[i];
  }

  /// Smallest referenced position, -1 if empty.
  int64_t min() const {
    return min_;
  }

  /// Largest referenced position, -1 if empty.
  int64_t max() const {
    return max_;
  }

  int64_t sliceStart() const;

  int64_t sliceStep() const;

  const std::vector<int64_t>& indices() const;

  std::vector<int64_t> toVector() const;

  /// Reinterprets the positions of 'this' as positions within 'parent'.
  /// result[i] = parent[this[i]].
  RowIndexPtr uplift(const RowIndex& parent) const;

  /// Positions in [0, nrows) not referenced by 'this', ascending.
  RowIndexPtr inverse(int64_t nrows) const;

  /// Equal when both address the same positions in the same order.
  bool operator==(const RowIndex& other) const;

  bool operator!=(const RowIndex& other) const {
    return !(*this == other);
  }

  std::string toString() const;

 private:
  RowIndex(int64_t start, int64_t count, int64_t step);

  explicit RowIndex(std::vector<int64_t> indices);

  // Shared owner for the private constructors.
  template <typename... Args>
  static RowIndexPtr create(Args&&... args) {
    return RowIndexPtr(new RowIndex(std::forward<Args>(args)...));
  }

  Kind kind_;
  int64_t start_{0};
  int64_t count_{0};
  int64_t step_{0};
  std::vector<int64_t> indices_;
  int64_t min_{-1};
  int64_t max_{-1};
};

} // namespace rowsel
