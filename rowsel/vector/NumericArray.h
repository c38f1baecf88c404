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
#include <string>
#include <variant>
#include <vector>

#include "rowsel/vector/Frame.h"

namespace rowsel {

enum class DType : int8_t {
  kBool,
  kInt8,
  kInt16,
  kInt32,
  kInt64,
  kFloat32,
  kFloat64,
};

const char* mapDTypeToName(DType dtype);

/// Dense n-dimensional array of numbers handed over by a caller, stored in C
/// order. Integer arrays keep their values widened to int64_t and floating
/// point arrays widened to double; 'dtype' records the declared element type.
class NumericArray {
 public:
  using Values = std::variant<
      std::vector<uint8_t>,
      std::vector<int64_t>,
      std::vector<double>>;

  NumericArray(DType dtype, std::vector<int64_t> shape, Values values);

  static NumericArray booleans(
      const std::vector<bool>& values,
      std::vector<int64_t> shape = {});

  static NumericArray integers(
      std::vector<int64_t> values,
      DType dtype = DType::kInt64,
      std::vector<int64_t> shape = {});

  static NumericArray floats(
      std::vector<double> values,
      DType dtype = DType::kFloat64,
      std::vector<int64_t> shape = {});

  DType dtype() const {
    return dtype_;
  }

  const std::vector<int64_t>& shape() const {
    return shape_;
  }

  size_t ndim() const {
    return shape_.size();
  }

  int64_t size() const;

  bool isBoolean() const {
    return dtype_ == DType::kBool;
  }

  bool isInteger() const;

  /// Single column frame with the elements of the array in C order. Boolean
  /// arrays produce a BOOLEAN column, int8 to int32 arrays an INTEGER column,
  /// int64 arrays a BIGINT column and floating point arrays a DOUBLE column.
  FramePtr toFrame() const;

  std::string toString() const;

 private:
  const DType dtype_;
  const std::vector<int64_t> shape_;
  const Values values_;
};

} // namespace rowsel
