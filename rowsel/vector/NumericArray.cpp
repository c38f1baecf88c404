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

#include "rowsel/vector/NumericArray.h"

#include <limits>
#include <utility>

#include <folly/String.h>

namespace rowsel {
namespace {

template <typename T>
std::pair<int64_t, int64_t> boundsOf() {
  return {std::numeric_limits<T>::min(), std::numeric_limits<T>::max()};
}

// Inclusive range of values an integer dtype can hold.
std::pair<int64_t, int64_t> integerBounds(DType dtype) {
  switch (dtype) {
    case DType::kInt8:
      return boundsOf<int8_t>();
    case DType::kInt16:
      return boundsOf<int16_t>();
    case DType::kInt32:
      return boundsOf<int32_t>();
    default:
      return boundsOf<int64_t>();
  }
}

} // namespace

const char* mapDTypeToName(DType dtype) {
  switch (dtype) {
    case DType::kBool:
      return "bool";
    case DType::kInt8:
      return "int8";
    case DType::kInt16:
      return "int16";
    case DType::kInt32:
      return "int32";
    case DType::kInt64:
      return "int64";
    case DType::kFloat32:
      return "float32";
    case DType::kFloat64:
      return "float64";
  }
  ROWSEL_UNREACHABLE("Unknown dtype {}", static_cast<int>(dtype));
}

NumericArray::NumericArray(
    DType dtype,
    std::vector<int64_t> shape,
    Values values)
    : dtype_(dtype), shape_(std::move(shape)), values_(std::move(values)) {
  const auto numValues = std::visit(
      [](const auto& v) { return static_cast<int64_t>(v.size()); }, values_);
  ROWSEL_CHECK_EQ(size(), numValues, "Array shape does not match its data");
  switch (dtype_) {
    case DType::kBool:
      ROWSEL_CHECK(std::holds_alternative<std::vector<uint8_t>>(values_));
      break;
    case DType::kFloat32:
    case DType::kFloat64:
      ROWSEL_CHECK(std::holds_alternative<std::vector<double>>(values_));
      break;
    default: {
      ROWSEL_CHECK(std::holds_alternative<std::vector<int64_t>>(values_));
      const auto [lower, upper] = integerBounds(dtype_);
      for (auto value : std::get<std::vector<int64_t>>(values_)) {
        ROWSEL_CHECK(
            lower <= value && value <= upper,
            "Value {} does not fit into dtype {}",
            value,
            mapDTypeToName(dtype_));
      }
    }
  }
}

// static
NumericArray NumericArray::booleans(
    const std::vector<bool>& values,
    std::vector<int64_t> shape) {
  if (shape.empty()) {
    shape.push_back(values.size());
  }
  return NumericArray(
      DType::kBool,
      std::move(shape),
      std::vector<uint8_t>(values.begin(), values.end()));
}

// static
NumericArray NumericArray::integers(
    std::vector<int64_t> values,
    DType dtype,
    std::vector<int64_t> shape) {
  if (shape.empty()) {
    shape.push_back(values.size());
  }
  return NumericArray(dtype, std::move(shape), std::move(values));
}

// static
NumericArray NumericArray::floats(
    std::vector<double> values,
    DType dtype,
    std::vector<int64_t> shape) {
  if (shape.empty()) {
    shape.push_back(values.size());
  }
  return NumericArray(dtype, std::move(shape), std::move(values));
}

int64_t NumericArray::size() const {
  int64_t size = 1;
  for (auto dim : shape_) {
    size *= dim;
  }
  return size;
}

bool NumericArray::isInteger() const {
  switch (dtype_) {
    case DType::kInt8:
    case DType::kInt16:
    case DType::kInt32:
    case DType::kInt64:
      return true;
    default:
      return false;
  }
}

FramePtr NumericArray::toFrame() const {
  ColumnPtr column;
  switch (dtype_) {
    case DType::kBool:
      column = std::make_shared<FlatColumn<bool>>(
          std::get<std::vector<uint8_t>>(values_));
      break;
    case DType::kInt8:
    case DType::kInt16:
    case DType::kInt32: {
      // Values were checked against the dtype range on construction.
      const auto& values = std::get<std::vector<int64_t>>(values_);
      column = std::make_shared<FlatColumn<int32_t>>(
          std::vector<int32_t>(values.begin(), values.end()));
      break;
    }
    case DType::kInt64:
      column = std::make_shared<FlatColumn<int64_t>>(
          std::get<std::vector<int64_t>>(values_));
      break;
    case DType::kFloat32:
    case DType::kFloat64:
      column = std::make_shared<FlatColumn<double>>(
          std::get<std::vector<double>>(values_));
      break;
  }
  return Frame::create({"C0"}, {std::move(column)});
}

std::string NumericArray::toString() const {
  return fmt::format(
      "array(shape=({}), dtype={})",
      folly::join(", ", shape_),
      mapDTypeToName(dtype_));
}

} // namespace rowsel
