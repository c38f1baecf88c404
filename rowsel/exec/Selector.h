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
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "rowsel/expression/ColumnScope.h"
#include "rowsel/expression/Expr.h"
#include "rowsel/vector/Frame.h"
#include "rowsel/vector/NumericArray.h"

namespace rowsel::exec {

/// Slice with optional bounds. Bounds are kept as given; a selector may carry
/// floating point bounds, which are rejected when the slice is resolved.
struct Slice {
  using Bound = std::variant<int64_t, double>;

  std::optional<Bound> start;
  std::optional<Bound> stop;
  std::optional<Bound> step;

  /// True if no bound is a floating point value.
  bool isIntegerValued() const;

  std::string toString() const;
};

/// Arithmetic progression start, start + step, ... stopping before 'stop'.
class Range {
 public:
  Range(int64_t start, int64_t stop, int64_t step = 1);

  int64_t start() const {
    return start_;
  }

  int64_t stop() const {
    return stop_;
  }

  int64_t step() const {
    return step_;
  }

  std::string toString() const;

 private:
  const int64_t start_;
  const int64_t stop_;
  const int64_t step_;
};

enum class SelectorKind {
  kAll,
  kBoolean,
  kInteger,
  kDouble,
  kString,
  kSlice,
  kRange,
  kList,
  kSet,
  kGenerator,
  kArray,
  kFrame,
  kFunction,
  kExpr,
};

const char* mapSelectorKindToName(SelectorKind kind);

class Selector;

/// Produces the elements of a lazily generated list, one per call, and
/// std::nullopt once exhausted.
using RowsGenerator = std::function<std::optional<Selector>()>;

/// Computes a selector from the columns of the frame being selected from.
using RowsFunction = std::function<Selector(const ColumnScope&)>;

/// The `rows` argument of a row selection as given by the caller.
class Selector {
 public:
  /// Selects every row.
  Selector() = default;

  static Selector all() {
    return Selector();
  }

  static Selector boolean(bool value) {
    return Selector(value);
  }

  static Selector integer(int64_t value) {
    return Selector(value);
  }

  static Selector floating(double value) {
    return Selector(value);
  }

  static Selector string(std::string value) {
    return Selector(std::move(value));
  }

  static Selector slice(Slice slice) {
    return Selector(std::move(slice));
  }

  /// Integer slice start:stop:step. std::nullopt leaves a bound out.
  static Selector slice(
      std::optional<int64_t> start,
      std::optional<int64_t> stop,
      std::optional<int64_t> step = std::nullopt);

  static Selector range(int64_t start, int64_t stop, int64_t step = 1) {
    return Selector(Range(start, stop, step));
  }

  static Selector list(std::vector<Selector> elements) {
    return Selector(
        std::make_shared<const std::vector<Selector>>(std::move(elements)));
  }

  static Selector set(std::set<int64_t> values) {
    return Selector(
        std::make_shared<const std::set<int64_t>>(std::move(values)));
  }

  static Selector generator(RowsGenerator generator) {
    ROWSEL_CHECK(generator != nullptr);
    return Selector(Generator{std::move(generator)});
  }

  static Selector array(NumericArray array) {
    return Selector(std::make_shared<const NumericArray>(std::move(array)));
  }

  static Selector frame(FramePtr frame) {
    ROWSEL_CHECK_NOT_NULL(frame);
    return Selector(std::move(frame));
  }

  static Selector function(RowsFunction function) {
    ROWSEL_CHECK(function != nullptr);
    return Selector(Function{std::move(function)});
  }

  static Selector expr(ExprPtr expr) {
    ROWSEL_CHECK_NOT_NULL(expr);
    return Selector(std::move(expr));
  }

  SelectorKind kind() const {
    return static_cast<SelectorKind>(value_.index());
  }

  bool asBoolean() const {
    return get<bool>();
  }

  int64_t asInteger() const {
    return get<int64_t>();
  }

  double asDouble() const {
    return get<double>();
  }

  const std::string& asString() const {
    return get<std::string>();
  }

  const Slice& asSlice() const {
    return get<Slice>();
  }

  const Range& asRange() const {
    return get<Range>();
  }

  const std::vector<Selector>& asList() const {
    return *get<ListPtr>();
  }

  const std::set<int64_t>& asSet() const {
    return *get<SetPtr>();
  }

  const RowsGenerator& asGenerator() const {
    return get<Generator>().next;
  }

  const NumericArray& asArray() const {
    return *get<ArrayPtr>();
  }

  const FramePtr& asFrame() const {
    return get<FramePtr>();
  }

  const RowsFunction& asFunction() const {
    return get<Function>().call;
  }

  const ExprPtr& asExpr() const {
    return get<ExprPtr>();
  }

  /// Representation used in error messages.
  std::string toString() const;

 private:
  using ListPtr = std::shared_ptr<const std::vector<Selector>>;
  using SetPtr = std::shared_ptr<const std::set<int64_t>>;
  using ArrayPtr = std::shared_ptr<const NumericArray>;

  struct Generator {
    RowsGenerator next;
  };

  struct Function {
    RowsFunction call;
  };

  // Alternatives are in the order of SelectorKind.
  using Value = std::variant<
      std::monostate,
      bool,
      int64_t,
      double,
      std::string,
      Slice,
      Range,
      ListPtr,
      SetPtr,
      Generator,
      ArrayPtr,
      FramePtr,
      Function,
      ExprPtr>;

  template <typename T>
  explicit Selector(T value) : value_(std::move(value)) {}

  template <typename T>
  const T& get() const {
    auto* value = std::get_if<T>(&value_);
    ROWSEL_CHECK_NOT_NULL(
        value,
        "Selector of kind {} accessed as a different kind",
        mapSelectorKindToName(kind()));
    return *value;
  }

  Value value_;
};

} // namespace rowsel::exec
