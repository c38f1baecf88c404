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

#include <memory>
#include <string>
#include <type_traits>
#include <variant>

#include "rowsel/codegen/LoopBuilder.h"
#include "rowsel/expression/EvalCtx.h"
#include "rowsel/type/Type.h"
#include "rowsel/vector/Column.h"

namespace rowsel::exec {

class Expr;

using ExprPtr = std::shared_ptr<const Expr>;

/// Expression over the columns of a frame. Expressions are immutable and may
/// be shared between selections.
class Expr {
 public:
  virtual ~Expr() = default;

  /// Result type of the expression when applied to 'frame'. Throws if the
  /// expression is not applicable to the frame.
  virtual TypeKind type(const Frame& frame) const = 0;

  /// Evaluates the expression over the active rows of 'ctx'. The result has
  /// one value per active row, in the order of the active rows.
  virtual ColumnPtr evaluate(EvalCtx& ctx) const = 0;

  /// Returns a C expression computing the value of this expression at the
  /// current row of the loop being built.
  virtual std::string generateValue(codegen::LoopBuilder& builder) const = 0;

  virtual std::string toString() const = 0;
};

/// Reference to a column of the frame, by name or by position.
class FieldReference : public Expr {
 public:
  explicit FieldReference(std::string name) : field_(std::move(name)) {}

  explicit FieldReference(column_index_t index) : field_(index) {}

  TypeKind type(const Frame& frame) const override;

  ColumnPtr evaluate(EvalCtx& ctx) const override;

  std::string generateValue(codegen::LoopBuilder& builder) const override;

  std::string toString() const override;

  /// Position of the referenced column in 'frame'.
  column_index_t resolve(const Frame& frame) const;

 private:
  const std::variant<std::string, column_index_t> field_;
};

class ConstantExpr : public Expr {
 public:
  using Value = std::variant<bool, int64_t, double, std::string>;

  explicit ConstantExpr(Value value) : value_(std::move(value)) {}

  const Value& value() const {
    return value_;
  }

  TypeKind type(const Frame& frame) const override;

  ColumnPtr evaluate(EvalCtx& ctx) const override;

  std::string generateValue(codegen::LoopBuilder& builder) const override;

  std::string toString() const override;

 private:
  const Value value_;
};

enum class CompareOp { kEq, kNe, kLt, kLe, kGt, kGe };

const char* mapCompareOpToSymbol(CompareOp op);

/// Comparison of two values. Numbers compare with numbers (booleans count as
/// numbers) and strings with strings.
class ComparisonExpr : public Expr {
 public:
  ComparisonExpr(CompareOp op, ExprPtr left, ExprPtr right);

  CompareOp op() const {
    return op_;
  }

  TypeKind type(const Frame& frame) const override;

  ColumnPtr evaluate(EvalCtx& ctx) const override;

  std::string generateValue(codegen::LoopBuilder& builder) const override;

  std::string toString() const override;

 private:
  const CompareOp op_;
  const ExprPtr left_;
  const ExprPtr right_;
};

/// Logical AND or OR of two boolean expressions.
class ConjunctExpr : public Expr {
 public:
  ConjunctExpr(bool isAnd, ExprPtr left, ExprPtr right);

  bool isAnd() const {
    return isAnd_;
  }

  TypeKind type(const Frame& frame) const override;

  ColumnPtr evaluate(EvalCtx& ctx) const override;

  std::string generateValue(codegen::LoopBuilder& builder) const override;

  std::string toString() const override;

 private:
  const bool isAnd_;
  const ExprPtr left_;
  const ExprPtr right_;
};

class NotExpr : public Expr {
 public:
  explicit NotExpr(ExprPtr input);

  TypeKind type(const Frame& frame) const override;

  ColumnPtr evaluate(EvalCtx& ctx) const override;

  std::string generateValue(codegen::LoopBuilder& builder) const override;

  std::string toString() const override;

 private:
  const ExprPtr input_;
};

inline ExprPtr makeField(const std::string& name) {
  return std::make_shared<FieldReference>(name);
}

inline ExprPtr makeField(column_index_t index) {
  return std::make_shared<FieldReference>(index);
}

template <typename T>
ExprPtr makeConstant(T value) {
  if constexpr (std::is_same_v<T, bool>) {
    return std::make_shared<ConstantExpr>(ConstantExpr::Value(value));
  } else if constexpr (std::is_integral_v<T>) {
    return std::make_shared<ConstantExpr>(
        ConstantExpr::Value(static_cast<int64_t>(value)));
  } else if constexpr (std::is_floating_point_v<T>) {
    return std::make_shared<ConstantExpr>(
        ConstantExpr::Value(static_cast<double>(value)));
  } else {
    return std::make_shared<ConstantExpr>(
        ConstantExpr::Value(std::string(value)));
  }
}

inline ExprPtr makeComparison(CompareOp op, ExprPtr left, ExprPtr right) {
  return std::make_shared<ComparisonExpr>(
      op, std::move(left), std::move(right));
}

inline ExprPtr makeAnd(ExprPtr left, ExprPtr right) {
  return std::make_shared<ConjunctExpr>(
      true, std::move(left), std::move(right));
}

inline ExprPtr makeOr(ExprPtr left, ExprPtr right) {
  return std::make_shared<ConjunctExpr>(
      false, std::move(left), std::move(right));
}

inline ExprPtr makeNot(ExprPtr input) {
  return std::make_shared<NotExpr>(std::move(input));
}

} // namespace rowsel::exec
