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

#include "rowsel/expression/Expr.h"

#include <cmath>

#include <fmt/format.h>

namespace rowsel::exec {
namespace {

ColumnPtr selectActiveRows(const ColumnPtr& column, const EvalCtx& ctx) {
  const auto& rows = ctx.activeRows();
  return rows ? column->copyRows(*rows) : column;
}

int64_t integerAt(const BaseColumn& column, int64_t row) {
  switch (column.typeKind()) {
    case TypeKind::BOOLEAN:
      return column.asChecked<bool>()->valueAt(row) ? 1 : 0;
    case TypeKind::INTEGER:
      return column.asChecked<int32_t>()->valueAt(row);
    case TypeKind::BIGINT:
      return column.asChecked<int64_t>()->valueAt(row);
    default:
      ROWSEL_UNREACHABLE(
          "Not an integer column: {}", mapTypeKindToName(column.typeKind()));
  }
}

double doubleAt(const BaseColumn& column, int64_t row) {
  if (column.typeKind() == TypeKind::DOUBLE) {
    return column.asChecked<double>()->valueAt(row);
  }
  return static_cast<double>(integerAt(column, row));
}

template <typename T>
bool compare(CompareOp op, const T& left, const T& right) {
  switch (op) {
    case CompareOp::kEq:
      return left == right;
    case CompareOp::kNe:
      return left != right;
    case CompareOp::kLt:
      return left < right;
    case CompareOp::kLe:
      return left <= right;
    case CompareOp::kGt:
      return left > right;
    case CompareOp::kGe:
      return left >= right;
  }
  ROWSEL_UNREACHABLE();
}

void checkBoolean(const Expr& input, const Frame& frame, const char* op) {
  const auto kind = input.type(frame);
  ROWSEL_TYPE_CHECK(
      kind == TypeKind::BOOLEAN,
      "Operator {} requires boolean operands, got {} of type {}",
      op,
      input.toString(),
      mapTypeKindToName(kind));
}

} // namespace

column_index_t FieldReference::resolve(const Frame& frame) const {
  if (auto* name = std::get_if<std::string>(&field_)) {
    return frame.getColumnIndex(*name);
  }
  const auto index = std::get<column_index_t>(field_);
  ROWSEL_USER_CHECK(
      index < frame.ncols(),
      "Column index {} is out of range for a Frame with {} columns",
      index,
      frame.ncols());
  return index;
}

TypeKind FieldReference::type(const Frame& frame) const {
  return frame.column(resolve(frame))->typeKind();
}

ColumnPtr FieldReference::evaluate(EvalCtx& ctx) const {
  const auto& frame = *ctx.frame();
  return selectActiveRows(frame.column(resolve(frame)), ctx);
}

std::string FieldReference::generateValue(
    codegen::LoopBuilder& builder) const {
  return builder.columnValue(resolve(*builder.frame()));
}

std::string FieldReference::toString() const {
  if (auto* name = std::get_if<std::string>(&field_)) {
    return fmt::format("f['{}']", *name);
  }
  return fmt::format("f[{}]", std::get<column_index_t>(field_));
}

TypeKind ConstantExpr::type(const Frame& /*frame*/) const {
  return std::visit(
      [](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        return CppToType<T>::typeKind;
      },
      value_);
}

ColumnPtr ConstantExpr::evaluate(EvalCtx& ctx) const {
  const auto size = ctx.activeRowCount();
  return std::visit(
      [size](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        return makeFlatColumn<T>(
            std::vector<T>(static_cast<size_t>(size), value));
      },
      value_);
}

std::string ConstantExpr::generateValue(
    codegen::LoopBuilder& /*builder*/) const {
  if (auto* value = std::get_if<bool>(&value_)) {
    return *value ? "1" : "0";
  }
  if (auto* value = std::get_if<int64_t>(&value_)) {
    return fmt::format("INT64_C({})", *value);
  }
  if (auto* value = std::get_if<double>(&value_)) {
    ROWSEL_USER_CHECK(
        std::isfinite(*value),
        "Constant {} is not supported in generated code",
        *value);
    return fmt::format("((double) {:.17g})", *value);
  }
  ROWSEL_USER_FAIL("String constants are not supported in generated code");
}

std::string ConstantExpr::toString() const {
  if (auto* value = std::get_if<bool>(&value_)) {
    return *value ? "true" : "false";
  }
  if (auto* value = std::get_if<int64_t>(&value_)) {
    return fmt::format("{}", *value);
  }
  if (auto* value = std::get_if<double>(&value_)) {
    return fmt::format("{}", *value);
  }
  return fmt::format("'{}'", std::get<std::string>(value_));
}

const char* mapCompareOpToSymbol(CompareOp op) {
  switch (op) {
    case CompareOp::kEq:
      return "==";
    case CompareOp::kNe:
      return "!=";
    case CompareOp::kLt:
      return "<";
    case CompareOp::kLe:
      return "<=";
    case CompareOp::kGt:
      return ">";
    case CompareOp::kGe:
      return ">=";
  }
  ROWSEL_UNREACHABLE();
}

ComparisonExpr::ComparisonExpr(CompareOp op, ExprPtr left, ExprPtr right)
    : op_(op), left_(std::move(left)), right_(std::move(right)) {
  ROWSEL_CHECK_NOT_NULL(left_);
  ROWSEL_CHECK_NOT_NULL(right_);
}

TypeKind ComparisonExpr::type(const Frame& frame) const {
  const auto leftType = left_->type(frame);
  const auto rightType = right_->type(frame);
  ROWSEL_TYPE_CHECK(
      isNumericKind(leftType) == isNumericKind(rightType),
      "Cannot compare {} of type {} with {} of type {}",
      left_->toString(),
      mapTypeKindToName(leftType),
      right_->toString(),
      mapTypeKindToName(rightType));
  return TypeKind::BOOLEAN;
}

ColumnPtr ComparisonExpr::evaluate(EvalCtx& ctx) const {
  const auto& frame = *ctx.frame();
  type(frame);
  const auto left = left_->evaluate(ctx);
  const auto right = right_->evaluate(ctx);
  ROWSEL_CHECK_EQ(left->size(), right->size());

  const auto size = left->size();
  std::vector<bool> result(size);
  if (left->typeKind() == TypeKind::VARCHAR) {
    const auto* leftValues = left->asChecked<std::string>();
    const auto* rightValues = right->asChecked<std::string>();
    for (int64_t i = 0; i < size; ++i) {
      result[i] =
          compare(op_, leftValues->valueAt(i), rightValues->valueAt(i));
    }
  } else if (
      left->typeKind() == TypeKind::DOUBLE ||
      right->typeKind() == TypeKind::DOUBLE) {
    for (int64_t i = 0; i < size; ++i) {
      result[i] = compare(op_, doubleAt(*left, i), doubleAt(*right, i));
    }
  } else {
    for (int64_t i = 0; i < size; ++i) {
      result[i] = compare(op_, integerAt(*left, i), integerAt(*right, i));
    }
  }
  return makeFlatColumn<bool>(result);
}

std::string ComparisonExpr::generateValue(
    codegen::LoopBuilder& builder) const {
  type(*builder.frame());
  return fmt::format(
      "({} {} {})",
      left_->generateValue(builder),
      mapCompareOpToSymbol(op_),
      right_->generateValue(builder));
}

std::string ComparisonExpr::toString() const {
  return fmt::format(
      "({} {} {})",
      left_->toString(),
      mapCompareOpToSymbol(op_),
      right_->toString());
}

ConjunctExpr::ConjunctExpr(bool isAnd, ExprPtr left, ExprPtr right)
    : isAnd_(isAnd), left_(std::move(left)), right_(std::move(right)) {
  ROWSEL_CHECK_NOT_NULL(left_);
  ROWSEL_CHECK_NOT_NULL(right_);
}

TypeKind ConjunctExpr::type(const Frame& frame) const {
  const char* op = isAnd_ ? "&" : "|";
  checkBoolean(*left_, frame, op);
  checkBoolean(*right_, frame, op);
  return TypeKind::BOOLEAN;
}

ColumnPtr ConjunctExpr::evaluate(EvalCtx& ctx) const {
  type(*ctx.frame());
  const auto left = left_->evaluate(ctx);
  const auto right = right_->evaluate(ctx);
  ROWSEL_CHECK_EQ(left->size(), right->size());

  const auto& leftValues = left->asChecked<bool>()->values();
  const auto& rightValues = right->asChecked<bool>()->values();
  std::vector<bool> result(leftValues.size());
  for (size_t i = 0; i < result.size(); ++i) {
    result[i] = isAnd_ ? (leftValues[i] && rightValues[i])
                       : (leftValues[i] || rightValues[i]);
  }
  return makeFlatColumn<bool>(result);
}

std::string ConjunctExpr::generateValue(codegen::LoopBuilder& builder) const {
  type(*builder.frame());
  return fmt::format(
      "({} {} {})",
      left_->generateValue(builder),
      isAnd_ ? "&&" : "||",
      right_->generateValue(builder));
}

std::string ConjunctExpr::toString() const {
  return fmt::format(
      "({} {} {})", left_->toString(), isAnd_ ? "&" : "|", right_->toString());
}

NotExpr::NotExpr(ExprPtr input) : input_(std::move(input)) {
  ROWSEL_CHECK_NOT_NULL(input_);
}

TypeKind NotExpr::type(const Frame& frame) const {
  checkBoolean(*input_, frame, "~");
  return TypeKind::BOOLEAN;
}

ColumnPtr NotExpr::evaluate(EvalCtx& ctx) const {
  type(*ctx.frame());
  const auto input = input_->evaluate(ctx);
  const auto& values = input->asChecked<bool>()->values();
  std::vector<bool> result(values.size());
  for (size_t i = 0; i < result.size(); ++i) {
    result[i] = !values[i];
  }
  return makeFlatColumn<bool>(result);
}

std::string NotExpr::generateValue(codegen::LoopBuilder& builder) const {
  type(*builder.frame());
  return fmt::format("(!{})", input_->generateValue(builder));
}

std::string NotExpr::toString() const {
  return fmt::format("~{}", input_->toString());
}

} // namespace rowsel::exec
