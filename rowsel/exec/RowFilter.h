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
#include <variant>
#include <vector>

#include "rowsel/codegen/CodegenCtx.h"
#include "rowsel/expression/EvalCtx.h"
#include "rowsel/expression/Expr.h"

namespace rowsel::exec {

class SortNode;

/// Every row. Kept apart from SliceRows so that consumers can skip filtering
/// altogether.
struct AllRows {};

/// Rows start + i * step for i in [0, count).
struct SliceRows {
  int64_t start;
  int64_t count;
  int64_t step;
};

/// Explicit row positions, already normalized to [0, nrows).
struct ArrayRows {
  std::vector<int64_t> rows;
};

/// Concatenation of slices. 'counts' and 'steps' have equal lengths and may be
/// shorter than 'bases', missing entries are 1.
struct MultiSliceRows {
  std::vector<int64_t> bases;
  std::vector<int64_t> counts;
  std::vector<int64_t> steps;
};

/// Rows where 'mask' is true. The mask has one value per row of the frame.
struct BooleanColumnRows {
  ColumnPtr mask;
};

/// Rows listed by the values of an integer column.
struct IntegerColumnRows {
  ColumnPtr column;
};

class FilterLoopGenerator;

/// Rows for which a boolean expression is true. 'generator' is set when the
/// expression is compiled into a filter function.
struct FilterExprRows {
  ExprPtr expr;
  std::shared_ptr<FilterLoopGenerator> generator;
};

/// Rows in the order computed by a sort.
struct SortedRows {
  std::shared_ptr<const SortNode> sortNode;
};

using RowFilterRule = std::variant<
    AllRows,
    SliceRows,
    ArrayRows,
    MultiSliceRows,
    BooleanColumnRows,
    IntegerColumnRows,
    FilterExprRows,
    SortedRows>;

/// Alternatives of RowFilterRule, in the same order.
enum class RowFilterKind {
  kAll,
  kSlice,
  kArray,
  kMultiSlice,
  kBooleanColumn,
  kIntegerColumn,
  kFilterExpr,
  kSorted,
};

const char* mapRowFilterKindToName(RowFilterKind kind);

/// Emits a filter function for a boolean expression:
///
///   void <name>(int64_t row0, int64_t row1, int32_t* out, size_t* n_outs)
///
/// writing the visible rows in [row0, row1) where the expression is true
/// into 'out'.
class FilterLoopGenerator : public codegen::CodegenNode {
 public:
  FilterLoopGenerator(FramePtr frame, ExprPtr expr, std::string name);

  const std::string& name() const {
    return name_;
  }

  void generateCode(codegen::CodegenCtx& ctx) override;

 private:
  const FramePtr frame_;
  const ExprPtr expr_;
  const std::string name_;
};

/// Resolved `rows` argument of a selection over the frame of 'ctx'. A
/// RowFilter is executed exactly once; execution stores the source and final
/// row indices in the context and makes the final index the context's
/// current row index.
class RowFilter {
 public:
  static RowFilter all(EvalCtx& ctx);

  /// Requires start >= 0, count >= 0 and start + (count - 1) * step >= 0.
  static RowFilter
  slice(EvalCtx& ctx, int64_t start, int64_t count, int64_t step);

  static RowFilter array(EvalCtx& ctx, std::vector<int64_t> rows);

  static RowFilter multiSlice(
      EvalCtx& ctx,
      std::vector<int64_t> bases,
      std::vector<int64_t> counts,
      std::vector<int64_t> steps);

  static RowFilter booleanColumn(EvalCtx& ctx, ColumnPtr mask);

  static RowFilter integerColumn(EvalCtx& ctx, ColumnPtr column);

  /// 'expr' must be boolean. If 'ctx' has a code generation context, the
  /// filter registers a generator for a compiled filter function with it.
  static RowFilter filterExpr(EvalCtx& ctx, ExprPtr expr);

  static RowFilter sorted(
      EvalCtx& ctx,
      std::shared_ptr<const SortNode> sortNode);

  /// Toggles selection of the complement of the rows.
  void negate();

  bool isNegated() const {
    return inverse_;
  }

  RowFilterKind kind() const {
    return static_cast<RowFilterKind>(rule_.index());
  }

  const RowFilterRule& rule() const {
    return rule_;
  }

  void execute();

  std::string toString() const;

 private:
  RowFilter(EvalCtx& ctx, RowFilterRule rule);

  SourceRowIndex makeSourceRowIndex() const;

  RowIndexPtr makeFinalRowIndex(const SourceRowIndex& source) const;

  // Negates 'rowIndex' if needed, then uplifts it through the frame's row
  // index.
  RowIndexPtr compose(RowIndexPtr rowIndex) const;

  RowIndexPtr makeFilterRowIndex(const FilterExprRows& rule) const;

  void executeSorted(const SortedRows& rule);

  EvalCtx& ctx_;
  RowFilterRule rule_;
  bool inverse_{false};
  bool executed_{false};
};

} // namespace rowsel::exec
