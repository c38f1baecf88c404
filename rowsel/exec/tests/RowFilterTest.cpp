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

#include "rowsel/exec/RowFilter.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "rowsel/codegen/SourceCodegenCtx.h"
#include "rowsel/codegen/tests/utils/FakeCompiler.h"
#include "rowsel/common/base/tests/GTestUtils.h"
#include "rowsel/exec/SortNode.h"
#include "rowsel/expression/ColumnScope.h"
#include "rowsel/vector/tests/utils/FrameTestBase.h"

namespace rowsel::exec::test {
namespace {

using testing::ElementsAre;
using testing::HasSubstr;

// Stands in for a compiled filter: selects every third visible row.
void everyThirdRow(int64_t row0, int64_t row1, int32_t* out, size_t* numOut) {
  size_t j = 0;
  for (int64_t i = row0; i < row1; ++i) {
    if (i % 3 == 0) {
      out[j++] = static_cast<int32_t>(i);
    }
  }
  *numOut = j;
}

class RowFilterTest : public testing::Test, public rowsel::test::FrameTestBase {
 protected:
  // Physical rows 9, 7, 5, 3, 1 of a sequence of 10.
  FramePtr makeReversedOddView() {
    return makeSequenceFrame(10)->withRowIndex(
        RowIndex::fromSlice(9, 5, -2));
  }

  ColumnScope f;
};

TEST_F(RowFilterTest, allRows) {
  auto frame = makeSequenceFrame(5);
  EvalCtx ctx(frame);
  auto rowFilter = RowFilter::all(ctx);
  rowFilter.execute();
  EXPECT_TRUE(ctx.sourceRowIndex().isAbsent());
  EXPECT_EQ(ctx.finalRowIndex(), nullptr);
  EXPECT_EQ(ctx.targetRowIndex(), nullptr);
  EXPECT_TRUE(ctx.hasCurrentRowIndex());
  EXPECT_EQ(ctx.activeRows(), nullptr);
}

TEST_F(RowFilterTest, allRowsOfView) {
  auto view = makeReversedOddView();
  EvalCtx ctx(view);
  RowFilter::all(ctx).execute();
  EXPECT_EQ(ctx.finalRowIndex(), view->rowIndex());
  EXPECT_EQ(ctx.targetRowIndex(), view->rowIndex());

  EvalCtx negatedCtx(view);
  auto negated = RowFilter::all(negatedCtx);
  negated.negate();
  negated.execute();
  EXPECT_TRUE(negatedCtx.finalRowIndex()->empty());
}

TEST_F(RowFilterTest, slice) {
  EvalCtx ctx(makeSequenceFrame(10));
  auto rowFilter = RowFilter::slice(ctx, 2, 3, 2);
  rowFilter.execute();
  ASSERT_TRUE(ctx.sourceRowIndex().isKnown());
  EXPECT_THAT(
      positions(ctx.sourceRowIndex().rowIndex()), ElementsAre(2, 4, 6));
  EXPECT_THAT(positions(ctx.finalRowIndex()), ElementsAre(2, 4, 6));
  EXPECT_EQ(ctx.activeRows(), ctx.finalRowIndex());

  ROWSEL_ASSERT_RUNTIME_THROW(
      RowFilter::slice(ctx, 1, 3, -1), "(-1 vs. 0)");
  ROWSEL_ASSERT_RUNTIME_THROW(RowFilter::slice(ctx, -1, 1, 1), "(-1 vs. 0)");
}

TEST_F(RowFilterTest, negate) {
  EvalCtx ctx(makeSequenceFrame(10));
  auto rowFilter = RowFilter::slice(ctx, 2, 3, 1);
  rowFilter.negate();
  EXPECT_TRUE(rowFilter.isNegated());
  rowFilter.execute();
  EXPECT_THAT(positions(ctx.sourceRowIndex().rowIndex()), ElementsAre(2, 3, 4));
  EXPECT_THAT(
      positions(ctx.finalRowIndex()), ElementsAre(0, 1, 5, 6, 7, 8, 9));

  EvalCtx doubleCtx(makeSequenceFrame(10));
  auto doubleNegated = RowFilter::array(doubleCtx, {7, 2});
  doubleNegated.negate();
  doubleNegated.negate();
  doubleNegated.execute();
  EXPECT_THAT(positions(doubleCtx.finalRowIndex()), ElementsAre(7, 2));
}

TEST_F(RowFilterTest, upliftThroughView) {
  auto view = makeReversedOddView();
  EvalCtx ctx(view);
  RowFilter::array(ctx, {0, 2}).execute();
  EXPECT_THAT(positions(ctx.sourceRowIndex().rowIndex()), ElementsAre(0, 2));
  EXPECT_THAT(positions(ctx.finalRowIndex()), ElementsAre(9, 5));
  EXPECT_EQ(ctx.targetRowIndex(), view->rowIndex());
}

TEST_F(RowFilterTest, inverseBeforeUplift) {
  EvalCtx ctx(makeReversedOddView());
  auto rowFilter = RowFilter::array(ctx, {0, 2});
  rowFilter.negate();
  rowFilter.execute();
  EXPECT_THAT(positions(ctx.finalRowIndex()), ElementsAre(7, 3, 1));
}

TEST_F(RowFilterTest, multiSlice) {
  EvalCtx ctx(makeSequenceFrame(10));
  RowFilter::multiSlice(ctx, {0, 9, 2}, {1, 3}, {1, -4}).execute();
  EXPECT_THAT(positions(ctx.finalRowIndex()), ElementsAre(0, 9, 5, 1, 2));

  ROWSEL_ASSERT_RUNTIME_THROW(
      RowFilter::multiSlice(ctx, {0}, {1, 1}, {1, 1}), "(2 vs. 1)");
}

TEST_F(RowFilterTest, booleanColumn) {
  auto view = makeReversedOddView();
  EvalCtx ctx(view);
  RowFilter::booleanColumn(
      ctx, makeColumn<bool>({false, true, true, false, true}))
      .execute();
  EXPECT_THAT(
      positions(ctx.sourceRowIndex().rowIndex()), ElementsAre(1, 2, 4));
  EXPECT_THAT(positions(ctx.finalRowIndex()), ElementsAre(7, 5, 1));
}

TEST_F(RowFilterTest, integerColumn) {
  EvalCtx ctx(makeSequenceFrame(10));
  RowFilter::integerColumn(ctx, makeColumn<int32_t>({9, 0, 9})).execute();
  EXPECT_THAT(positions(ctx.finalRowIndex()), ElementsAre(9, 0, 9));
}

TEST_F(RowFilterTest, integerColumnOutOfBounds) {
  EvalCtx ctx(makeSequenceFrame(10));
  auto rowFilter =
      RowFilter::integerColumn(ctx, makeColumn<int64_t>({3, 10, 4}));
  ROWSEL_ASSERT_ERROR_CODE(rowFilter.execute(), error_code::kInvalidArgument);
  EXPECT_FALSE(ctx.hasFinalRowIndex());

  EvalCtx otherCtx(makeSequenceFrame(10));
  ROWSEL_ASSERT_USER_THROW(
      RowFilter::integerColumn(otherCtx, makeColumn<int64_t>({10})).execute(),
      "The data column contains index 10 which is not allowed for a Frame "
      "with 10 rows");

  // Bounds are checked against the visible rows of a view.
  EvalCtx viewCtx(makeReversedOddView());
  ROWSEL_ASSERT_USER_THROW(
      RowFilter::integerColumn(viewCtx, makeColumn<int64_t>({5})).execute(),
      "contains index 5 which is not allowed for a Frame with 5 rows");
}

TEST_F(RowFilterTest, executeOnce) {
  EvalCtx ctx(makeSequenceFrame(3));
  auto rowFilter = RowFilter::all(ctx);
  rowFilter.execute();
  ROWSEL_ASSERT_RUNTIME_THROW(
      rowFilter.execute(), "RowFilter can only be executed once");
}

TEST_F(RowFilterTest, eagerFilter) {
  EvalCtx ctx(makeSequenceFrame(10));
  auto rowFilter = RowFilter::filterExpr(
      ctx, makeComparison(CompareOp::kGt, f["A"], makeConstant(6)));
  rowFilter.execute();
  EXPECT_TRUE(ctx.sourceRowIndex().isDeferred());
  EXPECT_THAT(positions(ctx.finalRowIndex()), ElementsAre(7, 8, 9));
}

TEST_F(RowFilterTest, eagerFilterOnView) {
  auto expr = makeComparison(CompareOp::kLt, f["A"], makeConstant(6));

  EvalCtx ctx(makeReversedOddView());
  RowFilter::filterExpr(ctx, expr).execute();
  EXPECT_THAT(positions(ctx.finalRowIndex()), ElementsAre(5, 3, 1));

  EvalCtx negatedCtx(makeReversedOddView());
  auto negated = RowFilter::filterExpr(negatedCtx, expr);
  negated.negate();
  negated.execute();
  EXPECT_THAT(positions(negatedCtx.finalRowIndex()), ElementsAre(9, 7));
}

TEST_F(RowFilterTest, compiledFilter) {
  auto compiler = std::make_shared<codegen::test::FakeCompiler>();
  compiler->addSymbol(
      "make_rowindex_0", reinterpret_cast<void*>(&everyThirdRow));
  codegen::SourceCodegenCtx codegen(compiler);

  auto view = makeReversedOddView();
  EvalCtx ctx(view, &codegen);
  auto rowFilter = RowFilter::filterExpr(
      ctx, makeComparison(CompareOp::kGt, f["A"], makeConstant(4)));
  const auto& rule = std::get<FilterExprRows>(rowFilter.rule());
  ASSERT_NE(rule.generator, nullptr);
  EXPECT_EQ(rule.generator->name(), "make_rowindex_0");
  rowFilter.negate();

  codegen.generate();
  ASSERT_EQ(compiler->sources().size(), 1);
  const auto& source = compiler->sources()[0];
  EXPECT_THAT(
      source,
      HasSubstr("void make_rowindex_0(int64_t row0, int64_t row1, "
                "int32_t* out, size_t* n_outs) {\n"));
  EXPECT_THAT(source, HasSubstr("  size_t j = 0;\n"));
  EXPECT_THAT(source, HasSubstr("    int64_t r = 9 + i * (-2);\n"));
  EXPECT_THAT(
      source,
      HasSubstr("    if ((v0 > INT64_C(4))) {\n"
                "        out[j++] = i;\n"
                "    }\n"));
  EXPECT_THAT(source, HasSubstr("  *n_outs = j;\n"));

  rowFilter.execute();
  EXPECT_TRUE(ctx.sourceRowIndex().isDeferred());
  // Visible rows 0 and 3 are selected, the complement 1, 2, 4 is uplifted.
  EXPECT_THAT(positions(ctx.finalRowIndex()), ElementsAre(7, 5, 1));
}

TEST_F(RowFilterTest, compiledFilterNames) {
  codegen::SourceCodegenCtx codegen(
      std::make_shared<codegen::test::FakeCompiler>());
  EvalCtx ctx(makeSequenceFrame(4), &codegen);
  auto expr = makeComparison(CompareOp::kEq, f["A"], makeConstant(1));
  auto first = RowFilter::filterExpr(ctx, expr);
  auto second = RowFilter::filterExpr(ctx, expr);
  EXPECT_EQ(
      std::get<FilterExprRows>(first.rule()).generator->name(),
      "make_rowindex_0");
  EXPECT_EQ(
      std::get<FilterExprRows>(second.rule()).generator->name(),
      "make_rowindex_1");
}

TEST_F(RowFilterTest, nonBooleanFilter) {
  EvalCtx ctx(makeSequenceFrame(4));
  ROWSEL_ASSERT_ERROR_CODE(
      RowFilter::filterExpr(ctx, f["A"]), error_code::kTypeMismatch);
}

TEST_F(RowFilterTest, sorted) {
  auto frame = makeFrame(
      {"k"}, {makeColumn<int64_t>({50, 10, 40, 30, 20, 0})});
  auto view = frame->withRowIndex(RowIndex::fromSlice(0, 5, 1));
  EvalCtx ctx(view);
  auto rowFilter = RowFilter::sorted(ctx, std::make_shared<SortNode>(view, 0));
  ROWSEL_ASSERT_RUNTIME_THROW(
      rowFilter.negate(), "Sorted rows cannot be negated");
  rowFilter.execute();

  EXPECT_TRUE(ctx.sourceRowIndex().isDeferred());
  EXPECT_THAT(positions(ctx.finalRowIndex()), ElementsAre(1, 4, 3, 2, 0));
  EXPECT_EQ(ctx.targetRowIndex(), view->columnRowIndex(0));
  EXPECT_EQ(ctx.activeRows(), ctx.finalRowIndex());
}

TEST_F(RowFilterTest, toString) {
  EvalCtx ctx(makeSequenceFrame(10));
  EXPECT_EQ(RowFilter::all(ctx).toString(), "AllRows");
  auto slice = RowFilter::slice(ctx, 1, 2, 3);
  slice.negate();
  EXPECT_EQ(slice.toString(), "~SliceRows(start=1, count=2, step=3)");
  EXPECT_EQ(
      RowFilter::multiSlice(ctx, {1, 4}, {2}, {1}).toString(),
      "MultiSliceRows(bases=[1, 4], counts=[2], steps=[1])");
  EXPECT_EQ(
      RowFilter::filterExpr(
          ctx, makeComparison(CompareOp::kGe, f["A"], makeConstant(2)))
          .toString(),
      "FilterExprRows((f['A'] >= 2), eager)");
  EXPECT_EQ(mapRowFilterKindToName(RowFilterKind::kSorted), "SortedRows");
}

} // namespace
} // namespace rowsel::exec::test
