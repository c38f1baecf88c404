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

#include "rowsel/exec/RowFilterFactory.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

#include "rowsel/common/base/tests/GTestUtils.h"
#include "rowsel/exec/tests/utils/SelectorTestUtils.h"
#include "rowsel/vector/tests/utils/FrameTestBase.h"

namespace rowsel::exec::test {
namespace {

using testing::ElementsAre;
using testing::IsEmpty;

class RowFilterFactoryTest : public testing::Test,
                             public rowsel::test::FrameTestBase {
 protected:
  RowFilter resolve(const Selector& selector, int64_t nrows = 10) {
    return resolve(selector, makeSequenceFrame(nrows));
  }

  RowFilter resolve(const Selector& selector, FramePtr frame) {
    contexts_.push_back(std::make_unique<EvalCtx>(std::move(frame)));
    return createRowFilter(selector, *contexts_.back());
  }

  static void assertSlice(
      const RowFilter& rowFilter,
      int64_t start,
      int64_t count,
      int64_t step) {
    ASSERT_EQ(rowFilter.kind(), RowFilterKind::kSlice) << rowFilter.toString();
    const auto& rule = std::get<SliceRows>(rowFilter.rule());
    EXPECT_EQ(rule.start, start);
    EXPECT_EQ(rule.count, count);
    EXPECT_EQ(rule.step, step);
  }

  static const std::vector<int64_t>& arrayRows(const RowFilter& rowFilter) {
    return std::get<ArrayRows>(rowFilter.rule()).rows;
  }

  std::vector<std::unique_ptr<EvalCtx>> contexts_;
};

TEST_F(RowFilterFactoryTest, all) {
  EXPECT_EQ(resolve(Selector()).kind(), RowFilterKind::kAll);
  EXPECT_EQ(resolve(Selector::all(), 0).kind(), RowFilterKind::kAll);
}

TEST_F(RowFilterFactoryTest, singleRow) {
  for (int64_t nrows : {2, 7, 10}) {
    for (int64_t row = -nrows; row < nrows; ++row) {
      SCOPED_TRACE(fmt::format("row {} of {}", row, nrows));
      const auto expected = (row + nrows) % nrows;
      assertSlice(resolve(makeIntegerList({row}), nrows), expected, 1, 1);
      assertSlice(resolve(Selector::integer(row), nrows), expected, 1, 1);
    }
  }

  // The only row of a single row frame.
  EXPECT_EQ(resolve(Selector::integer(0), 1).kind(), RowFilterKind::kAll);
  EXPECT_EQ(resolve(Selector::integer(-1), 1).kind(), RowFilterKind::kAll);
}

TEST_F(RowFilterFactoryTest, lastRow) {
  assertSlice(resolve(makeIntegerList({-1})), 9, 1, 1);
}

TEST_F(RowFilterFactoryTest, slice) {
  assertSlice(resolve(Selector::slice(2, 8, 2)), 2, 3, 2);
  assertSlice(resolve(Selector::slice(std::nullopt, 5)), 0, 5, 1);
  assertSlice(resolve(Selector::slice(-3, std::nullopt)), 7, 3, 1);
  assertSlice(
      resolve(Selector::slice(std::nullopt, std::nullopt, -1)), 9, 10, -1);
  assertSlice(resolve(Selector::slice(8, 2, -2)), 8, 3, -2);
  assertSlice(resolve(Selector::slice(-20, 3)), 0, 3, 1);
  assertSlice(resolve(Selector::slice(3, 4)), 3, 1, 1);
  assertSlice(resolve(Selector::slice(100, std::nullopt, -4)), 9, 3, -4);

  EXPECT_THAT(
      arrayRows(resolve(Selector::slice(20, std::nullopt))), IsEmpty());
  EXPECT_THAT(arrayRows(resolve(Selector::slice(5, 5))), IsEmpty());
  EXPECT_THAT(
      arrayRows(resolve(Selector::slice(-20, std::nullopt, -1))), IsEmpty());
}

TEST_F(RowFilterFactoryTest, zeroStepSlice) {
  assertSlice(resolve(Selector::slice(3, 4, 0)), 3, 4, 0);
  assertSlice(resolve(Selector::slice(-1, 2, 0)), 9, 2, 0);
  EXPECT_THAT(arrayRows(resolve(Selector::slice(-11, 2, 0))), IsEmpty());

  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::slice(std::nullopt, 2, 0)),
      "slice(None, 2, 0) with zero step requires a start and a non-negative "
      "count");
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::slice(10, 2, 0)),
      "Row `10` is invalid for datatable with 10 rows");
}

TEST_F(RowFilterFactoryTest, fullRangeIsAll) {
  for (int64_t nrows = 0; nrows <= 5; ++nrows) {
    SCOPED_TRACE(fmt::format("{} rows", nrows));
    EXPECT_EQ(
        resolve(Selector::slice(0, nrows, 1), nrows).kind(),
        RowFilterKind::kAll);
    EXPECT_EQ(
        resolve(Selector::slice(std::nullopt, std::nullopt), nrows).kind(),
        RowFilterKind::kAll);
    EXPECT_EQ(
        resolve(Selector::range(0, nrows), nrows).kind(), RowFilterKind::kAll);
  }
}

TEST_F(RowFilterFactoryTest, range) {
  assertSlice(resolve(Selector::range(1, 10, 4)), 1, 3, 4);
  assertSlice(resolve(Selector::range(-3, 0)), 7, 3, 1);
  assertSlice(resolve(Selector::range(8, 2, -3)), 8, 2, -3);
  assertSlice(resolve(Selector::range(-1, -4, -1)), 9, 3, -1);
  EXPECT_THAT(arrayRows(resolve(Selector::range(5, 5))), IsEmpty());

  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::range(5, 15)),
      "Invalid range(5, 15) for a datatable with 10 rows");
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::range(-2, 3)),
      "Invalid range(-2, 3) for a datatable with 10 rows");
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::range(0, 4, 2), 1),
      "Invalid range(0, 4, 2) for a datatable with 1 row");
  ROWSEL_ASSERT_USER_THROW(
      Selector::range(0, 4, 0), "range() step must not be zero");
}

TEST_F(RowFilterFactoryTest, extremeBounds) {
  constexpr auto kMin = std::numeric_limits<int64_t>::min();
  constexpr auto kMax = std::numeric_limits<int64_t>::max();

  assertSlice(
      resolve(Selector::slice(std::nullopt, std::nullopt, kMin)), 9, 1, 1);
  assertSlice(
      resolve(Selector::slice(std::nullopt, std::nullopt, kMax)), 0, 1, 1);
  assertSlice(resolve(Selector::slice(kMax, kMin, kMin)), 9, 1, 1);
  EXPECT_EQ(resolve(Selector::slice(kMin, kMax)).kind(), RowFilterKind::kAll);
  EXPECT_THAT(arrayRows(resolve(Selector::slice(kMax, kMin))), IsEmpty());

  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::range(kMin, kMax)),
      "Invalid range(-9223372036854775808, 9223372036854775807) for a "
      "datatable with 10 rows");
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::range(kMax, kMin, -1)),
      "Invalid range(9223372036854775807, -9223372036854775808, -1) for a "
      "datatable with 10 rows");
  EXPECT_THAT(arrayRows(resolve(Selector::range(kMax, kMin))), IsEmpty());
  assertSlice(resolve(Selector::range(9, -1, kMin)), 9, 1, 1);
  assertSlice(resolve(Selector::range(0, kMax, kMax)), 0, 1, 1);
}

TEST_F(RowFilterFactoryTest, list) {
  EXPECT_THAT(
      arrayRows(resolve(makeIntegerList({4, -2, 0, 4}))),
      ElementsAre(4, 8, 0, 4));
  EXPECT_THAT(arrayRows(resolve(Selector::list({}))), IsEmpty());
  assertSlice(
      resolve(Selector::list({Selector::slice(5, 5), Selector::integer(4)})),
      4,
      1,
      1);
}

TEST_F(RowFilterFactoryTest, multiSlice) {
  auto rowFilter = resolve(Selector::list(
      {Selector::integer(0),
       Selector::integer(1),
       Selector::integer(2),
       Selector::integer(5),
       Selector::slice(7, 10, 1)}));
  ASSERT_EQ(rowFilter.kind(), RowFilterKind::kMultiSlice);
  const auto& rule = std::get<MultiSliceRows>(rowFilter.rule());
  EXPECT_THAT(rule.bases, ElementsAre(0, 1, 2, 5, 7));
  EXPECT_THAT(rule.counts, ElementsAre(1, 1, 1, 1, 3));
  EXPECT_THAT(rule.steps, ElementsAre(1, 1, 1, 1, 1));
}

TEST_F(RowFilterFactoryTest, multiSliceTrailingRows) {
  auto rowFilter = resolve(Selector::list(
      {Selector::integer(3),
       Selector::slice(std::nullopt, std::nullopt, -3),
       Selector::integer(0),
       Selector::range(1, 3),
       Selector::integer(-1)}));
  ASSERT_EQ(rowFilter.kind(), RowFilterKind::kMultiSlice);
  const auto& rule = std::get<MultiSliceRows>(rowFilter.rule());
  EXPECT_THAT(rule.bases, ElementsAre(3, 9, 0, 1, 9));
  EXPECT_THAT(rule.counts, ElementsAre(1, 4, 1, 2));
  EXPECT_THAT(rule.steps, ElementsAre(1, -3, 1, 1));
}

TEST_F(RowFilterFactoryTest, invalidRows) {
  ROWSEL_ASSERT_USER_THROW(
      resolve(makeIntegerList({1, 10})),
      "Row `10` is invalid for datatable with 10 rows");
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::integer(-2), 1),
      "Row `-2` is invalid for datatable with 1 row");
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::integer(0), 0),
      "Row `0` is invalid for datatable with 0 rows");
  ROWSEL_ASSERT_ERROR_CODE(
      resolve(makeIntegerList({-11})), error_code::kInvalidArgument);
}

TEST_F(RowFilterFactoryTest, nonIntegerSlice) {
  Slice slice;
  slice.start = 1.5;
  slice.stop = int64_t{4};
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::slice(slice)),
      "slice(1.5, 4, None) is not integer-valued");

  Slice wholeDouble;
  wholeDouble.step = 2.0;
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::list({Selector::slice(wholeDouble)})),
      "slice(None, None, 2.0) is not integer-valued");
}

TEST_F(RowFilterFactoryTest, invalidElements) {
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::list({Selector::integer(1), Selector::string("a")})),
      "Invalid row selector 'a' at element 1 of the `rows` list");
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::list({Selector::boolean(true)})),
      "Invalid row selector True at element 0 of the `rows` list");
  ROWSEL_ASSERT_USER_THROW(
      resolve(makeGenerator({Selector::floating(2.5)})),
      "Invalid row selector 2.5 generated at position 0");
  ROWSEL_ASSERT_ERROR_CODE(
      resolve(Selector::list({makeIntegerList({1})})),
      error_code::kInvalidArgument);
}

TEST_F(RowFilterFactoryTest, set) {
  EXPECT_THAT(
      arrayRows(resolve(Selector::set({5, 1, 3, -1}))),
      ElementsAre(9, 1, 3, 5));
  assertSlice(resolve(Selector::set({6})), 6, 1, 1);
}

TEST_F(RowFilterFactoryTest, generator) {
  EXPECT_THAT(
      arrayRows(resolve(makeGenerator(
          {Selector::integer(0), Selector::integer(2), Selector::integer(1)}))),
      ElementsAre(0, 2, 1));
  auto rowFilter = resolve(makeGenerator(
      {Selector::integer(0), Selector::slice(4, 8), Selector::integer(1)}));
  ASSERT_EQ(rowFilter.kind(), RowFilterKind::kMultiSlice);
  EXPECT_THAT(
      std::get<MultiSliceRows>(rowFilter.rule()).bases, ElementsAre(0, 4, 1));
}

TEST_F(RowFilterFactoryTest, booleanLiteral) {
  for (int64_t nrows : {0, 1, 2, 10}) {
    for (bool value : {true, false}) {
      ROWSEL_ASSERT_ERROR_CODE(
          resolve(Selector::boolean(value), nrows), error_code::kTypeMismatch);
    }
  }
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::boolean(true)),
      "Boolean value cannot be used as a `rows` selector");
}

TEST_F(RowFilterFactoryTest, booleanArray) {
  std::vector<bool> mask(10, false);
  mask[3] = true;
  EXPECT_EQ(
      resolve(Selector::array(NumericArray::booleans(mask))).kind(),
      RowFilterKind::kBooleanColumn);
  EXPECT_EQ(
      resolve(Selector::array(NumericArray::booleans(mask, {1, 10}))).kind(),
      RowFilterKind::kBooleanColumn);

  for (int64_t size : {0, 9, 11}) {
    const bool valid = size == 10;
    auto selector =
        Selector::array(NumericArray::booleans(std::vector<bool>(size, true)));
    if (valid) {
      EXPECT_EQ(resolve(selector).kind(), RowFilterKind::kBooleanColumn);
    } else {
      ROWSEL_ASSERT_ERROR_CODE(resolve(selector), error_code::kInvalidArgument);
    }
  }
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::array(
          NumericArray::booleans(std::vector<bool>(9, true)))),
      "Cannot apply a boolean array of length 9 to a datatable with 10 rows");
}

TEST_F(RowFilterFactoryTest, integerArray) {
  auto rowFilter = resolve(Selector::array(
      NumericArray::integers({7, 7, 0}, DType::kInt32, {3, 1})));
  ASSERT_EQ(rowFilter.kind(), RowFilterKind::kIntegerColumn);
  EXPECT_EQ(
      std::get<IntegerColumnRows>(rowFilter.rule()).column->typeKind(),
      TypeKind::INTEGER);
}

TEST_F(RowFilterFactoryTest, invalidArray) {
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::array(
          NumericArray::integers({1, 2, 3, 4}, DType::kInt64, {2, 2}))),
      "Only a single-dimensional array is allowed as a `rows` argument, got "
      "array(shape=(2, 2), dtype=int64)");
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::array(
          NumericArray::integers({1, 2}, DType::kInt64, {1, 1, 2}))),
      "Only a single-dimensional array");
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::array(NumericArray::floats({1.0, 2.0}))),
      "Either a boolean or an integer array is expected for `rows` argument, "
      "got array(shape=(2), dtype=float64)");
}

TEST_F(RowFilterFactoryTest, frame) {
  std::vector<bool> mask(10, true);
  auto booleanFrame = makeFrame({"m"}, {makeColumn(mask)});
  EXPECT_EQ(
      resolve(Selector::frame(booleanFrame)).kind(),
      RowFilterKind::kBooleanColumn);

  auto integerFrame = makeFrame({"i"}, {makeColumn<int64_t>({3, 1})});
  EXPECT_EQ(
      resolve(Selector::frame(integerFrame)).kind(),
      RowFilterKind::kIntegerColumn);

  // A view selector is read through its row index.
  std::vector<bool> alternating(11);
  for (size_t i = 0; i < alternating.size(); ++i) {
    alternating[i] = i % 2 == 0;
  }
  auto maskView = makeFrame(
      {"m"}, {makeColumn(alternating)}, RowIndex::fromSlice(1, 10, 1));
  auto rowFilter = resolve(Selector::frame(maskView));
  ASSERT_EQ(rowFilter.kind(), RowFilterKind::kBooleanColumn);
  const auto& column = std::get<BooleanColumnRows>(rowFilter.rule()).mask;
  EXPECT_EQ(column->size(), 10);
  EXPECT_FALSE(column->asChecked<bool>()->valueAt(0));
}

TEST_F(RowFilterFactoryTest, invalidFrame) {
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::frame(
          makeFrame({"m"}, {makeColumn(std::vector<bool>(5))}))),
      "`rows` datatable has 5 rows, but applied to a datatable with 10 rows");
  ROWSEL_ASSERT_USER_THROW(
      resolve(
          Selector::frame(makeFrame({"m"}, {makeColumn(std::vector<bool>(1))})),
          3),
      "`rows` datatable has 1 row, but applied to a datatable with 3 rows");

  auto wide = makeFrame(
      {"a", "b"}, {makeColumn<int64_t>({1}), makeColumn<int64_t>({2})});
  ROWSEL_ASSERT_ERROR_CODE(
      resolve(Selector::frame(wide)), error_code::kInvalidArgument);
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::frame(wide)),
      "`rows` argument should be a single-column datatable, got "
      "<Frame [1 rows x 2 columns]>");

  auto doubles = makeFrame({"d"}, {makeColumn<double>({1.0})});
  ROWSEL_ASSERT_ERROR_CODE(
      resolve(Selector::frame(doubles)), error_code::kTypeMismatch);
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::frame(doubles)),
      "`rows` datatable should be either a boolean or an integer column, "
      "however it has type double");
}

TEST_F(RowFilterFactoryTest, function) {
  const std::vector<Selector> results = {
      Selector(),
      Selector::integer(-3),
      Selector::slice(1, 9, 3),
      makeIntegerList({2, 4}),
      Selector::set({1, 2, 8}),
  };
  for (const auto& result : results) {
    SCOPED_TRACE(result.toString());
    auto direct = resolve(result);
    auto viaFunction = resolve(
        Selector::function([&](const ColumnScope&) { return result; }));
    EXPECT_EQ(viaFunction.kind(), direct.kind());
    EXPECT_EQ(viaFunction.toString(), direct.toString());
  }

  auto rowFilter = resolve(Selector::function([](const ColumnScope& f) {
    return Selector::expr(
        makeComparison(CompareOp::kGt, f["A"], makeConstant(5)));
  }));
  EXPECT_EQ(rowFilter.kind(), RowFilterKind::kFilterExpr);
}

TEST_F(RowFilterFactoryTest, functionErrors) {
  auto nested = Selector::function([](const ColumnScope&) {
    return Selector::function(
        [](const ColumnScope&) { return Selector::integer(1); });
  });
  ROWSEL_ASSERT_ERROR_CODE(resolve(nested), error_code::kTypeMismatch);
  ROWSEL_ASSERT_USER_THROW(
      resolve(nested),
      "Unexpected result produced by the `rows` function: <function>");

  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::function(
          [](const ColumnScope&) { return Selector::string("x"); })),
      "Unexpected result produced by the `rows` function: 'x'");
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::function(
          [](const ColumnScope&) { return Selector::boolean(false); })),
      "Boolean value cannot be used as a `rows` selector");
}

TEST_F(RowFilterFactoryTest, unexpected) {
  ROWSEL_ASSERT_ERROR_CODE(
      resolve(Selector::floating(1.5)), error_code::kTypeMismatch);
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::floating(1.5)), "Unexpected `rows` argument: 1.5");
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::string("abc")), "Unexpected `rows` argument: 'abc'");
}

TEST_F(RowFilterFactoryTest, expr) {
  ColumnScope f;
  auto rowFilter = resolve(
      Selector::expr(makeComparison(CompareOp::kLt, f["A"], makeConstant(3))));
  ASSERT_EQ(rowFilter.kind(), RowFilterKind::kFilterExpr);
  EXPECT_EQ(std::get<FilterExprRows>(rowFilter.rule()).generator, nullptr);

  ROWSEL_ASSERT_ERROR_CODE(
      resolve(Selector::expr(f["A"])), error_code::kTypeMismatch);
  ROWSEL_ASSERT_USER_THROW(
      resolve(Selector::expr(f["A"])),
      "Filter expression f['A'] should be boolean, however it has type bigint");
}

} // namespace
} // namespace rowsel::exec::test
