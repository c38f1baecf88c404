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

#include "rowsel/vector/Frame.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "rowsel/common/base/tests/GTestUtils.h"
#include "rowsel/vector/tests/utils/FrameTestBase.h"

namespace rowsel::test {
namespace {

using testing::ElementsAre;

class FrameTest : public testing::Test, public FrameTestBase {};

TEST_F(FrameTest, basic) {
  auto frame = makeFrame(
      {"a", "b"},
      {makeColumn<int64_t>({1, 2, 3}),
       makeColumn<std::string>({"x", "y", "z"})});
  EXPECT_EQ(frame->nrows(), 3);
  EXPECT_EQ(frame->ncols(), 2);
  EXPECT_FALSE(frame->isView());
  EXPECT_EQ(frame->getColumnIndex("b"), 1);
  EXPECT_FALSE(frame->columnIndex("c").has_value());
  EXPECT_EQ(frame->valueAt<std::string>(1, 2), "z");

  ROWSEL_ASSERT_USER_THROW(
      frame->getColumnIndex("c"), "Column `c` does not exist in the Frame");
  ROWSEL_ASSERT_USER_THROW(
      frame->column(2), "Column index 2 is invalid for a Frame with 2 columns");
}

TEST_F(FrameTest, invalidColumns) {
  ROWSEL_ASSERT_USER_THROW(
      makeFrame(
          {"a", "a"},
          {makeColumn<int64_t>({1}), makeColumn<int64_t>({2})}),
      "Duplicate column name `a`");
  ROWSEL_ASSERT_USER_THROW(
      makeFrame(
          {"a", "b"},
          {makeColumn<int64_t>({1}), makeColumn<int64_t>({2, 3})}),
      "Column `b` has 2 rows, expected 1");
}

TEST_F(FrameTest, view) {
  auto frame = makeSequenceFrame(10);
  auto view = frame->withRowIndex(RowIndex::fromSlice(8, 3, -3));
  ASSERT_TRUE(view->isView());
  EXPECT_EQ(view->nrows(), 3);
  EXPECT_EQ(view->physicalRows(), 10);
  EXPECT_THAT(bigintValues(*view), ElementsAre(8, 5, 2));
  EXPECT_EQ(view->columnRowIndex(0), view->rowIndex());

  auto materialized = view->materialize();
  EXPECT_FALSE(materialized->isView());
  EXPECT_EQ(materialized->physicalRows(), 3);
  EXPECT_THAT(bigintValues(*materialized), ElementsAre(8, 5, 2));

  ROWSEL_ASSERT_RUNTIME_THROW(
      frame->withRowIndex(RowIndex::fromArray({10})),
      "Row index of a view does not fit into its columns");
}

TEST_F(FrameTest, toString) {
  auto frame = makeFrame(
      {"a", "b"},
      {makeColumn<bool>({true, false}), makeColumn<double>({1.5, 2})});
  EXPECT_EQ(
      frame->toString(),
      "Frame [2 rows x 2 columns]\n"
      "  a: [boolean x 2: true, false]\n"
      "  b: [double x 2: 1.5, 2]");
}

} // namespace
} // namespace rowsel::test
