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

#include <fmt/format.h>
#include <folly/String.h>
#include <glog/logging.h>

#include "rowsel/codegen/LoopBuilder.h"
#include "rowsel/exec/SortNode.h"

namespace rowsel::exec {
namespace {

template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

const char* mapRowFilterKindToName(RowFilterKind kind) {
  switch (kind) {
    case RowFilterKind::kAll:
      return "AllRows";
    case RowFilterKind::kSlice:
      return "SliceRows";
    case RowFilterKind::kArray:
      return "ArrayRows";
    case RowFilterKind::kMultiSlice:
      return "MultiSliceRows";
    case RowFilterKind::kBooleanColumn:
      return "BooleanColumnRows";
    case RowFilterKind::kIntegerColumn:
      return "IntegerColumnRows";
    case RowFilterKind::kFilterExpr:
      return "FilterExprRows";
    case RowFilterKind::kSorted:
      return "SortedRows";
  }
  ROWSEL_UNREACHABLE();
}

FilterLoopGenerator::FilterLoopGenerator(
    FramePtr frame,
    ExprPtr expr,
    std::string name)
    : frame_(std::move(frame)), expr_(std::move(expr)), name_(std::move(name)) {
  ROWSEL_CHECK_NOT_NULL(frame_);
  ROWSEL_CHECK_NOT_NULL(expr_);
}

void FilterLoopGenerator::generateCode(codegen::CodegenCtx& ctx) {
  codegen::LoopBuilder builder(frame_, ctx, name_);
  const auto condition = expr_->generateValue(builder);
  builder.addToPreamble("size_t j = 0;");
  builder.addToMainLoop(fmt::format("if ({}) {{", condition));
  builder.addToMainLoop("    out[j++] = i;");
  builder.addToMainLoop("}");
  builder.addToEpilogue("*n_outs = j;");
  builder.setExtraArgs("int32_t* out, size_t* n_outs");
  builder.generate();
}

RowFilter::RowFilter(EvalCtx& ctx, RowFilterRule rule)
    : ctx_(ctx), rule_(std::move(rule)) {}

RowFilter RowFilter::all(EvalCtx& ctx) {
  return RowFilter(ctx, AllRows{});
}

RowFilter
RowFilter::slice(EvalCtx& ctx, int64_t start, int64_t count, int64_t step) {
  ROWSEL_CHECK_GE(start, 0);
  ROWSEL_CHECK_GE(count, 0);
  if (count > 0) {
    ROWSEL_CHECK_GE(start + (count - 1) * step, 0);
  }
  return RowFilter(ctx, SliceRows{start, count, step});
}

RowFilter RowFilter::array(EvalCtx& ctx, std::vector<int64_t> rows) {
  return RowFilter(ctx, ArrayRows{std::move(rows)});
}

RowFilter RowFilter::multiSlice(
    EvalCtx& ctx,
    std::vector<int64_t> bases,
    std::vector<int64_t> counts,
    std::vector<int64_t> steps) {
  ROWSEL_CHECK_EQ(counts.size(), steps.size());
  ROWSEL_CHECK_LE(counts.size(), bases.size());
  return RowFilter(
      ctx,
      MultiSliceRows{std::move(bases), std::move(counts), std::move(steps)});
}

RowFilter RowFilter::booleanColumn(EvalCtx& ctx, ColumnPtr mask) {
  ROWSEL_CHECK_NOT_NULL(mask);
  ROWSEL_CHECK(mask->typeKind() == TypeKind::BOOLEAN);
  ROWSEL_CHECK_EQ(mask->size(), ctx.nrows());
  return RowFilter(ctx, BooleanColumnRows{std::move(mask)});
}

RowFilter RowFilter::integerColumn(EvalCtx& ctx, ColumnPtr column) {
  ROWSEL_CHECK_NOT_NULL(column);
  ROWSEL_CHECK(isIntegerKind(column->typeKind()));
  return RowFilter(ctx, IntegerColumnRows{std::move(column)});
}

RowFilter RowFilter::filterExpr(EvalCtx& ctx, ExprPtr expr) {
  ROWSEL_CHECK_NOT_NULL(expr);
  const auto type = expr->type(*ctx.frame());
  ROWSEL_TYPE_CHECK(
      type == TypeKind::BOOLEAN,
      "Filter expression {} should be boolean, however it has type {}",
      expr->toString(),
      mapTypeKindToName(type));

  std::shared_ptr<FilterLoopGenerator> generator;
  if (auto* codegen = ctx.codegen()) {
    generator = std::make_shared<FilterLoopGenerator>(
        ctx.frame(), expr, codegen->makeVariableName("make_rowindex"));
    codegen->addNode(generator);
  }
  return RowFilter(ctx, FilterExprRows{std::move(expr), std::move(generator)});
}

RowFilter RowFilter::sorted(
    EvalCtx& ctx,
    std::shared_ptr<const SortNode> sortNode) {
  ROWSEL_CHECK_NOT_NULL(sortNode);
  return RowFilter(ctx, SortedRows{std::move(sortNode)});
}

void RowFilter::negate() {
  ROWSEL_CHECK(
      kind() != RowFilterKind::kSorted, "Sorted rows cannot be negated");
  inverse_ = !inverse_;
}

void RowFilter::execute() {
  ROWSEL_CHECK(!executed_, "RowFilter can only be executed once");
  executed_ = true;
  VLOG(1) << "Executing " << toString();

  if (auto* sorted = std::get_if<SortedRows>(&rule_)) {
    executeSorted(*sorted);
    return;
  }

  auto source = makeSourceRowIndex();
  ctx_.setSourceRowIndex(source);
  auto target = ctx_.frameRowIndex();
  auto finalRowIndex = makeFinalRowIndex(source);
  ctx_.setFinalRowIndex(finalRowIndex, std::move(target));
  ctx_.setCurrentRowIndex(std::move(finalRowIndex));
}

SourceRowIndex RowFilter::makeSourceRowIndex() const {
  return std::visit(
      Overloaded{
          [](const AllRows&) { return SourceRowIndex::absent(); },
          [](const SliceRows& rule) {
            return SourceRowIndex::known(
                RowIndex::fromSlice(rule.start, rule.count, rule.step));
          },
          [](const ArrayRows& rule) {
            return SourceRowIndex::known(RowIndex::fromArray(rule.rows));
          },
          [](const MultiSliceRows& rule) {
            return SourceRowIndex::known(
                RowIndex::fromSliceList(rule.bases, rule.counts, rule.steps));
          },
          [](const BooleanColumnRows& rule) {
            return SourceRowIndex::known(RowIndex::fromColumn(*rule.mask));
          },
          [this](const IntegerColumnRows& rule) {
            auto rowIndex = RowIndex::fromColumn(*rule.column);
            ROWSEL_USER_CHECK(
                rowIndex->max() < ctx_.nrows(),
                "The data column contains index {} which is not allowed for "
                "a Frame with {} rows",
                rowIndex->max(),
                ctx_.nrows());
            return SourceRowIndex::known(std::move(rowIndex));
          },
          [](const FilterExprRows&) { return SourceRowIndex::deferred(); },
          [](const SortedRows&) -> SourceRowIndex {
            ROWSEL_UNREACHABLE("Sorted rows have no source row index");
          },
      },
      rule_);
}

RowIndexPtr RowFilter::makeFinalRowIndex(const SourceRowIndex& source) const {
  if (auto* filter = std::get_if<FilterExprRows>(&rule_)) {
    return compose(makeFilterRowIndex(*filter));
  }
  switch (source.state()) {
    case SourceRowIndex::State::kAbsent:
      return inverse_ ? RowIndex::fromSlice(0, 0, 0) : ctx_.frameRowIndex();
    case SourceRowIndex::State::kKnown:
      return compose(source.rowIndex());
    case SourceRowIndex::State::kDeferred:
      break;
  }
  ROWSEL_UNREACHABLE(
      "Deferred source row index for {}", mapRowFilterKindToName(kind()));
}

RowIndexPtr RowFilter::compose(RowIndexPtr rowIndex) const {
  if (inverse_) {
    rowIndex = rowIndex->inverse(ctx_.nrows());
  }
  if (const auto& target = ctx_.frameRowIndex()) {
    rowIndex = rowIndex->uplift(*target);
  }
  return rowIndex;
}

RowIndexPtr RowFilter::makeFilterRowIndex(const FilterExprRows& rule) const {
  if (rule.generator) {
    auto* codegen = ctx_.codegen();
    ROWSEL_CHECK_NOT_NULL(codegen);
    auto filter = reinterpret_cast<FilterFunction>(
        codegen->getResult(rule.generator->name()));
    VLOG(1) << "Filtering " << ctx_.nrows() << " rows with compiled function "
            << rule.generator->name();
    return RowIndex::fromFilterFunction(filter, ctx_.nrows());
  }

  VLOG(1) << "Evaluating filter " << rule.expr->toString() << " over "
          << ctx_.nrows() << " rows";
  const auto mask = rule.expr->evaluate(ctx_);
  ROWSEL_CHECK_EQ(mask->size(), ctx_.nrows());
  return RowIndex::fromColumn(*mask);
}

void RowFilter::executeSorted(const SortedRows& rule) {
  const auto& sortNode = *rule.sortNode;
  auto target = ctx_.frame()->columnRowIndex(sortNode.column());
  auto finalRowIndex = sortNode.makeRowIndex();
  ctx_.setSourceRowIndex(SourceRowIndex::deferred());
  ctx_.setFinalRowIndex(finalRowIndex, std::move(target));
  ctx_.setCurrentRowIndex(std::move(finalRowIndex));
}

std::string RowFilter::toString() const {
  auto description = std::visit(
      Overloaded{
          [](const AllRows&) { return std::string("AllRows"); },
          [](const SliceRows& rule) {
            return fmt::format(
                "SliceRows(start={}, count={}, step={})",
                rule.start,
                rule.count,
                rule.step);
          },
          [](const ArrayRows& rule) {
            return fmt::format("ArrayRows([{}])", folly::join(", ", rule.rows));
          },
          [](const MultiSliceRows& rule) {
            return fmt::format(
                "MultiSliceRows(bases=[{}], counts=[{}], steps=[{}])",
                folly::join(", ", rule.bases),
                folly::join(", ", rule.counts),
                folly::join(", ", rule.steps));
          },
          [](const BooleanColumnRows& rule) {
            return fmt::format("BooleanColumnRows(size={})", rule.mask->size());
          },
          [](const IntegerColumnRows& rule) {
            return fmt::format(
                "IntegerColumnRows(size={})", rule.column->size());
          },
          [](const FilterExprRows& rule) {
            return fmt::format(
                "FilterExprRows({}, {})",
                rule.expr->toString(),
                rule.generator ? rule.generator->name() : "eager");
          },
          [](const SortedRows& rule) {
            return fmt::format(
                "SortedRows(column={})", rule.sortNode->column());
          },
      },
      rule_);
  return inverse_ ? fmt::format("~{}", description) : description;
}

} // namespace rowsel::exec
