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

#include <algorithm>
#include <optional>

#include <fmt/format.h>
#include <glog/logging.h>

#include "rowsel/exec/SelectorClassifier.h"

namespace rowsel::exec {
namespace {

struct NormalizedSlice {
  int64_t start;
  int64_t count;
  int64_t step;
};

std::string pluralForm(int64_t n, const char* singular) {
  return fmt::format("{} {}{}", n, singular, n == 1 ? "" : "s");
}

// Spans between int64_t bounds and the magnitude of INT64_MIN do not fit in
// 64 bits.
using int128_t = __int128_t;

std::optional<int64_t> integerBound(const std::optional<Slice::Bound>& bound) {
  if (!bound.has_value()) {
    return std::nullopt;
  }
  return std::get<int64_t>(*bound);
}

// Rows of 'slice' within [0, nrows). Negative bounds count from the end and
// out-of-range bounds are clamped. A zero step repeats row 'start' 'stop'
// times.
NormalizedSlice normalizeSlice(const Slice& slice, int64_t nrows) {
  if (nrows == 0) {
    return {0, 0, 1};
  }
  auto start = integerBound(slice.start);
  const auto stop = integerBound(slice.stop);
  const auto step = integerBound(slice.step).value_or(1);

  if (step == 0) {
    ROWSEL_USER_CHECK(
        start.has_value() && stop.has_value() && *stop >= 0,
        "{} with zero step requires a start and a non-negative count",
        slice.toString());
    auto first = *start < 0 ? *start + nrows : *start;
    if (first < 0) {
      return {0, 0, 0};
    }
    ROWSEL_USER_CHECK(
        first < nrows,
        "Row `{}` is invalid for datatable with {}",
        *start,
        pluralForm(nrows, "row"));
    return {first, *stop, 0};
  }

  int64_t first;
  if (!start.has_value()) {
    first = step > 0 ? 0 : nrows - 1;
  } else {
    first = *start < 0 ? *start + nrows : *start;
    if ((first < 0 && step < 0) || (first >= nrows && step > 0)) {
      return {0, 0, 0};
    }
    first = std::clamp<int64_t>(first, 0, nrows - 1);
  }

  const int128_t stride = step;
  int128_t count;
  if (!stop.has_value()) {
    count =
        step > 0 ? (nrows - 1 - first) / stride + 1 : first / -stride + 1;
  } else {
    const auto last = *stop < 0 ? *stop + nrows : *stop;
    if (step > 0) {
      count =
          last > first ? (std::min(nrows, last) - 1 - first) / stride + 1 : 0;
    } else {
      count = last < first
          ? (first - std::max<int64_t>(last, -1) - 1) / -stride + 1
          : 0;
    }
  }
  // At most nrows positions fall between 'first' and the clamped stop.
  return {first, static_cast<int64_t>(count), step};
}

// Rows of 'range' within [0, nrows). A range starting below zero is shifted
// by nrows. Returns std::nullopt if any position is out of bounds.
std::optional<NormalizedSlice> normalizeRange(
    const Range& range,
    int64_t nrows) {
  const int128_t step = range.step();
  const int128_t span = step > 0
      ? int128_t{range.stop()} - range.start() - 1
      : int128_t{range.start()} - range.stop() - 1;
  const int128_t count = span < 0 ? 0 : span / (step > 0 ? step : -step) + 1;
  if (count == 0) {
    return NormalizedSlice{0, 0, range.step()};
  }

  int128_t start = range.start();
  int128_t finish = start + (count - 1) * step;
  if (start < 0) {
    start += nrows;
    finish += nrows;
  }
  if (start < 0 || start >= nrows || finish < 0 || finish >= nrows) {
    return std::nullopt;
  }
  // Every position is in [0, nrows), so the count is at most nrows.
  return NormalizedSlice{
      static_cast<int64_t>(start), static_cast<int64_t>(count), range.step()};
}

RowFilter fromElements(
    const std::vector<Selector>& elements,
    bool fromGenerator,
    EvalCtx& ctx) {
  const auto nrows = ctx.nrows();
  std::vector<int64_t> bases;
  std::vector<int64_t> counts;
  std::vector<int64_t> steps;

  for (size_t i = 0; i < elements.size(); ++i) {
    const auto& element = elements[i];
    std::optional<NormalizedSlice> slice;
    switch (element.kind()) {
      case SelectorKind::kInteger: {
        const auto row = element.asInteger();
        ROWSEL_USER_CHECK(
            -nrows <= row && row < nrows,
            "Row `{}` is invalid for datatable with {}",
            row,
            pluralForm(nrows, "row"));
        bases.push_back(row < 0 ? row + nrows : row);
        continue;
      }
      case SelectorKind::kSlice:
        ROWSEL_USER_CHECK(
            element.asSlice().isIntegerValued(),
            "{} is not integer-valued",
            element.toString());
        slice = normalizeSlice(element.asSlice(), nrows);
        break;
      case SelectorKind::kRange:
        slice = normalizeRange(element.asRange(), nrows);
        ROWSEL_USER_CHECK(
            slice.has_value(),
            "Invalid {} for a datatable with {}",
            element.toString(),
            pluralForm(nrows, "row"));
        break;
      default:
        if (fromGenerator) {
          ROWSEL_USER_FAIL(
              "Invalid row selector {} generated at position {}",
              element.toString(),
              i);
        }
        ROWSEL_USER_FAIL(
            "Invalid row selector {} at element {} of the `rows` list",
            element.toString(),
            i);
    }

    ROWSEL_CHECK_GE(slice->count, 0);
    if (slice->count == 0) {
      continue;
    }
    if (slice->count == 1) {
      bases.push_back(slice->start);
      continue;
    }
    // Rows accumulated so far become explicit unit slices.
    counts.resize(bases.size(), 1);
    steps.resize(bases.size(), 1);
    bases.push_back(slice->start);
    counts.push_back(slice->count);
    steps.push_back(slice->step);
  }

  if (counts.empty()) {
    if (bases.empty() && nrows == 0) {
      // Nothing to select from, every row is selected.
      return RowFilter::all(ctx);
    }
    if (bases.size() == 1) {
      if (bases[0] == 0 && nrows == 1) {
        return RowFilter::all(ctx);
      }
      return RowFilter::slice(ctx, bases[0], 1, 1);
    }
    return RowFilter::array(ctx, std::move(bases));
  }
  if (bases.size() == 1) {
    if (bases[0] == 0 && counts[0] == nrows && steps[0] == 1) {
      return RowFilter::all(ctx);
    }
    return RowFilter::slice(ctx, bases[0], counts[0], steps[0]);
  }
  return RowFilter::multiSlice(
      ctx, std::move(bases), std::move(counts), std::move(steps));
}

RowFilter fromFrame(const Frame& frame, EvalCtx& ctx) {
  ROWSEL_USER_CHECK(
      frame.ncols() == 1,
      "`rows` argument should be a single-column datatable, got "
      "<Frame [{} rows x {} columns]>",
      frame.nrows(),
      frame.ncols());
  const auto nrows = ctx.nrows();
  auto column = frame.materializedColumn(0);
  switch (column->typeKind()) {
    case TypeKind::BOOLEAN:
      ROWSEL_USER_CHECK(
          frame.nrows() == nrows,
          "`rows` datatable has {}, but applied to a datatable with {}",
          pluralForm(frame.nrows(), "row"),
          pluralForm(nrows, "row"));
      return RowFilter::booleanColumn(ctx, std::move(column));
    case TypeKind::INTEGER:
    case TypeKind::BIGINT:
      return RowFilter::integerColumn(ctx, std::move(column));
    default:
      ROWSEL_TYPE_FAIL(
          "`rows` datatable should be either a boolean or an integer column, "
          "however it has type {}",
          mapTypeKindToName(column->typeKind()));
  }
}

RowFilter fromArray(const NumericArray& array, EvalCtx& ctx) {
  const auto& shape = array.shape();
  ROWSEL_USER_CHECK(
      array.ndim() == 1 ||
          (array.ndim() == 2 && std::min(shape[0], shape[1]) == 1),
      "Only a single-dimensional array is allowed as a `rows` argument, got {}",
      array.toString());
  ROWSEL_USER_CHECK(
      array.isBoolean() || array.isInteger(),
      "Either a boolean or an integer array is expected for `rows` argument, "
      "got {}",
      array.toString());
  ROWSEL_USER_CHECK(
      !array.isBoolean() || array.size() == ctx.nrows(),
      "Cannot apply a boolean array of length {} to a datatable with {}",
      array.size(),
      pluralForm(ctx.nrows(), "row"));
  return fromFrame(*array.toFrame(), ctx);
}

} // namespace

RowFilter
createRowFilter(const Selector& selector, EvalCtx& ctx, bool nested) {
  auto shape = classifySelector(selector);
  switch (shape.kind) {
    case SelectorShape::Kind::kAll:
      return RowFilter::all(ctx);
    case SelectorShape::Kind::kBoolean:
      ROWSEL_TYPE_FAIL("Boolean value cannot be used as a `rows` selector");
    case SelectorShape::Kind::kElements:
      return fromElements(shape.elements, shape.fromGenerator, ctx);
    case SelectorShape::Kind::kArray:
      return fromArray(selector.asArray(), ctx);
    case SelectorShape::Kind::kFrame:
      return fromFrame(*selector.asFrame(), ctx);
    case SelectorShape::Kind::kFunction:
      if (nested) {
        break;
      }
      VLOG(1) << "Resolving the result of a rows function";
      return createRowFilter(selector.asFunction()(ColumnScope()), ctx, true);
    case SelectorShape::Kind::kExpr:
      return RowFilter::filterExpr(ctx, selector.asExpr());
    case SelectorShape::Kind::kUnknown:
      break;
  }
  if (nested) {
    ROWSEL_TYPE_FAIL(
        "Unexpected result produced by the `rows` function: {}",
        selector.toString());
  }
  ROWSEL_TYPE_FAIL("Unexpected `rows` argument: {}", selector.toString());
}

} // namespace rowsel::exec
