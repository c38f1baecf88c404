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

#include "rowsel/exec/Selector.h"

#include <fmt/format.h>
#include <folly/String.h>

namespace rowsel::exec {
namespace {

std::string doubleToString(double value) {
  auto result = fmt::format("{}", value);
  if (result.find_first_of(".eEn") == std::string::npos) {
    result += ".0";
  }
  return result;
}

std::string boundToString(const std::optional<Slice::Bound>& bound) {
  if (!bound.has_value()) {
    return "None";
  }
  if (auto* value = std::get_if<double>(&*bound)) {
    return doubleToString(*value);
  }
  return fmt::format("{}", std::get<int64_t>(*bound));
}

} // namespace

bool Slice::isIntegerValued() const {
  for (const auto* bound : {&start, &stop, &step}) {
    if (bound->has_value() && std::holds_alternative<double>(**bound)) {
      return false;
    }
  }
  return true;
}

std::string Slice::toString() const {
  return fmt::format(
      "slice({}, {}, {})",
      boundToString(start),
      boundToString(stop),
      boundToString(step));
}

Range::Range(int64_t start, int64_t stop, int64_t step)
    : start_(start), stop_(stop), step_(step) {
  ROWSEL_USER_CHECK(step_ != 0, "range() step must not be zero");
}

std::string Range::toString() const {
  if (step_ == 1) {
    return fmt::format("range({}, {})", start_, stop_);
  }
  return fmt::format("range({}, {}, {})", start_, stop_, step_);
}

const char* mapSelectorKindToName(SelectorKind kind) {
  switch (kind) {
    case SelectorKind::kAll:
      return "ALL";
    case SelectorKind::kBoolean:
      return "BOOLEAN";
    case SelectorKind::kInteger:
      return "INTEGER";
    case SelectorKind::kDouble:
      return "DOUBLE";
    case SelectorKind::kString:
      return "STRING";
    case SelectorKind::kSlice:
      return "SLICE";
    case SelectorKind::kRange:
      return "RANGE";
    case SelectorKind::kList:
      return "LIST";
    case SelectorKind::kSet:
      return "SET";
    case SelectorKind::kGenerator:
      return "GENERATOR";
    case SelectorKind::kArray:
      return "ARRAY";
    case SelectorKind::kFrame:
      return "FRAME";
    case SelectorKind::kFunction:
      return "FUNCTION";
    case SelectorKind::kExpr:
      return "EXPR";
  }
  ROWSEL_UNREACHABLE();
}

Selector Selector::slice(
    std::optional<int64_t> start,
    std::optional<int64_t> stop,
    std::optional<int64_t> step) {
  Slice result;
  if (start.has_value()) {
    result.start = *start;
  }
  if (stop.has_value()) {
    result.stop = *stop;
  }
  if (step.has_value()) {
    result.step = *step;
  }
  return Selector(std::move(result));
}

std::string Selector::toString() const {
  switch (kind()) {
    case SelectorKind::kAll:
      return "None";
    case SelectorKind::kBoolean:
      return asBoolean() ? "True" : "False";
    case SelectorKind::kInteger:
      return fmt::format("{}", asInteger());
    case SelectorKind::kDouble:
      return doubleToString(asDouble());
    case SelectorKind::kString:
      return fmt::format("'{}'", asString());
    case SelectorKind::kSlice:
      return asSlice().toString();
    case SelectorKind::kRange:
      return asRange().toString();
    case SelectorKind::kList: {
      std::vector<std::string> elements;
      for (const auto& element : asList()) {
        elements.push_back(element.toString());
      }
      return fmt::format("[{}]", folly::join(", ", elements));
    }
    case SelectorKind::kSet:
      if (asSet().empty()) {
        return "set()";
      }
      return fmt::format("{{{}}}", folly::join(", ", asSet()));
    case SelectorKind::kGenerator:
      return "<generator>";
    case SelectorKind::kArray:
      return asArray().toString();
    case SelectorKind::kFrame:
      return fmt::format(
          "<Frame [{} rows x {} columns]>",
          asFrame()->nrows(),
          asFrame()->ncols());
    case SelectorKind::kFunction:
      return "<function>";
    case SelectorKind::kExpr:
      return asExpr()->toString();
  }
  ROWSEL_UNREACHABLE();
}

} // namespace rowsel::exec
