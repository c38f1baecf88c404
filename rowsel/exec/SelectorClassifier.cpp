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

#include "rowsel/exec/SelectorClassifier.h"

namespace rowsel::exec {
namespace {

SelectorShape makeShape(SelectorShape::Kind kind) {
  return SelectorShape{kind, {}, false};
}

SelectorShape makeElements(
    std::vector<Selector> elements,
    bool fromGenerator = false) {
  return SelectorShape{
      SelectorShape::Kind::kElements, std::move(elements), fromGenerator};
}

} // namespace

SelectorShape classifySelector(const Selector& selector) {
  switch (selector.kind()) {
    case SelectorKind::kAll:
      return makeShape(SelectorShape::Kind::kAll);
    case SelectorKind::kBoolean:
      return makeShape(SelectorShape::Kind::kBoolean);
    case SelectorKind::kInteger:
    case SelectorKind::kSlice:
    case SelectorKind::kRange:
      return makeElements({selector});
    case SelectorKind::kList:
      return makeElements(selector.asList());
    case SelectorKind::kSet: {
      std::vector<Selector> elements;
      elements.reserve(selector.asSet().size());
      for (auto value : selector.asSet()) {
        elements.push_back(Selector::integer(value));
      }
      return makeElements(std::move(elements));
    }
    case SelectorKind::kGenerator: {
      std::vector<Selector> elements;
      const auto& next = selector.asGenerator();
      while (auto element = next()) {
        elements.push_back(std::move(*element));
      }
      return makeElements(std::move(elements), true);
    }
    case SelectorKind::kArray:
      return makeShape(SelectorShape::Kind::kArray);
    case SelectorKind::kFrame:
      return makeShape(SelectorShape::Kind::kFrame);
    case SelectorKind::kFunction:
      return makeShape(SelectorShape::Kind::kFunction);
    case SelectorKind::kExpr:
      return makeShape(SelectorShape::Kind::kExpr);
    case SelectorKind::kDouble:
    case SelectorKind::kString:
      return makeShape(SelectorShape::Kind::kUnknown);
  }
  ROWSEL_UNREACHABLE();
}

} // namespace rowsel::exec
