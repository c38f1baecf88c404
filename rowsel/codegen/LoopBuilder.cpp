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

#include "rowsel/codegen/LoopBuilder.h"

#include <cstdint>

#include <fmt/format.h>

namespace rowsel::codegen {
namespace {

const char* cType(TypeKind kind) {
  switch (kind) {
    case TypeKind::BOOLEAN:
      return "uint8_t";
    case TypeKind::INTEGER:
      return "int32_t";
    case TypeKind::BIGINT:
      return "int64_t";
    case TypeKind::DOUBLE:
      return "double";
    case TypeKind::VARCHAR:
      break;
  }
  ROWSEL_USER_FAIL(
      "Columns of type {} are not supported in generated code",
      mapTypeKindToName(kind));
}

std::string pointerConstant(const char* type, const void* pointer) {
  return fmt::format(
      "(const {}*) {:#x}ULL", type, reinterpret_cast<uintptr_t>(pointer));
}

} // namespace

LoopBuilder::LoopBuilder(FramePtr frame, CodegenCtx& ctx, std::string name)
    : frame_(std::move(frame)), ctx_(ctx), name_(std::move(name)) {
  ROWSEL_CHECK_NOT_NULL(frame_);
}

void LoopBuilder::addToPreamble(std::string line) {
  preamble_.push_back(std::move(line));
}

void LoopBuilder::addToMainLoop(std::string line) {
  mainLoop_.push_back(std::move(line));
}

void LoopBuilder::addToEpilogue(std::string line) {
  epilogue_.push_back(std::move(line));
}

void LoopBuilder::setExtraArgs(std::string args) {
  extraArgs_ = std::move(args);
}

std::string LoopBuilder::columnValue(column_index_t index) {
  auto it = columnValues_.find(index);
  if (it != columnValues_.end()) {
    return it->second;
  }
  // Fails early for unsupported column types.
  cType(frame_->column(index)->typeKind());
  auto variable = fmt::format("v{}", index);
  columnValues_.emplace(index, variable);
  return variable;
}

std::string LoopBuilder::physicalRowExpression() const {
  const auto& rowIndex = frame_->rowIndex();
  if (!rowIndex) {
    return "i";
  }
  if (rowIndex->isSlice()) {
    return fmt::format(
        "{} + i * ({})", rowIndex->sliceStart(), rowIndex->sliceStep());
  }
  return "rows[i]";
}

std::string LoopBuilder::build() const {
  std::string source = fmt::format(
      "void {}(int64_t row0, int64_t row1{}{}) {{\n",
      name_,
      extraArgs_.empty() ? "" : ", ",
      extraArgs_);

  const auto& rowIndex = frame_->rowIndex();
  if (rowIndex && rowIndex->isArray()) {
    source += fmt::format(
        "  const int64_t* rows = {};\n",
        pointerConstant("int64_t", rowIndex->indices().data()));
  }
  for (const auto& [index, variable] : columnValues_) {
    const auto& column = frame_->column(index);
    source += fmt::format(
        "  const {}* col{} = {};\n",
        cType(column->typeKind()),
        index,
        pointerConstant(cType(column->typeKind()), column->rawData()));
  }
  for (const auto& line : preamble_) {
    source += fmt::format("  {}\n", line);
  }

  source += "  for (int64_t i = row0; i < row1; ++i) {\n";
  if (!columnValues_.empty()) {
    source += fmt::format("    int64_t r = {};\n", physicalRowExpression());
  }
  for (const auto& [index, variable] : columnValues_) {
    source += fmt::format(
        "    {} {} = col{}[r];\n",
        cType(frame_->column(index)->typeKind()),
        variable,
        index);
  }
  for (const auto& line : mainLoop_) {
    source += fmt::format("    {}\n", line);
  }
  source += "  }\n";

  for (const auto& line : epilogue_) {
    source += fmt::format("  {}\n", line);
  }
  source += "}\n";
  return source;
}

void LoopBuilder::generate() {
  ctx_.addFunction(build());
}

} // namespace rowsel::codegen
