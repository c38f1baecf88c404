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

#include <map>
#include <string>
#include <vector>

#include "rowsel/codegen/CodegenCtx.h"
#include "rowsel/vector/Frame.h"

namespace rowsel::codegen {

/// Builds one generated C function that loops over a range of the visible
/// rows of 'frame':
///
///   void <name>(int64_t row0, int64_t row1, <extra args>) {
///     <preamble>
///     for (int64_t i = row0; i < row1; ++i) {
///       <main loop>
///     }
///     <epilogue>
///   }
///
/// 'i' is the visible row. The builder owns variable naming for the row and
/// column values; callers obtain expressions for them through columnValue().
/// Data pointers are embedded as constants, so the frame must outlive the
/// compiled function.
class LoopBuilder {
 public:
  LoopBuilder(FramePtr frame, CodegenCtx& ctx, std::string name);

  const std::string& name() const {
    return name_;
  }

  const FramePtr& frame() const {
    return frame_;
  }

  void addToPreamble(std::string line);

  void addToMainLoop(std::string line);

  void addToEpilogue(std::string line);

  /// Extra parameters of the function, following 'row0' and 'row1'.
  void setExtraArgs(std::string args);

  /// Returns a C expression holding the value of column 'index' at the
  /// current row.
  std::string columnValue(column_index_t index);

  /// Returns the source of the function.
  std::string build() const;

  /// Adds the function to the context.
  void generate();

 private:
  std::string physicalRowExpression() const;

  const FramePtr frame_;
  CodegenCtx& ctx_;
  const std::string name_;
  std::vector<std::string> preamble_;
  std::vector<std::string> mainLoop_;
  std::vector<std::string> epilogue_;
  std::string extraArgs_;
  // Column index -> name of the per-row value variable.
  std::map<column_index_t, std::string> columnValues_;
};

} // namespace rowsel::codegen
