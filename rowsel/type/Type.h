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

#include <cstdint>
#include <string>

namespace rowsel {

using column_index_t = uint32_t;

enum class TypeKind : int8_t {
  BOOLEAN = 0,
  INTEGER = 1,
  BIGINT = 2,
  DOUBLE = 3,
  VARCHAR = 4,
};

/// Returns the lower case name of the kind, e.g. "bigint".
const char* mapTypeKindToName(TypeKind kind);

inline bool isIntegerKind(TypeKind kind) {
  return kind == TypeKind::INTEGER || kind == TypeKind::BIGINT;
}

/// True for kinds that compare and convert as numbers. Booleans count as
/// numbers for comparisons.
inline bool isNumericKind(TypeKind kind) {
  return kind != TypeKind::VARCHAR;
}

template <typename T>
struct CppToType {};

template <>
struct CppToType<bool> {
  static constexpr TypeKind typeKind = TypeKind::BOOLEAN;
};

template <>
struct CppToType<int32_t> {
  static constexpr TypeKind typeKind = TypeKind::INTEGER;
};

template <>
struct CppToType<int64_t> {
  static constexpr TypeKind typeKind = TypeKind::BIGINT;
};

template <>
struct CppToType<double> {
  static constexpr TypeKind typeKind = TypeKind::DOUBLE;
};

template <>
struct CppToType<std::string> {
  static constexpr TypeKind typeKind = TypeKind::VARCHAR;
};

/// Physical storage type of a column element. Booleans are stored one per
/// byte so generated code can address them through a plain pointer.
template <typename T>
struct StorageType {
  using type = T;
};

template <>
struct StorageType<bool> {
  using type = uint8_t;
};

} // namespace rowsel
