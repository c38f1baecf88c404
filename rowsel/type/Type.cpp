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

#include "rowsel/type/Type.h"

#include "rowsel/common/base/Exceptions.h"

namespace rowsel {

const char* mapTypeKindToName(TypeKind kind) {
  switch (kind) {
    case TypeKind::BOOLEAN:
      return "boolean";
    case TypeKind::INTEGER:
      return "integer";
    case TypeKind::BIGINT:
      return "bigint";
    case TypeKind::DOUBLE:
      return "double";
    case TypeKind::VARCHAR:
      return "varchar";
  }
  ROWSEL_UNREACHABLE("Unknown type kind {}", static_cast<int>(kind));
}

} // namespace rowsel
