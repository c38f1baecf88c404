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

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <folly/Likely.h>

namespace rowsel {

namespace error_source {
/// Errors where the root cause of the problem is some invalid input from the
/// caller, e.g. a row selector of the wrong shape or out of bounds.
inline constexpr std::string_view kErrorSourceUser = "USER";

/// Errors where the root cause is an internal inconsistency of the library.
inline constexpr std::string_view kErrorSourceRuntime = "RUNTIME";
} // namespace error_source

namespace error_code {
/// A value is out of bounds or inconsistent with the frame it is applied to.
inline constexpr std::string_view kInvalidArgument = "INVALID_ARGUMENT";

/// The shape or type of an argument is fundamentally wrong for the context.
inline constexpr std::string_view kTypeMismatch = "TYPE_MISMATCH";

/// An internal invariant does not hold.
inline constexpr std::string_view kInvalidState = "INVALID_STATE";

/// Execution reached code that should not be reachable.
inline constexpr std::string_view kUnreachableCode = "UNREACHABLE_CODE";

/// Generated code could not be compiled or loaded.
inline constexpr std::string_view kCompileError = "COMPILE_ERROR";
} // namespace error_code

class RowselException : public std::exception {
 public:
  RowselException(
      const char* file,
      size_t line,
      const char* function,
      std::string_view failingExpression,
      std::string_view message,
      std::string_view errorSource,
      std::string_view errorCode);

  const char* what() const noexcept override {
    return what_.c_str();
  }

  const std::string& message() const {
    return message_;
  }

  const std::string& errorSource() const {
    return errorSource_;
  }

  const std::string& errorCode() const {
    return errorCode_;
  }

  const char* file() const {
    return file_;
  }

  size_t line() const {
    return line_;
  }

  const char* function() const {
    return function_;
  }

  const std::string& failingExpression() const {
    return failingExpression_;
  }

 private:
  const char* file_;
  size_t line_;
  const char* function_;
  std::string failingExpression_;
  std::string message_;
  std::string errorSource_;
  std::string errorCode_;
  std::string what_;
};

class RowselUserError : public RowselException {
 public:
  using RowselException::RowselException;
};

class RowselRuntimeError : public RowselException {
 public:
  using RowselException::RowselException;
};

namespace detail {

inline std::string errorMessage() {
  return "";
}

template <typename... Args>
std::string errorMessage(fmt::format_string<Args...> format, Args&&... args) {
  return fmt::format(format, std::forward<Args>(args)...);
}

} // namespace detail
} // namespace rowsel

#define _ROWSEL_THROW(exception, errorSource, errorCode, expression, ...) \
  throw exception(                                                        \
      __FILE__,                                                           \
      __LINE__,                                                           \
      __FUNCTION__,                                                       \
      expression,                                                         \
      ::rowsel::detail::errorMessage(__VA_ARGS__),                        \
      errorSource,                                                        \
      errorCode)

#define _ROWSEL_CHECK_IMPL(exception, errorSource, errorCode, expr, ...) \
  if (FOLLY_UNLIKELY(!(expr))) {                                         \
    _ROWSEL_THROW(exception, errorSource, errorCode, #expr, __VA_ARGS__); \
  }

#define _ROWSEL_CHECK_OP(expr1, expr2, op, ...)                         \
  if (FOLLY_UNLIKELY(!((expr1)op(expr2)))) {                            \
    throw ::rowsel::RowselRuntimeError(                                 \
        __FILE__,                                                       \
        __LINE__,                                                       \
        __FUNCTION__,                                                   \
        #expr1 " " #op " " #expr2,                                      \
        fmt::format("({} vs. {}) ", (expr1), (expr2)) +                 \
            ::rowsel::detail::errorMessage(__VA_ARGS__),                \
        ::rowsel::error_source::kErrorSourceRuntime,                    \
        ::rowsel::error_code::kInvalidState);                           \
  }

/// Internal invariant checks. A failure is a bug in the caller, never a
/// problem with user input.
#define ROWSEL_CHECK(expr, ...)                      \
  _ROWSEL_CHECK_IMPL(                                \
      ::rowsel::RowselRuntimeError,                  \
      ::rowsel::error_source::kErrorSourceRuntime,   \
      ::rowsel::error_code::kInvalidState,           \
      expr,                                          \
      __VA_ARGS__)

#define ROWSEL_CHECK_EQ(e1, e2, ...) _ROWSEL_CHECK_OP(e1, e2, ==, __VA_ARGS__)
#define ROWSEL_CHECK_NE(e1, e2, ...) _ROWSEL_CHECK_OP(e1, e2, !=, __VA_ARGS__)
#define ROWSEL_CHECK_LT(e1, e2, ...) _ROWSEL_CHECK_OP(e1, e2, <, __VA_ARGS__)
#define ROWSEL_CHECK_LE(e1, e2, ...) _ROWSEL_CHECK_OP(e1, e2, <=, __VA_ARGS__)
#define ROWSEL_CHECK_GT(e1, e2, ...) _ROWSEL_CHECK_OP(e1, e2, >, __VA_ARGS__)
#define ROWSEL_CHECK_GE(e1, e2, ...) _ROWSEL_CHECK_OP(e1, e2, >=, __VA_ARGS__)

#define ROWSEL_CHECK_NOT_NULL(e, ...) ROWSEL_CHECK((e) != nullptr, __VA_ARGS__)

#define ROWSEL_FAIL(...)                           \
  _ROWSEL_THROW(                                   \
      ::rowsel::RowselRuntimeError,                \
      ::rowsel::error_source::kErrorSourceRuntime, \
      ::rowsel::error_code::kInvalidState,         \
      "",                                          \
      __VA_ARGS__)

#define ROWSEL_UNREACHABLE(...)                    \
  _ROWSEL_THROW(                                   \
      ::rowsel::RowselRuntimeError,                \
      ::rowsel::error_source::kErrorSourceRuntime, \
      ::rowsel::error_code::kUnreachableCode,      \
      "",                                          \
      __VA_ARGS__)

/// Value-constraint errors: the argument has the right shape but a value is
/// out of bounds or inconsistent with the frame.
#define ROWSEL_USER_CHECK(expr, ...)             \
  _ROWSEL_CHECK_IMPL(                            \
      ::rowsel::RowselUserError,                 \
      ::rowsel::error_source::kErrorSourceUser,  \
      ::rowsel::error_code::kInvalidArgument,    \
      expr,                                      \
      __VA_ARGS__)

#define ROWSEL_USER_FAIL(...)                   \
  _ROWSEL_THROW(                                \
      ::rowsel::RowselUserError,                \
      ::rowsel::error_source::kErrorSourceUser, \
      ::rowsel::error_code::kInvalidArgument,   \
      "",                                       \
      __VA_ARGS__)

/// Type-mismatch errors: the argument is of the wrong kind altogether.
#define ROWSEL_TYPE_CHECK(expr, ...)             \
  _ROWSEL_CHECK_IMPL(                            \
      ::rowsel::RowselUserError,                 \
      ::rowsel::error_source::kErrorSourceUser,  \
      ::rowsel::error_code::kTypeMismatch,       \
      expr,                                      \
      __VA_ARGS__)

#define ROWSEL_TYPE_FAIL(...)                   \
  _ROWSEL_THROW(                                \
      ::rowsel::RowselUserError,                \
      ::rowsel::error_source::kErrorSourceUser, \
      ::rowsel::error_code::kTypeMismatch,      \
      "",                                       \
      __VA_ARGS__)
