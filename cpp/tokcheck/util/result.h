/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#pragma once

#include "tokcheck/util/error.h"
#include "tokcheck/util/logging.h"
#include "tokcheck/util/macros.h"
#include <new>
#include <type_traits>
#include <utility>

namespace tokcheck {

/// Wraps an error so that a Result can be constructed from it unambiguously,
/// in the manner of C++23 std::unexpected.
///
/// ```cpp
/// Result<uint8_t, Error> narrow(uint64_t v) {
///   if (v > 255) {
///     return Unexpected(Error::custom("too large"));
///   }
///   return static_cast<uint8_t>(v);
/// }
/// ```
template <typename E> class Unexpected {
public:
  explicit Unexpected(const E &e) : error_(e) {}
  explicit Unexpected(E &&e) : error_(std::move(e)) {}

  const E &error() const & { return error_; }
  E &error() & { return error_; }
  E &&error() && { return std::move(error_); }

private:
  E error_;
};

/// Either a value of type T or an error of type E.
///
/// Storage is a union with manual lifetime management, so a Result never
/// allocates by itself. Every verifier and driver operation in this library
/// returns a Result; callers are expected to check ok() before reading
/// value(), and reading the wrong side is a fatal programming error.
///
/// ```cpp
/// auto result = driver.next_token();
/// if (!result.ok()) {
///   return Unexpected(std::move(result).error());
/// }
/// const Token &token = result.value();
/// ```
template <typename T, typename E> class Result {
private:
  union Storage {
    T value_;
    E error_;

    Storage() {}
    ~Storage() {}
  };

  Storage storage_;
  bool has_value_;

  void destroy() {
    if (has_value_) {
      storage_.value_.~T();
    } else {
      storage_.error_.~E();
    }
  }

  template <typename R> void construct_from(R &&other) {
    if (has_value_) {
      new (&storage_.value_) T(std::forward<R>(other).storage_.value_);
    } else {
      new (&storage_.error_) E(std::forward<R>(other).storage_.error_);
    }
  }

public:
  using value_type = T;
  using error_type = E;

  Result(const T &value) : has_value_(true) { new (&storage_.value_) T(value); }

  Result(T &&value) : has_value_(true) {
    new (&storage_.value_) T(std::move(value));
  }

  Result(const Unexpected<E> &unexpected) : has_value_(false) {
    new (&storage_.error_) E(unexpected.error());
  }

  Result(Unexpected<E> &&unexpected) : has_value_(false) {
    new (&storage_.error_) E(std::move(unexpected).error());
  }

  ~Result() { destroy(); }

  Result(const Result &other) : has_value_(other.has_value_) {
    construct_from(other);
  }

  Result(Result &&other) noexcept(
      std::is_nothrow_move_constructible<T>::value &&
      std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    construct_from(std::move(other));
  }

  Result &operator=(const Result &other) {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      construct_from(other);
    }
    return *this;
  }

  Result &operator=(Result &&other) noexcept(
      std::is_nothrow_move_constructible<T>::value &&
      std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      construct_from(std::move(other));
    }
    return *this;
  }

  constexpr bool has_value() const noexcept { return has_value_; }
  constexpr bool ok() const noexcept { return has_value_; }
  constexpr explicit operator bool() const noexcept { return has_value_; }

  T &value() & {
    TOKCHECK_CHECK(has_value_) << "Cannot access value of error Result";
    return storage_.value_;
  }

  const T &value() const & {
    TOKCHECK_CHECK(has_value_) << "Cannot access value of error Result";
    return storage_.value_;
  }

  T &&value() && {
    TOKCHECK_CHECK(has_value_) << "Cannot access value of error Result";
    return std::move(storage_.value_);
  }

  template <typename U> T value_or(U &&default_value) const & {
    return has_value_ ? storage_.value_
                      : static_cast<T>(std::forward<U>(default_value));
  }

  E &error() & {
    TOKCHECK_CHECK(!has_value_) << "Cannot access error of successful Result";
    return storage_.error_;
  }

  const E &error() const & {
    TOKCHECK_CHECK(!has_value_) << "Cannot access error of successful Result";
    return storage_.error_;
  }

  E &&error() && {
    TOKCHECK_CHECK(!has_value_) << "Cannot access error of successful Result";
    return std::move(storage_.error_);
  }

  T &operator*() & { return value(); }
  const T &operator*() const & { return value(); }
  T &&operator*() && { return std::move(*this).value(); }

  T *operator->() {
    TOKCHECK_CHECK(has_value_) << "Cannot access value of error Result";
    return &storage_.value_;
  }

  const T *operator->() const {
    TOKCHECK_CHECK(has_value_) << "Cannot access value of error Result";
    return &storage_.value_;
  }
};

/// Result<void, E> - success without a value, or an error.
template <typename E> class Result<void, E> {
private:
  union Storage {
    char dummy_;
    E error_;

    Storage() : dummy_(0) {}
    ~Storage() {}
  };

  Storage storage_;
  bool has_value_;

  void destroy() {
    if (!has_value_) {
      storage_.error_.~E();
    }
  }

public:
  using error_type = E;

  Result() : has_value_(true) {}

  Result(const Unexpected<E> &unexpected) : has_value_(false) {
    new (&storage_.error_) E(unexpected.error());
  }

  Result(Unexpected<E> &&unexpected) : has_value_(false) {
    new (&storage_.error_) E(std::move(unexpected).error());
  }

  ~Result() { destroy(); }

  Result(const Result &other) : has_value_(other.has_value_) {
    if (!has_value_) {
      new (&storage_.error_) E(other.storage_.error_);
    }
  }

  Result(Result &&other) noexcept(std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    if (!has_value_) {
      new (&storage_.error_) E(std::move(other.storage_.error_));
    }
  }

  Result &operator=(const Result &other) {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      if (!has_value_) {
        new (&storage_.error_) E(other.storage_.error_);
      }
    }
    return *this;
  }

  Result &operator=(Result &&other) noexcept(
      std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      if (!has_value_) {
        new (&storage_.error_) E(std::move(other.storage_.error_));
      }
    }
    return *this;
  }

  constexpr bool has_value() const noexcept { return has_value_; }
  constexpr bool ok() const noexcept { return has_value_; }
  constexpr explicit operator bool() const noexcept { return has_value_; }

  E &error() & {
    TOKCHECK_CHECK(!has_value_) << "Cannot access error of successful Result";
    return storage_.error_;
  }

  const E &error() const & {
    TOKCHECK_CHECK(!has_value_) << "Cannot access error of successful Result";
    return storage_.error_;
  }

  E &&error() && {
    TOKCHECK_CHECK(!has_value_) << "Cannot access error of successful Result";
    return std::move(storage_.error_);
  }
};

template <typename T, typename E> class Result<T &, E> {
  static_assert(sizeof(T) == 0, "Result does not hold references; return a "
                                "pointer or a value instead.");
};

/// Return early if Result is an error
#define TOKCHECK_RETURN_NOT_OK(expr)                                           \
  do {                                                                         \
    auto _result = (expr);                                                     \
    if (TOKCHECK_PREDICT_FALSE(!_result.ok())) {                               \
      return ::tokcheck::Unexpected(std::move(_result).error());               \
    }                                                                          \
  } while (0)

/// Assign value from Result<T, E> or return error
#define TOKCHECK_ASSIGN_OR_RETURN(lhs, rexpr)                                  \
  do {                                                                         \
    auto _result = (rexpr);                                                    \
    if (TOKCHECK_PREDICT_FALSE(!_result.ok())) {                               \
      return ::tokcheck::Unexpected(std::move(_result).error());               \
    }                                                                          \
    lhs = std::move(_result).value();                                          \
  } while (0)

/// Declare and assign value from Result<T, E> or return error.
///
/// Expands to several statements; always brace the enclosing control flow.
#define TOKCHECK_TRY(var, expr)                                                \
  auto _result_##var = (expr);                                                 \
  if (TOKCHECK_PREDICT_FALSE(!_result_##var.ok())) {                           \
    return ::tokcheck::Unexpected(std::move(_result_##var).error());           \
  }                                                                            \
  auto var = std::move(_result_##var).value()

template <typename T, typename E>
inline std::ostream &operator<<(std::ostream &os, const Result<T, E> &r) {
  if (r.ok()) {
    return os << "Ok(" << r.value() << ")";
  }
  return os << "Err(" << r.error() << ")";
}

template <typename E>
inline std::ostream &operator<<(std::ostream &os, const Result<void, E> &r) {
  if (r.ok()) {
    return os << "Ok()";
  }
  return os << "Err(" << r.error() << ")";
}

} // namespace tokcheck
