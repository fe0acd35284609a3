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

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tokcheck {

/// Error codes for encode/decode checks.
enum class ErrorCode : char {
  Custom = 1,
  AssertFailed = 2,
  InvalidType = 3,
  InvalidValue = 4,
  InvalidLength = 5,
  UnknownVariant = 6,
  UnknownField = 7,
  MissingField = 8,
  DuplicateField = 9,
};

/// Error raised while encoding to or decoding from a token script, or by a
/// codec that rejects what it was given.
///
/// Always build errors through the static factory functions; the private
/// constructor is not part of the API. The factories fix the wording of each
/// message, so tests can compare an error directly against literal text:
///
/// ```cpp
/// auto err = Error::unknown_field("x", {"a", "b"});
/// ASSERT_EQ(err, "unknown field `x`, expected `a` or `b`");
/// ```
///
/// Available factories:
///
/// - Error::custom() - Free-form message, the default for codec failures
/// - Error::assert_failed() - A scripted expectation did not hold
/// - Error::invalid_type() - A value of the wrong shape was produced
/// - Error::invalid_value() - The shape is right but the value is not
/// - Error::invalid_length() - A sequence or map has the wrong size
/// - Error::unknown_variant() - A variant tag is not one of the allowed ones
/// - Error::unknown_field() - A record field is not one of the allowed ones
/// - Error::missing_field() - A required record field never appeared
/// - Error::duplicate_field() - A record field appeared twice
class Error {
public:
  /// Creates an error carrying the given message verbatim.
  static Error custom(std::string msg) {
    return Error(ErrorCode::Custom, std::move(msg));
  }

  /// Creates an assertion failure. Raised only by the verifiers, and matched
  /// on by the comparator to report a scripted mismatch.
  static Error assert_failed(std::string msg) {
    return Error(ErrorCode::AssertFailed, std::move(msg));
  }

  /// `actual` and `expected` are descriptions such as "integer `1`" and
  /// "a string".
  static Error invalid_type(std::string_view actual,
                            std::string_view expected) {
    return Error(ErrorCode::InvalidType, "invalid type: " + std::string(actual) +
                                             ", expected " +
                                             std::string(expected));
  }

  static Error invalid_value(std::string_view actual,
                             std::string_view expected) {
    return Error(ErrorCode::InvalidValue, "invalid value: " +
                                              std::string(actual) +
                                              ", expected " +
                                              std::string(expected));
  }

  static Error invalid_length(size_t len, std::string_view expected) {
    return Error(ErrorCode::InvalidLength,
                 "invalid length " + std::to_string(len) + ", expected " +
                     std::string(expected));
  }

  static Error unknown_variant(std::string_view variant,
                               const std::vector<std::string_view> &expected);

  static Error unknown_field(std::string_view field,
                             const std::vector<std::string_view> &expected);

  static Error missing_field(std::string_view field) {
    return Error(ErrorCode::MissingField,
                 "missing field `" + std::string(field) + "`");
  }

  static Error duplicate_field(std::string_view field) {
    return Error(ErrorCode::DuplicateField,
                 "duplicate field `" + std::string(field) + "`");
  }

  // Accessors
  ErrorCode code() const { return state_->code_; }
  const std::string &message() const { return state_->msg_; }

  /// Returns "<code>: <message>".
  std::string to_string() const;

  /// Returns the error code as a string.
  std::string code_as_string() const;

  // Copy and move semantics
  Error(const Error &other) : state_(new ErrorState(*other.state_)) {}
  Error(Error &&) noexcept = default;
  Error &operator=(const Error &other) {
    if (this != &other) {
      state_.reset(new ErrorState(*other.state_));
    }
    return *this;
  }
  Error &operator=(Error &&) noexcept = default;

  ~Error() = default;

private:
  // Heap state keeps Result<T, Error> small on the success path.
  struct ErrorState {
    ErrorCode code_;
    std::string msg_;

    ErrorState(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}
  };

  Error(ErrorCode code, std::string msg)
      : state_(new ErrorState(code, std::move(msg))) {}

  std::unique_ptr<ErrorState> state_;
};

/// Errors compare against plain text by message.
inline bool operator==(const Error &err, std::string_view msg) {
  return err.message() == msg;
}
inline bool operator==(std::string_view msg, const Error &err) {
  return err.message() == msg;
}
inline bool operator!=(const Error &err, std::string_view msg) {
  return !(err == msg);
}
inline bool operator!=(std::string_view msg, const Error &err) {
  return !(err == msg);
}

inline std::ostream &operator<<(std::ostream &os, const Error &e) {
  return os << e.to_string();
}

} // namespace tokcheck
