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

#include "tokcheck/harness/config.h"
#include "tokcheck/harness/decode_driver.h"
#include "tokcheck/harness/encode_verifier.h"
#include "tokcheck/model/codec.h"
#include "tokcheck/token/token.h"
#include "tokcheck/util/logging.h"
#include "gtest/gtest.h"
#include <string>
#include <string_view>
#include <utility>

namespace tokcheck {
namespace harness {

// ============================================================================
// Token script assertions
//
// Each entry point returns a ::testing::AssertionResult, so it composes with
// EXPECT_TRUE / ASSERT_TRUE:
//
//   EXPECT_TRUE(assert_tokens(S{0, 0}, {Token::Struct("S", 2),
//                                       Token::Str("a"), Token::U8(0),
//                                       Token::Str("b"), Token::U8(0),
//                                       Token::StructEnd()}));
//
// Every entry point has an overload taking a Config first, for types whose
// codec branches on is_human_readable().
// ============================================================================

namespace detail {

inline ::testing::AssertionResult failure(const std::string &message) {
  TOKCHECK_LOG(DEBUG) << "token assertion failed: " << message;
  return ::testing::AssertionFailure() << message;
}

inline ::testing::AssertionResult remaining_tokens(size_t remaining) {
  return failure(std::to_string(remaining) + " remaining tokens");
}

} // namespace detail

/// Asserts that `value` encodes to exactly `tokens`.
template <typename T>
::testing::AssertionResult assert_ser_tokens(const Config &config,
                                             const T &value,
                                             TokenSpan tokens) {
  EncodeVerifier verifier(tokens, config);
  auto result = model::Codec<T>::encode(value, verifier);
  if (!result.ok()) {
    return detail::failure("value failed to serialize: " +
                           result.error().message());
  }
  if (verifier.remaining() > 0) {
    return detail::remaining_tokens(verifier.remaining());
  }
  return ::testing::AssertionSuccess();
}

template <typename T>
::testing::AssertionResult assert_ser_tokens(const T &value,
                                             TokenSpan tokens) {
  return assert_ser_tokens(Config(), value, tokens);
}

/// Asserts that encoding `value` against `tokens` fails with exactly `error`
/// and that the failure consumed the whole script.
template <typename T>
::testing::AssertionResult
assert_ser_tokens_error(const Config &config, const T &value,
                        TokenSpan tokens, std::string_view error) {
  EncodeVerifier verifier(tokens, config);
  auto result = model::Codec<T>::encode(value, verifier);
  if (result.ok()) {
    return detail::failure("value serialized successfully");
  }
  if (result.error() != error) {
    return detail::failure("expected error `" + std::string(error) +
                           "` but serialization failed with `" +
                           result.error().message() + "`");
  }
  if (verifier.remaining() > 0) {
    return detail::remaining_tokens(verifier.remaining());
  }
  return ::testing::AssertionSuccess();
}

template <typename T>
::testing::AssertionResult assert_ser_tokens_error(const T &value,
                                                   TokenSpan tokens,
                                                   std::string_view error) {
  return assert_ser_tokens_error(Config(), value, tokens, error);
}

/// Asserts that `tokens` decode to a value equal to `value`, both through
/// Codec<T>::decode and through Codec<T>::decode_in_place over the decoded
/// value, consuming the whole script each time.
template <typename T>
::testing::AssertionResult assert_de_tokens(const Config &config,
                                            const T &value,
                                            TokenSpan tokens) {
  DecodeDriver driver(tokens, config);
  auto decoded = model::Codec<T>::decode(driver);
  if (!decoded.ok()) {
    return detail::failure("tokens failed to deserialize: " +
                           decoded.error().message());
  }
  T place = std::move(decoded).value();
  if (!(place == value)) {
    return detail::failure("deserialized " + ::testing::PrintToString(place) +
                           " but expected " + ::testing::PrintToString(value));
  }
  if (driver.remaining() > 0) {
    return detail::remaining_tokens(driver.remaining());
  }

  DecodeDriver in_place_driver(tokens, config);
  auto in_place = model::Codec<T>::decode_in_place(in_place_driver, place);
  if (!in_place.ok()) {
    return detail::failure("tokens failed to deserialize_in_place: " +
                           in_place.error().message());
  }
  if (!(place == value)) {
    return detail::failure("deserialized in place " +
                           ::testing::PrintToString(place) + " but expected " +
                           ::testing::PrintToString(value));
  }
  if (in_place_driver.remaining() > 0) {
    return detail::remaining_tokens(in_place_driver.remaining());
  }
  return ::testing::AssertionSuccess();
}

template <typename T>
::testing::AssertionResult assert_de_tokens(const T &value,
                                            TokenSpan tokens) {
  return assert_de_tokens(Config(), value, tokens);
}

/// Asserts that decoding a T from `tokens` fails with exactly `error`.
///
/// A failure found by peeking leaves that token unconsumed, so one token may
/// remain; anything beyond it fails the assertion.
template <typename T>
::testing::AssertionResult assert_de_tokens_error(const Config &config,
                                                  TokenSpan tokens,
                                                  std::string_view error) {
  DecodeDriver driver(tokens, config);
  auto decoded = model::Codec<T>::decode(driver);
  if (decoded.ok()) {
    return detail::failure("tokens deserialized successfully");
  }
  if (decoded.error() != error) {
    return detail::failure("expected error `" + std::string(error) +
                           "` but deserialization failed with `" +
                           decoded.error().message() + "`");
  }
  driver.next_token_opt();
  if (driver.remaining() > 0) {
    return detail::remaining_tokens(driver.remaining());
  }
  return ::testing::AssertionSuccess();
}

template <typename T>
::testing::AssertionResult assert_de_tokens_error(TokenSpan tokens,
                                                  std::string_view error) {
  return assert_de_tokens_error<T>(Config(), tokens, error);
}

/// Asserts both directions: assert_ser_tokens, then assert_de_tokens.
template <typename T>
::testing::AssertionResult assert_tokens(const Config &config, const T &value,
                                         TokenSpan tokens) {
  auto ser = assert_ser_tokens(config, value, tokens);
  if (!ser) {
    return ser;
  }
  return assert_de_tokens(config, value, tokens);
}

template <typename T>
::testing::AssertionResult assert_tokens(const T &value, TokenSpan tokens) {
  return assert_tokens(Config(), value, tokens);
}

} // namespace harness
} // namespace tokcheck
