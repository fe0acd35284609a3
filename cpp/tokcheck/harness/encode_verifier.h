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
#include "tokcheck/model/encoder.h"
#include "tokcheck/token/token.h"
#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

namespace tokcheck {
namespace harness {

using model::CompoundEncoder;
using model::CompoundResult;
using model::EncodeRef;

/// An Encoder that checks every callback against a token script instead of
/// producing output.
///
/// Each callback consumes the next scripted token and fails with an
/// AssertFailed error if it differs from the token the callback stands for.
/// Composite openers hand back a CompoundEncoder that shares the cursor and
/// checks the matching closer on end().
///
/// ```cpp
/// std::vector<Token> tokens = {Token::Seq(2), Token::I32(1), Token::I32(2),
///                              Token::SeqEnd()};
/// EncodeVerifier verifier(tokens);
/// auto result = Codec<std::vector<int32_t>>::encode({1, 2}, verifier);
/// // result.ok() && verifier.remaining() == 0
/// ```
///
/// The script must outlive the verifier.
class EncodeVerifier : public model::Encoder {
public:
  explicit EncodeVerifier(TokenSpan tokens, Config config = Config())
      : tokens_(tokens), config_(config) {}

  /// Number of scripted tokens not consumed yet.
  size_t remaining() const { return tokens_.size() - pos_; }

  Result<void, Error> encode_bool(bool v) override;
  Result<void, Error> encode_i8(int8_t v) override;
  Result<void, Error> encode_i16(int16_t v) override;
  Result<void, Error> encode_i32(int32_t v) override;
  Result<void, Error> encode_i64(int64_t v) override;
  Result<void, Error> encode_i128(absl::int128 v) override;
  Result<void, Error> encode_u8(uint8_t v) override;
  Result<void, Error> encode_u16(uint16_t v) override;
  Result<void, Error> encode_u32(uint32_t v) override;
  Result<void, Error> encode_u64(uint64_t v) override;
  Result<void, Error> encode_u128(absl::uint128 v) override;
  Result<void, Error> encode_f32(float v) override;
  Result<void, Error> encode_f64(double v) override;
  Result<void, Error> encode_char(char32_t v) override;

  /// Matches whichever string flavor is scripted next; Str by default.
  Result<void, Error> encode_str(std::string_view v) override;

  /// Matches whichever byte flavor is scripted next; Bytes by default.
  Result<void, Error> encode_bytes(ByteView v) override;

  Result<void, Error> encode_none() override;
  Result<void, Error> encode_some(EncodeRef value) override;
  Result<void, Error> encode_unit() override;
  Result<void, Error> encode_unit_struct(std::string_view name) override;

  // The variant callbacks accept both the closed form (UnitVariant,
  // NewtypeVariant, ...) and the open form introduced by Enum { name }:
  // the variant name as Str, then Unit, the payload, a Seq or a Map.

  Result<void, Error> encode_unit_variant(std::string_view name,
                                          uint32_t variant_index,
                                          std::string_view variant) override;
  Result<void, Error> encode_newtype_struct(std::string_view name,
                                            EncodeRef value) override;
  Result<void, Error> encode_newtype_variant(std::string_view name,
                                             uint32_t variant_index,
                                             std::string_view variant,
                                             EncodeRef value) override;

  CompoundResult encode_seq(std::optional<size_t> len) override;
  CompoundResult encode_tuple(size_t len) override;
  CompoundResult encode_tuple_struct(std::string_view name,
                                     size_t len) override;
  CompoundResult encode_tuple_variant(std::string_view name,
                                      uint32_t variant_index,
                                      std::string_view variant,
                                      size_t len) override;
  CompoundResult encode_map(std::optional<size_t> len) override;
  CompoundResult encode_struct(std::string_view name, size_t len) override;
  CompoundResult encode_struct_variant(std::string_view name,
                                       uint32_t variant_index,
                                       std::string_view variant,
                                       size_t len) override;

  Result<bool, Error> is_human_readable() const override {
    return config_.is_human_readable();
  }

private:
  friend class CompoundVerifier;

  const Token *peek() const {
    return pos_ < tokens_.size() ? &tokens_[pos_] : nullptr;
  }

  const Token *next_token();

  /// Consumes the next token and checks that it equals `actual`.
  Result<void, Error> assert_next(const Token &actual);

  /// Consumes an Enum { name } opener if one is scripted next.
  bool take_enum(std::string_view name);

  CompoundResult open(const Token &opener, EndToken end);

  TokenSpan tokens_;
  size_t pos_ = 0;
  Config config_;
};

} // namespace harness
} // namespace tokcheck
