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
#include "tokcheck/model/decoder.h"
#include "tokcheck/token/token.h"
#include <cstddef>
#include <optional>
#include <string_view>

namespace tokcheck {
namespace harness {

using model::DecodeRef;
using model::NameList;
using model::Visitor;

/// A Decoder that replays a token script as if it were a live,
/// self-describing source.
///
/// Tokens are consumed lazily, one visitor callback at a time. Shape-specific
/// entry points peek at the next token and accept either the exact token they
/// stand for or fall back to decode_any(). SkipStructField markers are
/// invisible to decoding.
///
/// ```cpp
/// std::vector<Token> tokens = {Token::Seq(2), Token::I32(1), Token::I32(2),
///                              Token::SeqEnd()};
/// DecodeDriver driver(tokens);
/// auto value = Codec<std::vector<int32_t>>::decode(driver);
/// // value.value() == {1, 2} && driver.remaining() == 0
/// ```
///
/// The script must outlive the driver.
class DecodeDriver : public model::Decoder {
public:
  explicit DecodeDriver(TokenSpan tokens, Config config = Config())
      : tokens_(tokens), config_(config) {}

  /// Unconsumed tokens, SkipStructField markers included.
  size_t remaining() const { return tokens_.size() - pos_; }

  /// Consumes the next token other than a SkipStructField marker, if any.
  std::optional<Token> next_token_opt();

  Result<void, Error> decode_any(Visitor &visitor) override;

  /// None or Unit decode as absent, Some as present.
  Result<void, Error> decode_option(Visitor &visitor) override;

  Result<void, Error> decode_unit_struct(std::string_view name,
                                         Visitor &visitor) override;
  Result<void, Error> decode_newtype_struct(std::string_view name,
                                            Visitor &visitor) override;
  Result<void, Error> decode_tuple(size_t len, Visitor &visitor) override;
  Result<void, Error> decode_tuple_struct(std::string_view name, size_t len,
                                          Visitor &visitor) override;

  /// Accepts Struct { name } or an unnamed Map.
  Result<void, Error> decode_struct(std::string_view name,
                                    const NameList &fields,
                                    Visitor &visitor) override;

  /// Accepts Enum { name } or a closed-form variant token of that enum.
  Result<void, Error> decode_enum(std::string_view name,
                                  const NameList &variants,
                                  Visitor &visitor) override;

  Result<bool, Error> is_human_readable() const override {
    return config_.is_human_readable();
  }

private:
  friend class SeqDriver;
  friend class MapDriver;
  friend class DriverEnumAccess;
  friend class EnumMapAccess;

  std::optional<Token> peek_token_opt() const;
  Result<Token, Error> peek_token() const;
  Result<Token, Error> next_token();

  /// Consumes the next token and checks that it is `expected`.
  Result<void, Error> assert_next(const Token &expected);

  /// Walks a sequence up to `end` and then consumes the closer.
  Result<void, Error> visit_seq(std::optional<size_t> len, EndToken end,
                                Visitor &visitor);
  Result<void, Error> visit_map(std::optional<size_t> len, EndToken end,
                                Visitor &visitor);

  /// Open-form Enum { name }: tag, then Unit or a payload.
  Result<void, Error> visit_open_enum(Visitor &visitor);

  TokenSpan tokens_;
  size_t pos_ = 0;
  Config config_;
};

} // namespace harness
} // namespace tokcheck
