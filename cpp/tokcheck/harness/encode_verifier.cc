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

#include "tokcheck/harness/encode_verifier.h"
#include "tokcheck/util/logging.h"
#include <memory>
#include <utility>

namespace tokcheck {
namespace harness {

/// Members of one composite. Shares the verifier's cursor and checks the
/// closer it was opened with.
class CompoundVerifier : public CompoundEncoder {
public:
  CompoundVerifier(EncodeVerifier &verifier, EndToken end)
      : verifier_(verifier), end_(end) {}

  Result<void, Error> encode_element(EncodeRef value) override {
    return value.encode(verifier_);
  }

  Result<void, Error> encode_key(EncodeRef key) override {
    return key.encode(verifier_);
  }

  Result<void, Error> encode_value(EncodeRef value) override {
    return value.encode(verifier_);
  }

  Result<void, Error> encode_field(std::string_view key,
                                   EncodeRef value) override {
    TOKCHECK_RETURN_NOT_OK(verifier_.encode_str(key));
    return value.encode(verifier_);
  }

  Result<void, Error> skip_field(std::string_view key) override {
    const Token *next = verifier_.peek();
    if (next != nullptr && *next == Token::SkipStructField(key)) {
      verifier_.next_token();
    }
    return Result<void, Error>();
  }

  Result<void, Error> end() override {
    return verifier_.assert_next(end_token(end_));
  }

private:
  EncodeVerifier &verifier_;
  EndToken end_;
};

const Token *EncodeVerifier::next_token() {
  if (pos_ >= tokens_.size()) {
    return nullptr;
  }
  const Token *token = &tokens_[pos_++];
  TOKCHECK_LOG(DEBUG) << "encode consumed " << *token;
  return token;
}

Result<void, Error> EncodeVerifier::assert_next(const Token &actual) {
  const Token *expected = next_token();
  if (TOKCHECK_PREDICT_FALSE(expected == nullptr)) {
    return Unexpected(Error::assert_failed("expected end of tokens, but " +
                                          actual.to_string() +
                                          " was serialized"));
  }
  if (TOKCHECK_PREDICT_FALSE(*expected != actual)) {
    return Unexpected(Error::assert_failed(
        "expected Token::" + expected->to_string() + " but serialized as " +
        actual.to_string()));
  }
  return Result<void, Error>();
}

bool EncodeVerifier::take_enum(std::string_view name) {
  const Token *next = peek();
  if (next != nullptr && *next == Token::Enum(name)) {
    next_token();
    return true;
  }
  return false;
}

CompoundResult EncodeVerifier::open(const Token &opener, EndToken end) {
  TOKCHECK_RETURN_NOT_OK(assert_next(opener));
  std::unique_ptr<CompoundEncoder> compound =
      std::make_unique<CompoundVerifier>(*this, end);
  return CompoundResult(std::move(compound));
}

Result<void, Error> EncodeVerifier::encode_bool(bool v) {
  return assert_next(Token::Bool(v));
}

Result<void, Error> EncodeVerifier::encode_i8(int8_t v) {
  return assert_next(Token::I8(v));
}

Result<void, Error> EncodeVerifier::encode_i16(int16_t v) {
  return assert_next(Token::I16(v));
}

Result<void, Error> EncodeVerifier::encode_i32(int32_t v) {
  return assert_next(Token::I32(v));
}

Result<void, Error> EncodeVerifier::encode_i64(int64_t v) {
  return assert_next(Token::I64(v));
}

Result<void, Error> EncodeVerifier::encode_i128(absl::int128 v) {
  return assert_next(Token::I128(v));
}

Result<void, Error> EncodeVerifier::encode_u8(uint8_t v) {
  return assert_next(Token::U8(v));
}

Result<void, Error> EncodeVerifier::encode_u16(uint16_t v) {
  return assert_next(Token::U16(v));
}

Result<void, Error> EncodeVerifier::encode_u32(uint32_t v) {
  return assert_next(Token::U32(v));
}

Result<void, Error> EncodeVerifier::encode_u64(uint64_t v) {
  return assert_next(Token::U64(v));
}

Result<void, Error> EncodeVerifier::encode_u128(absl::uint128 v) {
  return assert_next(Token::U128(v));
}

Result<void, Error> EncodeVerifier::encode_f32(float v) {
  return assert_next(Token::F32(v));
}

Result<void, Error> EncodeVerifier::encode_f64(double v) {
  return assert_next(Token::F64(v));
}

Result<void, Error> EncodeVerifier::encode_char(char32_t v) {
  return assert_next(Token::Char(v));
}

Result<void, Error> EncodeVerifier::encode_str(std::string_view v) {
  const Token *next = peek();
  if (next != nullptr && next->is(TokenKind::BorrowedStr)) {
    return assert_next(Token::BorrowedStr(v));
  }
  if (next != nullptr && next->is(TokenKind::String)) {
    return assert_next(Token::String(v));
  }
  return assert_next(Token::Str(v));
}

Result<void, Error> EncodeVerifier::encode_bytes(ByteView v) {
  const Token *next = peek();
  if (next != nullptr && next->is(TokenKind::BorrowedBytes)) {
    return assert_next(Token::BorrowedBytes(v));
  }
  if (next != nullptr && next->is(TokenKind::ByteBuf)) {
    return assert_next(Token::ByteBuf(v));
  }
  return assert_next(Token::Bytes(v));
}

Result<void, Error> EncodeVerifier::encode_none() {
  return assert_next(Token::None());
}

Result<void, Error> EncodeVerifier::encode_some(EncodeRef value) {
  TOKCHECK_RETURN_NOT_OK(assert_next(Token::Some()));
  return value.encode(*this);
}

Result<void, Error> EncodeVerifier::encode_unit() {
  return assert_next(Token::Unit());
}

Result<void, Error>
EncodeVerifier::encode_unit_struct(std::string_view name) {
  return assert_next(Token::UnitStruct(name));
}

Result<void, Error>
EncodeVerifier::encode_unit_variant(std::string_view name,
                                    uint32_t variant_index,
                                    std::string_view variant) {
  (void)variant_index;
  if (take_enum(name)) {
    TOKCHECK_RETURN_NOT_OK(assert_next(Token::Str(variant)));
    return assert_next(Token::Unit());
  }
  return assert_next(Token::UnitVariant(name, variant));
}

Result<void, Error>
EncodeVerifier::encode_newtype_struct(std::string_view name,
                                      EncodeRef value) {
  TOKCHECK_RETURN_NOT_OK(assert_next(Token::NewtypeStruct(name)));
  return value.encode(*this);
}

Result<void, Error> EncodeVerifier::encode_newtype_variant(
    std::string_view name, uint32_t variant_index, std::string_view variant,
    EncodeRef value) {
  (void)variant_index;
  if (take_enum(name)) {
    TOKCHECK_RETURN_NOT_OK(assert_next(Token::Str(variant)));
  } else {
    TOKCHECK_RETURN_NOT_OK(assert_next(Token::NewtypeVariant(name, variant)));
  }
  return value.encode(*this);
}

CompoundResult EncodeVerifier::encode_seq(std::optional<size_t> len) {
  return open(Token::Seq(len), EndToken::Seq);
}

CompoundResult EncodeVerifier::encode_tuple(size_t len) {
  return open(Token::Tuple(len), EndToken::Tuple);
}

CompoundResult EncodeVerifier::encode_tuple_struct(std::string_view name,
                                                   size_t len) {
  return open(Token::TupleStruct(name, len), EndToken::TupleStruct);
}

CompoundResult EncodeVerifier::encode_tuple_variant(std::string_view name,
                                                    uint32_t variant_index,
                                                    std::string_view variant,
                                                    size_t len) {
  (void)variant_index;
  if (take_enum(name)) {
    TOKCHECK_RETURN_NOT_OK(assert_next(Token::Str(variant)));
    return open(Token::Seq(len), EndToken::Seq);
  }
  return open(Token::TupleVariant(name, variant, len), EndToken::TupleVariant);
}

CompoundResult EncodeVerifier::encode_map(std::optional<size_t> len) {
  return open(Token::Map(len), EndToken::Map);
}

CompoundResult EncodeVerifier::encode_struct(std::string_view name,
                                             size_t len) {
  return open(Token::Struct(name, len), EndToken::Struct);
}

CompoundResult EncodeVerifier::encode_struct_variant(std::string_view name,
                                                     uint32_t variant_index,
                                                     std::string_view variant,
                                                     size_t len) {
  (void)variant_index;
  if (take_enum(name)) {
    TOKCHECK_RETURN_NOT_OK(assert_next(Token::Str(variant)));
    return open(Token::Map(len), EndToken::Map);
  }
  return open(Token::StructVariant(name, variant, len),
              EndToken::StructVariant);
}

} // namespace harness
} // namespace tokcheck
