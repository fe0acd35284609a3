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

#include "tokcheck/harness/decode_driver.h"
#include "tokcheck/model/codec.h"
#include "tokcheck/model/value_decoder.h"
#include "tokcheck/util/logging.h"
#include <string>

namespace tokcheck {
namespace harness {

namespace {

Error unexpected(const Token &token) {
  return Error::custom("deserialization did not expect this token: " +
                       token.to_string());
}

Error end_of_tokens() {
  return Error::custom("ran out of tokens to deserialize");
}

bool is_closed_variant(const Token &token) {
  switch (token.kind()) {
  case TokenKind::UnitVariant:
  case TokenKind::NewtypeVariant:
  case TokenKind::TupleVariant:
  case TokenKind::StructVariant:
    return true;
  default:
    return false;
  }
}

} // namespace

// ============================================================================
// Access objects handed to visitors
// ============================================================================

/// Elements of a sequence, up to its closer.
class SeqDriver : public model::SeqAccess {
public:
  SeqDriver(DecodeDriver &driver, std::optional<size_t> len, EndToken end)
      : driver_(driver), len_(len), end_(end) {}

  Result<bool, Error> next_element(DecodeRef element) override {
    if (driver_.peek_token_opt() == end_token(end_)) {
      return false;
    }
    if (len_ && *len_ > 0) {
      --*len_;
    }
    TOKCHECK_RETURN_NOT_OK(element.decode(driver_));
    return true;
  }

  std::optional<size_t> size_hint() const override { return len_; }

private:
  DecodeDriver &driver_;
  std::optional<size_t> len_;
  EndToken end_;
};

/// Entries of a map or fields of a record, up to its closer.
class MapDriver : public model::MapAccess {
public:
  MapDriver(DecodeDriver &driver, std::optional<size_t> len, EndToken end)
      : driver_(driver), len_(len), end_(end) {}

  Result<bool, Error> next_key(DecodeRef key) override {
    if (driver_.peek_token_opt() == end_token(end_)) {
      return false;
    }
    if (len_ && *len_ > 0) {
      --*len_;
    }
    TOKCHECK_RETURN_NOT_OK(key.decode(driver_));
    return true;
  }

  Result<void, Error> next_value(DecodeRef value) override {
    return value.decode(driver_);
  }

  std::optional<size_t> size_hint() const override { return len_; }

private:
  DecodeDriver &driver_;
  std::optional<size_t> len_;
  EndToken end_;
};

/// Resolves a variant for decode_enum(), from either the open form or a
/// closed-form variant token.
class DriverEnumAccess : public model::EnumAccess {
public:
  explicit DriverEnumAccess(DecodeDriver &driver) : driver_(driver) {}

  Result<void, Error> variant(DecodeRef tag) override {
    TOKCHECK_TRY(token, driver_.peek_token());
    if (is_closed_variant(token)) {
      model::StrDecoder decoder(token.variant());
      return tag.decode(decoder);
    }
    return tag.decode(driver_);
  }

  Result<void, Error> unit_variant() override {
    TOKCHECK_TRY(token, driver_.peek_token());
    if (token.is(TokenKind::UnitVariant)) {
      TOKCHECK_RETURN_NOT_OK(driver_.next_token());
      return Result<void, Error>();
    }
    TOKCHECK_RETURN_NOT_OK(model::Codec<std::monostate>::decode(driver_));
    return Result<void, Error>();
  }

  Result<void, Error> newtype_variant(DecodeRef value) override {
    TOKCHECK_TRY(token, driver_.peek_token());
    if (token.is(TokenKind::NewtypeVariant)) {
      TOKCHECK_RETURN_NOT_OK(driver_.next_token());
    }
    return value.decode(driver_);
  }

  Result<void, Error> tuple_variant(size_t len, Visitor &visitor) override {
    TOKCHECK_TRY(token, driver_.peek_token());
    if (token.is(TokenKind::TupleVariant) ||
        (token.is(TokenKind::Seq) && token.len())) {
      TOKCHECK_RETURN_NOT_OK(driver_.next_token());
      if (*token.len() != len) {
        return Unexpected(unexpected(token));
      }
      EndToken end = token.is(TokenKind::Seq) ? EndToken::Seq
                                              : EndToken::TupleVariant;
      return driver_.visit_seq(len, end, visitor);
    }
    return driver_.decode_any(visitor);
  }

  Result<void, Error> struct_variant(const NameList &fields,
                                     Visitor &visitor) override {
    TOKCHECK_TRY(token, driver_.peek_token());
    if (token.is(TokenKind::StructVariant) ||
        (token.is(TokenKind::Map) && token.len())) {
      TOKCHECK_RETURN_NOT_OK(driver_.next_token());
      if (*token.len() != fields.size()) {
        return Unexpected(unexpected(token));
      }
      EndToken end = token.is(TokenKind::Map) ? EndToken::Map
                                              : EndToken::StructVariant;
      return driver_.visit_map(fields.size(), end, visitor);
    }
    return driver_.decode_any(visitor);
  }

private:
  DecodeDriver &driver_;
};

/// Presents a variant to decode_any() callers as a one-entry map from the
/// tag to the payload.
class EnumMapAccess : public model::MapAccess {
public:
  enum class Format {
    /// Payload is a TupleVariant body closed by TupleVariantEnd.
    Seq,
    /// Payload is a StructVariant body closed by StructVariantEnd.
    Map,
    /// Payload is one value.
    Any,
  };

  EnumMapAccess(DecodeDriver &driver, Token variant, Format format)
      : driver_(driver), variant_(variant), format_(format) {}

  Result<bool, Error> next_key(DecodeRef key) override {
    if (!variant_) {
      return false;
    }
    Token variant = *variant_;
    variant_.reset();
    switch (variant.kind()) {
    case TokenKind::Str: {
      model::StrDecoder decoder(variant.str_value());
      TOKCHECK_RETURN_NOT_OK(key.decode(decoder));
      return true;
    }
    case TokenKind::Bytes: {
      model::BytesDecoder decoder(variant.bytes_value());
      TOKCHECK_RETURN_NOT_OK(key.decode(decoder));
      return true;
    }
    case TokenKind::U32: {
      model::U32Decoder decoder(static_cast<uint32_t>(variant.uint_value()));
      TOKCHECK_RETURN_NOT_OK(key.decode(decoder));
      return true;
    }
    default:
      return Unexpected(unexpected(variant));
    }
  }

  Result<void, Error> next_value(DecodeRef value) override {
    switch (format_) {
    case Format::Seq: {
      SeqDriver seq(driver_, std::nullopt, EndToken::TupleVariant);
      model::SeqAccessDecoder decoder(seq);
      TOKCHECK_RETURN_NOT_OK(value.decode(decoder));
      return driver_.assert_next(Token::TupleVariantEnd());
    }
    case Format::Map: {
      MapDriver map(driver_, std::nullopt, EndToken::StructVariant);
      model::MapAccessDecoder decoder(map);
      TOKCHECK_RETURN_NOT_OK(value.decode(decoder));
      return driver_.assert_next(Token::StructVariantEnd());
    }
    case Format::Any:
      break;
    }
    return value.decode(driver_);
  }

  std::optional<size_t> size_hint() const override {
    return variant_ ? 1 : 0;
  }

private:
  DecodeDriver &driver_;
  std::optional<Token> variant_;
  Format format_;
};

// ============================================================================
// Cursor
// ============================================================================

std::optional<Token> DecodeDriver::peek_token_opt() const {
  for (size_t i = pos_; i < tokens_.size(); ++i) {
    if (!tokens_[i].is(TokenKind::SkipStructField)) {
      return tokens_[i];
    }
  }
  return std::nullopt;
}

Result<Token, Error> DecodeDriver::peek_token() const {
  auto token = peek_token_opt();
  if (!token) {
    return Unexpected(end_of_tokens());
  }
  return *token;
}

std::optional<Token> DecodeDriver::next_token_opt() {
  while (pos_ < tokens_.size()) {
    const Token &token = tokens_[pos_++];
    if (token.is(TokenKind::SkipStructField)) {
      TOKCHECK_LOG(DEBUG) << "decode skipped " << token;
      continue;
    }
    TOKCHECK_LOG(DEBUG) << "decode consumed " << token;
    return token;
  }
  return std::nullopt;
}

Result<Token, Error> DecodeDriver::next_token() {
  auto token = next_token_opt();
  if (!token) {
    return Unexpected(end_of_tokens());
  }
  return *token;
}

Result<void, Error> DecodeDriver::assert_next(const Token &expected) {
  auto token = next_token_opt();
  if (TOKCHECK_PREDICT_FALSE(!token)) {
    return Unexpected(
        Error::custom("end of tokens but deserialization wants Token::" +
                      expected.to_string()));
  }
  if (TOKCHECK_PREDICT_FALSE(*token != expected)) {
    return Unexpected(Error::custom("expected Token::" + token->to_string() +
                                    " but deserialization wants Token::" +
                                    expected.to_string()));
  }
  return Result<void, Error>();
}

Result<void, Error> DecodeDriver::visit_seq(std::optional<size_t> len,
                                            EndToken end, Visitor &visitor) {
  SeqDriver seq(*this, len, end);
  TOKCHECK_RETURN_NOT_OK(visitor.visit_seq(seq));
  return assert_next(end_token(end));
}

Result<void, Error> DecodeDriver::visit_map(std::optional<size_t> len,
                                            EndToken end, Visitor &visitor) {
  MapDriver map(*this, len, end);
  TOKCHECK_RETURN_NOT_OK(visitor.visit_map(map));
  return assert_next(end_token(end));
}

// ============================================================================
// Decoder entry points
// ============================================================================

Result<void, Error> DecodeDriver::decode_any(Visitor &visitor) {
  TOKCHECK_TRY(token, next_token());
  switch (token.kind()) {
  case TokenKind::Bool:
    return visitor.visit_bool(token.bool_value());
  case TokenKind::I8:
    return visitor.visit_i8(static_cast<int8_t>(token.int_value()));
  case TokenKind::I16:
    return visitor.visit_i16(static_cast<int16_t>(token.int_value()));
  case TokenKind::I32:
    return visitor.visit_i32(static_cast<int32_t>(token.int_value()));
  case TokenKind::I64:
    return visitor.visit_i64(token.int_value());
  case TokenKind::I128:
    return visitor.visit_i128(token.i128_value());
  case TokenKind::U8:
    return visitor.visit_u8(static_cast<uint8_t>(token.uint_value()));
  case TokenKind::U16:
    return visitor.visit_u16(static_cast<uint16_t>(token.uint_value()));
  case TokenKind::U32:
    return visitor.visit_u32(static_cast<uint32_t>(token.uint_value()));
  case TokenKind::U64:
    return visitor.visit_u64(token.uint_value());
  case TokenKind::U128:
    return visitor.visit_u128(token.u128_value());
  case TokenKind::F32:
    return visitor.visit_f32(token.f32_value());
  case TokenKind::F64:
    return visitor.visit_f64(token.f64_value());
  case TokenKind::Char:
    return visitor.visit_char(token.char_value());
  case TokenKind::Str:
    return visitor.visit_str(token.str_value());
  case TokenKind::BorrowedStr:
    return visitor.visit_borrowed_str(token.str_value());
  case TokenKind::String:
    return visitor.visit_string(std::string(token.str_value()));
  case TokenKind::Bytes:
    return visitor.visit_bytes(token.bytes_value());
  case TokenKind::BorrowedBytes:
    return visitor.visit_borrowed_bytes(token.bytes_value());
  case TokenKind::ByteBuf:
    return visitor.visit_byte_buf(token.bytes_value().to_vector());
  case TokenKind::None:
    return visitor.visit_none();
  case TokenKind::Some:
    return visitor.visit_some(*this);
  case TokenKind::Unit:
  case TokenKind::UnitStruct:
    return visitor.visit_unit();
  case TokenKind::NewtypeStruct:
    return visitor.visit_newtype_struct(*this);
  case TokenKind::Seq:
    return visit_seq(token.len(), EndToken::Seq, visitor);
  case TokenKind::Tuple:
    return visit_seq(token.len(), EndToken::Tuple, visitor);
  case TokenKind::TupleStruct:
    return visit_seq(token.len(), EndToken::TupleStruct, visitor);
  case TokenKind::Map:
    return visit_map(token.len(), EndToken::Map, visitor);
  case TokenKind::Struct:
    return visit_map(token.len(), EndToken::Struct, visitor);
  case TokenKind::Enum:
    return visit_open_enum(visitor);
  case TokenKind::UnitVariant:
    return visitor.visit_str(token.variant());
  case TokenKind::NewtypeVariant: {
    EnumMapAccess access(*this, Token::Str(token.variant()),
                         EnumMapAccess::Format::Any);
    return visitor.visit_map(access);
  }
  case TokenKind::TupleVariant: {
    EnumMapAccess access(*this, Token::Str(token.variant()),
                         EnumMapAccess::Format::Seq);
    return visitor.visit_map(access);
  }
  case TokenKind::StructVariant: {
    EnumMapAccess access(*this, Token::Str(token.variant()),
                         EnumMapAccess::Format::Map);
    return visitor.visit_map(access);
  }
  case TokenKind::SeqEnd:
  case TokenKind::TupleEnd:
  case TokenKind::TupleStructEnd:
  case TokenKind::MapEnd:
  case TokenKind::StructEnd:
  case TokenKind::TupleVariantEnd:
  case TokenKind::StructVariantEnd:
  case TokenKind::SkipStructField:
    break;
  }
  return Unexpected(unexpected(token));
}

Result<void, Error> DecodeDriver::visit_open_enum(Visitor &visitor) {
  TOKCHECK_TRY(variant, next_token());
  TOKCHECK_TRY(next, peek_token());
  if (!next.is(TokenKind::Unit)) {
    EnumMapAccess access(*this, variant, EnumMapAccess::Format::Any);
    return visitor.visit_map(access);
  }
  // Unit variant in open form: the tag itself is the value.
  switch (variant.kind()) {
  case TokenKind::Str:
  case TokenKind::BorrowedStr:
  case TokenKind::String:
  case TokenKind::Bytes:
  case TokenKind::BorrowedBytes:
  case TokenKind::ByteBuf:
  case TokenKind::U8:
  case TokenKind::U16:
  case TokenKind::U32:
  case TokenKind::U64:
    break;
  default:
    return Unexpected(unexpected(variant));
  }
  TOKCHECK_RETURN_NOT_OK(next_token());
  switch (variant.kind()) {
  case TokenKind::Str:
    return visitor.visit_str(variant.str_value());
  case TokenKind::BorrowedStr:
    return visitor.visit_borrowed_str(variant.str_value());
  case TokenKind::String:
    return visitor.visit_string(std::string(variant.str_value()));
  case TokenKind::Bytes:
    return visitor.visit_bytes(variant.bytes_value());
  case TokenKind::BorrowedBytes:
    return visitor.visit_borrowed_bytes(variant.bytes_value());
  case TokenKind::ByteBuf:
    return visitor.visit_byte_buf(variant.bytes_value().to_vector());
  case TokenKind::U8:
    return visitor.visit_u8(static_cast<uint8_t>(variant.uint_value()));
  case TokenKind::U16:
    return visitor.visit_u16(static_cast<uint16_t>(variant.uint_value()));
  case TokenKind::U32:
    return visitor.visit_u32(static_cast<uint32_t>(variant.uint_value()));
  default:
    return visitor.visit_u64(variant.uint_value());
  }
}

Result<void, Error> DecodeDriver::decode_option(Visitor &visitor) {
  TOKCHECK_TRY(token, peek_token());
  switch (token.kind()) {
  case TokenKind::Unit:
  case TokenKind::None:
    TOKCHECK_RETURN_NOT_OK(next_token());
    return visitor.visit_none();
  case TokenKind::Some:
    TOKCHECK_RETURN_NOT_OK(next_token());
    return visitor.visit_some(*this);
  default:
    return decode_any(visitor);
  }
}

Result<void, Error> DecodeDriver::decode_unit_struct(std::string_view name,
                                                     Visitor &visitor) {
  TOKCHECK_TRY(token, peek_token());
  if (token.is(TokenKind::UnitStruct)) {
    TOKCHECK_RETURN_NOT_OK(assert_next(Token::UnitStruct(name)));
    return visitor.visit_unit();
  }
  return decode_any(visitor);
}

Result<void, Error>
DecodeDriver::decode_newtype_struct(std::string_view name, Visitor &visitor) {
  TOKCHECK_TRY(token, peek_token());
  if (token.is(TokenKind::NewtypeStruct)) {
    TOKCHECK_RETURN_NOT_OK(assert_next(Token::NewtypeStruct(name)));
    return visitor.visit_newtype_struct(*this);
  }
  return decode_any(visitor);
}

Result<void, Error> DecodeDriver::decode_tuple(size_t len, Visitor &visitor) {
  TOKCHECK_TRY(token, peek_token());
  switch (token.kind()) {
  case TokenKind::Unit:
  case TokenKind::UnitStruct:
    TOKCHECK_RETURN_NOT_OK(next_token());
    return visitor.visit_unit();
  case TokenKind::Seq:
    TOKCHECK_RETURN_NOT_OK(next_token());
    return visit_seq(len, EndToken::Seq, visitor);
  case TokenKind::Tuple:
    TOKCHECK_RETURN_NOT_OK(next_token());
    return visit_seq(len, EndToken::Tuple, visitor);
  case TokenKind::TupleStruct:
    TOKCHECK_RETURN_NOT_OK(next_token());
    return visit_seq(len, EndToken::TupleStruct, visitor);
  default:
    return decode_any(visitor);
  }
}

Result<void, Error> DecodeDriver::decode_tuple_struct(std::string_view name,
                                                      size_t len,
                                                      Visitor &visitor) {
  TOKCHECK_TRY(token, peek_token());
  switch (token.kind()) {
  case TokenKind::Unit:
    TOKCHECK_RETURN_NOT_OK(next_token());
    return visitor.visit_unit();
  case TokenKind::UnitStruct:
    TOKCHECK_RETURN_NOT_OK(assert_next(Token::UnitStruct(name)));
    return visitor.visit_unit();
  case TokenKind::Seq:
    TOKCHECK_RETURN_NOT_OK(next_token());
    return visit_seq(len, EndToken::Seq, visitor);
  case TokenKind::Tuple:
    TOKCHECK_RETURN_NOT_OK(next_token());
    return visit_seq(len, EndToken::Tuple, visitor);
  case TokenKind::TupleStruct:
    TOKCHECK_RETURN_NOT_OK(
        assert_next(Token::TupleStruct(name, *token.len())));
    return visit_seq(len, EndToken::TupleStruct, visitor);
  default:
    return decode_any(visitor);
  }
}

Result<void, Error> DecodeDriver::decode_struct(std::string_view name,
                                                const NameList &fields,
                                                Visitor &visitor) {
  TOKCHECK_TRY(token, peek_token());
  switch (token.kind()) {
  case TokenKind::Struct:
    TOKCHECK_RETURN_NOT_OK(assert_next(Token::Struct(name, *token.len())));
    return visit_map(fields.size(), EndToken::Struct, visitor);
  case TokenKind::Map:
    TOKCHECK_RETURN_NOT_OK(next_token());
    return visit_map(fields.size(), EndToken::Map, visitor);
  default:
    return decode_any(visitor);
  }
}

Result<void, Error> DecodeDriver::decode_enum(std::string_view name,
                                              const NameList &variants,
                                              Visitor &visitor) {
  (void)variants;
  TOKCHECK_TRY(token, peek_token());
  if (token.is(TokenKind::Enum) && token.name() == name) {
    TOKCHECK_RETURN_NOT_OK(next_token());
    DriverEnumAccess access(*this);
    return visitor.visit_enum(access);
  }
  if (is_closed_variant(token) && token.name() == name) {
    DriverEnumAccess access(*this);
    return visitor.visit_enum(access);
  }
  return decode_any(visitor);
}

} // namespace harness
} // namespace tokcheck
