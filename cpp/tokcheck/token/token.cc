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

#include "tokcheck/token/token.h"
#include "tokcheck/util/string_util.h"
#include <cstring>

namespace tokcheck {

namespace {

template <typename F> bool same_bits(F a, F b) {
  return std::memcmp(&a, &b, sizeof(F)) == 0;
}

std::string format_len(std::optional<size_t> len) {
  return len ? "Some(" + std::to_string(*len) + ")" : "None";
}

} // namespace

const char *token_kind_name(TokenKind kind) {
  switch (kind) {
  case TokenKind::Bool:
    return "Bool";
  case TokenKind::I8:
    return "I8";
  case TokenKind::I16:
    return "I16";
  case TokenKind::I32:
    return "I32";
  case TokenKind::I64:
    return "I64";
  case TokenKind::I128:
    return "I128";
  case TokenKind::U8:
    return "U8";
  case TokenKind::U16:
    return "U16";
  case TokenKind::U32:
    return "U32";
  case TokenKind::U64:
    return "U64";
  case TokenKind::U128:
    return "U128";
  case TokenKind::F32:
    return "F32";
  case TokenKind::F64:
    return "F64";
  case TokenKind::Char:
    return "Char";
  case TokenKind::Str:
    return "Str";
  case TokenKind::BorrowedStr:
    return "BorrowedStr";
  case TokenKind::String:
    return "String";
  case TokenKind::Bytes:
    return "Bytes";
  case TokenKind::BorrowedBytes:
    return "BorrowedBytes";
  case TokenKind::ByteBuf:
    return "ByteBuf";
  case TokenKind::None:
    return "None";
  case TokenKind::Some:
    return "Some";
  case TokenKind::Unit:
    return "Unit";
  case TokenKind::UnitStruct:
    return "UnitStruct";
  case TokenKind::NewtypeStruct:
    return "NewtypeStruct";
  case TokenKind::Seq:
    return "Seq";
  case TokenKind::SeqEnd:
    return "SeqEnd";
  case TokenKind::Tuple:
    return "Tuple";
  case TokenKind::TupleEnd:
    return "TupleEnd";
  case TokenKind::TupleStruct:
    return "TupleStruct";
  case TokenKind::TupleStructEnd:
    return "TupleStructEnd";
  case TokenKind::Map:
    return "Map";
  case TokenKind::MapEnd:
    return "MapEnd";
  case TokenKind::Struct:
    return "Struct";
  case TokenKind::StructEnd:
    return "StructEnd";
  case TokenKind::Enum:
    return "Enum";
  case TokenKind::UnitVariant:
    return "UnitVariant";
  case TokenKind::NewtypeVariant:
    return "NewtypeVariant";
  case TokenKind::TupleVariant:
    return "TupleVariant";
  case TokenKind::TupleVariantEnd:
    return "TupleVariantEnd";
  case TokenKind::StructVariant:
    return "StructVariant";
  case TokenKind::StructVariantEnd:
    return "StructVariantEnd";
  case TokenKind::SkipStructField:
    return "SkipStructField";
  }
  return "Unknown";
}

bool operator==(const ByteView &a, const ByteView &b) {
  if (a.size() != b.size()) {
    return false;
  }
  return a.size() == 0 || std::memcmp(a.data(), b.data(), a.size()) == 0;
}

Token Token::Bool(bool v) {
  Token t(TokenKind::Bool);
  t.scalar_.b = v;
  return t;
}

#define TOKCHECK_SIGNED_TOKEN(KIND, TYPE)                                      \
  Token Token::KIND(TYPE v) {                                                  \
    Token t(TokenKind::KIND);                                                  \
    t.scalar_.i = v;                                                           \
    return t;                                                                  \
  }

#define TOKCHECK_UNSIGNED_TOKEN(KIND, TYPE)                                    \
  Token Token::KIND(TYPE v) {                                                  \
    Token t(TokenKind::KIND);                                                  \
    t.scalar_.u = v;                                                           \
    return t;                                                                  \
  }

TOKCHECK_SIGNED_TOKEN(I8, int8_t)
TOKCHECK_SIGNED_TOKEN(I16, int16_t)
TOKCHECK_SIGNED_TOKEN(I32, int32_t)
TOKCHECK_SIGNED_TOKEN(I64, int64_t)
TOKCHECK_UNSIGNED_TOKEN(U8, uint8_t)
TOKCHECK_UNSIGNED_TOKEN(U16, uint16_t)
TOKCHECK_UNSIGNED_TOKEN(U32, uint32_t)
TOKCHECK_UNSIGNED_TOKEN(U64, uint64_t)

Token Token::I128(absl::int128 v) {
  Token t(TokenKind::I128);
  t.scalar_.u = absl::Int128Low64(v);
  t.high_ = static_cast<uint64_t>(absl::Int128High64(v));
  return t;
}

Token Token::U128(absl::uint128 v) {
  Token t(TokenKind::U128);
  t.scalar_.u = absl::Uint128Low64(v);
  t.high_ = absl::Uint128High64(v);
  return t;
}

#undef TOKCHECK_SIGNED_TOKEN
#undef TOKCHECK_UNSIGNED_TOKEN

Token Token::F32(float v) {
  Token t(TokenKind::F32);
  t.scalar_.f32 = v;
  return t;
}

Token Token::F64(double v) {
  Token t(TokenKind::F64);
  t.scalar_.f64 = v;
  return t;
}

Token Token::Char(char32_t v) {
  Token t(TokenKind::Char);
  t.scalar_.c = v;
  return t;
}

Token Token::text(TokenKind kind, std::string_view text) {
  Token t(kind);
  t.text_ = text;
  return t;
}

Token Token::named(TokenKind kind, std::string_view name,
                   std::string_view variant, std::optional<size_t> len) {
  Token t(kind);
  t.text_ = name;
  t.variant_ = variant;
  if (len) {
    t.len_ = *len;
    t.has_len_ = true;
  }
  return t;
}

Token Token::Str(std::string_view v) { return text(TokenKind::Str, v); }

Token Token::BorrowedStr(std::string_view v) {
  return text(TokenKind::BorrowedStr, v);
}

Token Token::String(std::string_view v) { return text(TokenKind::String, v); }

static std::string_view as_text(ByteView v) {
  return std::string_view(reinterpret_cast<const char *>(v.data()), v.size());
}

Token Token::Bytes(ByteView v) { return text(TokenKind::Bytes, as_text(v)); }

Token Token::BorrowedBytes(ByteView v) {
  return text(TokenKind::BorrowedBytes, as_text(v));
}

Token Token::ByteBuf(ByteView v) {
  return text(TokenKind::ByteBuf, as_text(v));
}

Token Token::None() { return Token(TokenKind::None); }
Token Token::Some() { return Token(TokenKind::Some); }
Token Token::Unit() { return Token(TokenKind::Unit); }

Token Token::UnitStruct(std::string_view name) {
  return text(TokenKind::UnitStruct, name);
}

Token Token::NewtypeStruct(std::string_view name) {
  return text(TokenKind::NewtypeStruct, name);
}

Token Token::Seq(std::optional<size_t> len) {
  return named(TokenKind::Seq, {}, {}, len);
}

Token Token::SeqEnd() { return Token(TokenKind::SeqEnd); }

Token Token::Tuple(size_t len) {
  return named(TokenKind::Tuple, {}, {}, len);
}

Token Token::TupleEnd() { return Token(TokenKind::TupleEnd); }

Token Token::TupleStruct(std::string_view name, size_t len) {
  return named(TokenKind::TupleStruct, name, {}, len);
}

Token Token::TupleStructEnd() { return Token(TokenKind::TupleStructEnd); }

Token Token::Map(std::optional<size_t> len) {
  return named(TokenKind::Map, {}, {}, len);
}

Token Token::MapEnd() { return Token(TokenKind::MapEnd); }

Token Token::Struct(std::string_view name, size_t len) {
  return named(TokenKind::Struct, name, {}, len);
}

Token Token::StructEnd() { return Token(TokenKind::StructEnd); }

Token Token::Enum(std::string_view name) { return text(TokenKind::Enum, name); }

Token Token::UnitVariant(std::string_view name, std::string_view variant) {
  return named(TokenKind::UnitVariant, name, variant, std::nullopt);
}

Token Token::NewtypeVariant(std::string_view name, std::string_view variant) {
  return named(TokenKind::NewtypeVariant, name, variant, std::nullopt);
}

Token Token::TupleVariant(std::string_view name, std::string_view variant,
                          size_t len) {
  return named(TokenKind::TupleVariant, name, variant, len);
}

Token Token::TupleVariantEnd() { return Token(TokenKind::TupleVariantEnd); }

Token Token::StructVariant(std::string_view name, std::string_view variant,
                           size_t len) {
  return named(TokenKind::StructVariant, name, variant, len);
}

Token Token::StructVariantEnd() { return Token(TokenKind::StructVariantEnd); }

Token Token::SkipStructField(std::string_view key) {
  return text(TokenKind::SkipStructField, key);
}

bool Token::is_end() const {
  switch (kind_) {
  case TokenKind::SeqEnd:
  case TokenKind::TupleEnd:
  case TokenKind::TupleStructEnd:
  case TokenKind::MapEnd:
  case TokenKind::StructEnd:
  case TokenKind::TupleVariantEnd:
  case TokenKind::StructVariantEnd:
    return true;
  default:
    return false;
  }
}

bool operator==(const Token &a, const Token &b) {
  if (a.kind_ != b.kind_) {
    return false;
  }
  switch (a.kind_) {
  case TokenKind::Bool:
    return a.scalar_.b == b.scalar_.b;
  case TokenKind::I8:
  case TokenKind::I16:
  case TokenKind::I32:
  case TokenKind::I64:
    return a.scalar_.i == b.scalar_.i;
  case TokenKind::U8:
  case TokenKind::U16:
  case TokenKind::U32:
  case TokenKind::U64:
    return a.scalar_.u == b.scalar_.u;
  case TokenKind::I128:
  case TokenKind::U128:
    return a.scalar_.u == b.scalar_.u && a.high_ == b.high_;
  case TokenKind::F32:
    return same_bits(a.scalar_.f32, b.scalar_.f32);
  case TokenKind::F64:
    return same_bits(a.scalar_.f64, b.scalar_.f64);
  case TokenKind::Char:
    return a.scalar_.c == b.scalar_.c;
  default:
    return a.text_ == b.text_ && a.variant_ == b.variant_ &&
           a.has_len_ == b.has_len_ && a.len_ == b.len_;
  }
}

std::string Token::to_string() const {
  std::string out = token_kind_name(kind_);
  switch (kind_) {
  case TokenKind::Bool:
    out += scalar_.b ? "(true)" : "(false)";
    break;
  case TokenKind::I8:
  case TokenKind::I16:
  case TokenKind::I32:
  case TokenKind::I64:
    out += "(" + std::to_string(scalar_.i) + ")";
    break;
  case TokenKind::U8:
  case TokenKind::U16:
  case TokenKind::U32:
  case TokenKind::U64:
    out += "(" + std::to_string(scalar_.u) + ")";
    break;
  case TokenKind::I128:
    out += "(" + format_int128(i128_value()) + ")";
    break;
  case TokenKind::U128:
    out += "(" + format_uint128(u128_value()) + ")";
    break;
  case TokenKind::F32:
    out += "(" + format_float(scalar_.f32) + ")";
    break;
  case TokenKind::F64:
    out += "(" + format_float(scalar_.f64) + ")";
    break;
  case TokenKind::Char:
    out += "(" + quote_char(scalar_.c) + ")";
    break;
  case TokenKind::Str:
  case TokenKind::BorrowedStr:
  case TokenKind::String:
    out += "(" + quote_string(text_) + ")";
    break;
  case TokenKind::Bytes:
  case TokenKind::BorrowedBytes:
  case TokenKind::ByteBuf: {
    ByteView bytes = bytes_value();
    out += "(" + format_bytes(bytes.data(), bytes.size()) + ")";
    break;
  }
  case TokenKind::UnitStruct:
  case TokenKind::NewtypeStruct:
  case TokenKind::Enum:
    out += " { name: " + quote_string(text_) + " }";
    break;
  case TokenKind::Seq:
  case TokenKind::Map:
    out += " { len: " + format_len(len()) + " }";
    break;
  case TokenKind::Tuple:
    out += " { len: " + std::to_string(len_) + " }";
    break;
  case TokenKind::TupleStruct:
  case TokenKind::Struct:
    out += " { name: " + quote_string(text_) +
           ", len: " + std::to_string(len_) + " }";
    break;
  case TokenKind::UnitVariant:
  case TokenKind::NewtypeVariant:
    out += " { name: " + quote_string(text_) +
           ", variant: " + quote_string(variant_) + " }";
    break;
  case TokenKind::TupleVariant:
  case TokenKind::StructVariant:
    out += " { name: " + quote_string(text_) +
           ", variant: " + quote_string(variant_) +
           ", len: " + std::to_string(len_) + " }";
    break;
  case TokenKind::SkipStructField:
    out += " { key: " + quote_string(text_) + " }";
    break;
  default:
    break;
  }
  return out;
}

Token end_token(EndToken end) {
  switch (end) {
  case EndToken::Seq:
    return Token::SeqEnd();
  case EndToken::Tuple:
    return Token::TupleEnd();
  case EndToken::TupleStruct:
    return Token::TupleStructEnd();
  case EndToken::Map:
    return Token::MapEnd();
  case EndToken::Struct:
    return Token::StructEnd();
  case EndToken::TupleVariant:
    return Token::TupleVariantEnd();
  case EndToken::StructVariant:
    return Token::StructVariantEnd();
  }
  return Token::SeqEnd();
}

} // namespace tokcheck
