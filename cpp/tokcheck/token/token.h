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

#include "absl/numeric/int128.h"
#include "absl/types/span.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace tokcheck {

/// One kind per structural event an encoder can emit or a decoder can
/// observe.
enum class TokenKind : uint8_t {
  Bool,
  I8,
  I16,
  I32,
  I64,
  I128,
  U8,
  U16,
  U32,
  U64,
  U128,
  F32,
  F64,
  Char,
  Str,
  BorrowedStr,
  String,
  Bytes,
  BorrowedBytes,
  ByteBuf,
  None,
  Some,
  Unit,
  UnitStruct,
  NewtypeStruct,
  Seq,
  SeqEnd,
  Tuple,
  TupleEnd,
  TupleStruct,
  TupleStructEnd,
  Map,
  MapEnd,
  Struct,
  StructEnd,
  Enum,
  UnitVariant,
  NewtypeVariant,
  TupleVariant,
  TupleVariantEnd,
  StructVariant,
  StructVariantEnd,
  SkipStructField,
};

/// Returns the kind name, e.g. "TupleVariantEnd".
const char *token_kind_name(TokenKind kind);

/// Non-owning view of a byte sequence held by a token script.
class ByteView {
public:
  constexpr ByteView() : data_(nullptr), size_(0) {}
  constexpr ByteView(const uint8_t *data, size_t size)
      : data_(data), size_(size) {}
  ByteView(const std::vector<uint8_t> &bytes)
      : data_(bytes.data()), size_(bytes.size()) {}
  ByteView(std::string_view text)
      : data_(reinterpret_cast<const uint8_t *>(text.data())),
        size_(text.size()) {}
  /// Views a string literal without its terminating NUL.
  template <size_t N>
  ByteView(const char (&text)[N])
      : data_(reinterpret_cast<const uint8_t *>(text)), size_(N - 1) {}

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  const uint8_t *begin() const { return data_; }
  const uint8_t *end() const { return data_ + size_; }

  std::vector<uint8_t> to_vector() const {
    return std::vector<uint8_t>(begin(), end());
  }

private:
  const uint8_t *data_;
  size_t size_;
};

bool operator==(const ByteView &a, const ByteView &b);
inline bool operator!=(const ByteView &a, const ByteView &b) {
  return !(a == b);
}

/// One scripted structural event.
///
/// Tokens are small copyable values. Text and byte payloads (strings, type,
/// variant and field names) are borrowed: the storage they point into must
/// outlive every token that refers to it. String literals are the usual
/// source.
///
/// Build tokens with the factory named after their kind:
///
/// ```cpp
/// std::vector<Token> script = {
///     Token::Struct("S", 2), Token::Str("a"), Token::U8(0),
///     Token::Str("b"),       Token::U8(0),   Token::StructEnd(),
/// };
/// ```
class Token {
public:
  // Scalars
  static Token Bool(bool v);
  static Token I8(int8_t v);
  static Token I16(int16_t v);
  static Token I32(int32_t v);
  static Token I64(int64_t v);
  static Token I128(absl::int128 v);
  static Token U8(uint8_t v);
  static Token U16(uint16_t v);
  static Token U32(uint32_t v);
  static Token U64(uint64_t v);
  static Token U128(absl::uint128 v);
  static Token F32(float v);
  static Token F64(double v);
  static Token Char(char32_t v);

  /// A string with no particular ownership.
  static Token Str(std::string_view v);
  /// A string borrowed from the input for the whole decode.
  static Token BorrowedStr(std::string_view v);
  /// An owned string.
  static Token String(std::string_view v);

  static Token Bytes(ByteView v);
  static Token BorrowedBytes(ByteView v);
  static Token ByteBuf(ByteView v);

  static Token None();
  static Token Some();
  static Token Unit();

  static Token UnitStruct(std::string_view name);
  /// Header of a single-field wrapper; the wrapped value follows.
  static Token NewtypeStruct(std::string_view name);

  static Token Seq(std::optional<size_t> len);
  static Token SeqEnd();
  static Token Tuple(size_t len);
  static Token TupleEnd();
  static Token TupleStruct(std::string_view name, size_t len);
  static Token TupleStructEnd();
  static Token Map(std::optional<size_t> len);
  static Token MapEnd();
  static Token Struct(std::string_view name, size_t len);
  static Token StructEnd();

  /// Header of a variant in its open form: the tag follows as a separate
  /// token, then the payload (`Unit`, a single value, a `Seq` or a `Map`).
  static Token Enum(std::string_view name);
  static Token UnitVariant(std::string_view name, std::string_view variant);
  static Token NewtypeVariant(std::string_view name, std::string_view variant);
  static Token TupleVariant(std::string_view name, std::string_view variant,
                            size_t len);
  static Token TupleVariantEnd();
  static Token StructVariant(std::string_view name, std::string_view variant,
                             size_t len);
  static Token StructVariantEnd();

  /// Marks a record field that the encoder skips. Decoding never sees it.
  static Token SkipStructField(std::string_view key);

  TokenKind kind() const { return kind_; }
  bool is(TokenKind kind) const { return kind_ == kind; }

  // Payload accessors. Each is valid only for the kinds that carry it.
  bool bool_value() const { return scalar_.b; }
  int64_t int_value() const { return scalar_.i; }
  uint64_t uint_value() const { return scalar_.u; }
  absl::int128 i128_value() const {
    return absl::MakeInt128(static_cast<int64_t>(high_), scalar_.u);
  }
  absl::uint128 u128_value() const {
    return absl::MakeUint128(high_, scalar_.u);
  }
  float f32_value() const { return scalar_.f32; }
  double f64_value() const { return scalar_.f64; }
  char32_t char_value() const { return scalar_.c; }
  std::string_view str_value() const { return text_; }
  ByteView bytes_value() const {
    return ByteView(reinterpret_cast<const uint8_t *>(text_.data()),
                    text_.size());
  }
  /// Type name of named units, wrappers, records, tuples and variants.
  std::string_view name() const { return text_; }
  std::string_view variant() const { return variant_; }
  /// Field name of a SkipStructField marker.
  std::string_view key() const { return text_; }
  /// Declared length. Seq and Map report std::nullopt when none was given.
  std::optional<size_t> len() const {
    return has_len_ ? std::optional<size_t>(len_) : std::nullopt;
  }

  /// True for the seven composite closers.
  bool is_end() const;

  /// Debug rendering, e.g. `Str("a")` or `Struct { name: "S", len: 2 }`.
  std::string to_string() const;

  friend bool operator==(const Token &a, const Token &b);

private:
  explicit Token(TokenKind kind) : kind_(kind) { scalar_.u = 0; }

  static Token text(TokenKind kind, std::string_view text);
  static Token named(TokenKind kind, std::string_view name,
                     std::string_view variant, std::optional<size_t> len);

  TokenKind kind_;
  union {
    bool b;
    int64_t i;
    uint64_t u;
    float f32;
    double f64;
    char32_t c;
  } scalar_;
  // Upper half of I128 and U128 payloads; scalar_.u holds the lower half.
  uint64_t high_ = 0;
  std::string_view text_;
  std::string_view variant_;
  size_t len_ = 0;
  bool has_len_ = false;
};

inline bool operator!=(const Token &a, const Token &b) { return !(a == b); }

inline std::ostream &operator<<(std::ostream &os, const Token &token) {
  return os << token.to_string();
}

/// The closers a composite region can owe.
enum class EndToken : uint8_t {
  Seq,
  Tuple,
  TupleStruct,
  Map,
  Struct,
  TupleVariant,
  StructVariant,
};

Token end_token(EndToken end);

/// A borrowed, contiguous token script.
///
/// Converts from a vector, an array or a braced list. A braced list's backing
/// array lives until the end of the full expression, so do not keep such a
/// span in a variable.
using TokenSpan = absl::Span<const Token>;

} // namespace tokcheck
