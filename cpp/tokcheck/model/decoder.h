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
#include "tokcheck/model/codec_fwd.h"
#include "tokcheck/token/token.h"
#include "tokcheck/util/error.h"
#include "tokcheck/util/result.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tokcheck {
namespace model {

class Decoder;
class SeqAccess;
class MapAccess;
class EnumAccess;

/// Field or variant names handed to Decoder::decode_struct and
/// Decoder::decode_enum.
using NameList = std::vector<std::string_view>;

/// Describes a value a visitor did not accept, for invalid_type and
/// invalid_value messages: "integer `1`", "string \"a\"", "sequence".
class Actual {
public:
  static Actual Bool(bool v);
  static Actual Unsigned(uint64_t v);
  static Actual Signed(int64_t v);
  /// "integer `v` as i128"
  static Actual Signed128(absl::int128 v);
  static Actual Unsigned128(absl::uint128 v);
  static Actual Float(double v);
  static Actual Char(char32_t v);
  static Actual Str(std::string_view v);
  static Actual Bytes() { return Actual("byte array"); }
  static Actual Unit() { return Actual("unit value"); }
  static Actual Option() { return Actual("Option value"); }
  static Actual NewtypeStruct() { return Actual("newtype struct"); }
  static Actual Seq() { return Actual("sequence"); }
  static Actual Map() { return Actual("map"); }
  static Actual Enum() { return Actual("enum"); }
  static Actual UnitVariant() { return Actual("unit variant"); }
  static Actual NewtypeVariant() { return Actual("newtype variant"); }
  static Actual TupleVariant() { return Actual("tuple variant"); }
  static Actual StructVariant() { return Actual("struct variant"); }
  static Actual Other(std::string text) { return Actual(std::move(text)); }

  const std::string &text() const { return text_; }

private:
  explicit Actual(std::string text) : text_(std::move(text)) {}

  std::string text_;
};

/// Non-owning, type-erased reference to the place a decoded value goes.
///
/// Converting from `T &` decodes a fresh T through Codec<T>::decode and
/// assigns it; DecodeRef::in_place(place) updates the existing value through
/// Codec<T>::decode_in_place instead.
class DecodeRef {
public:
  template <typename T,
            typename = std::enable_if_t<
                !std::is_same<std::decay_t<T>, DecodeRef>::value>>
  DecodeRef(T &place)
      : place_(&place), decode_fn_(&DecodeRef::assign_thunk<T>) {}

  template <typename T> static DecodeRef in_place(T &place) {
    return DecodeRef(&place, &DecodeRef::in_place_thunk<T>);
  }

  Result<void, Error> decode(Decoder &decoder) const {
    return decode_fn_(place_, decoder);
  }

private:
  using DecodeFn = Result<void, Error> (*)(void *, Decoder &);

  DecodeRef(void *place, DecodeFn fn) : place_(place), decode_fn_(fn) {}

  template <typename T>
  static Result<void, Error> assign_thunk(void *place, Decoder &decoder);

  template <typename T>
  static Result<void, Error> in_place_thunk(void *place, Decoder &decoder);

  void *place_;
  DecodeFn decode_fn_;
};

/// Receives whatever the decoder finds next. Each Codec supplies a visitor
/// for the shapes it accepts and stores the decoded value in itself.
///
/// Unhandled callbacks degrade the way most visitors want: narrow integers
/// widen to 64 bits, f32 widens to f64, a char becomes a one-character
/// string, borrowed and owned strings and bytes fall back to their transient
/// form, and everything else fails with an invalid_type error naming
/// expecting().
class Visitor {
public:
  virtual ~Visitor() = default;

  /// Completes "expected ..." in error messages, e.g. "a boolean".
  virtual std::string expecting() const = 0;

  virtual Result<void, Error> visit_bool(bool v);

  virtual Result<void, Error> visit_i8(int8_t v) { return visit_i64(v); }
  virtual Result<void, Error> visit_i16(int16_t v) { return visit_i64(v); }
  virtual Result<void, Error> visit_i32(int32_t v) { return visit_i64(v); }
  virtual Result<void, Error> visit_i64(int64_t v);

  virtual Result<void, Error> visit_u8(uint8_t v) { return visit_u64(v); }
  virtual Result<void, Error> visit_u16(uint16_t v) { return visit_u64(v); }
  virtual Result<void, Error> visit_u32(uint32_t v) { return visit_u64(v); }
  virtual Result<void, Error> visit_u64(uint64_t v);

  /// 128-bit integers do not narrow on their own.
  virtual Result<void, Error> visit_i128(absl::int128 v);
  virtual Result<void, Error> visit_u128(absl::uint128 v);

  virtual Result<void, Error> visit_f32(float v) { return visit_f64(v); }
  virtual Result<void, Error> visit_f64(double v);

  virtual Result<void, Error> visit_char(char32_t v);

  virtual Result<void, Error> visit_str(std::string_view v);
  virtual Result<void, Error> visit_borrowed_str(std::string_view v) {
    return visit_str(v);
  }
  virtual Result<void, Error> visit_string(std::string v) {
    return visit_str(v);
  }

  virtual Result<void, Error> visit_bytes(ByteView v);
  virtual Result<void, Error> visit_borrowed_bytes(ByteView v) {
    return visit_bytes(v);
  }
  virtual Result<void, Error> visit_byte_buf(std::vector<uint8_t> v) {
    return visit_bytes(ByteView(v));
  }

  virtual Result<void, Error> visit_none();
  virtual Result<void, Error> visit_some(Decoder &decoder);
  virtual Result<void, Error> visit_unit();
  virtual Result<void, Error> visit_newtype_struct(Decoder &decoder);
  virtual Result<void, Error> visit_seq(SeqAccess &seq);
  virtual Result<void, Error> visit_map(MapAccess &map);
  virtual Result<void, Error> visit_enum(EnumAccess &data);
};

/// invalid_type / invalid_value errors phrased against a visitor.
Error invalid_type(const Actual &actual, const Visitor &visitor);
Error invalid_value(const Actual &actual, const Visitor &visitor);
Error invalid_length(size_t len, const Visitor &visitor);

/// Walks the elements of a sequence.
class SeqAccess {
public:
  virtual ~SeqAccess() = default;

  /// Decodes the next element into `element`. Returns false, leaving the
  /// place untouched, once the sequence is exhausted.
  virtual Result<bool, Error> next_element(DecodeRef element) = 0;

  /// Remaining number of elements, when known.
  virtual std::optional<size_t> size_hint() const { return std::nullopt; }
};

/// Walks the entries of a map. Every successful next_key() is followed by
/// exactly one next_value().
class MapAccess {
public:
  virtual ~MapAccess() = default;

  virtual Result<bool, Error> next_key(DecodeRef key) = 0;
  virtual Result<void, Error> next_value(DecodeRef value) = 0;

  virtual std::optional<size_t> size_hint() const { return std::nullopt; }
};

/// Resolves one variant of a sum type. variant() is called once to decode the
/// tag, then exactly one of the payload methods.
class EnumAccess {
public:
  virtual ~EnumAccess() = default;

  virtual Result<void, Error> variant(DecodeRef tag) = 0;

  virtual Result<void, Error> unit_variant() = 0;
  virtual Result<void, Error> newtype_variant(DecodeRef value) = 0;
  virtual Result<void, Error> tuple_variant(size_t len, Visitor &visitor) = 0;
  virtual Result<void, Error> struct_variant(const NameList &fields,
                                             Visitor &visitor) = 0;
};

/// The decoding driver interface. A type's Codec calls the entry point that
/// names the shape it expects; self-describing sources may ignore the hint,
/// which is why every entry point forwards to decode_any() by default.
class Decoder {
public:
  virtual ~Decoder() = default;

  /// Decodes whatever comes next and reports it to the most specific visitor
  /// callback.
  virtual Result<void, Error> decode_any(Visitor &visitor) = 0;

  virtual Result<void, Error> decode_bool(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_i8(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_i16(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_i32(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_i64(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_i128(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_u8(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_u16(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_u32(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_u64(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_u128(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_f32(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_f64(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_char(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_str(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_string(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_bytes(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_byte_buf(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_option(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_unit(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_unit_struct(std::string_view name,
                                                 Visitor &visitor) {
    (void)name;
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_newtype_struct(std::string_view name,
                                                    Visitor &visitor) {
    (void)name;
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_seq(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_tuple(size_t len, Visitor &visitor) {
    (void)len;
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_tuple_struct(std::string_view name,
                                                  size_t len,
                                                  Visitor &visitor) {
    (void)name;
    (void)len;
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_map(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_struct(std::string_view name,
                                            const NameList &fields,
                                            Visitor &visitor) {
    (void)name;
    (void)fields;
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_enum(std::string_view name,
                                          const NameList &variants,
                                          Visitor &visitor) {
    (void)name;
    (void)variants;
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_identifier(Visitor &visitor) {
    return decode_any(visitor);
  }
  virtual Result<void, Error> decode_ignored_any(Visitor &visitor) {
    return decode_any(visitor);
  }

  virtual Result<bool, Error> is_human_readable() const { return true; }
};

template <typename T>
Result<void, Error> DecodeRef::assign_thunk(void *place, Decoder &decoder) {
  TOKCHECK_TRY(value, Codec<T>::decode(decoder));
  *static_cast<T *>(place) = std::move(value);
  return Result<void, Error>();
}

template <typename T>
Result<void, Error> DecodeRef::in_place_thunk(void *place, Decoder &decoder) {
  return Codec<T>::decode_in_place(decoder, *static_cast<T *>(place));
}

} // namespace model
} // namespace tokcheck
