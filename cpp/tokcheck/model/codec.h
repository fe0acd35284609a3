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
#include "tokcheck/model/decoder.h"
#include "tokcheck/model/encoder.h"
#include "tokcheck/util/string_util.h"
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace tokcheck {
namespace model {

// ============================================================================
// Codec<T> contract
//
//   static Result<void, Error> encode(const T &value, Encoder &encoder);
//   static Result<T, Error> decode(Decoder &decoder);
//   static Result<void, Error> decode_in_place(Decoder &decoder, T &place);
//
// Decode-only or encode-only types leave out the half they do not support.
// Codecs that have nothing better to do in place derive from DecodeByValue,
// which decodes a fresh value and move-assigns it.
// ============================================================================

template <typename T> struct DecodeByValue {
  static Result<void, Error> decode_in_place(Decoder &decoder, T &place) {
    TOKCHECK_TRY(value, Codec<T>::decode(decoder));
    place = std::move(value);
    return Result<void, Error>();
  }
};

/// Byte string that encodes as bytes rather than as a sequence of u8.
class ByteBuf {
public:
  ByteBuf() = default;
  explicit ByteBuf(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}
  ByteBuf(std::initializer_list<uint8_t> bytes) : bytes_(bytes) {}

  const std::vector<uint8_t> &bytes() const { return bytes_; }
  std::vector<uint8_t> &bytes() { return bytes_; }

  friend bool operator==(const ByteBuf &a, const ByteBuf &b) {
    return a.bytes_ == b.bytes_;
  }
  friend bool operator!=(const ByteBuf &a, const ByteBuf &b) {
    return !(a == b);
  }

private:
  std::vector<uint8_t> bytes_;
};

inline std::ostream &operator<<(std::ostream &os, const ByteBuf &buf) {
  return os << format_bytes(buf.bytes().data(), buf.bytes().size());
}

/// Accepts and discards any single value.
struct IgnoredAny {
  friend bool operator==(const IgnoredAny &, const IgnoredAny &) {
    return true;
  }
};

// ============================================================================
// Visitors shared by the primitive codecs
// ============================================================================

/// Range-checked acceptance of any integer width into T.
template <typename T> class IntegerVisitor : public Visitor {
  static_assert(std::is_integral<T>::value, "integers only");

public:
  explicit IntegerVisitor(const char *name) : name_(name) {}

  std::string expecting() const override { return name_; }

  Result<void, Error> visit_i64(int64_t v) override {
    bool fits;
    if (std::is_signed<T>::value) {
      fits = v >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
             v <= static_cast<int64_t>(std::numeric_limits<T>::max());
    } else {
      fits = v >= 0 && static_cast<uint64_t>(v) <=
                           static_cast<uint64_t>(std::numeric_limits<T>::max());
    }
    if (!fits) {
      return Unexpected(invalid_value(Actual::Signed(v), *this));
    }
    value_ = static_cast<T>(v);
    return Result<void, Error>();
  }

  Result<void, Error> visit_u64(uint64_t v) override {
    if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
      return Unexpected(invalid_value(Actual::Unsigned(v), *this));
    }
    value_ = static_cast<T>(v);
    return Result<void, Error>();
  }

  Result<void, Error> visit_i128(absl::int128 v) override {
    if (v < absl::int128(std::numeric_limits<T>::min()) ||
        v > absl::int128(std::numeric_limits<T>::max())) {
      return Unexpected(invalid_value(Actual::Signed128(v), *this));
    }
    value_ = static_cast<T>(v);
    return Result<void, Error>();
  }

  Result<void, Error> visit_u128(absl::uint128 v) override {
    if (v > absl::uint128(std::numeric_limits<T>::max())) {
      return Unexpected(invalid_value(Actual::Unsigned128(v), *this));
    }
    value_ = static_cast<T>(v);
    return Result<void, Error>();
  }

  T value() const { return value_; }

private:
  const char *name_;
  T value_ = 0;
};

/// Accepts floats and integers; f32 targets keep an f32 token's exact bits.
template <typename T> class FloatVisitor : public Visitor {
public:
  explicit FloatVisitor(const char *name) : name_(name) {}

  std::string expecting() const override { return name_; }

  Result<void, Error> visit_f32(float v) override {
    value_ = static_cast<T>(v);
    return Result<void, Error>();
  }

  Result<void, Error> visit_f64(double v) override {
    value_ = static_cast<T>(v);
    return Result<void, Error>();
  }

  Result<void, Error> visit_i64(int64_t v) override {
    value_ = static_cast<T>(v);
    return Result<void, Error>();
  }

  Result<void, Error> visit_u64(uint64_t v) override {
    value_ = static_cast<T>(v);
    return Result<void, Error>();
  }

  Result<void, Error> visit_i128(absl::int128 v) override {
    value_ = static_cast<T>(v);
    return Result<void, Error>();
  }

  Result<void, Error> visit_u128(absl::uint128 v) override {
    value_ = static_cast<T>(v);
    return Result<void, Error>();
  }

  T value() const { return value_; }

private:
  const char *name_;
  T value_ = 0;
};

// ============================================================================
// Primitive codecs
// ============================================================================

/// bool codec
template <> struct Codec<bool> : DecodeByValue<bool> {
  static Result<void, Error> encode(bool value, Encoder &encoder) {
    return encoder.encode_bool(value);
  }

  static Result<bool, Error> decode(Decoder &decoder) {
    class BoolVisitor : public Visitor {
    public:
      std::string expecting() const override { return "a boolean"; }
      Result<void, Error> visit_bool(bool v) override {
        value = v;
        return Result<void, Error>();
      }
      bool value = false;
    };
    BoolVisitor visitor;
    TOKCHECK_RETURN_NOT_OK(decoder.decode_bool(visitor));
    return visitor.value;
  }
};

#define TOKCHECK_DEFINE_NUMBER_CODEC(TYPE, NAME, VISITOR)                      \
  template <> struct Codec<TYPE> : DecodeByValue<TYPE> {                       \
    static Result<void, Error> encode(TYPE value, Encoder &encoder) {          \
      return encoder.encode_##NAME(value);                                     \
    }                                                                          \
    static Result<TYPE, Error> decode(Decoder &decoder) {                      \
      VISITOR<TYPE> visitor(#NAME);                                            \
      TOKCHECK_RETURN_NOT_OK(decoder.decode_##NAME(visitor));                  \
      return visitor.value();                                                  \
    }                                                                          \
  };

TOKCHECK_DEFINE_NUMBER_CODEC(int8_t, i8, IntegerVisitor)
TOKCHECK_DEFINE_NUMBER_CODEC(int16_t, i16, IntegerVisitor)
TOKCHECK_DEFINE_NUMBER_CODEC(int32_t, i32, IntegerVisitor)
TOKCHECK_DEFINE_NUMBER_CODEC(int64_t, i64, IntegerVisitor)
TOKCHECK_DEFINE_NUMBER_CODEC(uint8_t, u8, IntegerVisitor)
TOKCHECK_DEFINE_NUMBER_CODEC(uint16_t, u16, IntegerVisitor)
TOKCHECK_DEFINE_NUMBER_CODEC(uint32_t, u32, IntegerVisitor)
TOKCHECK_DEFINE_NUMBER_CODEC(uint64_t, u64, IntegerVisitor)
TOKCHECK_DEFINE_NUMBER_CODEC(float, f32, FloatVisitor)
TOKCHECK_DEFINE_NUMBER_CODEC(double, f64, FloatVisitor)

#undef TOKCHECK_DEFINE_NUMBER_CODEC

/// 128-bit integer codecs. Any integer token that fits is accepted.
template <> struct Codec<absl::int128> : DecodeByValue<absl::int128> {
  static Result<void, Error> encode(absl::int128 value, Encoder &encoder) {
    return encoder.encode_i128(value);
  }

  static Result<absl::int128, Error> decode(Decoder &decoder);
};

template <> struct Codec<absl::uint128> : DecodeByValue<absl::uint128> {
  static Result<void, Error> encode(absl::uint128 value, Encoder &encoder) {
    return encoder.encode_u128(value);
  }

  static Result<absl::uint128, Error> decode(Decoder &decoder);
};

/// Unicode scalar codec. Also accepts a one-character string.
template <> struct Codec<char32_t> : DecodeByValue<char32_t> {
  static Result<void, Error> encode(char32_t value, Encoder &encoder) {
    return encoder.encode_char(value);
  }

  static Result<char32_t, Error> decode(Decoder &decoder);
};

/// std::string codec. Bytes are accepted when they are valid UTF-8.
template <> struct Codec<std::string> {
  static Result<void, Error> encode(const std::string &value,
                                    Encoder &encoder) {
    return encoder.encode_str(value);
  }

  static Result<std::string, Error> decode(Decoder &decoder) {
    std::string value;
    TOKCHECK_RETURN_NOT_OK(decode_in_place(decoder, value));
    return value;
  }

  /// Reuses the existing buffer.
  static Result<void, Error> decode_in_place(Decoder &decoder,
                                             std::string &place);
};

/// Encode-only view of a string.
template <> struct Codec<std::string_view> {
  static Result<void, Error> encode(std::string_view value,
                                    Encoder &encoder) {
    return encoder.encode_str(value);
  }
};

/// ByteBuf codec. Accepts bytes, strings and sequences of u8.
template <> struct Codec<ByteBuf> : DecodeByValue<ByteBuf> {
  static Result<void, Error> encode(const ByteBuf &value, Encoder &encoder) {
    return encoder.encode_bytes(ByteView(value.bytes()));
  }

  static Result<ByteBuf, Error> decode(Decoder &decoder);
};

/// Unit codec.
template <> struct Codec<std::monostate> : DecodeByValue<std::monostate> {
  static Result<void, Error> encode(const std::monostate &, Encoder &encoder) {
    return encoder.encode_unit();
  }

  static Result<std::monostate, Error> decode(Decoder &decoder) {
    class UnitVisitor : public Visitor {
    public:
      std::string expecting() const override { return "unit"; }
      Result<void, Error> visit_unit() override {
        return Result<void, Error>();
      }
    };
    UnitVisitor visitor;
    TOKCHECK_RETURN_NOT_OK(decoder.decode_unit(visitor));
    return std::monostate();
  }
};

/// Decode-only codec that walks one value of any shape and drops it.
template <> struct Codec<IgnoredAny> : DecodeByValue<IgnoredAny> {
  static Result<IgnoredAny, Error> decode(Decoder &decoder);
};

} // namespace model
} // namespace tokcheck
