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
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>

namespace tokcheck {
namespace model {

class Encoder;

/// Non-owning, type-erased reference to a value that has a Codec.
///
/// Converts implicitly from `const T &`, so callers pass values straight to
/// the Encoder methods that take one:
///
/// ```cpp
/// TOKCHECK_RETURN_NOT_OK(encoder.encode_some(inner));
/// ```
///
/// The referenced value must outlive the call it is passed to.
class EncodeRef {
public:
  template <typename T,
            typename = std::enable_if_t<
                !std::is_same<std::decay_t<T>, EncodeRef>::value>>
  EncodeRef(const T &value)
      : value_(&value), encode_fn_(&EncodeRef::encode_thunk<T>) {}

  Result<void, Error> encode(Encoder &encoder) const {
    return encode_fn_(value_, encoder);
  }

private:
  template <typename T>
  static Result<void, Error> encode_thunk(const void *value,
                                          Encoder &encoder) {
    return Codec<T>::encode(*static_cast<const T *>(value), encoder);
  }

  const void *value_;
  Result<void, Error> (*encode_fn_)(const void *, Encoder &);
};

/// Receives the members of one composite value: the elements of a sequence,
/// tuple or tuple variant, the entries of a map, or the fields of a record or
/// record variant. Obtained from one of the Encoder::encode_* openers.
///
/// end() must be called exactly once, after the last member.
class CompoundEncoder {
public:
  virtual ~CompoundEncoder() = default;

  /// Sequence, tuple, tuple struct and tuple variant members.
  virtual Result<void, Error> encode_element(EncodeRef value) = 0;

  /// Map entries, key then value.
  virtual Result<void, Error> encode_key(EncodeRef key) = 0;
  virtual Result<void, Error> encode_value(EncodeRef value) = 0;

  /// Record and record variant fields.
  virtual Result<void, Error> encode_field(std::string_view key,
                                           EncodeRef value) = 0;

  /// Reports a record field that is left out of the encoding.
  virtual Result<void, Error> skip_field(std::string_view key) {
    (void)key;
    return Result<void, Error>();
  }

  virtual Result<void, Error> end() = 0;
};

using CompoundResult = Result<std::unique_ptr<CompoundEncoder>, Error>;

/// The encoding callback interface. A value's Codec drives it with one call
/// per primitive, and with an opener plus CompoundEncoder calls per composite.
///
/// Variants carry the enum's type name, the variant's declaration index and
/// its name; formats pick whichever of the two identifies the variant.
class Encoder {
public:
  virtual ~Encoder() = default;

  virtual Result<void, Error> encode_bool(bool v) = 0;
  virtual Result<void, Error> encode_i8(int8_t v) = 0;
  virtual Result<void, Error> encode_i16(int16_t v) = 0;
  virtual Result<void, Error> encode_i32(int32_t v) = 0;
  virtual Result<void, Error> encode_i64(int64_t v) = 0;
  virtual Result<void, Error> encode_u8(uint8_t v) = 0;
  virtual Result<void, Error> encode_u16(uint16_t v) = 0;
  virtual Result<void, Error> encode_u32(uint32_t v) = 0;
  virtual Result<void, Error> encode_u64(uint64_t v) = 0;
  /// 128-bit integers are optional for a format; the default rejects them.
  virtual Result<void, Error> encode_i128(absl::int128 v) {
    (void)v;
    return Unexpected(Error::custom("i128 is not supported"));
  }
  virtual Result<void, Error> encode_u128(absl::uint128 v) {
    (void)v;
    return Unexpected(Error::custom("u128 is not supported"));
  }
  virtual Result<void, Error> encode_f32(float v) = 0;
  virtual Result<void, Error> encode_f64(double v) = 0;
  virtual Result<void, Error> encode_char(char32_t v) = 0;
  virtual Result<void, Error> encode_str(std::string_view v) = 0;
  virtual Result<void, Error> encode_bytes(ByteView v) = 0;

  virtual Result<void, Error> encode_none() = 0;
  virtual Result<void, Error> encode_some(EncodeRef value) = 0;

  virtual Result<void, Error> encode_unit() = 0;
  virtual Result<void, Error> encode_unit_struct(std::string_view name) = 0;
  virtual Result<void, Error> encode_unit_variant(std::string_view name,
                                                  uint32_t variant_index,
                                                  std::string_view variant) = 0;

  virtual Result<void, Error> encode_newtype_struct(std::string_view name,
                                                    EncodeRef value) = 0;
  virtual Result<void, Error>
  encode_newtype_variant(std::string_view name, uint32_t variant_index,
                         std::string_view variant, EncodeRef value) = 0;

  virtual CompoundResult encode_seq(std::optional<size_t> len) = 0;
  virtual CompoundResult encode_tuple(size_t len) = 0;
  virtual CompoundResult encode_tuple_struct(std::string_view name,
                                             size_t len) = 0;
  virtual CompoundResult encode_tuple_variant(std::string_view name,
                                              uint32_t variant_index,
                                              std::string_view variant,
                                              size_t len) = 0;
  virtual CompoundResult encode_map(std::optional<size_t> len) = 0;
  virtual CompoundResult encode_struct(std::string_view name, size_t len) = 0;
  virtual CompoundResult encode_struct_variant(std::string_view name,
                                               uint32_t variant_index,
                                               std::string_view variant,
                                               size_t len) = 0;

  /// Whether the format is textual. Codecs with distinct readable and compact
  /// forms branch on it.
  virtual Result<bool, Error> is_human_readable() const = 0;
};

} // namespace model
} // namespace tokcheck
