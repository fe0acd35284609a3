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

#include "tokcheck/model/codec.h"
#include <algorithm>
#include <limits>

namespace tokcheck {
namespace model {

namespace {

class CharVisitor : public Visitor {
public:
  std::string expecting() const override { return "a character"; }

  Result<void, Error> visit_char(char32_t v) override {
    value_ = v;
    return Result<void, Error>();
  }

  Result<void, Error> visit_str(std::string_view v) override {
    auto c = single_code_point(v);
    if (!c) {
      return Unexpected(invalid_value(Actual::Str(v), *this));
    }
    value_ = *c;
    return Result<void, Error>();
  }

  char32_t value() const { return value_; }

private:
  char32_t value_ = 0;
};

class I128Visitor : public Visitor {
public:
  std::string expecting() const override { return "i128"; }

  Result<void, Error> visit_i64(int64_t v) override {
    value_ = v;
    return Result<void, Error>();
  }

  Result<void, Error> visit_u64(uint64_t v) override {
    value_ = v;
    return Result<void, Error>();
  }

  Result<void, Error> visit_i128(absl::int128 v) override {
    value_ = v;
    return Result<void, Error>();
  }

  Result<void, Error> visit_u128(absl::uint128 v) override {
    if (absl::Uint128High64(v) >
        static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return Unexpected(invalid_value(Actual::Unsigned128(v), *this));
    }
    value_ = absl::MakeInt128(static_cast<int64_t>(absl::Uint128High64(v)),
                              absl::Uint128Low64(v));
    return Result<void, Error>();
  }

  absl::int128 value() const { return value_; }

private:
  absl::int128 value_ = 0;
};

class U128Visitor : public Visitor {
public:
  std::string expecting() const override { return "u128"; }

  Result<void, Error> visit_i64(int64_t v) override {
    if (v < 0) {
      return Unexpected(invalid_value(Actual::Signed(v), *this));
    }
    value_ = static_cast<uint64_t>(v);
    return Result<void, Error>();
  }

  Result<void, Error> visit_u64(uint64_t v) override {
    value_ = v;
    return Result<void, Error>();
  }

  Result<void, Error> visit_i128(absl::int128 v) override {
    if (v < 0) {
      return Unexpected(invalid_value(Actual::Signed128(v), *this));
    }
    value_ = absl::MakeUint128(static_cast<uint64_t>(absl::Int128High64(v)),
                               absl::Int128Low64(v));
    return Result<void, Error>();
  }

  Result<void, Error> visit_u128(absl::uint128 v) override {
    value_ = v;
    return Result<void, Error>();
  }

  absl::uint128 value() const { return value_; }

private:
  absl::uint128 value_ = 0;
};

class StringVisitor : public Visitor {
public:
  explicit StringVisitor(std::string &place) : place_(place) {}

  std::string expecting() const override { return "a string"; }

  Result<void, Error> visit_str(std::string_view v) override {
    place_.assign(v.data(), v.size());
    return Result<void, Error>();
  }

  Result<void, Error> visit_string(std::string v) override {
    place_ = std::move(v);
    return Result<void, Error>();
  }

  Result<void, Error> visit_bytes(ByteView v) override {
    std::string_view text(reinterpret_cast<const char *>(v.data()), v.size());
    if (!is_utf8(text)) {
      return Unexpected(invalid_value(Actual::Bytes(), *this));
    }
    return visit_str(text);
  }

private:
  std::string &place_;
};

class ByteBufVisitor : public Visitor {
public:
  std::string expecting() const override { return "byte array"; }

  Result<void, Error> visit_bytes(ByteView v) override {
    value_.bytes() = v.to_vector();
    return Result<void, Error>();
  }

  Result<void, Error> visit_byte_buf(std::vector<uint8_t> v) override {
    value_.bytes() = std::move(v);
    return Result<void, Error>();
  }

  Result<void, Error> visit_str(std::string_view v) override {
    return visit_bytes(ByteView(v));
  }

  Result<void, Error> visit_seq(SeqAccess &seq) override {
    auto hint = seq.size_hint();
    value_.bytes().clear();
    value_.bytes().reserve(hint ? std::min<size_t>(*hint, 4096) : 0);
    uint8_t byte = 0;
    while (true) {
      TOKCHECK_TRY(has_next, seq.next_element(byte));
      if (!has_next) {
        break;
      }
      value_.bytes().push_back(byte);
    }
    return Result<void, Error>();
  }

  ByteBuf take() { return std::move(value_); }

private:
  ByteBuf value_;
};

class IgnoredAnyVisitor : public Visitor {
public:
  std::string expecting() const override { return "anything at all"; }

  Result<void, Error> visit_bool(bool) override { return ok(); }
  Result<void, Error> visit_i64(int64_t) override { return ok(); }
  Result<void, Error> visit_u64(uint64_t) override { return ok(); }
  Result<void, Error> visit_i128(absl::int128) override { return ok(); }
  Result<void, Error> visit_u128(absl::uint128) override { return ok(); }
  Result<void, Error> visit_f64(double) override { return ok(); }
  Result<void, Error> visit_str(std::string_view) override { return ok(); }
  Result<void, Error> visit_bytes(ByteView) override { return ok(); }
  Result<void, Error> visit_none() override { return ok(); }
  Result<void, Error> visit_unit() override { return ok(); }

  Result<void, Error> visit_some(Decoder &decoder) override {
    return Codec<IgnoredAny>::decode_in_place(decoder, ignored_);
  }

  Result<void, Error> visit_newtype_struct(Decoder &decoder) override {
    return Codec<IgnoredAny>::decode_in_place(decoder, ignored_);
  }

  Result<void, Error> visit_seq(SeqAccess &seq) override {
    while (true) {
      TOKCHECK_TRY(has_next, seq.next_element(ignored_));
      if (!has_next) {
        return ok();
      }
    }
  }

  Result<void, Error> visit_map(MapAccess &map) override {
    while (true) {
      TOKCHECK_TRY(has_key, map.next_key(ignored_));
      if (!has_key) {
        return ok();
      }
      TOKCHECK_RETURN_NOT_OK(map.next_value(ignored_));
    }
  }

  Result<void, Error> visit_enum(EnumAccess &data) override {
    TOKCHECK_RETURN_NOT_OK(data.variant(ignored_));
    return data.newtype_variant(ignored_);
  }

private:
  static Result<void, Error> ok() { return Result<void, Error>(); }

  IgnoredAny ignored_;
};

} // namespace

Result<char32_t, Error> Codec<char32_t>::decode(Decoder &decoder) {
  CharVisitor visitor;
  TOKCHECK_RETURN_NOT_OK(decoder.decode_char(visitor));
  return visitor.value();
}

Result<absl::int128, Error> Codec<absl::int128>::decode(Decoder &decoder) {
  I128Visitor visitor;
  TOKCHECK_RETURN_NOT_OK(decoder.decode_i128(visitor));
  return visitor.value();
}

Result<absl::uint128, Error> Codec<absl::uint128>::decode(Decoder &decoder) {
  U128Visitor visitor;
  TOKCHECK_RETURN_NOT_OK(decoder.decode_u128(visitor));
  return visitor.value();
}

Result<void, Error> Codec<std::string>::decode_in_place(Decoder &decoder,
                                                        std::string &place) {
  StringVisitor visitor(place);
  return decoder.decode_string(visitor);
}

Result<ByteBuf, Error> Codec<ByteBuf>::decode(Decoder &decoder) {
  ByteBufVisitor visitor;
  TOKCHECK_RETURN_NOT_OK(decoder.decode_byte_buf(visitor));
  return visitor.take();
}

Result<IgnoredAny, Error> Codec<IgnoredAny>::decode(Decoder &decoder) {
  IgnoredAnyVisitor visitor;
  TOKCHECK_RETURN_NOT_OK(decoder.decode_ignored_any(visitor));
  return IgnoredAny();
}

} // namespace model
} // namespace tokcheck
