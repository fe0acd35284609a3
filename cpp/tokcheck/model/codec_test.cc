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
#include "tokcheck/model/container_codec.h"
#include "tokcheck/model/value_decoder.h"
#include "gtest/gtest.h"
#include <cmath>
#include <vector>

namespace tokcheck {
namespace model {

namespace {

// Yields a fixed list of u32 values as a sequence.
class U32Seq : public SeqAccess {
public:
  explicit U32Seq(std::vector<uint32_t> items) : items_(std::move(items)) {}

  Result<bool, Error> next_element(DecodeRef element) override {
    if (pos_ >= items_.size()) {
      return false;
    }
    U32Decoder decoder(items_[pos_++]);
    TOKCHECK_RETURN_NOT_OK(element.decode(decoder));
    return true;
  }

  std::optional<size_t> size_hint() const override {
    return items_.size() - pos_;
  }

private:
  std::vector<uint32_t> items_;
  size_t pos_ = 0;
};

// Reports a single scalar of the chosen width.
class ScalarDecoder : public Decoder {
public:
  enum class Kind { I64, F32, Bool, Unit, None, Char };

  ScalarDecoder(Kind kind, double value = 0) : kind_(kind), value_(value) {}

  Result<void, Error> decode_any(Visitor &visitor) override {
    switch (kind_) {
    case Kind::I64:
      return visitor.visit_i64(static_cast<int64_t>(value_));
    case Kind::F32:
      return visitor.visit_f32(static_cast<float>(value_));
    case Kind::Bool:
      return visitor.visit_bool(value_ != 0);
    case Kind::Unit:
      return visitor.visit_unit();
    case Kind::None:
      return visitor.visit_none();
    case Kind::Char:
      return visitor.visit_char(static_cast<char32_t>(value_));
    }
    return visitor.visit_unit();
  }

private:
  Kind kind_;
  double value_;
};

// Reports one 128-bit integer.
class WideDecoder : public Decoder {
public:
  explicit WideDecoder(absl::int128 v) : signed_(true), i_(v) {}
  explicit WideDecoder(absl::uint128 v) : signed_(false), u_(v) {}

  Result<void, Error> decode_any(Visitor &visitor) override {
    return signed_ ? visitor.visit_i128(i_) : visitor.visit_u128(u_);
  }

private:
  bool signed_;
  absl::int128 i_ = 0;
  absl::uint128 u_ = 0;
};

} // namespace

class CodecTest : public ::testing::Test {};

TEST_F(CodecTest, IntegerWidening) {
  U32Decoder decoder(300);
  auto value = Codec<uint64_t>::decode(decoder);
  ASSERT_TRUE(value.ok());
  EXPECT_EQ(value.value(), 300u);

  U32Decoder as_signed(7);
  EXPECT_EQ(Codec<int16_t>::decode(as_signed).value(), 7);
}

TEST_F(CodecTest, IntegerOutOfRange) {
  U32Decoder decoder(300);
  auto value = Codec<uint8_t>::decode(decoder);
  ASSERT_FALSE(value.ok());
  EXPECT_EQ(value.error(), "invalid value: integer `300`, expected u8");

  ScalarDecoder negative(ScalarDecoder::Kind::I64, -1);
  auto unsigned_value = Codec<uint32_t>::decode(negative);
  ASSERT_FALSE(unsigned_value.ok());
  EXPECT_EQ(unsigned_value.error(),
            "invalid value: integer `-1`, expected u32");

  ScalarDecoder too_small(ScalarDecoder::Kind::I64, -129);
  EXPECT_EQ(Codec<int8_t>::decode(too_small).error(),
            "invalid value: integer `-129`, expected i8");
}

TEST_F(CodecTest, IntegerWrongType) {
  StrDecoder decoder("1");
  auto value = Codec<int32_t>::decode(decoder);
  ASSERT_FALSE(value.ok());
  EXPECT_EQ(value.error().code(), ErrorCode::InvalidType);
  EXPECT_EQ(value.error(), "invalid type: string \"1\", expected i32");
}

TEST_F(CodecTest, WideIntegers) {
  WideDecoder big(absl::MakeUint128(1, 0));
  EXPECT_EQ(Codec<absl::uint128>::decode(big).value(),
            absl::MakeUint128(1, 0));

  WideDecoder negative(absl::int128(-5));
  EXPECT_EQ(Codec<absl::int128>::decode(negative).value(), absl::int128(-5));

  U32Decoder narrow(9);
  EXPECT_EQ(Codec<absl::int128>::decode(narrow).value(), absl::int128(9));

  ScalarDecoder signed_narrow(ScalarDecoder::Kind::I64, -3);
  EXPECT_EQ(Codec<absl::int128>::decode(signed_narrow).value(),
            absl::int128(-3));
}

TEST_F(CodecTest, WideIntegersOutOfRange) {
  WideDecoder negative(absl::int128(-1));
  auto value = Codec<absl::uint128>::decode(negative);
  ASSERT_FALSE(value.ok());
  EXPECT_EQ(value.error().code(), ErrorCode::InvalidValue);
  EXPECT_EQ(value.error(),
            "invalid value: integer `-1` as i128, expected u128");

  WideDecoder too_big(absl::Uint128Max());
  EXPECT_EQ(Codec<absl::int128>::decode(too_big).error(),
            "invalid value: integer "
            "`340282366920938463463374607431768211455` as u128, expected "
            "i128");

  ScalarDecoder negative64(ScalarDecoder::Kind::I64, -1);
  EXPECT_EQ(Codec<absl::uint128>::decode(negative64).error(),
            "invalid value: integer `-1`, expected u128");
}

TEST_F(CodecTest, WideIntoNarrow) {
  WideDecoder fits(absl::int128(-100));
  EXPECT_EQ(Codec<int8_t>::decode(fits).value(), -100);

  WideDecoder too_big(absl::MakeUint128(1, 0));
  EXPECT_EQ(Codec<uint64_t>::decode(too_big).error(),
            "invalid value: integer `18446744073709551616` as u128, "
            "expected u64");

  WideDecoder as_float(absl::int128(2));
  EXPECT_EQ(Codec<double>::decode(as_float).value(), 2.0);

  WideDecoder wrong(absl::int128(5));
  EXPECT_EQ(Codec<bool>::decode(wrong).error(),
            "invalid type: integer `5` as i128, expected a boolean");
}

TEST_F(CodecTest, Floats) {
  ScalarDecoder decoder(ScalarDecoder::Kind::F32, 0.5);
  EXPECT_EQ(Codec<double>::decode(decoder).value(), 0.5);

  U32Decoder integer(3);
  EXPECT_EQ(Codec<float>::decode(integer).value(), 3.0f);
}

TEST_F(CodecTest, Bool) {
  ScalarDecoder decoder(ScalarDecoder::Kind::Bool, 1);
  EXPECT_TRUE(Codec<bool>::decode(decoder).value());

  U32Decoder integer(1);
  EXPECT_EQ(Codec<bool>::decode(integer).error(),
            "invalid type: integer `1`, expected a boolean");
}

TEST_F(CodecTest, Char) {
  StrDecoder one("\xE2\x82\xAC");
  EXPECT_EQ(Codec<char32_t>::decode(one).value(), char32_t(0x20AC));

  ScalarDecoder direct(ScalarDecoder::Kind::Char, 'z');
  EXPECT_EQ(Codec<char32_t>::decode(direct).value(), U'z');

  StrDecoder two("ab");
  EXPECT_EQ(Codec<char32_t>::decode(two).error(),
            "invalid value: string \"ab\", expected a character");
}

TEST_F(CodecTest, String) {
  StrDecoder decoder("hello");
  EXPECT_EQ(Codec<std::string>::decode(decoder).value(), "hello");

  ScalarDecoder from_char(ScalarDecoder::Kind::Char, 'c');
  EXPECT_EQ(Codec<std::string>::decode(from_char).value(), "c");

  BytesDecoder utf8(ByteView("bytes"));
  EXPECT_EQ(Codec<std::string>::decode(utf8).value(), "bytes");

  BytesDecoder invalid(ByteView("\xFF"));
  EXPECT_EQ(Codec<std::string>::decode(invalid).error(),
            "invalid value: byte array, expected a string");
}

TEST_F(CodecTest, StringInPlace) {
  std::string place = "a much longer previous value";
  StrDecoder decoder("x");
  ASSERT_TRUE(Codec<std::string>::decode_in_place(decoder, place).ok());
  EXPECT_EQ(place, "x");
}

TEST_F(CodecTest, ByteBuf) {
  BytesDecoder decoder(ByteView("\x01\x02"));
  EXPECT_EQ(Codec<ByteBuf>::decode(decoder).value(), (ByteBuf{1, 2}));

  U32Seq seq({3, 4, 5});
  SeqAccessDecoder from_seq(seq);
  EXPECT_EQ(Codec<ByteBuf>::decode(from_seq).value(), (ByteBuf{3, 4, 5}));

  U32Seq too_big({256});
  SeqAccessDecoder overflow(too_big);
  EXPECT_EQ(Codec<ByteBuf>::decode(overflow).error(),
            "invalid value: integer `256`, expected u8");
}

TEST_F(CodecTest, Unit) {
  ScalarDecoder unit(ScalarDecoder::Kind::Unit);
  EXPECT_TRUE(Codec<std::monostate>::decode(unit).ok());

  U32Decoder integer(0);
  EXPECT_EQ(Codec<std::monostate>::decode(integer).error(),
            "invalid type: integer `0`, expected unit");
}

TEST_F(CodecTest, Optional) {
  ScalarDecoder none(ScalarDecoder::Kind::None);
  EXPECT_EQ(Codec<std::optional<uint8_t>>::decode(none).value(),
            std::nullopt);

  ScalarDecoder unit(ScalarDecoder::Kind::Unit);
  EXPECT_EQ(Codec<std::optional<uint8_t>>::decode(unit).value(),
            std::nullopt);

  U32Decoder bare(1);
  EXPECT_EQ(Codec<std::optional<uint8_t>>::decode(bare).error(),
            "invalid type: integer `1`, expected option");
}

TEST_F(CodecTest, Vector) {
  U32Seq seq({1, 2, 3});
  SeqAccessDecoder decoder(seq);
  EXPECT_EQ(Codec<std::vector<uint16_t>>::decode(decoder).value(),
            (std::vector<uint16_t>{1, 2, 3}));
}

TEST_F(CodecTest, VectorInPlaceTruncates) {
  std::vector<uint32_t> place = {9, 9, 9, 9};
  U32Seq seq({1, 2});
  SeqAccessDecoder decoder(seq);
  ASSERT_TRUE(Codec<std::vector<uint32_t>>::decode_in_place(decoder, place)
                  .ok());
  EXPECT_EQ(place, (std::vector<uint32_t>{1, 2}));
}

TEST_F(CodecTest, VectorInPlaceGrows) {
  std::vector<uint32_t> place = {9};
  U32Seq seq({1, 2, 3});
  SeqAccessDecoder decoder(seq);
  ASSERT_TRUE(Codec<std::vector<uint32_t>>::decode_in_place(decoder, place)
                  .ok());
  EXPECT_EQ(place, (std::vector<uint32_t>{1, 2, 3}));
}

TEST_F(CodecTest, TupleTooShort) {
  U32Seq seq({1});
  SeqAccessDecoder decoder(seq);
  auto pair = Codec<std::pair<uint8_t, uint8_t>>::decode(decoder);
  ASSERT_FALSE(pair.ok());
  EXPECT_EQ(pair.error(), "invalid length 1, expected a tuple of size 2");

  U32Seq short_array({1, 2});
  SeqAccessDecoder array_decoder(short_array);
  auto array = Codec<std::array<uint8_t, 3>>::decode(array_decoder);
  ASSERT_FALSE(array.ok());
  EXPECT_EQ(array.error(), "invalid length 2, expected an array of length 3");
}

TEST_F(CodecTest, Tuple) {
  U32Seq seq({1, 2, 3});
  SeqAccessDecoder decoder(seq);
  auto tuple = Codec<std::tuple<uint8_t, uint16_t, uint32_t>>::decode(decoder);
  ASSERT_TRUE(tuple.ok());
  EXPECT_EQ(tuple.value(), std::make_tuple(uint8_t(1), uint16_t(2), 3u));
}

TEST_F(CodecTest, IgnoredAnyAcceptsAnything) {
  U32Seq seq({1, 2});
  SeqAccessDecoder decoder(seq);
  EXPECT_TRUE(Codec<IgnoredAny>::decode(decoder).ok());

  StrDecoder text("whatever");
  EXPECT_TRUE(Codec<IgnoredAny>::decode(text).ok());

  ScalarDecoder unit(ScalarDecoder::Kind::Unit);
  EXPECT_TRUE(Codec<IgnoredAny>::decode(unit).ok());
}

} // namespace model
} // namespace tokcheck

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
