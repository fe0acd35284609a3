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

#include "tokcheck/model/field_set.h"
#include "tokcheck/model/value_decoder.h"
#include "gtest/gtest.h"

namespace tokcheck {
namespace model {

class FieldSetTest : public ::testing::Test {
protected:
  const FieldSet fields_ = FieldSet::fields({"a", "b"});
  const FieldSet variants_ = FieldSet::variants({"Unit", "Newtype", "Tuple"});
};

TEST_F(FieldSetTest, Lookup) {
  EXPECT_EQ(fields_.size(), 2);
  EXPECT_EQ(fields_.name(1), "b");
  EXPECT_EQ(fields_.find("a"), std::optional<size_t>(0));
  EXPECT_EQ(fields_.find("c"), std::nullopt);
  EXPECT_EQ(variants_.kind(), FieldSet::Kind::Variants);
}

TEST_F(FieldSetTest, IndexOf) {
  auto b = fields_.index_of("b");
  ASSERT_TRUE(b.ok());
  EXPECT_EQ(b.value(), 1);

  auto missing = fields_.index_of("x");
  ASSERT_FALSE(missing.ok());
  EXPECT_EQ(missing.error(), "unknown field `x`, expected `a` or `b`");

  auto variant = variants_.index_of("Struct");
  ASSERT_FALSE(variant.ok());
  EXPECT_EQ(variant.error().code(), ErrorCode::UnknownVariant);
  EXPECT_EQ(variant.error(), "unknown variant `Struct`, expected one of "
                             "`Unit`, `Newtype`, `Tuple`");
}

TEST_F(FieldSetTest, IndexAt) {
  EXPECT_EQ(variants_.index_at(2).value(), 2);

  auto out_of_range = variants_.index_at(3);
  ASSERT_FALSE(out_of_range.ok());
  EXPECT_EQ(out_of_range.error(), "invalid value: integer `3`, expected "
                                  "variant index 0 <= i < 3");

  auto field = fields_.index_at(7);
  ASSERT_FALSE(field.ok());
  EXPECT_EQ(field.error(),
            "invalid value: integer `7`, expected field index 0 <= i < 2");
}

TEST_F(FieldSetTest, IdentifierFromName) {
  Identifier key(fields_);
  StrDecoder decoder("b");
  ASSERT_TRUE(Codec<Identifier>::decode_in_place(decoder, key).ok());
  EXPECT_EQ(key.index(), std::optional<size_t>(1));
}

TEST_F(FieldSetTest, IdentifierFromBytes) {
  Identifier key(fields_);
  BytesDecoder decoder(ByteView("a"));
  ASSERT_TRUE(Codec<Identifier>::decode_in_place(decoder, key).ok());
  EXPECT_EQ(key.index(), std::optional<size_t>(0));
}

TEST_F(FieldSetTest, IdentifierFromIndex) {
  Identifier tag(variants_);
  U32Decoder decoder(1);
  ASSERT_TRUE(Codec<Identifier>::decode_in_place(decoder, tag).ok());
  EXPECT_EQ(tag.index(), std::optional<size_t>(1));
}

TEST_F(FieldSetTest, UnknownIdentifier) {
  Identifier key(fields_);
  StrDecoder decoder("c");
  auto result = Codec<Identifier>::decode_in_place(decoder, key);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error(), "unknown field `c`, expected `a` or `b`");
}

TEST_F(FieldSetTest, IgnoredUnknownField) {
  Identifier key(fields_, true);
  key.set_index(0);
  StrDecoder decoder("c");
  ASSERT_TRUE(Codec<Identifier>::decode_in_place(decoder, key).ok());
  EXPECT_EQ(key.index(), std::nullopt);
}

TEST_F(FieldSetTest, UnknownVariantNeverIgnored) {
  Identifier tag(variants_, true);
  StrDecoder decoder("Other");
  auto result = Codec<Identifier>::decode_in_place(decoder, tag);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code(), ErrorCode::UnknownVariant);
}

TEST_F(FieldSetTest, WrongShape) {
  class BoolDecoder : public Decoder {
  public:
    Result<void, Error> decode_any(Visitor &visitor) override {
      return visitor.visit_bool(true);
    }
  };
  Identifier key(fields_);
  BoolDecoder decoder;
  auto result = Codec<Identifier>::decode_in_place(decoder, key);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error(),
            "invalid type: boolean `true`, expected field identifier");
}

} // namespace model
} // namespace tokcheck

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
