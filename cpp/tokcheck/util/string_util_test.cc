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

#include "tokcheck/util/string_util.h"
#include "gtest/gtest.h"
#include <limits>

namespace tokcheck {

class StringUtilTest : public ::testing::Test {};

TEST_F(StringUtilTest, Utf8Encode) {
  EXPECT_EQ(utf8_encode(U'a'), "a");
  EXPECT_EQ(utf8_encode(0xE9), "\xC3\xA9");
  EXPECT_EQ(utf8_encode(0x20AC), "\xE2\x82\xAC");
  EXPECT_EQ(utf8_encode(0x1F600), "\xF0\x9F\x98\x80");
  // Surrogates cannot be encoded.
  EXPECT_EQ(utf8_encode(0xD800), "\xEF\xBF\xBD");
  EXPECT_EQ(utf8_encode(0x110000), "\xEF\xBF\xBD");
}

TEST_F(StringUtilTest, IsUtf8) {
  EXPECT_TRUE(is_utf8(""));
  EXPECT_TRUE(is_utf8("plain ascii"));
  EXPECT_TRUE(is_utf8("caf\xC3\xA9"));
  EXPECT_TRUE(is_utf8("\xF0\x9F\x98\x80"));
  EXPECT_FALSE(is_utf8("\xFF"));
  EXPECT_FALSE(is_utf8("\xC3"));          // truncated
  EXPECT_FALSE(is_utf8("\xC0\xAF"));      // overlong
  EXPECT_FALSE(is_utf8("\xED\xA0\x80"));  // surrogate
  EXPECT_FALSE(is_utf8("\xF4\x90\x80\x80")); // past U+10FFFF
}

TEST_F(StringUtilTest, SingleCodePoint) {
  EXPECT_EQ(single_code_point("a"), std::optional<char32_t>(U'a'));
  EXPECT_EQ(single_code_point("\xE2\x82\xAC"),
            std::optional<char32_t>(0x20AC));
  EXPECT_EQ(single_code_point(""), std::nullopt);
  EXPECT_EQ(single_code_point("ab"), std::nullopt);
  EXPECT_EQ(single_code_point("\xC3"), std::nullopt);
}

TEST_F(StringUtilTest, QuoteString) {
  EXPECT_EQ(quote_string("a"), "\"a\"");
  EXPECT_EQ(quote_string(""), "\"\"");
  EXPECT_EQ(quote_string("a\"b\n"), "\"a\\\"b\\n\"");
  EXPECT_EQ(quote_string("tab\there"), "\"tab\\there\"");
  EXPECT_EQ(quote_string("back\\slash"), "\"back\\\\slash\"");
  EXPECT_EQ(quote_string("it's"), "\"it's\"");
  EXPECT_EQ(quote_string("caf\xC3\xA9"), "\"caf\xC3\xA9\"");
}

TEST_F(StringUtilTest, QuoteChar) {
  EXPECT_EQ(quote_char(U'a'), "'a'");
  EXPECT_EQ(quote_char(U'\n'), "'\\n'");
  EXPECT_EQ(quote_char(U'\''), "'\\''");
  EXPECT_EQ(quote_char(U'"'), "'\"'");
  EXPECT_EQ(quote_char(0x1), "'\\u{1}'");
}

TEST_F(StringUtilTest, FormatBytes) {
  const uint8_t bytes[] = {1, 2, 255};
  EXPECT_EQ(format_bytes(bytes, 3), "[1, 2, 255]");
  EXPECT_EQ(format_bytes(bytes, 0), "[]");
}

TEST_F(StringUtilTest, FormatFloat) {
  EXPECT_EQ(format_float(1.0), "1.0");
  EXPECT_EQ(format_float(0.1), "0.1");
  EXPECT_EQ(format_float(-2.5f), "-2.5");
  EXPECT_EQ(format_float(0.1f), "0.1");
  EXPECT_EQ(format_float(std::numeric_limits<double>::quiet_NaN()), "NaN");
  EXPECT_EQ(format_float(-std::numeric_limits<double>::infinity()), "-inf");
  EXPECT_EQ(format_float(std::numeric_limits<float>::infinity()), "inf");
  EXPECT_EQ(format_float(-0.0), "-0.0");
}

TEST_F(StringUtilTest, FormatFloatExponent) {
  EXPECT_EQ(format_float(1e20), "1e20");
  EXPECT_EQ(format_float(1e-7), "1e-7");
  EXPECT_EQ(format_float(-1.5e-7), "-1.5e-7");
  EXPECT_EQ(format_float(1e16), "1e16");
  EXPECT_EQ(format_float(1e15), "1000000000000000.0");
  EXPECT_EQ(format_float(0.0001), "0.0001");
  EXPECT_EQ(format_float(1e-5f), "1e-5");
  EXPECT_EQ(format_float(1e300), "1e300");
}

TEST_F(StringUtilTest, FormatInt128) {
  EXPECT_EQ(format_int128(absl::Int128Min()),
            "-170141183460469231731687303715884105728");
  EXPECT_EQ(format_uint128(absl::Uint128Max()),
            "340282366920938463463374607431768211455");
  EXPECT_EQ(format_int128(-1), "-1");
}

TEST_F(StringUtilTest, OneOf) {
  EXPECT_EQ(one_of({}), "");
  EXPECT_EQ(one_of({"a"}), "`a`");
  EXPECT_EQ(one_of({"a", "b"}), "`a` or `b`");
  EXPECT_EQ(one_of({"a", "b", "c"}), "one of `a`, `b`, `c`");
}

} // namespace tokcheck

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
