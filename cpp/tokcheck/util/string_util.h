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
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tokcheck {

/// Appends the UTF-8 encoding of a code point. Surrogates and values past
/// U+10FFFF are replaced by U+FFFD.
void append_utf8(char32_t code_point, std::string &out);

inline std::string utf8_encode(char32_t code_point) {
  std::string out;
  append_utf8(code_point, out);
  return out;
}

/// Whether `text` is well-formed UTF-8.
bool is_utf8(std::string_view text);

/// The code point of a string holding exactly one character, if it does.
std::optional<char32_t> single_code_point(std::string_view text);

/// Renders text quoted and escaped: `"a\"b\n"`.
std::string quote_string(std::string_view text);

/// Renders a code point quoted and escaped: `'a'`, `'\n'`.
std::string quote_char(char32_t c);

/// Renders bytes as a list of decimal values: `[1, 2, 255]`.
std::string format_bytes(const uint8_t *data, size_t size);

/// Shortest text that reads back to the same value. Magnitudes below 1e-4 or
/// from 1e16 up use an exponent, and integral values get a trailing ".0":
/// `1.0`, `0.1`, `1e20`, `1e-7`, `NaN`, `-inf`.
std::string format_float(float value);
std::string format_float(double value);

/// Decimal rendering of 128-bit integers.
std::string format_int128(absl::int128 value);
std::string format_uint128(absl::uint128 value);

/// Formats a list of names the way the unknown-name errors phrase it:
/// "`a`", "`a` or `b`", "one of `a`, `b`, `c`".
std::string one_of(const std::vector<std::string_view> &names);

} // namespace tokcheck
