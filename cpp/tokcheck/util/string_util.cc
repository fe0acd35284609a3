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
#include <charconv>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace tokcheck {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

void append_escaped(char32_t c, char quote, std::string &out) {
  switch (c) {
  case '\n':
    out += "\\n";
    return;
  case '\r':
    out += "\\r";
    return;
  case '\t':
    out += "\\t";
    return;
  case '\0':
    out += "\\0";
    return;
  case '\\':
    out += "\\\\";
    return;
  default:
    break;
  }
  if (c == static_cast<char32_t>(quote)) {
    out += '\\';
    out += quote;
    return;
  }
  if (c < 0x20 || c == 0x7F) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "\\u{%x}", static_cast<unsigned>(c));
    out += buf;
    return;
  }
  append_utf8(c, out);
}

// Decodes one code point at `pos`, advancing it. Rejects overlong forms,
// surrogates and values past U+10FFFF.
bool next_code_point(std::string_view text, size_t &pos, char32_t &out) {
  auto byte = [&](size_t i) { return static_cast<unsigned char>(text[i]); };
  unsigned char lead = byte(pos);
  size_t extra;
  char32_t cp;
  if (lead < 0x80) {
    out = lead;
    ++pos;
    return true;
  } else if ((lead & 0xE0) == 0xC0) {
    extra = 1;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    extra = 2;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    extra = 3;
    cp = lead & 0x07;
  } else {
    return false;
  }
  if (pos + extra >= text.size()) {
    return false;
  }
  for (size_t i = 1; i <= extra; ++i) {
    unsigned char next = byte(pos + i);
    if ((next & 0xC0) != 0x80) {
      return false;
    }
    cp = (cp << 6) | (next & 0x3F);
  }
  static constexpr char32_t kMin[] = {0, 0x80, 0x800, 0x10000};
  if (cp < kMin[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    return false;
  }
  pos += extra + 1;
  out = cp;
  return true;
}

// Exponents are written without a sign for positive powers and without
// leading zeros: `1e20`, `1.5e-7`.
std::string trim_exponent(std::string text) {
  size_t e = text.find('e');
  if (e == std::string::npos) {
    return text;
  }
  std::string mantissa = text.substr(0, e);
  std::string exponent = text.substr(e + 1);
  bool negative = !exponent.empty() && exponent[0] == '-';
  if (!exponent.empty() && (exponent[0] == '-' || exponent[0] == '+')) {
    exponent.erase(0, 1);
  }
  size_t digits = exponent.find_first_not_of('0');
  exponent = digits == std::string::npos ? "0" : exponent.substr(digits);
  return mantissa + "e" + (negative ? "-" : "") + exponent;
}

template <typename F> std::string format_floating(F value) {
  if (std::isnan(value)) {
    return "NaN";
  }
  if (std::isinf(value)) {
    return value < 0 ? "-inf" : "inf";
  }
  char buf[64];
  F magnitude = std::fabs(value);
  if (value != 0 && (magnitude < F(1e-4) || magnitude >= F(1e16))) {
    auto res = std::to_chars(buf, buf + sizeof(buf), value,
                             std::chars_format::scientific);
    return trim_exponent(std::string(buf, res.ptr));
  }
  auto res =
      std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
  std::string text(buf, res.ptr);
  if (text.find('.') == std::string::npos) {
    text += ".0";
  }
  return text;
}

template <typename V> std::string format_wide(V value) {
  std::ostringstream os;
  os << value;
  return os.str();
}

} // namespace

void append_utf8(char32_t code_point, std::string &out) {
  if ((code_point >= 0xD800 && code_point <= 0xDFFF) ||
      code_point > 0x10FFFF) {
    code_point = kReplacementChar;
  }
  if (code_point < 0x80) {
    out += static_cast<char>(code_point);
  } else if (code_point < 0x800) {
    out += static_cast<char>(0xC0 | (code_point >> 6));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else if (code_point < 0x10000) {
    out += static_cast<char>(0xE0 | (code_point >> 12));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (code_point >> 18));
    out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  }
}

bool is_utf8(std::string_view text) {
  size_t pos = 0;
  char32_t cp;
  while (pos < text.size()) {
    if (!next_code_point(text, pos, cp)) {
      return false;
    }
  }
  return true;
}

std::optional<char32_t> single_code_point(std::string_view text) {
  size_t pos = 0;
  char32_t cp;
  if (text.empty() || !next_code_point(text, pos, cp) || pos != text.size()) {
    return std::nullopt;
  }
  return cp;
}

std::string quote_string(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 2);
  out += '"';
  for (char ch : text) {
    auto c = static_cast<unsigned char>(ch);
    if (c >= 0x80) {
      // Multi-byte sequences pass through untouched.
      out += ch;
    } else {
      append_escaped(c, '"', out);
    }
  }
  out += '"';
  return out;
}

std::string quote_char(char32_t c) {
  std::string out = "'";
  append_escaped(c, '\'', out);
  out += '\'';
  return out;
}

std::string format_bytes(const uint8_t *data, size_t size) {
  std::string out = "[";
  for (size_t i = 0; i < size; ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += std::to_string(static_cast<unsigned>(data[i]));
  }
  out += ']';
  return out;
}

std::string format_float(float value) { return format_floating(value); }

std::string format_float(double value) { return format_floating(value); }

std::string format_int128(absl::int128 value) { return format_wide(value); }

std::string format_uint128(absl::uint128 value) { return format_wide(value); }

std::string one_of(const std::vector<std::string_view> &names) {
  std::string out;
  switch (names.size()) {
  case 0:
    return out;
  case 1:
    out += "`";
    out += names[0];
    out += "`";
    return out;
  case 2:
    out += "`";
    out += names[0];
    out += "` or `";
    out += names[1];
    out += "`";
    return out;
  default:
    out += "one of ";
    for (size_t i = 0; i < names.size(); ++i) {
      if (i > 0) {
        out += ", ";
      }
      out += "`";
      out += names[i];
      out += "`";
    }
    return out;
  }
}

} // namespace tokcheck
