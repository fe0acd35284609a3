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

#include "tokcheck/model/decoder.h"
#include "tokcheck/util/string_util.h"

namespace tokcheck {
namespace model {

Actual Actual::Bool(bool v) {
  return Actual(std::string("boolean `") + (v ? "true" : "false") + "`");
}

Actual Actual::Unsigned(uint64_t v) {
  return Actual("integer `" + std::to_string(v) + "`");
}

Actual Actual::Signed(int64_t v) {
  return Actual("integer `" + std::to_string(v) + "`");
}

Actual Actual::Signed128(absl::int128 v) {
  return Actual("integer `" + format_int128(v) + "` as i128");
}

Actual Actual::Unsigned128(absl::uint128 v) {
  return Actual("integer `" + format_uint128(v) + "` as u128");
}

Actual Actual::Float(double v) {
  return Actual("floating point `" + format_float(v) + "`");
}

Actual Actual::Char(char32_t v) {
  return Actual("character `" + utf8_encode(v) + "`");
}

Actual Actual::Str(std::string_view v) {
  return Actual("string " + quote_string(v));
}

Error invalid_type(const Actual &actual, const Visitor &visitor) {
  return Error::invalid_type(actual.text(), visitor.expecting());
}

Error invalid_value(const Actual &actual, const Visitor &visitor) {
  return Error::invalid_value(actual.text(), visitor.expecting());
}

Error invalid_length(size_t len, const Visitor &visitor) {
  return Error::invalid_length(len, visitor.expecting());
}

Result<void, Error> Visitor::visit_bool(bool v) {
  return Unexpected(invalid_type(Actual::Bool(v), *this));
}

Result<void, Error> Visitor::visit_i64(int64_t v) {
  return Unexpected(invalid_type(Actual::Signed(v), *this));
}

Result<void, Error> Visitor::visit_u64(uint64_t v) {
  return Unexpected(invalid_type(Actual::Unsigned(v), *this));
}

Result<void, Error> Visitor::visit_i128(absl::int128 v) {
  return Unexpected(invalid_type(Actual::Signed128(v), *this));
}

Result<void, Error> Visitor::visit_u128(absl::uint128 v) {
  return Unexpected(invalid_type(Actual::Unsigned128(v), *this));
}

Result<void, Error> Visitor::visit_f64(double v) {
  return Unexpected(invalid_type(Actual::Float(v), *this));
}

Result<void, Error> Visitor::visit_char(char32_t v) {
  return visit_str(utf8_encode(v));
}

Result<void, Error> Visitor::visit_str(std::string_view v) {
  return Unexpected(invalid_type(Actual::Str(v), *this));
}

Result<void, Error> Visitor::visit_bytes(ByteView v) {
  (void)v;
  return Unexpected(invalid_type(Actual::Bytes(), *this));
}

Result<void, Error> Visitor::visit_none() {
  return Unexpected(invalid_type(Actual::Option(), *this));
}

Result<void, Error> Visitor::visit_some(Decoder &decoder) {
  (void)decoder;
  return Unexpected(invalid_type(Actual::Option(), *this));
}

Result<void, Error> Visitor::visit_unit() {
  return Unexpected(invalid_type(Actual::Unit(), *this));
}

Result<void, Error> Visitor::visit_newtype_struct(Decoder &decoder) {
  (void)decoder;
  return Unexpected(invalid_type(Actual::NewtypeStruct(), *this));
}

Result<void, Error> Visitor::visit_seq(SeqAccess &seq) {
  (void)seq;
  return Unexpected(invalid_type(Actual::Seq(), *this));
}

Result<void, Error> Visitor::visit_map(MapAccess &map) {
  (void)map;
  return Unexpected(invalid_type(Actual::Map(), *this));
}

Result<void, Error> Visitor::visit_enum(EnumAccess &data) {
  (void)data;
  return Unexpected(invalid_type(Actual::Enum(), *this));
}

} // namespace model
} // namespace tokcheck
