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

/**
 * tokcheck Example
 *
 * This example shows how a codec is checked against a token script: the
 * encode verifier confirms that a value produces exactly the scripted
 * tokens, and the decode driver replays the script to rebuild the value.
 */

#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "tokcheck/harness/decode_driver.h"
#include "tokcheck/harness/encode_verifier.h"
#include "tokcheck/model/container_codec.h"
#include "tokcheck/model/field_set.h"

// Define a simple struct with primitive fields
struct Point {
  int32_t x;
  int32_t y;

  bool operator==(const Point &other) const {
    return x == other.x && y == other.y;
  }

  static const tokcheck::model::FieldSet &fields() {
    static const tokcheck::model::FieldSet set =
        tokcheck::model::FieldSet::fields({"x", "y"});
    return set;
  }
};

namespace tokcheck {
namespace model {

// Encodes Point as a record and accepts it back from a record or a map.
template <> struct Codec<Point> : DecodeByValue<Point> {
  static Result<void, Error> encode(const Point &value, Encoder &encoder) {
    TOKCHECK_TRY(record, encoder.encode_struct("Point", 2));
    TOKCHECK_RETURN_NOT_OK(record->encode_field("x", value.x));
    TOKCHECK_RETURN_NOT_OK(record->encode_field("y", value.y));
    return record->end();
  }

  static Result<Point, Error> decode(Decoder &decoder) {
    class PointVisitor : public Visitor {
    public:
      std::string expecting() const override { return "struct Point"; }

      Result<void, Error> visit_map(MapAccess &map) override {
        bool seen[2] = {false, false};
        while (true) {
          Identifier key(Point::fields());
          TOKCHECK_TRY(has_key, map.next_key(DecodeRef::in_place(key)));
          if (!has_key) {
            break;
          }
          size_t index = *key.index();
          if (seen[index]) {
            return Unexpected(Error::duplicate_field(Point::fields().name(index)));
          }
          seen[index] = true;
          TOKCHECK_RETURN_NOT_OK(
              map.next_value(index == 0 ? value.x : value.y));
        }
        for (size_t i = 0; i < 2; ++i) {
          if (!seen[i]) {
            return Unexpected(Error::missing_field(Point::fields().name(i)));
          }
        }
        return Result<void, Error>();
      }

      Point value{};
    };
    PointVisitor visitor;
    TOKCHECK_RETURN_NOT_OK(
        decoder.decode_struct("Point", Point::fields().names(), visitor));
    return visitor.value;
  }
};

} // namespace model
} // namespace tokcheck

using tokcheck::Token;
using tokcheck::harness::DecodeDriver;
using tokcheck::harness::EncodeVerifier;
using tokcheck::model::Codec;

// Helper function to print a script
void print_tokens(const std::vector<Token> &tokens) {
  std::cout << "Script (" << tokens.size() << " tokens):" << std::endl;
  for (const Token &token : tokens) {
    std::cout << "  " << token << std::endl;
  }
}

template <typename T>
void check(const T &value, const std::vector<Token> &tokens) {
  print_tokens(tokens);

  EncodeVerifier verifier(tokens);
  auto encoded = Codec<T>::encode(value, verifier);
  if (!encoded.ok()) {
    std::cout << "Encode check failed: " << encoded.error() << std::endl;
  } else {
    std::cout << "Encode check passed, " << verifier.remaining()
              << " tokens left over" << std::endl;
  }

  DecodeDriver driver(tokens);
  auto decoded = Codec<T>::decode(driver);
  if (!decoded.ok()) {
    std::cout << "Decode failed: " << decoded.error() << std::endl;
  } else {
    std::cout << "Decoded value "
              << (decoded.value() == value ? "matches" : "differs") << ", "
              << driver.remaining() << " tokens left over" << std::endl;
  }
}

int main() {
  std::cout << "=== tokcheck Example ===" << std::endl << std::endl;

  // ============================================================================
  // Example 1: Primitive types
  // ============================================================================
  std::cout << "--- Example 1: Primitive Types ---" << std::endl;
  check(int32_t(42), {Token::I32(42)});
  std::cout << std::endl;

  // ============================================================================
  // Example 2: Sequence
  // ============================================================================
  std::cout << "--- Example 2: Sequence ---" << std::endl;
  check(std::vector<std::string>{"reading", "hiking"},
        {Token::Seq(2), Token::Str("reading"), Token::Str("hiking"),
         Token::SeqEnd()});
  std::cout << std::endl;

  // ============================================================================
  // Example 3: Map
  // ============================================================================
  std::cout << "--- Example 3: Map ---" << std::endl;
  check(std::map<std::string, int32_t>{{"one", 1}},
        {Token::Map(1), Token::Str("one"), Token::I32(1), Token::MapEnd()});
  std::cout << std::endl;

  // ============================================================================
  // Example 4: Record
  // ============================================================================
  std::cout << "--- Example 4: Record ---" << std::endl;
  check(Point{10, 20},
        {Token::Struct("Point", 2), Token::Str("x"), Token::I32(10),
         Token::Str("y"), Token::I32(20), Token::StructEnd()});
  std::cout << std::endl;

  // ============================================================================
  // Example 5: A script that does not match
  // ============================================================================
  std::cout << "--- Example 5: Mismatch ---" << std::endl;
  check(Point{10, 20},
        {Token::Struct("Point", 2), Token::Str("x"), Token::I32(11),
         Token::Str("y"), Token::I32(20), Token::StructEnd()});

  return 0;
}
