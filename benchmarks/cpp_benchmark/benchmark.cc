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

#include <benchmark/benchmark.h>
#include <cstdint>
#include <string>
#include <vector>

#include "tokcheck/harness/decode_driver.h"
#include "tokcheck/harness/encode_verifier.h"
#include "tokcheck/model/container_codec.h"
#include "tokcheck/model/field_set.h"

using tokcheck::Error;
using tokcheck::Result;
using tokcheck::Token;
using tokcheck::Unexpected;
using tokcheck::harness::DecodeDriver;
using tokcheck::harness::EncodeVerifier;
using tokcheck::model::Codec;
using tokcheck::model::DecodeByValue;
using tokcheck::model::DecodeRef;
using tokcheck::model::Decoder;
using tokcheck::model::Encoder;
using tokcheck::model::FieldSet;
using tokcheck::model::Identifier;
using tokcheck::model::MapAccess;
using tokcheck::model::Visitor;

// ============================================================================
// Benchmark record (eight i32 fields)
// ============================================================================

struct NumericStruct {
  int32_t f[8];

  static const FieldSet &fields() {
    static const FieldSet set =
        FieldSet::fields({"f1", "f2", "f3", "f4", "f5", "f6", "f7", "f8"});
    return set;
  }

  bool operator==(const NumericStruct &other) const {
    for (int i = 0; i < 8; ++i) {
      if (f[i] != other.f[i]) {
        return false;
      }
    }
    return true;
  }
};

namespace tokcheck {
namespace model {

template <> struct Codec<NumericStruct> : DecodeByValue<NumericStruct> {
  static Result<void, Error> encode(const NumericStruct &value,
                                    Encoder &encoder) {
    const FieldSet &set = NumericStruct::fields();
    TOKCHECK_TRY(record, encoder.encode_struct("NumericStruct", set.size()));
    for (size_t i = 0; i < set.size(); ++i) {
      TOKCHECK_RETURN_NOT_OK(record->encode_field(set.name(i), value.f[i]));
    }
    return record->end();
  }

  static Result<NumericStruct, Error> decode(Decoder &decoder) {
    class NumericVisitor : public Visitor {
    public:
      std::string expecting() const override {
        return "struct NumericStruct";
      }

      Result<void, Error> visit_map(MapAccess &map) override {
        while (true) {
          Identifier key(NumericStruct::fields());
          TOKCHECK_TRY(has_key, map.next_key(DecodeRef::in_place(key)));
          if (!has_key) {
            return Result<void, Error>();
          }
          TOKCHECK_RETURN_NOT_OK(map.next_value(value.f[*key.index()]));
        }
      }

      NumericStruct value{};
    };
    NumericVisitor visitor;
    TOKCHECK_RETURN_NOT_OK(decoder.decode_struct(
        "NumericStruct", NumericStruct::fields().names(), visitor));
    return visitor.value;
  }
};

} // namespace model
} // namespace tokcheck

// ============================================================================
// Test data creation
// ============================================================================

NumericStruct CreateNumericStruct() {
  // Mixed signs and magnitudes
  return NumericStruct{
      {-12345, 987654321, -31415, 27182818, -32000, 1000000, -999999999, 42}};
}

std::vector<Token> CreateStructTokens(const NumericStruct &obj) {
  std::vector<Token> tokens;
  tokens.push_back(Token::Struct("NumericStruct", 8));
  for (size_t i = 0; i < 8; ++i) {
    tokens.push_back(Token::Str(NumericStruct::fields().name(i)));
    tokens.push_back(Token::I32(obj.f[i]));
  }
  tokens.push_back(Token::StructEnd());
  return tokens;
}

std::vector<int64_t> CreateLongArray() {
  return {-123400, -12300, -1200, -100, 0, 100, 1200, 12300, 123400};
}

std::vector<Token> CreateSeqTokens(const std::vector<int64_t> &values) {
  std::vector<Token> tokens;
  tokens.push_back(Token::Seq(values.size()));
  for (int64_t v : values) {
    tokens.push_back(Token::I64(v));
  }
  tokens.push_back(Token::SeqEnd());
  return tokens;
}

// ============================================================================
// Record benchmarks
// ============================================================================

static void BM_Verify_Struct_Encode(benchmark::State &state) {
  NumericStruct obj = CreateNumericStruct();
  std::vector<Token> tokens = CreateStructTokens(obj);

  for (auto _ : state) {
    EncodeVerifier verifier(tokens);
    auto result = Codec<NumericStruct>::encode(obj, verifier);
    if (!result.ok()) {
      state.SkipWithError("Encode verification failed");
      return;
    }
    benchmark::DoNotOptimize(verifier.remaining());
  }
}
BENCHMARK(BM_Verify_Struct_Encode);

static void BM_Replay_Struct_Decode(benchmark::State &state) {
  NumericStruct obj = CreateNumericStruct();
  std::vector<Token> tokens = CreateStructTokens(obj);

  // Verify decoding works first
  DecodeDriver check(tokens);
  auto check_result = Codec<NumericStruct>::decode(check);
  if (!check_result.ok() || !(check_result.value() == obj)) {
    state.SkipWithError("Decode check failed");
    return;
  }

  for (auto _ : state) {
    DecodeDriver driver(tokens);
    auto result = Codec<NumericStruct>::decode(driver);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_Replay_Struct_Decode);

// ============================================================================
// Sequence benchmarks
// ============================================================================

static void BM_Verify_Seq_Encode(benchmark::State &state) {
  std::vector<int64_t> values = CreateLongArray();
  std::vector<Token> tokens = CreateSeqTokens(values);

  for (auto _ : state) {
    EncodeVerifier verifier(tokens);
    auto result = Codec<std::vector<int64_t>>::encode(values, verifier);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_Verify_Seq_Encode);

static void BM_Replay_Seq_DecodeInPlace(benchmark::State &state) {
  std::vector<int64_t> values = CreateLongArray();
  std::vector<Token> tokens = CreateSeqTokens(values);
  std::vector<int64_t> place;

  for (auto _ : state) {
    DecodeDriver driver(tokens);
    auto result =
        Codec<std::vector<int64_t>>::decode_in_place(driver, place);
    benchmark::DoNotOptimize(result);
  }
  state.counters["tokens"] = tokens.size();
}
BENCHMARK(BM_Replay_Seq_DecodeInPlace);
