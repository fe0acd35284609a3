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

#include "tokcheck/model/decoder.h"
#include <cstdint>
#include <string_view>

namespace tokcheck {
namespace model {

// Decoders over a single in-memory value. Whatever shape is requested, they
// report their one value; codecs that wanted something else reject it through
// their visitor.

class StrDecoder : public Decoder {
public:
  explicit StrDecoder(std::string_view value) : value_(value) {}

  Result<void, Error> decode_any(Visitor &visitor) override {
    return visitor.visit_str(value_);
  }

private:
  std::string_view value_;
};

class BytesDecoder : public Decoder {
public:
  explicit BytesDecoder(ByteView value) : value_(value) {}

  Result<void, Error> decode_any(Visitor &visitor) override {
    return visitor.visit_bytes(value_);
  }

private:
  ByteView value_;
};

class U32Decoder : public Decoder {
public:
  explicit U32Decoder(uint32_t value) : value_(value) {}

  Result<void, Error> decode_any(Visitor &visitor) override {
    return visitor.visit_u32(value_);
  }

private:
  uint32_t value_;
};

/// Presents a SeqAccess as a decoder whose only content is that sequence.
class SeqAccessDecoder : public Decoder {
public:
  explicit SeqAccessDecoder(SeqAccess &seq) : seq_(seq) {}

  Result<void, Error> decode_any(Visitor &visitor) override {
    return visitor.visit_seq(seq_);
  }

private:
  SeqAccess &seq_;
};

/// Presents a MapAccess as a decoder whose only content is that map.
class MapAccessDecoder : public Decoder {
public:
  explicit MapAccessDecoder(MapAccess &map) : map_(map) {}

  Result<void, Error> decode_any(Visitor &visitor) override {
    return visitor.visit_map(map_);
  }

private:
  MapAccess &map_;
};

} // namespace model
} // namespace tokcheck
