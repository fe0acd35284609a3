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

#include "tokcheck/model/container_codec.h"
#include "tokcheck/model/field_set.h"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

// Hand-written codecs for the record, wrapper and variant shapes the harness
// tests exercise.

namespace tokcheck {
namespace harness {
namespace test {

using model::Codec;
using model::Decoder;
using model::DecodeRef;
using model::Encoder;
using model::FieldSet;
using model::Identifier;
using model::MapAccess;
using model::SeqAccess;
using model::Visitor;

/// struct S { a: u8, b: u8 }, unknown fields rejected.
struct S {
  uint8_t a = 0;
  uint8_t b = 0;

  static const FieldSet &fields() {
    static const FieldSet set = FieldSet::fields({"a", "b"});
    return set;
  }
};

inline bool operator==(const S &x, const S &y) {
  return x.a == y.a && x.b == y.b;
}

inline std::ostream &operator<<(std::ostream &os, const S &s) {
  return os << "S { a: " << static_cast<int>(s.a)
            << ", b: " << static_cast<int>(s.b) << " }";
}

/// struct Lenient { a: u8, b: Option<u8> }. `b` is skipped when absent and
/// unknown fields are ignored.
struct Lenient {
  uint8_t a = 0;
  std::optional<uint8_t> b;

  static const FieldSet &fields() {
    static const FieldSet set = FieldSet::fields({"a", "b"});
    return set;
  }
};

inline bool operator==(const Lenient &x, const Lenient &y) {
  return x.a == y.a && x.b == y.b;
}

inline std::ostream &operator<<(std::ostream &os, const Lenient &l) {
  os << "Lenient { a: " << static_cast<int>(l.a) << ", b: ";
  if (l.b) {
    os << "Some(" << static_cast<int>(*l.b) << ")";
  } else {
    os << "None";
  }
  return os << " }";
}

/// enum E { Unit, Newtype(u8), Tuple(u8, u8), Struct { a: u8 } }
struct E {
  enum class Tag : uint32_t { Unit, Newtype, Tuple, Struct };

  Tag tag = Tag::Unit;
  uint8_t first = 0;
  uint8_t second = 0;

  static E unit() { return E(); }

  static E newtype(uint8_t v) {
    E e;
    e.tag = Tag::Newtype;
    e.first = v;
    return e;
  }

  static E tuple(uint8_t x, uint8_t y) {
    E e;
    e.tag = Tag::Tuple;
    e.first = x;
    e.second = y;
    return e;
  }

  static E record(uint8_t a) {
    E e;
    e.tag = Tag::Struct;
    e.first = a;
    return e;
  }

  static const FieldSet &variants() {
    static const FieldSet set =
        FieldSet::variants({"Unit", "Newtype", "Tuple", "Struct"});
    return set;
  }

  static const FieldSet &struct_fields() {
    static const FieldSet set = FieldSet::fields({"a"});
    return set;
  }
};

inline bool operator==(const E &x, const E &y) {
  if (x.tag != y.tag) {
    return false;
  }
  switch (x.tag) {
  case E::Tag::Unit:
    return true;
  case E::Tag::Tuple:
    return x.first == y.first && x.second == y.second;
  default:
    return x.first == y.first;
  }
}

inline std::ostream &operator<<(std::ostream &os, const E &e) {
  switch (e.tag) {
  case E::Tag::Unit:
    return os << "E::Unit";
  case E::Tag::Newtype:
    return os << "E::Newtype(" << static_cast<int>(e.first) << ")";
  case E::Tag::Tuple:
    return os << "E::Tuple(" << static_cast<int>(e.first) << ", "
              << static_cast<int>(e.second) << ")";
  case E::Tag::Struct:
    return os << "E::Struct { a: " << static_cast<int>(e.first) << " }";
  }
  return os;
}

/// struct Marker;
struct Marker {};

inline bool operator==(const Marker &, const Marker &) { return true; }

inline std::ostream &operator<<(std::ostream &os, const Marker &) {
  return os << "Marker";
}

/// struct Meters(u32);
struct Meters {
  uint32_t value = 0;
};

inline bool operator==(const Meters &x, const Meters &y) {
  return x.value == y.value;
}

inline std::ostream &operator<<(std::ostream &os, const Meters &m) {
  return os << "Meters(" << m.value << ")";
}

/// struct Point(i32, i32);
struct Point {
  int32_t x = 0;
  int32_t y = 0;
};

inline bool operator==(const Point &p, const Point &q) {
  return p.x == q.x && p.y == q.y;
}

inline std::ostream &operator<<(std::ostream &os, const Point &p) {
  return os << "Point(" << p.x << ", " << p.y << ")";
}

/// A version number: the string "1.2" in readable formats, the tuple (1, 2)
/// in compact ones.
struct Version {
  uint8_t major = 0;
  uint8_t minor = 0;
};

inline bool operator==(const Version &x, const Version &y) {
  return x.major == y.major && x.minor == y.minor;
}

inline std::ostream &operator<<(std::ostream &os, const Version &v) {
  return os << static_cast<int>(v.major) << "." << static_cast<int>(v.minor);
}

} // namespace test
} // namespace harness

// ============================================================================
// Codecs
// ============================================================================

namespace model {

template <> struct Codec<harness::test::S> : DecodeByValue<harness::test::S> {
  using S = harness::test::S;

  static Result<void, Error> encode(const S &value, Encoder &encoder) {
    TOKCHECK_TRY(record, encoder.encode_struct("S", 2));
    TOKCHECK_RETURN_NOT_OK(record->encode_field("a", value.a));
    TOKCHECK_RETURN_NOT_OK(record->encode_field("b", value.b));
    return record->end();
  }

  static Result<S, Error> decode(Decoder &decoder) {
    class SVisitor : public Visitor {
    public:
      std::string expecting() const override { return "struct S"; }

      Result<void, Error> visit_seq(SeqAccess &seq) override {
        TOKCHECK_TRY(has_a, seq.next_element(value.a));
        if (!has_a) {
          return Unexpected(model::invalid_length(0, *this));
        }
        TOKCHECK_TRY(has_b, seq.next_element(value.b));
        if (!has_b) {
          return Unexpected(model::invalid_length(1, *this));
        }
        return Result<void, Error>();
      }

      Result<void, Error> visit_map(MapAccess &map) override {
        std::optional<uint8_t> a;
        std::optional<uint8_t> b;
        while (true) {
          Identifier key(S::fields());
          TOKCHECK_TRY(has_key, map.next_key(DecodeRef::in_place(key)));
          if (!has_key) {
            break;
          }
          std::optional<uint8_t> &slot = *key.index() == 0 ? a : b;
          if (slot) {
            return Unexpected(
                Error::duplicate_field(S::fields().name(*key.index())));
          }
          uint8_t field = 0;
          TOKCHECK_RETURN_NOT_OK(map.next_value(field));
          slot = field;
        }
        if (!a) {
          return Unexpected(Error::missing_field("a"));
        }
        if (!b) {
          return Unexpected(Error::missing_field("b"));
        }
        value.a = *a;
        value.b = *b;
        return Result<void, Error>();
      }

      S value;
    };
    SVisitor visitor;
    TOKCHECK_RETURN_NOT_OK(
        decoder.decode_struct("S", S::fields().names(), visitor));
    return visitor.value;
  }
};

template <>
struct Codec<harness::test::Lenient>
    : DecodeByValue<harness::test::Lenient> {
  using Lenient = harness::test::Lenient;

  static Result<void, Error> encode(const Lenient &value, Encoder &encoder) {
    TOKCHECK_TRY(record, encoder.encode_struct("Lenient", value.b ? 2 : 1));
    TOKCHECK_RETURN_NOT_OK(record->encode_field("a", value.a));
    if (value.b) {
      TOKCHECK_RETURN_NOT_OK(record->encode_field("b", value.b));
    } else {
      TOKCHECK_RETURN_NOT_OK(record->skip_field("b"));
    }
    return record->end();
  }

  static Result<Lenient, Error> decode(Decoder &decoder) {
    class LenientVisitor : public Visitor {
    public:
      std::string expecting() const override { return "struct Lenient"; }

      Result<void, Error> visit_map(MapAccess &map) override {
        std::optional<uint8_t> a;
        while (true) {
          Identifier key(Lenient::fields(), true);
          TOKCHECK_TRY(has_key, map.next_key(DecodeRef::in_place(key)));
          if (!has_key) {
            break;
          }
          if (!key.index()) {
            model::IgnoredAny ignored;
            TOKCHECK_RETURN_NOT_OK(map.next_value(ignored));
          } else if (*key.index() == 0) {
            uint8_t field = 0;
            TOKCHECK_RETURN_NOT_OK(map.next_value(field));
            a = field;
          } else {
            TOKCHECK_RETURN_NOT_OK(map.next_value(value.b));
          }
        }
        if (!a) {
          return Unexpected(Error::missing_field("a"));
        }
        value.a = *a;
        return Result<void, Error>();
      }

      Lenient value;
    };
    LenientVisitor visitor;
    TOKCHECK_RETURN_NOT_OK(decoder.decode_struct(
        "Lenient", Lenient::fields().names(), visitor));
    return visitor.value;
  }
};

template <> struct Codec<harness::test::E> : DecodeByValue<harness::test::E> {
  using E = harness::test::E;

  static Result<void, Error> encode(const E &value, Encoder &encoder) {
    uint32_t index = static_cast<uint32_t>(value.tag);
    switch (value.tag) {
    case E::Tag::Unit:
      return encoder.encode_unit_variant("E", index, "Unit");
    case E::Tag::Newtype:
      return encoder.encode_newtype_variant("E", index, "Newtype",
                                            value.first);
    case E::Tag::Tuple: {
      TOKCHECK_TRY(tuple, encoder.encode_tuple_variant("E", index, "Tuple", 2));
      TOKCHECK_RETURN_NOT_OK(tuple->encode_element(value.first));
      TOKCHECK_RETURN_NOT_OK(tuple->encode_element(value.second));
      return tuple->end();
    }
    case E::Tag::Struct: {
      TOKCHECK_TRY(record,
                   encoder.encode_struct_variant("E", index, "Struct", 1));
      TOKCHECK_RETURN_NOT_OK(record->encode_field("a", value.first));
      return record->end();
    }
    }
    return Unexpected(Error::custom("invalid E tag"));
  }

  static Result<E, Error> decode(Decoder &decoder) {
    class TupleBody : public Visitor {
    public:
      explicit TupleBody(E &value) : value_(value) {}

      std::string expecting() const override { return "tuple variant E::Tuple"; }

      Result<void, Error> visit_seq(SeqAccess &seq) override {
        TOKCHECK_TRY(has_first, seq.next_element(value_.first));
        if (!has_first) {
          return Unexpected(model::invalid_length(0, *this));
        }
        TOKCHECK_TRY(has_second, seq.next_element(value_.second));
        if (!has_second) {
          return Unexpected(model::invalid_length(1, *this));
        }
        return Result<void, Error>();
      }

    private:
      E &value_;
    };

    class StructBody : public Visitor {
    public:
      explicit StructBody(E &value) : value_(value) {}

      std::string expecting() const override {
        return "struct variant E::Struct";
      }

      Result<void, Error> visit_map(MapAccess &map) override {
        bool has_a = false;
        while (true) {
          Identifier key(E::struct_fields());
          TOKCHECK_TRY(has_key, map.next_key(DecodeRef::in_place(key)));
          if (!has_key) {
            break;
          }
          if (has_a) {
            return Unexpected(Error::duplicate_field("a"));
          }
          TOKCHECK_RETURN_NOT_OK(map.next_value(value_.first));
          has_a = true;
        }
        if (!has_a) {
          return Unexpected(Error::missing_field("a"));
        }
        return Result<void, Error>();
      }

    private:
      E &value_;
    };

    class EVisitor : public Visitor {
    public:
      std::string expecting() const override { return "enum E"; }

      Result<void, Error> visit_enum(model::EnumAccess &data) override {
        Identifier tag(E::variants());
        TOKCHECK_RETURN_NOT_OK(data.variant(DecodeRef::in_place(tag)));
        value.tag = static_cast<E::Tag>(*tag.index());
        switch (value.tag) {
        case E::Tag::Unit:
          return data.unit_variant();
        case E::Tag::Newtype:
          return data.newtype_variant(value.first);
        case E::Tag::Tuple: {
          TupleBody body(value);
          return data.tuple_variant(2, body);
        }
        case E::Tag::Struct: {
          StructBody body(value);
          return data.struct_variant(E::struct_fields().names(), body);
        }
        }
        return Result<void, Error>();
      }

      E value;
    };

    EVisitor visitor;
    TOKCHECK_RETURN_NOT_OK(
        decoder.decode_enum("E", E::variants().names(), visitor));
    return visitor.value;
  }
};

template <>
struct Codec<harness::test::Marker> : DecodeByValue<harness::test::Marker> {
  using Marker = harness::test::Marker;

  static Result<void, Error> encode(const Marker &, Encoder &encoder) {
    return encoder.encode_unit_struct("Marker");
  }

  static Result<Marker, Error> decode(Decoder &decoder) {
    class MarkerVisitor : public Visitor {
    public:
      std::string expecting() const override { return "unit struct Marker"; }
      Result<void, Error> visit_unit() override {
        return Result<void, Error>();
      }
    };
    MarkerVisitor visitor;
    TOKCHECK_RETURN_NOT_OK(decoder.decode_unit_struct("Marker", visitor));
    return Marker();
  }
};

template <>
struct Codec<harness::test::Meters> : DecodeByValue<harness::test::Meters> {
  using Meters = harness::test::Meters;

  static Result<void, Error> encode(const Meters &value, Encoder &encoder) {
    return encoder.encode_newtype_struct("Meters", value.value);
  }

  static Result<Meters, Error> decode(Decoder &decoder) {
    class MetersVisitor : public Visitor {
    public:
      std::string expecting() const override {
        return "tuple struct Meters";
      }
      Result<void, Error> visit_newtype_struct(Decoder &inner) override {
        TOKCHECK_TRY(v, Codec<uint32_t>::decode(inner));
        value.value = v;
        return Result<void, Error>();
      }
      Meters value;
    };
    MetersVisitor visitor;
    TOKCHECK_RETURN_NOT_OK(decoder.decode_newtype_struct("Meters", visitor));
    return visitor.value;
  }
};

template <>
struct Codec<harness::test::Point> : DecodeByValue<harness::test::Point> {
  using Point = harness::test::Point;

  static Result<void, Error> encode(const Point &value, Encoder &encoder) {
    TOKCHECK_TRY(tuple, encoder.encode_tuple_struct("Point", 2));
    TOKCHECK_RETURN_NOT_OK(tuple->encode_element(value.x));
    TOKCHECK_RETURN_NOT_OK(tuple->encode_element(value.y));
    return tuple->end();
  }

  static Result<Point, Error> decode(Decoder &decoder) {
    class PointVisitor : public Visitor {
    public:
      std::string expecting() const override { return "tuple struct Point"; }
      Result<void, Error> visit_seq(SeqAccess &seq) override {
        TOKCHECK_TRY(has_x, seq.next_element(value.x));
        if (!has_x) {
          return Unexpected(model::invalid_length(0, *this));
        }
        TOKCHECK_TRY(has_y, seq.next_element(value.y));
        if (!has_y) {
          return Unexpected(model::invalid_length(1, *this));
        }
        return Result<void, Error>();
      }
      Point value;
    };
    PointVisitor visitor;
    TOKCHECK_RETURN_NOT_OK(decoder.decode_tuple_struct("Point", 2, visitor));
    return visitor.value;
  }
};

template <>
struct Codec<harness::test::Version>
    : DecodeByValue<harness::test::Version> {
  using Version = harness::test::Version;

  static Result<void, Error> encode(const Version &value, Encoder &encoder) {
    TOKCHECK_TRY(readable, encoder.is_human_readable());
    if (readable) {
      std::string text = std::to_string(value.major) + "." +
                         std::to_string(value.minor);
      return encoder.encode_str(text);
    }
    return Codec<std::pair<uint8_t, uint8_t>>::encode(
        std::make_pair(value.major, value.minor), encoder);
  }

  static Result<Version, Error> decode(Decoder &decoder) {
    TOKCHECK_TRY(readable, decoder.is_human_readable());
    if (!readable) {
      TOKCHECK_TRY(pair, (Codec<std::pair<uint8_t, uint8_t>>::decode(decoder)));
      Version version;
      version.major = pair.first;
      version.minor = pair.second;
      return version;
    }
    TOKCHECK_TRY(text, Codec<std::string>::decode(decoder));
    size_t dot = text.find('.');
    std::optional<uint8_t> major;
    std::optional<uint8_t> minor;
    if (dot != std::string::npos) {
      major = parse_u8(std::string_view(text).substr(0, dot));
      minor = parse_u8(std::string_view(text).substr(dot + 1));
    }
    if (!major || !minor) {
      return Unexpected(Error::invalid_value("string " + quote_string(text),
                                             "a version like 1.2"));
    }
    Version version;
    version.major = *major;
    version.minor = *minor;
    return version;
  }

private:
  static std::optional<uint8_t> parse_u8(std::string_view digits) {
    if (digits.empty() || digits.size() > 3) {
      return std::nullopt;
    }
    unsigned value = 0;
    for (char c : digits) {
      if (c < '0' || c > '9') {
        return std::nullopt;
      }
      value = value * 10 + static_cast<unsigned>(c - '0');
    }
    if (value > 255) {
      return std::nullopt;
    }
    return static_cast<uint8_t>(value);
  }
};

} // namespace model
} // namespace tokcheck
