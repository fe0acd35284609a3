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

#include "tokcheck/model/codec.h"
#include <algorithm>
#include <array>
#include <map>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

namespace tokcheck {
namespace model {

namespace detail {

// Caps preallocation from an untrusted size hint.
inline size_t cautious_size(std::optional<size_t> hint) {
  return hint ? std::min<size_t>(*hint, 4096) : 0;
}

/// Decodes the N elements of a fixed-size tuple-like value, reporting an
/// invalid_length error if the sequence ends early.
template <typename Tuple, size_t... Is>
Result<void, Error> next_elements(SeqAccess &seq, const Visitor &visitor,
                                  Tuple &out, std::index_sequence<Is...>) {
  Result<void, Error> result;
  // Short-circuits on the first failure.
  (void)((
       [&]() {
         auto has_next = seq.next_element(std::get<Is>(out));
         if (!has_next.ok()) {
           result = Unexpected(std::move(has_next).error());
           return false;
         }
         if (!has_next.value()) {
           result = Unexpected(invalid_length(Is, visitor));
           return false;
         }
         return true;
       }()) &&
   ...);
  return result;
}

template <typename Tuple, size_t... Is>
Result<void, Error> encode_elements(const Tuple &value,
                                    CompoundEncoder &tuple,
                                    std::index_sequence<Is...>) {
  Result<void, Error> result;
  (void)((
       [&]() {
         result = tuple.encode_element(std::get<Is>(value));
         return result.ok();
       }()) &&
   ...);
  return result;
}

template <typename Tuple> class TupleVisitor : public Visitor {
public:
  explicit TupleVisitor(std::string expecting)
      : expecting_(std::move(expecting)) {}

  std::string expecting() const override { return expecting_; }

  Result<void, Error> visit_seq(SeqAccess &seq) override {
    return next_elements(
        seq, *this, value_,
        std::make_index_sequence<std::tuple_size<Tuple>::value>());
  }

  Tuple take() { return std::move(value_); }

private:
  std::string expecting_;
  Tuple value_{};
};

template <typename Tuple> Result<void, Error>
encode_tuple_like(const Tuple &value, Encoder &encoder) {
  constexpr size_t N = std::tuple_size<Tuple>::value;
  TOKCHECK_TRY(tuple, encoder.encode_tuple(N));
  TOKCHECK_RETURN_NOT_OK(
      encode_elements(value, *tuple, std::make_index_sequence<N>()));
  return tuple->end();
}

template <typename Tuple>
Result<Tuple, Error> decode_tuple_like(Decoder &decoder,
                                       std::string expecting) {
  constexpr size_t N = std::tuple_size<Tuple>::value;
  TupleVisitor<Tuple> visitor(std::move(expecting));
  TOKCHECK_RETURN_NOT_OK(decoder.decode_tuple(N, visitor));
  return visitor.take();
}

} // namespace detail

// ============================================================================
// Container codecs
// ============================================================================

/// std::optional codec. Unit decodes as an empty optional.
template <typename T>
struct Codec<std::optional<T>> : DecodeByValue<std::optional<T>> {
  static Result<void, Error> encode(const std::optional<T> &value,
                                    Encoder &encoder) {
    if (!value) {
      return encoder.encode_none();
    }
    return encoder.encode_some(*value);
  }

  static Result<std::optional<T>, Error> decode(Decoder &decoder) {
    class OptionVisitor : public Visitor {
    public:
      std::string expecting() const override { return "option"; }

      Result<void, Error> visit_none() override {
        value.reset();
        return Result<void, Error>();
      }

      Result<void, Error> visit_unit() override { return visit_none(); }

      Result<void, Error> visit_some(Decoder &inner) override {
        TOKCHECK_TRY(decoded, Codec<T>::decode(inner));
        value = std::move(decoded);
        return Result<void, Error>();
      }

      std::optional<T> value;
    };
    OptionVisitor visitor;
    TOKCHECK_RETURN_NOT_OK(decoder.decode_option(visitor));
    return std::move(visitor.value);
  }
};

/// std::vector codec, encoded as a sequence of known length.
template <typename T> struct Codec<std::vector<T>> {
  static Result<void, Error> encode(const std::vector<T> &value,
                                    Encoder &encoder) {
    TOKCHECK_TRY(seq, encoder.encode_seq(value.size()));
    for (const T &element : value) {
      TOKCHECK_RETURN_NOT_OK(seq->encode_element(element));
    }
    return seq->end();
  }

  static Result<std::vector<T>, Error> decode(Decoder &decoder) {
    std::vector<T> value;
    TOKCHECK_RETURN_NOT_OK(decode_in_place(decoder, value));
    return value;
  }

  /// Decodes over the existing elements first, then appends. A shorter
  /// sequence truncates the vector.
  static Result<void, Error> decode_in_place(Decoder &decoder,
                                             std::vector<T> &place) {
    class VecInPlaceVisitor : public Visitor {
    public:
      explicit VecInPlaceVisitor(std::vector<T> &place) : place_(place) {}

      std::string expecting() const override { return "a sequence"; }

      Result<void, Error> visit_seq(SeqAccess &seq) override {
        size_t hint = detail::cautious_size(seq.size_hint());
        for (size_t i = 0; i < place_.size(); ++i) {
          TOKCHECK_TRY(has_next,
                       seq.next_element(DecodeRef::in_place(place_[i])));
          if (!has_next) {
            place_.resize(i);
            return Result<void, Error>();
          }
        }
        if (hint > place_.size()) {
          place_.reserve(hint);
        }
        while (true) {
          T element{};
          TOKCHECK_TRY(has_next, seq.next_element(element));
          if (!has_next) {
            return Result<void, Error>();
          }
          place_.push_back(std::move(element));
        }
      }

    private:
      std::vector<T> &place_;
    };
    VecInPlaceVisitor visitor(place);
    return decoder.decode_seq(visitor);
  }
};

/// std::map codec. A repeated key keeps the last value.
template <typename K, typename V>
struct Codec<std::map<K, V>> : DecodeByValue<std::map<K, V>> {
  static Result<void, Error> encode(const std::map<K, V> &value,
                                    Encoder &encoder) {
    TOKCHECK_TRY(map, encoder.encode_map(value.size()));
    for (const auto &entry : value) {
      TOKCHECK_RETURN_NOT_OK(map->encode_key(entry.first));
      TOKCHECK_RETURN_NOT_OK(map->encode_value(entry.second));
    }
    return map->end();
  }

  static Result<std::map<K, V>, Error> decode(Decoder &decoder) {
    class MapVisitor : public Visitor {
    public:
      std::string expecting() const override { return "a map"; }

      Result<void, Error> visit_map(MapAccess &map) override {
        while (true) {
          K key{};
          TOKCHECK_TRY(has_key, map.next_key(key));
          if (!has_key) {
            return Result<void, Error>();
          }
          V entry{};
          TOKCHECK_RETURN_NOT_OK(map.next_value(entry));
          value.insert_or_assign(std::move(key), std::move(entry));
        }
      }

      std::map<K, V> value;
    };
    MapVisitor visitor;
    TOKCHECK_RETURN_NOT_OK(decoder.decode_map(visitor));
    return std::move(visitor.value);
  }
};

/// std::pair codec, a tuple of two.
template <typename A, typename B>
struct Codec<std::pair<A, B>> : DecodeByValue<std::pair<A, B>> {
  static Result<void, Error> encode(const std::pair<A, B> &value,
                                    Encoder &encoder) {
    return detail::encode_tuple_like(value, encoder);
  }

  static Result<std::pair<A, B>, Error> decode(Decoder &decoder) {
    return detail::decode_tuple_like<std::pair<A, B>>(decoder,
                                                      "a tuple of size 2");
  }
};

/// std::tuple codec.
template <typename... Ts>
struct Codec<std::tuple<Ts...>> : DecodeByValue<std::tuple<Ts...>> {
  static Result<void, Error> encode(const std::tuple<Ts...> &value,
                                    Encoder &encoder) {
    return detail::encode_tuple_like(value, encoder);
  }

  static Result<std::tuple<Ts...>, Error> decode(Decoder &decoder) {
    return detail::decode_tuple_like<std::tuple<Ts...>>(
        decoder, "a tuple of size " + std::to_string(sizeof...(Ts)));
  }
};

/// std::array codec, a tuple of N.
template <typename T, size_t N>
struct Codec<std::array<T, N>> : DecodeByValue<std::array<T, N>> {
  static Result<void, Error> encode(const std::array<T, N> &value,
                                    Encoder &encoder) {
    return detail::encode_tuple_like(value, encoder);
  }

  static Result<std::array<T, N>, Error> decode(Decoder &decoder) {
    return detail::decode_tuple_like<std::array<T, N>>(
        decoder, "an array of length " + std::to_string(N));
  }
};

} // namespace model
} // namespace tokcheck
